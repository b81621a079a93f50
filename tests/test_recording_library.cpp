#include <catch2/catch_test_macros.hpp>

#include "storage/recording_library.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("tapedeck_test_library_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

SavedRecording meta(const std::string& name, double duration = 1.5) {
    return SavedRecording{
        .name = name,
        .duration = duration,
        .format = "wav",
        .channel_mode = "stereo",
        .mime_type = "audio/wav",
    };
}

const std::vector<uint8_t> audio = {'R', 'I', 'F', 'F', 1, 2, 3};

} // namespace

TEST_CASE("RecordingLibrary", "[library]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        RecordingLibrary lib;
        REQUIRE(lib.open(tmp.path));
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        RecordingLibrary lib;
        REQUIRE(lib.open(":memory:"));

        auto id = lib.insert(meta("Morning news", 12.25), audio);
        REQUIRE(id.has_value());

        auto r = lib.get(*id);
        REQUIRE(r.has_value());
        REQUIRE(r->id == *id);
        REQUIRE(r->name == "Morning news");
        REQUIRE(r->duration == 12.25);
        REQUIRE(r->format == "wav");
        REQUIRE(r->channel_mode == "stereo");
        REQUIRE(r->mime_type == "audio/wav");
        REQUIRE(r->size_bytes == audio.size());
        REQUIRE(lib.audio(*id) == audio);
    }

    SECTION("ReverseChronological") {
        RecordingLibrary lib;
        REQUIRE(lib.open(":memory:"));

        REQUIRE(lib.insert(meta("first"), audio));
        REQUIRE(lib.insert(meta("second"), audio));
        REQUIRE(lib.insert(meta("third"), audio));

        auto entries = lib.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].name == "third");
        REQUIRE(entries[1].name == "second");
        REQUIRE(entries[2].name == "first");
    }

    SECTION("LimitWorks") {
        RecordingLibrary lib;
        REQUIRE(lib.open(":memory:"));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(lib.insert(meta("take " + std::to_string(i)), audio));
        }
        REQUIRE(lib.recent(2).size() == 2);
        REQUIRE(lib.recent().size() == 5);
    }

    SECTION("TimestampAutoPopulated") {
        RecordingLibrary lib;
        REQUIRE(lib.open(":memory:"));
        auto id = lib.insert(meta("test"), audio);
        REQUIRE_FALSE(lib.get(*id)->timestamp.empty());
    }

    SECTION("RenameAndRemove") {
        RecordingLibrary lib;
        REQUIRE(lib.open(":memory:"));
        auto id = *lib.insert(meta("draft"), audio);

        REQUIRE(lib.rename(id, "final"));
        REQUIRE(lib.get(id)->name == "final");

        REQUIRE(lib.remove(id));
        REQUIRE_FALSE(lib.get(id).has_value());
        REQUIRE_FALSE(lib.audio(id).has_value());

        REQUIRE_FALSE(lib.remove(id));
        REQUIRE_FALSE(lib.rename(id, "gone"));
    }

    SECTION("ClearAndUsage") {
        RecordingLibrary lib;
        REQUIRE(lib.open(":memory:"));

        auto empty = lib.usage();
        REQUIRE(empty.has_value());
        REQUIRE(empty->count == 0);
        REQUIRE(empty->audio_bytes == 0);

        REQUIRE(lib.insert(meta("one"), audio));
        REQUIRE(lib.insert(meta("two"), audio));
        auto used = lib.usage();
        REQUIRE(used->count == 2);
        REQUIRE(used->audio_bytes == 2 * audio.size());

        REQUIRE(lib.clear() == 2u);
        REQUIRE(lib.recent().empty());
        REQUIRE(lib.usage()->count == 0);
        REQUIRE(lib.clear() == 0u);
    }

    SECTION("SurvivesReopen") {
        TmpDb tmp;
        int64_t id = 0;
        {
            RecordingLibrary lib;
            REQUIRE(lib.open(tmp.path));
            id = *lib.insert(meta("kept"), audio);
        }
        RecordingLibrary lib;
        REQUIRE(lib.open(tmp.path));
        REQUIRE(lib.get(id)->name == "kept");
        REQUIRE(lib.audio(id) == audio);
    }

    SECTION("ClosedLibrary") {
        RecordingLibrary lib;
        REQUIRE_FALSE(lib.is_open());
        REQUIRE_FALSE(lib.insert(meta("x"), audio).has_value());
        REQUIRE(lib.recent().empty());
        REQUIRE_FALSE(lib.remove(1));
        REQUIRE_FALSE(lib.clear().has_value());
        REQUIRE_FALSE(lib.usage().has_value());
    }
}
