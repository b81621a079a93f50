#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"

#include <chrono>
#include <format>
#include <print>
#include <variant>

using json = nlohmann::json;

namespace {

json recording_to_json(const SavedRecording& r) {
    return {
        {"id", r.id},
        {"name", r.name},
        {"timestamp", r.timestamp},
        {"duration", r.duration},
        {"format", r.format},
        {"channelMode", r.channel_mode},
        {"mimeType", r.mime_type},
        {"sizeBytes", r.size_bytes},
    };
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, Scheduler& scheduler, CaptureHost& host)
    : config_(std::move(config)), verbose_(verbose),
      scheduler_(scheduler), host_(host),
      kv_(config_.storage.quota_bytes),
      chunk_store_(kv_),
      prefs_(kv_, config_.preferences),
      acquirer_(host_, scheduler_, chunk_store_,
                CaptureAcquirer::Options{
                    .initial_grace = std::chrono::milliseconds(config_.capture.initial_grace_ms),
                    .conflict_grace = std::chrono::milliseconds(config_.capture.conflict_grace_ms),
                }) {}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init() {
    auto state_path = db_path(config_.storage.state_db, "state.db");
    if (!kv_.open(state_path)) {
        std::println(stderr, "Failed to open state store at {}", state_path);
        return false;
    }

    auto library_path = db_path(config_.storage.library_db, "library.db");
    if (!library_.open(library_path)) {
        std::println(stderr, "Warning: recording library failed to open, library disabled");
    }

    session_ = std::make_unique<Session>(
        host_, acquirer_, chunk_store_, prefs_, scheduler_,
        Session::Options{.timeslice = std::chrono::milliseconds(config_.capture.chunk_interval_ms)});

    if (!session_->chunks().empty()) {
        log(std::format("Unfinished recording recovered ({} chunks), stop-capture collects it",
                        session_->chunks().size()));
    }
    log(std::format("Storage: {} of {} bytes used", kv_.total_bytes(), kv_.quota()));
    return true;
}

void DaemonCore::handle_command(const json& request, Reply reply) {
    auto cmd = protocol::parse_command(request);
    if (!cmd) {
        log("Rejected request: " + cmd.error());
        reply(protocol::error(cmd.error()));
        return;
    }
    if (!session_) {
        reply(protocol::error("daemon not initialized"));
        return;
    }

    std::visit([this, &reply](const auto& c) { handle(c, std::move(reply)); }, *cmd);
}

SessionState DaemonCore::session_state() const {
    return session_ ? session_->state() : SessionState::Idle;
}

void DaemonCore::handle(const protocol::StartCapture& c, Reply reply) {
    session_->start_capture(c.surface_id, [this, reply](std::expected<CaptureHandle, std::string> r) {
        if (!r) {
            log("Capture negotiation failed: " + r.error());
            reply(protocol::error(r.error()));
            return;
        }
        log(std::format("Stream granted for surface {}{}", r->surface_id,
                        r->title.empty() ? "" : " (" + r->title + ")"));
        reply(protocol::ok({
            {"streamToken", r->stream_token},
            {"method", "tab"},
            {"surfaceId", r->surface_id},
        }));
    });
}

void DaemonCore::handle(const protocol::StartRecordingWithStream& c, Reply reply) {
    session_->start_recording(c.stream_token, [this, reply](std::expected<void, std::string> r) {
        if (!r) {
            reply(protocol::error(r.error()));
            return;
        }
        auto& fmt = *session_->format();
        log(std::format("Recording started ({} Hz, {} ch)", fmt.sample_rate, fmt.channels));
        reply(protocol::ok());
    });
}

void DaemonCore::handle(const protocol::StopCapture&, Reply reply) {
    session_->stop([this, reply](std::expected<StopResult, std::string> r) {
        if (!r) {
            log("Stop failed: " + r.error());
            reply(protocol::error(r.error()));
            return;
        }
        if (!r->audio) {
            log("Recording stopped, no audio captured");
            reply(protocol::ok({{"audioBytes", nullptr}, {"hasData", false}}));
            return;
        }

        auto& audio = *r->audio;
        log(std::format("Recording stopped, {:.1f}s, {} bytes {}", audio.duration_s,
                        audio.bytes.size(), audio.format));

        json resp = {
            {"audioBytes", protocol::bytes_to_json(audio.bytes)},
            {"hasData", true},
            {"mimeType", audio.mime_type},
            {"format", audio.format},
            {"fallbackApplied", audio.fallback_applied},
            {"requestedFormat", audio.requested_format},
            {"durationS", audio.duration_s},
        };
        if (config_.library.autosave) {
            if (auto id = save_to_library(*r)) resp["recordingId"] = *id;
        }
        reply(protocol::ok(std::move(resp)));
    });
}

void DaemonCore::handle(const protocol::GetRecordingState&, Reply reply) {
    json resp = {
        {"isRecording", session_->is_recording()},
        {"hasRecording", session_->has_recording()},
        {"state", to_string(session_->state())},
    };
    if (session_->state() == SessionState::Capturing) {
        resp["durationS"] = session_->recording_duration();
    }
    if (!session_->storage_warning().empty()) {
        resp["storageWarning"] = session_->storage_warning();
    }
    reply(protocol::ok(std::move(resp)));
}

void DaemonCore::handle(const protocol::GetRecordingData&, Reply reply) {
    auto encoded = session_->peek();
    if (!encoded) {
        reply(protocol::error(encoded.error()));
        return;
    }
    if (!*encoded) {
        reply(protocol::ok({{"hasData", false}}));
        return;
    }
    reply(protocol::ok({
        {"audioBytes", protocol::bytes_to_json((*encoded)->bytes)},
        {"hasData", true},
        {"mimeType", (*encoded)->mime_type},
    }));
}

void DaemonCore::handle(const protocol::ClearRecording&, Reply reply) {
    session_->clear();
    log("Recording cleared");
    reply(protocol::ok());
}

void DaemonCore::handle(const protocol::AddRecordingChunk& c, Reply reply) {
    session_->add_chunk(c.chunk);
    reply(protocol::ok());
}

void DaemonCore::handle(const protocol::ListSurfaces&, Reply reply) {
    json list = json::array();
    for (auto& s : host_.surfaces()) {
        list.push_back({{"id", s.id}, {"title", s.title}, {"app", s.app}});
    }
    reply(protocol::ok({{"surfaces", std::move(list)}}));
}

void DaemonCore::handle(const protocol::GetPreferences&, Reply reply) {
    reply(protocol::ok({{"preferences", prefs_.load().to_json()}}));
}

void DaemonCore::handle(const protocol::SetPreferences& c, Reply reply) {
    auto updated = prefs_.update(c.patch);
    if (!updated) {
        reply(protocol::error(updated.error()));
        return;
    }
    if (session_->state() == SessionState::Capturing) {
        log("Preferences saved; sample rate and channel mode apply to the next recording");
    }
    reply(protocol::ok({{"preferences", updated->to_json()}}));
}

void DaemonCore::handle(const protocol::ListRecordings& c, Reply reply) {
    json list = json::array();
    for (auto& r : library_.recent(c.limit)) {
        list.push_back(recording_to_json(r));
    }
    reply(protocol::ok({{"recordings", std::move(list)}}));
}

void DaemonCore::handle(const protocol::GetSavedRecording& c, Reply reply) {
    auto meta = library_.get(c.id);
    auto audio = meta ? library_.audio(c.id) : std::nullopt;
    if (!meta || !audio) {
        reply(protocol::error("Recording not found"));
        return;
    }
    reply(protocol::ok({
        {"recording", recording_to_json(*meta)},
        {"audioBytes", protocol::bytes_to_json(*audio)},
    }));
}

void DaemonCore::handle(const protocol::DeleteSavedRecording& c, Reply reply) {
    if (!library_.remove(c.id)) {
        reply(protocol::error("Recording not found"));
        return;
    }
    log(std::format("Deleted recording {}", c.id));
    reply(protocol::ok());
}

void DaemonCore::handle(const protocol::RenameRecording& c, Reply reply) {
    if (!library_.rename(c.id, c.name)) {
        reply(protocol::error("Recording not found"));
        return;
    }
    reply(protocol::ok());
}

void DaemonCore::handle(const protocol::ClearRecordings&, Reply reply) {
    auto removed = library_.clear();
    if (!removed) {
        reply(protocol::error("Failed to clear recordings"));
        return;
    }
    log(std::format("Cleared {} saved recordings", *removed));
    reply(protocol::ok({{"removed", *removed}}));
}

void DaemonCore::handle(const protocol::GetStorageUsage&, Reply reply) {
    auto lib = library_.usage().value_or(LibraryUsage{});
    reply(protocol::ok({
        {"used", kv_.total_bytes()},
        {"quota", kv_.quota()},
        {"libraryBytes", lib.audio_bytes},
        {"recordingCount", lib.count},
    }));
}

std::optional<int64_t> DaemonCore::save_to_library(const StopResult& result) {
    if (!library_.is_open()) return std::nullopt;

    auto& audio = *result.audio;
    auto prefs = prefs_.load();

    std::string name;
    if (prefs.use_tab_title && !result.surface_title.empty()) {
        name = result.surface_title;
    } else {
        auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
        name = std::format("Recording {:%Y-%m-%d %H:%M:%S}", now);
    }

    SavedRecording meta{
        .name = name,
        .duration = audio.duration_s,
        .format = audio.format,
        .channel_mode = audio.channels == 1 ? "mono" : "stereo",
        .mime_type = audio.mime_type,
    };
    auto id = library_.insert(meta, audio.bytes);
    if (id) log(std::format("Saved recording {} as \"{}\"", *id, name));
    return id;
}

std::string DaemonCore::db_path(const std::string& configured, const char* file) const {
    if (!configured.empty()) return configured;
    auto data = platform::data_dir();
    if (!data.empty()) return data + "/" + file;
    return std::string("/tmp/tapedeck/") + file;
}

void DaemonCore::shutdown() {
    if (!session_) return;
    if (session_->state() == SessionState::Capturing || session_->state() == SessionState::Stopping) {
        log("Suspending active recording; it is kept for the next start");
    }
    session_->suspend();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[tapedeck] {}", msg);
    }
}
