#include "preferences.hpp"

#include "storage/chunk_store.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <limits>
#include <print>
#include <string_view>

using json = nlohmann::json;

namespace {

constexpr std::array<std::string_view, 4> formats = {"wav", "webm", "ogg", "mp3"};

// Sample rates arrive either as numbers or as numeric strings ("44100").
std::expected<uint32_t, std::string> parse_sample_rate(const json& v) {
    uint32_t rate = 0;
    if (v.is_number_unsigned()) {
        auto wide = v.get<uint64_t>();
        if (wide > std::numeric_limits<uint32_t>::max()) {
            return std::unexpected("sampleRate out of range: " + std::to_string(wide));
        }
        rate = static_cast<uint32_t>(wide);
    } else if (v.is_string()) {
        auto s = v.get<std::string>();
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), rate);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::unexpected("sampleRate must be numeric: " + s);
        }
    } else {
        return std::unexpected(std::string("sampleRate must be a number"));
    }
    if (rate < 8000 || rate > 384000) {
        return std::unexpected("sampleRate out of range: " + std::to_string(rate));
    }
    return rate;
}

} // namespace

json Preferences::to_json() const {
    return {
        {"format", format},
        {"sampleRate", sample_rate},
        {"channelMode", channel_mode},
        {"bitDepth", bit_depth},
        {"normalize", normalize},
        {"useTabTitle", use_tab_title},
    };
}

std::expected<Preferences, std::string> Preferences::merge(Preferences base, const json& patch) {
    if (!patch.is_object()) return std::unexpected(std::string("preferences must be an object"));

    try {
        if (patch.contains("format")) {
            auto f = patch["format"].get<std::string>();
            std::transform(f.begin(), f.end(), f.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (std::ranges::find(formats, f) == formats.end()) {
                return std::unexpected("unsupported format: " + f);
            }
            base.format = f;
        }
        if (patch.contains("sampleRate")) {
            auto rate = parse_sample_rate(patch["sampleRate"]);
            if (!rate) return std::unexpected(rate.error());
            base.sample_rate = *rate;
        }
        if (patch.contains("channelMode")) {
            auto m = patch["channelMode"].get<std::string>();
            if (m != "mono" && m != "stereo") {
                return std::unexpected("channelMode must be mono or stereo: " + m);
            }
            base.channel_mode = m;
        }
        if (patch.contains("bitDepth")) {
            auto bits = patch["bitDepth"].get<int64_t>();
            if (bits != 16 && bits != 24 && bits != 32) {
                return std::unexpected("bitDepth must be 16, 24 or 32: " + std::to_string(bits));
            }
            base.bit_depth = static_cast<uint16_t>(bits);
        }
        if (patch.contains("normalize")) base.normalize = patch["normalize"].get<bool>();
        if (patch.contains("useTabTitle")) base.use_tab_title = patch["useTabTitle"].get<bool>();
    } catch (const json::exception& e) {
        return std::unexpected(std::string("invalid preferences: ") + e.what());
    }
    return base;
}

PreferenceStore::PreferenceStore(KeyValueStore& kv, Preferences defaults)
    : kv_(kv), defaults_(std::move(defaults)) {}

Preferences PreferenceStore::load() {
    auto stored = kv_.get(keys::preferences);
    if (!stored) return defaults_;

    auto prefs = Preferences::merge(defaults_, *stored);
    if (!prefs) {
        std::println(stderr, "preferences: stored value rejected ({}), using defaults",
                     prefs.error());
        return defaults_;
    }
    return *prefs;
}

std::expected<Preferences, std::string> PreferenceStore::update(const json& patch) {
    auto prefs = Preferences::merge(load(), patch);
    if (!prefs) return prefs;

    if (auto r = kv_.put(keys::preferences, prefs->to_json()); !r) {
        return std::unexpected("failed to save preferences: " + r.error().message);
    }
    return prefs;
}
