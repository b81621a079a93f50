#pragma once

#include "storage/kv_store.hpp"

#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>

struct Preferences {
    std::string format = "wav";          // wav, webm, ogg or mp3
    uint32_t sample_rate = 44100;
    std::string channel_mode = "stereo"; // mono or stereo
    uint16_t bit_depth = 16;
    bool normalize = false;
    bool use_tab_title = false;

    uint16_t channels() const { return channel_mode == "mono" ? 1 : 2; }

    nlohmann::json to_json() const;

    // Applies the keys present in `patch` on top of `base`. Unknown keys are
    // ignored; a present key with an invalid value rejects the whole patch.
    static std::expected<Preferences, std::string> merge(Preferences base,
                                                         const nlohmann::json& patch);
};

// The "preferences" key of the key-value area, falling back to configured
// defaults for anything not stored.
class PreferenceStore {
public:
    PreferenceStore(KeyValueStore& kv, Preferences defaults);

    Preferences load();
    std::expected<Preferences, std::string> update(const nlohmann::json& patch);

private:
    KeyValueStore& kv_;
    Preferences defaults_;
};
