#pragma once

#include "platform/capture_host.hpp"
#include "preferences.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

struct EncodedAudio {
    std::vector<uint8_t> bytes;
    std::string mime_type;
    std::string format;            // container actually produced
    std::string requested_format;  // container the preferences asked for
    bool fallback_applied = false;
    uint16_t channels = 0;
    double duration_s = 0.0;
};

namespace recording {

std::string mime_type_for(const std::string& format);

// Joins chunks in sequence order.
std::vector<uint8_t> concat(std::span<const Chunk> chunks);

// Splits interleaved s16le PCM into one float plane per channel. A trailing
// partial frame is dropped.
std::vector<std::vector<float>> decode_pcm16(std::span<const uint8_t> pcm, uint16_t channels);

// Scales all planes so the loudest sample reaches full scale. Silence is left
// untouched.
void normalize_peak(std::vector<std::vector<float>>& planes);

// Encodes captured PCM according to the preferences. The recorder only
// produces PCM, so webm, ogg and mp3 requests are written as WAV with
// fallback_applied set.
std::expected<EncodedAudio, std::string> encode(std::span<const uint8_t> pcm,
                                                const CaptureFormat& format,
                                                const Preferences& prefs);

} // namespace recording
