#include "recording_encoder.hpp"

#include "wav_encoder.hpp"

#include <algorithm>
#include <cmath>
#include <print>

namespace recording {

std::string mime_type_for(const std::string& format) {
    if (format == "wav") return "audio/wav";
    if (format == "webm") return "audio/webm";
    if (format == "ogg") return "audio/ogg";
    if (format == "mp3") return "audio/mpeg";
    return "application/octet-stream";
}

std::vector<uint8_t> concat(std::span<const Chunk> chunks) {
    size_t total = 0;
    for (auto& c : chunks) total += c.size();

    std::vector<uint8_t> out;
    out.reserve(total);
    for (auto& c : chunks) out.insert(out.end(), c.begin(), c.end());
    return out;
}

std::vector<std::vector<float>> decode_pcm16(std::span<const uint8_t> pcm, uint16_t channels) {
    if (channels == 0) return {};
    size_t frame_bytes = static_cast<size_t>(channels) * 2;
    size_t frames = pcm.size() / frame_bytes;

    std::vector<std::vector<float>> planes(channels, std::vector<float>(frames));
    const uint8_t* p = pcm.data();
    for (size_t i = 0; i < frames; ++i) {
        for (uint16_t ch = 0; ch < channels; ++ch) {
            auto v = static_cast<int16_t>(static_cast<uint16_t>(p[0] | (p[1] << 8)));
            // Inverse of wav::quantize, so 16-bit output reproduces the input.
            planes[ch][i] = v < 0 ? v / 32768.0f : v / 32767.0f;
            p += 2;
        }
    }
    return planes;
}

void normalize_peak(std::vector<std::vector<float>>& planes) {
    float peak = 0.0f;
    for (auto& plane : planes) {
        for (float s : plane) peak = std::max(peak, std::fabs(s));
    }
    if (peak <= 0.0f) return;

    float gain = 1.0f / peak;
    for (auto& plane : planes) {
        for (float& s : plane) s *= gain;
    }
}

std::expected<EncodedAudio, std::string> encode(std::span<const uint8_t> pcm,
                                                const CaptureFormat& format,
                                                const Preferences& prefs) {
    EncodedAudio out;
    out.requested_format = prefs.format;
    out.format = "wav";
    out.mime_type = mime_type_for("wav");
    if (prefs.format != "wav") {
        std::println(stderr, "encoder: {} output not supported, writing wav instead", prefs.format);
        out.fallback_applied = true;
    }

    auto planes = decode_pcm16(pcm, format.channels);
    if (planes.empty()) return std::unexpected(std::string("capture format has no channels"));
    if (prefs.normalize) normalize_peak(planes);

    auto bytes = wav::encode(planes, format.sample_rate, prefs.bit_depth);
    if (!bytes) return std::unexpected(bytes.error());

    out.bytes = std::move(*bytes);
    out.channels = format.channels;
    out.duration_s = format.sample_rate
        ? static_cast<double>(planes[0].size()) / format.sample_rate
        : 0.0;
    return out;
}

} // namespace recording
