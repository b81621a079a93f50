#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <vector>

// Encodes planar float samples into a PCM WAV file in memory.
namespace wav {

constexpr size_t header_size = 44;

// Clamps to [-1, 1] and scales asymmetrically: negatives by 2^(bits-1),
// positives by 2^(bits-1) - 1.
inline int32_t quantize(float s, uint16_t bits_per_sample) {
    double neg_scale = std::ldexp(1.0, bits_per_sample - 1);
    double pos_scale = neg_scale - 1.0;
    double v = std::clamp(static_cast<double>(s), -1.0, 1.0);
    return static_cast<int32_t>(std::lround(v < 0 ? v * neg_scale : v * pos_scale));
}

inline bool supported_bit_depth(uint16_t bits_per_sample) {
    return bits_per_sample == 16 || bits_per_sample == 24 || bits_per_sample == 32;
}

// `planes` holds one sample array per channel, all of equal length.
// Output frames are interleaved channel-minor: ch0[i], ch1[i], ... chN-1[i].
inline std::expected<std::vector<uint8_t>, std::string>
encode(std::span<const std::vector<float>> planes, uint32_t sample_rate,
       uint16_t bits_per_sample = 16) {
    if (planes.empty()) {
        return std::unexpected("no channels");
    }
    if (!supported_bit_depth(bits_per_sample)) {
        return std::unexpected("unsupported bit depth " + std::to_string(bits_per_sample));
    }
    size_t frames = planes[0].size();
    for (auto& p : planes) {
        if (p.size() != frames) return std::unexpected("channel lengths differ");
    }

    auto channels = static_cast<uint16_t>(planes.size());
    uint16_t bytes_per_sample = bits_per_sample / 8;
    uint16_t block_align = channels * bytes_per_sample;
    uint32_t byte_rate = sample_rate * block_align;
    uint32_t data_size = static_cast<uint32_t>(frames * block_align);
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(header_size + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    // Explicit little-endian stores, independent of host byte order.
    auto w16 = [&w](uint16_t v) {
        uint8_t b[2] = {uint8_t(v), uint8_t(v >> 8)};
        w(b, 2);
    };
    auto w32 = [&w](uint32_t v) {
        uint8_t b[4] = {uint8_t(v), uint8_t(v >> 8), uint8_t(v >> 16), uint8_t(v >> 24)};
        w(b, 4);
    };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);

    uint8_t* dst = out.data() + header_size;
    for (size_t i = 0; i < frames; ++i) {
        for (uint16_t ch = 0; ch < channels; ++ch) {
            auto v = static_cast<uint32_t>(quantize(planes[ch][i], bits_per_sample));
            for (uint16_t b = 0; b < bytes_per_sample; ++b) {
                *dst++ = static_cast<uint8_t>(v >> (8 * b));
            }
        }
    }

    return out;
}

} // namespace wav
