#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace oneamp_test {

// MPEG-1 Layer III, 128 kbps, 44.1 kHz, mono, no CRC: 417 bytes and 1152
// samples per frame. Zeroed side info decodes to silence.
constexpr size_t MP3_FRAME_BYTES = 417;
constexpr int MP3_FRAME_SAMPLES = 1152;
constexpr int MP3_SAMPLE_RATE = 44100;

// Frames in [corrupt_begin, corrupt_end) keep a valid header but carry
// big_values = 511 in their side info, which no decoder accepts.
inline std::vector<uint8_t> mp3_stream(size_t frame_count, size_t corrupt_begin = 0, size_t corrupt_end = 0) {
    std::vector<uint8_t> bytes;
    bytes.reserve(frame_count * MP3_FRAME_BYTES);
    for (size_t i = 0; i < frame_count; ++i) {
        std::vector<uint8_t> frame(MP3_FRAME_BYTES, 0);
        frame[0] = 0xFF;
        frame[1] = 0xFB;
        frame[2] = 0x90;
        frame[3] = 0xC0;
        if (i >= corrupt_begin && i < corrupt_end) {
            // Side info starts at byte 4; big_values sits in bits 30..38 of it
            frame[4 + 3] = 0xFF;
            frame[4 + 4] = 0xFF;
        }
        bytes.insert(bytes.end(), frame.begin(), frame.end());
    }
    return bytes;
}

inline double mp3_frame_seconds(double frames) {
    return frames * MP3_FRAME_SAMPLES / MP3_SAMPLE_RATE;
}

inline uint8_t flac_crc8(const std::vector<uint8_t>& data, size_t begin, size_t end) {
    uint8_t crc = 0;
    for (size_t i = begin; i < end; ++i) {
        crc ^= data[i];
        for (int bit = 0; bit < 8; ++bit) {
            crc = static_cast<uint8_t>((crc & 0x80) ? (crc << 1) ^ 0x07 : crc << 1);
        }
    }
    return crc;
}

inline uint16_t flac_crc16(const std::vector<uint8_t>& data, size_t begin, size_t end) {
    uint16_t crc = 0;
    for (size_t i = begin; i < end; ++i) {
        crc = static_cast<uint16_t>(crc ^ (data[i] << 8));
        for (int bit = 0; bit < 8; ++bit) {
            crc = static_cast<uint16_t>((crc & 0x8000) ? (crc << 1) ^ 0x8005 : crc << 1);
        }
    }
    return crc;
}

constexpr int FLAC_BLOCK_FRAMES = 192;
constexpr int FLAC_SAMPLE_RATE = 8000;

// Native FLAC, 8 kHz mono 16-bit, whose STREAMINFO leaves the total sample
// count at zero (unknown). Block `i` is a constant subframe of value values[i].
inline std::vector<uint8_t> flac_without_length(const std::vector<int16_t>& values) {
    std::vector<uint8_t> bytes = {'f', 'L', 'a', 'C', 0x80, 0x00, 0x00, 0x22};

    // min/max block size, then unknown min/max frame size
    const uint8_t block_hi = static_cast<uint8_t>(FLAC_BLOCK_FRAMES >> 8);
    const uint8_t block_lo = static_cast<uint8_t>(FLAC_BLOCK_FRAMES & 0xFF);
    bytes.insert(bytes.end(), {block_hi, block_lo, block_hi, block_lo, 0, 0, 0, 0, 0, 0});

    // sample rate (20) | channels - 1 (3) | bits - 1 (5) | total samples (36)
    const uint64_t packed = (static_cast<uint64_t>(FLAC_SAMPLE_RATE) << 44) | (uint64_t{15} << 36);
    for (int shift = 56; shift >= 0; shift -= 8) {
        bytes.push_back(static_cast<uint8_t>(packed >> shift));
    }
    bytes.insert(bytes.end(), 16, 0);  // MD5 not set

    for (size_t i = 0; i < values.size() && i < 128; ++i) {
        const size_t frame_start = bytes.size();
        // fixed blocking, 192-sample blocks at 8 kHz, mono 16-bit, frame number
        bytes.insert(bytes.end(), {0xFF, 0xF8, 0x14, 0x08, static_cast<uint8_t>(i)});
        bytes.push_back(flac_crc8(bytes, frame_start, bytes.size()));

        // CONSTANT subframe
        const uint16_t value = static_cast<uint16_t>(values[i]);
        bytes.insert(bytes.end(), {0x00, static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value & 0xFF)});

        const uint16_t crc = flac_crc16(bytes, frame_start, bytes.size());
        bytes.push_back(static_cast<uint8_t>(crc >> 8));
        bytes.push_back(static_cast<uint8_t>(crc & 0xFF));
    }
    return bytes;
}

inline bool write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(file);
}

}
