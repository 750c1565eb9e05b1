#include "audio_decoder.hpp"
#include "tag_reader.hpp"
#include <filesystem>
#include <algorithm>
#include <iostream>
#include <fstream>
#include <vector>
#include <cmath>
#include <cstdint>

#define MINIMP3_FLOAT_OUTPUT
#define MINIMP3_IMPLEMENTATION
#include <minimp3.h>

namespace oneamp {

namespace {

// Frames decoded and discarded after a seek to refill the bit reservoir
constexpr size_t SEEK_PREROLL_FRAMES = 2;

struct Mp3FrameEntry {
    size_t offset;
    uint64_t first_sample;
};

}

struct Mp3Decoder::Impl {
    AudioFormat format;
    bool is_open = false;
    double duration = 0.0;
    AudioError error = AudioError::SUCCESS;

    mp3dec_t mp3d;
    std::vector<uint8_t> file_data;
    size_t data_end = 0;
    std::vector<Mp3FrameEntry> frames;
    uint64_t total_samples = 0;
    size_t next_frame = 0;
    int consecutive_bad = 0;
    std::vector<float> pcm;

    bool read_file(const std::string& file_path) {
        std::ifstream file(file_path, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
            return false;
        }

        const std::streamoff file_size = file.tellg();
        if (file_size < 0) {
            return false;
        }
        file.seekg(0, std::ios::beg);

        file_data.resize(static_cast<size_t>(file_size));
        if (file_size > 0 && !file.read(reinterpret_cast<char*>(file_data.data()), file_size)) {
            return false;
        }
        return true;
    }

    // Walks the stream once without decoding to find every frame boundary
    size_t build_frame_index(size_t start) {
        mp3dec_t scanner;
        mp3dec_init(&scanner);

        size_t offset = start;
        size_t payload_bytes = 0;
        frames.clear();
        total_samples = 0;

        while (offset < data_end) {
            mp3dec_frame_info_t info;
            const int samples = mp3dec_decode_frame(&scanner, file_data.data() + offset,
                                                    static_cast<int>(data_end - offset), nullptr, &info);
            if (info.frame_bytes == 0) {
                break;
            }
            if (samples > 0) {
                if (frames.empty()) {
                    format.sample_rate = info.hz;
                    format.channels = info.channels;
                }
                frames.push_back({offset + static_cast<size_t>(info.frame_offset), total_samples});
                total_samples += static_cast<uint64_t>(samples);
                payload_bytes += static_cast<size_t>(info.frame_bytes - info.frame_offset);
            }
            offset += static_cast<size_t>(info.frame_bytes);
        }
        return payload_bytes;
    }

    // Decodes the frame at `index` into `pcm`. Returns samples per channel.
    int decode_frame_at(size_t index, mp3dec_frame_info_t& info) {
        const size_t offset = frames[index].offset;
        return mp3dec_decode_frame(&mp3d, file_data.data() + offset,
                                   static_cast<int>(data_end - offset), pcm.data(), &info);
    }

    void copy_samples(int samples, int source_channels, PcmFrame& frame) const {
        const size_t count = static_cast<size_t>(samples);
        frame.samples.resize(count * static_cast<size_t>(format.channels));

        if (source_channels == format.channels) {
            std::copy(pcm.begin(), pcm.begin() + static_cast<std::ptrdiff_t>(frame.samples.size()),
                      frame.samples.begin());
        } else if (source_channels == 1) {
            // Mono frame inside a stereo stream
            for (size_t i = 0; i < count; ++i) {
                frame.samples[i * 2] = pcm[i];
                frame.samples[i * 2 + 1] = pcm[i];
            }
        } else {
            // Stereo frame inside a mono stream
            for (size_t i = 0; i < count; ++i) {
                frame.samples[i] = 0.5f * (pcm[i * 2] + pcm[i * 2 + 1]);
            }
        }
    }
};

Mp3Decoder::Mp3Decoder() : m_impl(std::make_unique<Impl>()) {}

Mp3Decoder::~Mp3Decoder() {
    close();
}

AudioError Mp3Decoder::open(const std::string& file_path, TrackMetadata& metadata) {
    close();

    AudioError readable = check_readable(file_path);
    if (readable != AudioError::SUCCESS) {
        m_impl->error = readable;
        return readable;
    }

    if (!m_impl->read_file(file_path)) {
        std::cerr << "Failed to read MP3 file data: " << file_path << "\n";
        m_impl->error = AudioError::IO_ERROR;
        return m_impl->error;
    }

    TrackMetadata parsed;
    parsed.file_path = file_path;
    parsed.codec = codec_name();

    const size_t tag_size = id3v2_tag_size(m_impl->file_data.data(), m_impl->file_data.size());
    parse_id3v2(m_impl->file_data.data(), m_impl->file_data.size(), parsed);

    m_impl->data_end = m_impl->file_data.size();
    if (parse_id3v1(m_impl->file_data.data(), m_impl->file_data.size(), parsed)) {
        m_impl->data_end -= 128;
    }

    const size_t start = std::min(tag_size, m_impl->data_end);
    const size_t payload_bytes = m_impl->build_frame_index(start);
    if (m_impl->frames.empty() || m_impl->format.sample_rate <= 0) {
        std::cerr << "Failed to find any MP3 frame in " << file_path << "\n";
        m_impl->file_data.clear();
        m_impl->error = AudioError::CORRUPT_STREAM;
        return m_impl->error;
    }

    m_impl->duration = static_cast<double>(m_impl->total_samples) / m_impl->format.sample_rate;
    m_impl->pcm.assign(MINIMP3_MAX_SAMPLES_PER_FRAME, 0.0f);
    mp3dec_init(&m_impl->mp3d);
    m_impl->next_frame = 0;
    m_impl->consecutive_bad = 0;
    m_impl->error = AudioError::SUCCESS;
    m_impl->is_open = true;

    parsed.duration = m_impl->duration;
    parsed.sample_rate = m_impl->format.sample_rate;
    parsed.channels = m_impl->format.channels;
    if (m_impl->duration > 0.0) {
        parsed.bitrate_kbps = static_cast<int>(std::lround(payload_bytes * 8.0 / m_impl->duration / 1000.0));
    }
    metadata = parsed;
    return AudioError::SUCCESS;
}

DecodeStatus Mp3Decoder::decode_next(PcmFrame& frame) {
    if (!m_impl->is_open) {
        m_impl->error = AudioError::IO_ERROR;
        return DecodeStatus::STREAM_ERROR;
    }

    while (m_impl->next_frame < m_impl->frames.size()) {
        const size_t index = m_impl->next_frame++;
        mp3dec_frame_info_t info;
        const int samples = m_impl->decode_frame_at(index, info);

        if (samples <= 0 || info.channels <= 0) {
            if (m_impl->consecutive_bad == 0) {
                std::cerr << "MP3: skipped undecodable frame at offset " << m_impl->frames[index].offset << "\n";
            }
            if (++m_impl->consecutive_bad > MAX_CONSECUTIVE_BAD_PACKETS) {
                std::cerr << "MP3: too many undecodable frames, giving up at frame " << index << "\n";
                m_impl->error = AudioError::DECODE_PACKET_ERROR;
                return DecodeStatus::STREAM_ERROR;
            }
            continue;
        }

        m_impl->consecutive_bad = 0;
        m_impl->copy_samples(samples, info.channels, frame);
        frame.sample_rate = m_impl->format.sample_rate;
        frame.channels = m_impl->format.channels;
        frame.first_frame = m_impl->frames[index].first_sample;
        return DecodeStatus::FRAME_READY;
    }

    return DecodeStatus::END_OF_STREAM;
}

SeekStatus Mp3Decoder::seek(double target_seconds, SeekMode mode, double& actual_seconds) {
    if (!m_impl->is_open) {
        m_impl->error = AudioError::SEEK_ERROR;
        return SeekStatus::FAILED;
    }

    if (!std::isfinite(target_seconds)) {
        m_impl->error = AudioError::SEEK_ERROR;
        return SeekStatus::FAILED;
    }
    if (target_seconds < 0.0) {
        target_seconds = 0.0;
    }
    if (target_seconds >= m_impl->duration) {
        return SeekStatus::PAST_END;
    }

    const auto& frames = m_impl->frames;
    const uint64_t target_sample = static_cast<uint64_t>(target_seconds * m_impl->format.sample_rate);

    // Last frame starting at or before the target
    auto it = std::upper_bound(frames.begin(), frames.end(), target_sample,
                               [](uint64_t sample, const Mp3FrameEntry& entry) {
                                   return sample < entry.first_sample;
                               });
    size_t index = it == frames.begin() ? 0 : static_cast<size_t>(std::distance(frames.begin(), it) - 1);

    if (mode == SeekMode::COARSE && index + 1 < frames.size()) {
        const uint64_t before = target_sample - frames[index].first_sample;
        const uint64_t after = frames[index + 1].first_sample - target_sample;
        if (after < before) {
            ++index;
        }
    }

    mp3dec_init(&m_impl->mp3d);
    const size_t preroll_start = index > SEEK_PREROLL_FRAMES ? index - SEEK_PREROLL_FRAMES : 0;
    for (size_t i = preroll_start; i < index; ++i) {
        mp3dec_frame_info_t info;
        m_impl->decode_frame_at(i, info);
    }

    m_impl->next_frame = index;
    m_impl->consecutive_bad = 0;
    actual_seconds = static_cast<double>(frames[index].first_sample) / m_impl->format.sample_rate;
    return SeekStatus::OK;
}

void Mp3Decoder::close() {
    if (m_impl->is_open) {
        m_impl->file_data.clear();
        m_impl->frames.clear();
        m_impl->next_frame = 0;
        m_impl->is_open = false;
    }
}

AudioFormat Mp3Decoder::get_format() const {
    return m_impl->format;
}

double Mp3Decoder::get_duration() const {
    return m_impl->duration;
}

uint64_t Mp3Decoder::get_position_frames() const {
    if (m_impl->next_frame < m_impl->frames.size()) {
        return m_impl->frames[m_impl->next_frame].first_sample;
    }
    return m_impl->total_samples;
}

AudioError Mp3Decoder::last_error() const {
    return m_impl->error;
}

}
