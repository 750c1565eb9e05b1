#include "audio_decoder.hpp"
#include "tag_reader.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>

#include <stb_vorbis.c>

namespace oneamp {

struct OggDecoder::Impl {
    AudioFormat format;
    bool is_open = false;
    double duration = 0.0;
    AudioError error = AudioError::SUCCESS;
    stb_vorbis* vorbis = nullptr;
    uint64_t total_frames = 0;
    uint64_t current_frame = 0;

    void cleanup() {
        if (vorbis != nullptr) {
            stb_vorbis_close(vorbis);
            vorbis = nullptr;
        }
    }
};

OggDecoder::OggDecoder() : m_impl(std::make_unique<Impl>()) {}

OggDecoder::~OggDecoder() {
    close();
}

AudioError OggDecoder::open(const std::string& file_path, TrackMetadata& metadata) {
    close();

    AudioError readable = check_readable(file_path);
    if (readable != AudioError::SUCCESS) {
        m_impl->error = readable;
        return readable;
    }

    int vorbis_error = 0;
    m_impl->vorbis = stb_vorbis_open_filename(file_path.c_str(), &vorbis_error, nullptr);
    if (m_impl->vorbis == nullptr) {
        std::cerr << "Failed to open Ogg Vorbis stream: " << file_path << " (stb_vorbis error "
                  << vorbis_error << ")\n";
        m_impl->error = AudioError::CORRUPT_STREAM;
        return m_impl->error;
    }

    const stb_vorbis_info info = stb_vorbis_get_info(m_impl->vorbis);
    if (info.sample_rate == 0 || info.channels <= 0) {
        m_impl->cleanup();
        m_impl->error = AudioError::CORRUPT_STREAM;
        return m_impl->error;
    }

    m_impl->format.sample_rate = static_cast<int>(info.sample_rate);
    m_impl->format.channels = info.channels;
    m_impl->total_frames = stb_vorbis_stream_length_in_samples(m_impl->vorbis);
    m_impl->duration = static_cast<double>(m_impl->total_frames) / info.sample_rate;
    m_impl->current_frame = 0;
    m_impl->error = AudioError::SUCCESS;
    m_impl->is_open = true;

    TrackMetadata parsed;
    parsed.file_path = file_path;
    parsed.codec = codec_name();
    parsed.duration = m_impl->duration;
    parsed.sample_rate = m_impl->format.sample_rate;
    parsed.channels = m_impl->format.channels;

    const stb_vorbis_comment comments = stb_vorbis_get_comment(m_impl->vorbis);
    for (int i = 0; i < comments.comment_list_length; ++i) {
        apply_vorbis_comment(comments.comment_list[i], parsed);
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(file_path, ec);
    if (!ec && m_impl->duration > 0.0) {
        parsed.bitrate_kbps = static_cast<int>(file_size * 8.0 / m_impl->duration / 1000.0);
    }
    metadata = parsed;
    return AudioError::SUCCESS;
}

DecodeStatus OggDecoder::decode_next(PcmFrame& frame) {
    if (!m_impl->is_open) {
        m_impl->error = AudioError::IO_ERROR;
        return DecodeStatus::STREAM_ERROR;
    }

    const int channels = m_impl->format.channels;
    frame.samples.resize(DECODE_BLOCK_FRAMES * static_cast<size_t>(channels));

    const int frames_read = stb_vorbis_get_samples_float_interleaved(
        m_impl->vorbis, channels, frame.samples.data(), static_cast<int>(frame.samples.size()));
    if (frames_read <= 0) {
        if (m_impl->total_frames > 0 && m_impl->current_frame < m_impl->total_frames) {
            std::cerr << "Vorbis: stream ended early at frame " << m_impl->current_frame << "\n";
        }
        return DecodeStatus::END_OF_STREAM;
    }

    frame.samples.resize(static_cast<size_t>(frames_read) * static_cast<size_t>(channels));
    frame.sample_rate = m_impl->format.sample_rate;
    frame.channels = channels;
    frame.first_frame = m_impl->current_frame;
    m_impl->current_frame += static_cast<uint64_t>(frames_read);
    return DecodeStatus::FRAME_READY;
}

SeekStatus OggDecoder::seek(double target_seconds, SeekMode mode, double& actual_seconds) {
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
    // Zero duration means the stream did not report its length
    if (m_impl->duration > 0.0 && target_seconds >= m_impl->duration) {
        return SeekStatus::PAST_END;
    }
    if (target_seconds * m_impl->format.sample_rate >=
        static_cast<double>(std::numeric_limits<unsigned int>::max())) {
        return SeekStatus::PAST_END;
    }

    const unsigned int target_frame = static_cast<unsigned int>(target_seconds * m_impl->format.sample_rate);

    if (mode == SeekMode::COARSE) {
        if (!stb_vorbis_seek_frame(m_impl->vorbis, target_frame)) {
            m_impl->error = AudioError::SEEK_ERROR;
            return SeekStatus::FAILED;
        }
        const int offset = stb_vorbis_get_sample_offset(m_impl->vorbis);
        m_impl->current_frame = offset >= 0 ? static_cast<uint64_t>(offset) : target_frame;
    } else {
        if (!stb_vorbis_seek(m_impl->vorbis, target_frame)) {
            std::cerr << "Vorbis: seek to frame " << target_frame << " failed\n";
            m_impl->error = AudioError::SEEK_ERROR;
            return SeekStatus::FAILED;
        }
        m_impl->current_frame = target_frame;
    }

    actual_seconds = static_cast<double>(m_impl->current_frame) / m_impl->format.sample_rate;
    return SeekStatus::OK;
}

void OggDecoder::close() {
    if (m_impl->is_open) {
        m_impl->cleanup();
        m_impl->is_open = false;
    }
}

AudioFormat OggDecoder::get_format() const {
    return m_impl->format;
}

double OggDecoder::get_duration() const {
    return m_impl->duration;
}

uint64_t OggDecoder::get_position_frames() const {
    return m_impl->current_frame;
}

AudioError OggDecoder::last_error() const {
    return m_impl->error;
}

}
