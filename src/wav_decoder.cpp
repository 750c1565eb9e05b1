#include "audio_decoder.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

#define DR_WAV_IMPLEMENTATION
#include <dr_wav.h>

namespace oneamp {

struct WavDecoder::Impl {
    AudioFormat format;
    bool is_open = false;
    double duration = 0.0;
    AudioError error = AudioError::SUCCESS;
    drwav wav;
    uint64_t current_frame = 0;

    bool initialize_drwav(const std::string& file_path) {
        if (!drwav_init_file(&wav, file_path.c_str(), nullptr)) {
            return false;
        }
        if (wav.sampleRate == 0 || wav.channels == 0) {
            drwav_uninit(&wav);
            return false;
        }

        format.sample_rate = static_cast<int>(wav.sampleRate);
        format.channels = static_cast<int>(wav.channels);
        duration = static_cast<double>(wav.totalPCMFrameCount) / wav.sampleRate;
        current_frame = 0;
        return true;
    }

    void cleanup_drwav() {
        if (is_open) {
            drwav_uninit(&wav);
        }
    }
};

WavDecoder::WavDecoder() : m_impl(std::make_unique<Impl>()) {}

WavDecoder::~WavDecoder() {
    close();
}

AudioError WavDecoder::open(const std::string& file_path, TrackMetadata& metadata) {
    close();

    AudioError readable = check_readable(file_path);
    if (readable != AudioError::SUCCESS) {
        m_impl->error = readable;
        return readable;
    }

    if (!m_impl->initialize_drwav(file_path)) {
        std::cerr << "Failed to parse WAV header: " << file_path << "\n";
        m_impl->error = AudioError::CORRUPT_STREAM;
        return m_impl->error;
    }

    m_impl->is_open = true;
    m_impl->error = AudioError::SUCCESS;

    TrackMetadata parsed;
    parsed.file_path = file_path;
    parsed.codec = codec_name();
    parsed.duration = m_impl->duration;
    parsed.sample_rate = m_impl->format.sample_rate;
    parsed.channels = m_impl->format.channels;
    parsed.bitrate_kbps = static_cast<int>(static_cast<uint64_t>(m_impl->wav.sampleRate) *
                                           m_impl->wav.channels * m_impl->wav.bitsPerSample / 1000);
    metadata = parsed;
    return AudioError::SUCCESS;
}

DecodeStatus WavDecoder::decode_next(PcmFrame& frame) {
    if (!m_impl->is_open) {
        m_impl->error = AudioError::IO_ERROR;
        return DecodeStatus::STREAM_ERROR;
    }

    const uint64_t remaining = m_impl->wav.totalPCMFrameCount > m_impl->current_frame
        ? m_impl->wav.totalPCMFrameCount - m_impl->current_frame : 0;
    if (remaining == 0) {
        return DecodeStatus::END_OF_STREAM;
    }

    const size_t frames_to_read = static_cast<size_t>(std::min<uint64_t>(DECODE_BLOCK_FRAMES, remaining));
    frame.samples.resize(frames_to_read * static_cast<size_t>(m_impl->format.channels));

    const drwav_uint64 frames_read = drwav_read_pcm_frames_f32(&m_impl->wav, frames_to_read, frame.samples.data());
    if (frames_read == 0) {
        // Header promised more data than the file holds
        std::cerr << "WAV: stream ended early at frame " << m_impl->current_frame << "\n";
        return DecodeStatus::END_OF_STREAM;
    }

    frame.samples.resize(static_cast<size_t>(frames_read) * static_cast<size_t>(m_impl->format.channels));
    frame.sample_rate = m_impl->format.sample_rate;
    frame.channels = m_impl->format.channels;
    frame.first_frame = m_impl->current_frame;
    m_impl->current_frame += frames_read;
    return DecodeStatus::FRAME_READY;
}

SeekStatus WavDecoder::seek(double target_seconds, SeekMode /*mode*/, double& actual_seconds) {
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

    // PCM seeks are sample exact in both modes
    drwav_uint64 target_frame = static_cast<drwav_uint64>(target_seconds * m_impl->wav.sampleRate);
    if (target_frame >= m_impl->wav.totalPCMFrameCount) {
        return SeekStatus::PAST_END;
    }

    if (!drwav_seek_to_pcm_frame(&m_impl->wav, target_frame)) {
        std::cerr << "WAV: seek to frame " << target_frame << " failed\n";
        m_impl->error = AudioError::SEEK_ERROR;
        return SeekStatus::FAILED;
    }

    m_impl->current_frame = target_frame;
    actual_seconds = static_cast<double>(target_frame) / m_impl->wav.sampleRate;
    return SeekStatus::OK;
}

void WavDecoder::close() {
    if (m_impl->is_open) {
        m_impl->cleanup_drwav();
        m_impl->is_open = false;
    }
}

AudioFormat WavDecoder::get_format() const {
    return m_impl->format;
}

double WavDecoder::get_duration() const {
    return m_impl->duration;
}

uint64_t WavDecoder::get_position_frames() const {
    return m_impl->current_frame;
}

AudioError WavDecoder::last_error() const {
    return m_impl->error;
}

}
