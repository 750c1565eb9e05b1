#include "audio_decoder.hpp"
#include "tag_reader.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#define DR_FLAC_IMPLEMENTATION
#include <dr_flac.h>

namespace oneamp {

namespace {

// Frames skipped past an unreadable block before retrying
constexpr uint64_t RESYNC_SKIP_FRAMES = 4096;

}

struct FlacDecoder::Impl {
    AudioFormat format;
    bool is_open = false;
    double duration = 0.0;
    AudioError error = AudioError::SUCCESS;
    drflac* flac = nullptr;
    uint64_t current_frame = 0;
    int consecutive_bad = 0;
    std::vector<std::string> comments;

    static void on_metadata(void* user_data, drflac_metadata* metadata) {
        auto* self = static_cast<Impl*>(user_data);
        if (metadata->type != DRFLAC_METADATA_BLOCK_TYPE_VORBIS_COMMENT) {
            return;
        }

        drflac_vorbis_comment_iterator it;
        drflac_init_vorbis_comment_iterator(&it, metadata->data.vorbis_comment.commentCount,
                                            metadata->data.vorbis_comment.pComments);
        drflac_uint32 length = 0;
        const char* comment = nullptr;
        while ((comment = drflac_next_vorbis_comment(&it, &length)) != nullptr) {
            self->comments.emplace_back(comment, length);
        }
    }

    void cleanup() {
        if (flac != nullptr) {
            drflac_close(flac);
            flac = nullptr;
        }
    }
};

FlacDecoder::FlacDecoder() : m_impl(std::make_unique<Impl>()) {}

FlacDecoder::~FlacDecoder() {
    close();
}

AudioError FlacDecoder::open(const std::string& file_path, TrackMetadata& metadata) {
    close();

    AudioError readable = check_readable(file_path);
    if (readable != AudioError::SUCCESS) {
        m_impl->error = readable;
        return readable;
    }

    m_impl->comments.clear();
    m_impl->flac = drflac_open_file_with_metadata(file_path.c_str(), &Impl::on_metadata, m_impl.get(), nullptr);
    if (m_impl->flac == nullptr || m_impl->flac->sampleRate == 0 || m_impl->flac->channels == 0) {
        std::cerr << "Failed to open FLAC stream: " << file_path << "\n";
        m_impl->cleanup();
        m_impl->error = AudioError::CORRUPT_STREAM;
        return m_impl->error;
    }

    m_impl->format.sample_rate = static_cast<int>(m_impl->flac->sampleRate);
    m_impl->format.channels = static_cast<int>(m_impl->flac->channels);
    m_impl->duration = static_cast<double>(m_impl->flac->totalPCMFrameCount) / m_impl->flac->sampleRate;
    m_impl->current_frame = 0;
    m_impl->consecutive_bad = 0;
    m_impl->error = AudioError::SUCCESS;
    m_impl->is_open = true;

    TrackMetadata parsed;
    parsed.file_path = file_path;
    parsed.codec = codec_name();
    parsed.duration = m_impl->duration;
    parsed.sample_rate = m_impl->format.sample_rate;
    parsed.channels = m_impl->format.channels;
    for (const auto& comment : m_impl->comments) {
        apply_vorbis_comment(comment, parsed);
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(file_path, ec);
    if (!ec && m_impl->duration > 0.0) {
        parsed.bitrate_kbps = static_cast<int>(file_size * 8.0 / m_impl->duration / 1000.0);
    }
    metadata = parsed;
    return AudioError::SUCCESS;
}

DecodeStatus FlacDecoder::decode_next(PcmFrame& frame) {
    if (!m_impl->is_open) {
        m_impl->error = AudioError::IO_ERROR;
        return DecodeStatus::STREAM_ERROR;
    }

    const uint64_t total = m_impl->flac->totalPCMFrameCount;
    const size_t channels = static_cast<size_t>(m_impl->format.channels);

    while (total == 0 || m_impl->current_frame < total) {
        frame.samples.resize(DECODE_BLOCK_FRAMES * channels);
        const drflac_uint64 frames_read =
            drflac_read_pcm_frames_f32(m_impl->flac, DECODE_BLOCK_FRAMES, frame.samples.data());

        if (frames_read > 0) {
            m_impl->consecutive_bad = 0;
            frame.samples.resize(static_cast<size_t>(frames_read) * channels);
            frame.sample_rate = m_impl->format.sample_rate;
            frame.channels = m_impl->format.channels;
            frame.first_frame = m_impl->current_frame;
            m_impl->current_frame += frames_read;
            return DecodeStatus::FRAME_READY;
        }

        if (total == 0) {
            // Unknown length: a short read is the end
            break;
        }

        // A block failed to decode before the advertised end; skip past it
        if (++m_impl->consecutive_bad > MAX_CONSECUTIVE_BAD_PACKETS) {
            std::cerr << "FLAC: too many undecodable blocks near frame " << m_impl->current_frame << "\n";
            m_impl->error = AudioError::DECODE_PACKET_ERROR;
            return DecodeStatus::STREAM_ERROR;
        }
        const uint64_t next = std::min(total, m_impl->current_frame + RESYNC_SKIP_FRAMES);
        if (next >= total || !drflac_seek_to_pcm_frame(m_impl->flac, next)) {
            break;
        }
        m_impl->current_frame = next;
    }

    return DecodeStatus::END_OF_STREAM;
}

SeekStatus FlacDecoder::seek(double target_seconds, SeekMode /*mode*/, double& actual_seconds) {
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
        static_cast<double>(std::numeric_limits<drflac_uint64>::max())) {
        return SeekStatus::PAST_END;
    }

    const drflac_uint64 target_frame = static_cast<drflac_uint64>(target_seconds * m_impl->format.sample_rate);
    if (!drflac_seek_to_pcm_frame(m_impl->flac, target_frame)) {
        std::cerr << "FLAC: seek to frame " << target_frame << " failed\n";
        m_impl->error = AudioError::SEEK_ERROR;
        return SeekStatus::FAILED;
    }

    m_impl->current_frame = target_frame;
    m_impl->consecutive_bad = 0;
    actual_seconds = static_cast<double>(target_frame) / m_impl->format.sample_rate;
    return SeekStatus::OK;
}

void FlacDecoder::close() {
    if (m_impl->is_open) {
        m_impl->cleanup();
        m_impl->is_open = false;
    }
}

AudioFormat FlacDecoder::get_format() const {
    return m_impl->format;
}

double FlacDecoder::get_duration() const {
    return m_impl->duration;
}

uint64_t FlacDecoder::get_position_frames() const {
    return m_impl->current_frame;
}

AudioError FlacDecoder::last_error() const {
    return m_impl->error;
}

}
