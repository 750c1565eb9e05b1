#pragma once

#include "types.hpp"
#include "audio_error.hpp"
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace oneamp {

enum class ContainerFormat {
    UNKNOWN,
    WAV,
    MP3,
    FLAC,
    OGG
};

// Frames requested per decode_next() call from PCM-style codecs
constexpr size_t DECODE_BLOCK_FRAMES = 1152;
// Undecodable packets in a row before the stream is declared broken
constexpr int MAX_CONSECUTIVE_BAD_PACKETS = 64;

class IAudioDecoder {
public:
    virtual ~IAudioDecoder() = default;

    // Fills `metadata` on success. Fails with FILE_NOT_FOUND / IO_ERROR /
    // UNSUPPORTED_FORMAT / CORRUPT_STREAM.
    virtual AudioError open(const std::string& file_path, TrackMetadata& metadata) = 0;

    // FRAME_READY with `frame` filled, END_OF_STREAM, or STREAM_ERROR when
    // the stream cannot continue (see last_error()). Single bad packets are
    // skipped internally.
    virtual DecodeStatus decode_next(PcmFrame& frame) = 0;

    // ACCURATE: actual_seconds <= target_seconds. COARSE: nearest decodable
    // boundary. PAST_END leaves the position untouched.
    virtual SeekStatus seek(double target_seconds, SeekMode mode, double& actual_seconds) = 0;

    virtual void close() = 0;
    virtual AudioFormat get_format() const = 0;
    virtual double get_duration() const = 0;
    virtual uint64_t get_position_frames() const = 0;
    virtual AudioError last_error() const = 0;
    virtual const char* codec_name() const = 0;
};

class Mp3Decoder : public IAudioDecoder {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    Mp3Decoder();
    ~Mp3Decoder() override;

    AudioError open(const std::string& file_path, TrackMetadata& metadata) override;
    DecodeStatus decode_next(PcmFrame& frame) override;
    SeekStatus seek(double target_seconds, SeekMode mode, double& actual_seconds) override;
    void close() override;
    AudioFormat get_format() const override;
    double get_duration() const override;
    uint64_t get_position_frames() const override;
    AudioError last_error() const override;
    const char* codec_name() const override { return "MP3"; }
};

class WavDecoder : public IAudioDecoder {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    WavDecoder();
    ~WavDecoder() override;

    AudioError open(const std::string& file_path, TrackMetadata& metadata) override;
    DecodeStatus decode_next(PcmFrame& frame) override;
    SeekStatus seek(double target_seconds, SeekMode mode, double& actual_seconds) override;
    void close() override;
    AudioFormat get_format() const override;
    double get_duration() const override;
    uint64_t get_position_frames() const override;
    AudioError last_error() const override;
    const char* codec_name() const override { return "WAV"; }
};

class FlacDecoder : public IAudioDecoder {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    FlacDecoder();
    ~FlacDecoder() override;

    AudioError open(const std::string& file_path, TrackMetadata& metadata) override;
    DecodeStatus decode_next(PcmFrame& frame) override;
    SeekStatus seek(double target_seconds, SeekMode mode, double& actual_seconds) override;
    void close() override;
    AudioFormat get_format() const override;
    double get_duration() const override;
    uint64_t get_position_frames() const override;
    AudioError last_error() const override;
    const char* codec_name() const override { return "FLAC"; }
};

class OggDecoder : public IAudioDecoder {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    OggDecoder();
    ~OggDecoder() override;

    AudioError open(const std::string& file_path, TrackMetadata& metadata) override;
    DecodeStatus decode_next(PcmFrame& frame) override;
    SeekStatus seek(double target_seconds, SeekMode mode, double& actual_seconds) override;
    void close() override;
    AudioFormat get_format() const override;
    double get_duration() const override;
    uint64_t get_position_frames() const override;
    AudioError last_error() const override;
    const char* codec_name() const override { return "Vorbis"; }
};

ContainerFormat detect_format(const uint8_t* header, size_t size);
ContainerFormat format_from_extension(const std::string& file_path);
const std::vector<std::string>& supported_extensions();
bool is_supported_extension(const std::string& file_path);

// FILE_NOT_FOUND / IO_ERROR when the path cannot be read, SUCCESS otherwise
AudioError check_readable(const std::string& file_path);

std::unique_ptr<IAudioDecoder> create_decoder(ContainerFormat format);

// Sniffs the container, picks a decoder and opens it. On failure `decoder`
// is left empty.
AudioError open_decoder(const std::string& file_path,
                        std::unique_ptr<IAudioDecoder>& decoder,
                        TrackMetadata& metadata);

}
