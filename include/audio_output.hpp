#pragma once

#include "types.hpp"
#include "audio_error.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace oneamp {

struct OutputSettings {
    std::string device{"default"};
    // Capacity of the sink's sample ring
    int buffer_ms{500};
    // Amount handed to the device per wakeup
    int period_ms{50};
};

class IAudioOutput {
public:
    virtual ~IAudioOutput() = default;

    // DEVICE_UNAVAILABLE when the device cannot be opened, UNSUPPORTED_FORMAT
    // when it refuses the requested rate or channel count.
    virtual AudioError open(const AudioFormat& format, const OutputSettings& settings) = 0;
    virtual bool start() = 0;
    virtual bool pause() = 0;
    virtual bool resume() = 0;
    // Drops everything buffered. The sink stays open and can be restarted.
    virtual bool stop() = 0;
    virtual void close() = 0;
    // End of stream: play out what is buffered without padding starved
    // periods with silence. Cleared by start() and stop().
    virtual void drain() = 0;

    // Blocks for at most `timeout` while the ring is full. Returns the number
    // of samples accepted.
    virtual size_t write(const float* samples, size_t count, std::chrono::milliseconds timeout) = 0;

    virtual void set_volume(float volume) = 0;
    virtual float get_volume() const = 0;

    // Samples in the sink's ring
    virtual size_t buffered_samples() const = 0;
    // Samples not yet played: the ring plus whatever the device still holds
    virtual size_t pending_samples() const = 0;
    virtual size_t capacity_samples() const = 0;
    virtual size_t underrun_count() const = 0;
    // SUCCESS unless the device failed while running
    virtual AudioError device_error() const = 0;
    virtual bool is_open() const = 0;
    virtual bool is_playing() const = 0;
    virtual AudioFormat get_format() const = 0;
};

class AlsaAudioOutput : public IAudioOutput {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    AlsaAudioOutput();
    ~AlsaAudioOutput() override;

    AudioError open(const AudioFormat& format, const OutputSettings& settings) override;
    bool start() override;
    bool pause() override;
    bool resume() override;
    bool stop() override;
    void close() override;
    void drain() override;
    size_t write(const float* samples, size_t count, std::chrono::milliseconds timeout) override;
    void set_volume(float volume) override;
    float get_volume() const override;
    size_t buffered_samples() const override;
    size_t pending_samples() const override;
    size_t capacity_samples() const override;
    size_t underrun_count() const override;
    AudioError device_error() const override;
    bool is_open() const override;
    bool is_playing() const override;
    AudioFormat get_format() const override;
};

// Device-less sink that consumes samples at the stream's real-time rate
class NullAudioOutput : public IAudioOutput {
private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;

public:
    NullAudioOutput();
    ~NullAudioOutput() override;

    AudioError open(const AudioFormat& format, const OutputSettings& settings) override;
    bool start() override;
    bool pause() override;
    bool resume() override;
    bool stop() override;
    void close() override;
    void drain() override;
    size_t write(const float* samples, size_t count, std::chrono::milliseconds timeout) override;
    void set_volume(float volume) override;
    float get_volume() const override;
    size_t buffered_samples() const override;
    size_t pending_samples() const override;
    size_t capacity_samples() const override;
    size_t underrun_count() const override;
    AudioError device_error() const override;
    bool is_open() const override;
    bool is_playing() const override;
    AudioFormat get_format() const override;
};

size_t ring_capacity_samples(const AudioFormat& format, int buffer_ms);

std::unique_ptr<IAudioOutput> create_audio_output(bool null_output = false);

}
