#pragma once

#include "config.hpp"
#include "wav_writer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <portaudio.h>

namespace wayvox {

// Microphone input. read() blocks until frame_count frames are available.
class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual bool open(int sample_rate, int channels, int frames_per_buffer) = 0;
    virtual bool read(int16_t* buffer, int frame_count) = 0;
    virtual void close() = 0;

    // Release the audio backend itself
    virtual void shutdown() {}
};

// Default input device through PortAudio's blocking API
class PortAudioSource : public AudioSource {
public:
    PortAudioSource() = default;
    ~PortAudioSource() override;

    bool open(int sample_rate, int channels, int frames_per_buffer) override;
    bool read(int16_t* buffer, int frame_count) override;
    void close() override;
    void shutdown() override;

private:
    bool initialize();

    PaStream* stream_ = nullptr;
    bool initialized_ = false;
};

class AudioCapture {
public:
    explicit AudioCapture(const AudioConfig& config,
                          std::unique_ptr<AudioSource> source = nullptr);
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    // Open the microphone and a WAV sink at destination, then capture on a
    // background thread. Returns false if already active or the device or
    // file could not be opened.
    bool start(const std::string& destination);

    // Stop capturing, join the capture thread and close the sink.
    // Returns the captured duration in seconds (0 if nothing was started).
    // Safe to call after capture stopped on its own at max duration.
    // file_ok, if given, is set to whether the WAV file was written and
    // finalized completely.
    double stop(bool* file_ok = nullptr);

    // Seconds since start while capturing, 0 otherwise
    double elapsed() const;

    // Captured length of the open session: live while capturing, frozen once
    // capture ended on its own, 0 when no session is open
    double duration() const;

    bool is_active() const { return active_.load(); }

    // True between start() and stop(), even after capture ended on its own
    bool is_open() const { return session_open_.load(); }

    // Stop any capture and release the audio device
    void release();

    AudioSource* source() { return source_.get(); }

private:
    void capture_loop();

    AudioConfig config_;
    std::unique_ptr<AudioSource> source_;
    WavWriter sink_;

    std::thread capture_thread_;
    std::atomic<bool> active_{false};
    std::atomic<bool> stop_requested_{false};

    mutable std::mutex time_mutex_;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point end_time_;
    std::atomic<bool> session_open_{false};
};

} // namespace wayvox
