#include "audio_capture.hpp"
#include <iostream>

namespace wayvox {

PortAudioSource::~PortAudioSource() {
    shutdown();
}

bool PortAudioSource::initialize() {
    if (initialized_) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "[audio] PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }
    initialized_ = true;
    return true;
}

bool PortAudioSource::open(int sample_rate, int channels, int frames_per_buffer) {
    if (stream_) return true;
    if (!initialize()) return false;

    // Open default input device
    PaStreamParameters input_params;
    input_params.device = Pa_GetDefaultInputDevice();
    if (input_params.device == paNoDevice) {
        std::cerr << "[audio] No default input device" << std::endl;
        return false;
    }

    input_params.channelCount = channels;
    input_params.sampleFormat = paInt16;
    input_params.suggestedLatency = Pa_GetDeviceInfo(input_params.device)->defaultLowInputLatency;
    input_params.hostApiSpecificStreamInfo = nullptr;

    // No callback: the capture thread pulls with Pa_ReadStream
    PaError err = Pa_OpenStream(&stream_,
                                &input_params,
                                nullptr,  // No output
                                sample_rate,
                                frames_per_buffer,
                                paClipOff,
                                nullptr,
                                nullptr);

    if (err != paNoError) {
        std::cerr << "[audio] Failed to open stream: " << Pa_GetErrorText(err) << std::endl;
        stream_ = nullptr;
        return false;
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        std::cerr << "[audio] Failed to start stream: " << Pa_GetErrorText(err) << std::endl;
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        return false;
    }
    return true;
}

bool PortAudioSource::read(int16_t* buffer, int frame_count) {
    if (!stream_) return false;

    PaError err = Pa_ReadStream(stream_, buffer, static_cast<unsigned long>(frame_count));
    // Overflow only means we lost a few frames; keep going
    if (err != paNoError && err != paInputOverflowed) {
        std::cerr << "[audio] Read error: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }
    return true;
}

void PortAudioSource::close() {
    if (!stream_) return;

    PaError err = Pa_StopStream(stream_);
    if (err != paNoError) {
        std::cerr << "[audio] Failed to stop stream: " << Pa_GetErrorText(err) << std::endl;
    }
    Pa_CloseStream(stream_);
    stream_ = nullptr;
}

void PortAudioSource::shutdown() {
    close();
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
}

AudioCapture::AudioCapture(const AudioConfig& config, std::unique_ptr<AudioSource> source)
    : config_(config)
    , source_(std::move(source)) {
    if (!source_) {
        source_ = std::make_unique<PortAudioSource>();
    }
}

AudioCapture::~AudioCapture() {
    release();
}

bool AudioCapture::start(const std::string& destination) {
    if (session_open_) {
        std::cerr << "[audio] Already recording, ignoring start request" << std::endl;
        return false;
    }

    if (!sink_.open(destination, config_.sample_rate, config_.channels)) {
        return false;
    }

    if (!source_->open(config_.sample_rate, config_.channels, config_.chunk_size)) {
        sink_.close();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(time_mutex_);
        start_time_ = std::chrono::steady_clock::now();
        end_time_ = start_time_;
    }
    stop_requested_.store(false);
    active_.store(true);
    session_open_ = true;

    capture_thread_ = std::thread([this]() {
        capture_loop();
    });

    std::cout << "[audio] Started recording to " << destination << std::endl;
    return true;
}

void AudioCapture::capture_loop() {
    const int frames = config_.chunk_size;
    std::vector<int16_t> chunk(static_cast<size_t>(frames) * config_.channels);
    const auto max_duration = std::chrono::seconds(config_.max_duration);

    while (!stop_requested_.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now - start_time_ >= max_duration) {
            std::cerr << "[audio] Maximum recording duration (" << config_.max_duration
                      << "s) reached" << std::endl;
            break;
        }

        if (!source_->read(chunk.data(), frames)) {
            break;
        }
        if (!sink_.write(chunk.data(), chunk.size())) {
            std::cerr << "[audio] Failed to write audio chunk" << std::endl;
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(time_mutex_);
        end_time_ = std::chrono::steady_clock::now();
    }
    active_.store(false);
}

double AudioCapture::stop(bool* file_ok) {
    if (file_ok) *file_ok = false;
    if (!session_open_) {
        std::cerr << "[audio] Not recording, ignoring stop request" << std::endl;
        return 0.0;
    }

    stop_requested_.store(true);
    if (capture_thread_.joinable()) {
        capture_thread_.join();
    }

    source_->close();
    const bool saved = sink_.close();
    session_open_ = false;
    if (!saved) {
        std::cerr << "[audio] Recording could not be saved" << std::endl;
    }
    if (file_ok) *file_ok = saved;

    double duration;
    {
        std::lock_guard<std::mutex> lock(time_mutex_);
        duration = std::chrono::duration<double>(end_time_ - start_time_).count();
    }
    std::cout << "[audio] Stopped recording. Duration: " << duration << "s" << std::endl;
    return duration;
}

double AudioCapture::elapsed() const {
    if (!active_.load()) return 0.0;

    std::lock_guard<std::mutex> lock(time_mutex_);
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
}

double AudioCapture::duration() const {
    if (!session_open_.load()) return 0.0;
    if (active_.load()) return elapsed();

    std::lock_guard<std::mutex> lock(time_mutex_);
    return std::chrono::duration<double>(end_time_ - start_time_).count();
}

void AudioCapture::release() {
    if (session_open_) {
        stop();
    }
    if (source_) {
        source_->shutdown();
    }
}

} // namespace wayvox
