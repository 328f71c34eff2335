#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

namespace wayvox {

// Streams 16-bit PCM into a RIFF/WAVE file. The header is written with zero
// sizes on open() and patched on close().
class WavWriter {
public:
    WavWriter() = default;
    ~WavWriter();

    WavWriter(const WavWriter&) = delete;
    WavWriter& operator=(const WavWriter&) = delete;

    bool open(const std::string& path, int sample_rate, int channels);
    bool write(const int16_t* samples, size_t count);
    bool close();

    bool is_open() const { return file_ != nullptr; }
    uint32_t data_bytes() const { return data_bytes_; }

private:
    std::FILE* file_ = nullptr;
    uint32_t data_bytes_ = 0;
    bool failed_ = false;
};

} // namespace wayvox
