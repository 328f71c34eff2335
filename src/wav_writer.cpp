#include "wav_writer.hpp"

#include <iostream>

namespace wayvox {

namespace {

void put_u16(unsigned char* out, uint16_t v) {
    out[0] = static_cast<unsigned char>(v & 0xFF);
    out[1] = static_cast<unsigned char>((v >> 8) & 0xFF);
}

void put_u32(unsigned char* out, uint32_t v) {
    out[0] = static_cast<unsigned char>(v & 0xFF);
    out[1] = static_cast<unsigned char>((v >> 8) & 0xFF);
    out[2] = static_cast<unsigned char>((v >> 16) & 0xFF);
    out[3] = static_cast<unsigned char>((v >> 24) & 0xFF);
}

constexpr size_t HEADER_SIZE = 44;
constexpr uint16_t BITS_PER_SAMPLE = 16;

} // namespace

WavWriter::~WavWriter() {
    close();
}

bool WavWriter::open(const std::string& path, int sample_rate, int channels) {
    if (file_) close();

    file_ = std::fopen(path.c_str(), "wb");
    if (!file_) {
        std::cerr << "[audio] Cannot create " << path << std::endl;
        return false;
    }
    data_bytes_ = 0;
    failed_ = false;

    const uint16_t block_align = static_cast<uint16_t>(channels * (BITS_PER_SAMPLE / 8));
    const uint32_t byte_rate = static_cast<uint32_t>(sample_rate) * block_align;

    // Sizes are placeholders until close()
    unsigned char header[HEADER_SIZE] = {'R', 'I', 'F', 'F', 0, 0, 0, 0,
                                         'W', 'A', 'V', 'E', 'f', 'm', 't', ' '};
    put_u32(header + 16, 16);
    put_u16(header + 20, 1);  // PCM
    put_u16(header + 22, static_cast<uint16_t>(channels));
    put_u32(header + 24, static_cast<uint32_t>(sample_rate));
    put_u32(header + 28, byte_rate);
    put_u16(header + 32, block_align);
    put_u16(header + 34, BITS_PER_SAMPLE);
    header[36] = 'd'; header[37] = 'a'; header[38] = 't'; header[39] = 'a';
    put_u32(header + 40, 0);

    if (std::fwrite(header, 1, HEADER_SIZE, file_) != HEADER_SIZE) {
        std::cerr << "[audio] Failed to write WAV header" << std::endl;
        std::fclose(file_);
        file_ = nullptr;
        return false;
    }
    return true;
}

bool WavWriter::write(const int16_t* samples, size_t count) {
    if (!file_ || failed_) return false;

    // Little-endian host assumed, like every Linux target we build for
    size_t written = std::fwrite(samples, sizeof(int16_t), count, file_);
    data_bytes_ += static_cast<uint32_t>(written * sizeof(int16_t));
    if (written != count) {
        failed_ = true;
        return false;
    }
    return true;
}

bool WavWriter::close() {
    if (!file_) return false;

    bool ok = !failed_;
    unsigned char size_field[4];

    put_u32(size_field, 36 + data_bytes_);
    ok = ok && std::fseek(file_, 4, SEEK_SET) == 0
            && std::fwrite(size_field, 1, 4, file_) == 4;

    put_u32(size_field, data_bytes_);
    ok = ok && std::fseek(file_, 40, SEEK_SET) == 0
            && std::fwrite(size_field, 1, 4, file_) == 4;

    if (std::fclose(file_) != 0) ok = false;
    file_ = nullptr;

    if (!ok) {
        std::cerr << "[audio] Failed to finalize WAV file" << std::endl;
    }
    return ok;
}

} // namespace wayvox
