#include "sample_file.hpp"

#include <cstring>
#include <stdexcept>
#include <vector>

namespace {

void put_f32_le(float value, unsigned char* out) {
    std::uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    out[0] = static_cast<unsigned char>(bits);
    out[1] = static_cast<unsigned char>(bits >> 8);
    out[2] = static_cast<unsigned char>(bits >> 16);
    out[3] = static_cast<unsigned char>(bits >> 24);
}

float get_f32_le(const unsigned char* in) {
    const std::uint32_t bits = static_cast<std::uint32_t>(in[0]) |
                               static_cast<std::uint32_t>(in[1]) << 8 |
                               static_cast<std::uint32_t>(in[2]) << 16 |
                               static_cast<std::uint32_t>(in[3]) << 24;
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

}  // namespace

SampleFileWriter::SampleFileWriter(const std::string& path)
    : out_(path, std::ios::binary | std::ios::trunc) {
    if (!out_) {
        throw std::runtime_error("Failed to open " + path + " for writing");
    }
}

void SampleFileWriter::write(const Complex* samples, std::size_t count) {
    std::vector<unsigned char> bytes(count * SAMPLE_FILE_BYTES_PER_SAMPLE);
    for (std::size_t i = 0; i < count; ++i) {
        unsigned char* out = &bytes[i * SAMPLE_FILE_BYTES_PER_SAMPLE];
        put_f32_le(samples[i].real(), out);
        put_f32_le(samples[i].imag(), out + 4);
    }
    out_.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!out_) {
        throw std::runtime_error("Failed to write samples");
    }
    samples_written_ += count;
}

void SampleFileWriter::flush() {
    out_.flush();
    if (!out_) {
        throw std::runtime_error("Failed to flush samples");
    }
}

SampleFileReader::SampleFileReader(const std::string& path)
    : in_(path, std::ios::binary) {
    if (!in_) {
        throw std::runtime_error("Failed to open " + path + " for reading");
    }
}

std::size_t SampleFileReader::read(Complex* samples, std::size_t max_samples) {
    std::vector<unsigned char> bytes(max_samples *
                                     SAMPLE_FILE_BYTES_PER_SAMPLE);
    in_.read(reinterpret_cast<char*>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
    if (in_.bad()) {
        throw std::runtime_error("Failed to read samples");
    }

    const std::size_t count =
        static_cast<std::size_t>(in_.gcount()) / SAMPLE_FILE_BYTES_PER_SAMPLE;
    for (std::size_t i = 0; i < count; ++i) {
        const unsigned char* in = &bytes[i * SAMPLE_FILE_BYTES_PER_SAMPLE];
        samples[i] = Complex(get_f32_le(in), get_f32_le(in + 4));
    }
    return count;
}

void SampleFileReader::rewind() {
    in_.clear();
    in_.seekg(0);
    if (!in_) {
        throw std::runtime_error("Failed to rewind sample file");
    }
}
