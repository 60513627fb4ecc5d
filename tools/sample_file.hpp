#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

#include "config.hpp"

// Raw interleaved little-endian float32 I/Q, 8 bytes per sample, no header.
constexpr std::size_t SAMPLE_FILE_BYTES_PER_SAMPLE = 8;

class SampleFileWriter {
   private:
    std::ofstream out_;
    std::uint64_t samples_written_ = 0;

   public:
    // Truncates path. Throws std::runtime_error if it cannot be opened.
    explicit SampleFileWriter(const std::string& path);

    void write(const Complex* samples, std::size_t count);
    void flush();
    std::uint64_t samples_written() const { return samples_written_; }
};

class SampleFileReader {
   private:
    std::ifstream in_;

   public:
    explicit SampleFileReader(const std::string& path);

    // Reads up to max_samples whole samples. Returns 0 at end of file; a
    // trailing partial sample is ignored.
    std::size_t read(Complex* samples, std::size_t max_samples);
    void rewind();
};
