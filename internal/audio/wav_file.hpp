#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace soundscribe::audio {

struct PcmFormat {
  uint32_t sample_rate     = 48000;
  uint16_t channels        = 2;
  uint16_t bits_per_sample = 16;

  uint32_t ByteRate() const {
    return sample_rate * channels * bits_per_sample / 8;
  }

  uint16_t BlockAlign() const {
    return static_cast<uint16_t>(channels * bits_per_sample / 8);
  }
};

// 44-byte canonical RIFF/WAVE header for integer PCM.
std::vector<uint8_t> BuildWavHeader(const PcmFormat& format, uint32_t data_bytes);

/*
  Writes header + raw samples to path, replacing any existing file.
  A trailing partial frame is dropped so the data chunk stays aligned.
  Throws std::runtime_error on I/O failure.
*/
void WriteWavFile(const std::filesystem::path& path, const PcmFormat& format, const std::vector<uint8_t>& pcm);

} // namespace soundscribe::audio
