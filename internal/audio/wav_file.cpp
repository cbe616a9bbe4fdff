#include "wav_file.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>

namespace soundscribe::audio {

namespace {

void PutTag(std::vector<uint8_t>& out, const char (&tag)[5]) {
  out.insert(out.end(), tag, tag + 4);
}

void PutU16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void PutU32(std::vector<uint8_t>& out, uint32_t v) {
  for (int shift = 0; shift < 32; shift += 8) {
    out.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
  }
}

} // namespace

std::vector<uint8_t> BuildWavHeader(const PcmFormat& format, uint32_t data_bytes) {
  std::vector<uint8_t> header;
  header.reserve(44);

  PutTag(header, "RIFF");
  PutU32(header, 36 + data_bytes);
  PutTag(header, "WAVE");

  PutTag(header, "fmt ");
  PutU32(header, 16);
  PutU16(header, 1); // PCM
  PutU16(header, format.channels);
  PutU32(header, format.sample_rate);
  PutU32(header, format.ByteRate());
  PutU16(header, format.BlockAlign());
  PutU16(header, format.bits_per_sample);

  PutTag(header, "data");
  PutU32(header, data_bytes);
  return header;
}

void WriteWavFile(const std::filesystem::path& path, const PcmFormat& format, const std::vector<uint8_t>& pcm) {
  const std::size_t block = format.BlockAlign() == 0 ? 1 : format.BlockAlign();
  const std::size_t usable = pcm.size() - (pcm.size() % block);
  if (usable > std::numeric_limits<uint32_t>::max() - 36) {
    throw std::runtime_error("PCM data too large for a WAV file: " + path.string());
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot open " + path.string() + " for writing");
  }

  const auto header = BuildWavHeader(format, static_cast<uint32_t>(usable));
  out.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));
  out.write(reinterpret_cast<const char*>(pcm.data()), static_cast<std::streamsize>(usable));
  out.flush();
  if (!out) {
    throw std::runtime_error("short write to " + path.string());
  }
}

} // namespace soundscribe::audio
