#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace soundscribe::audio {

struct MixInput {
  std::filesystem::path path;
  double                start_offset_s = 0.0;
};

/*
  Merges captured per-participant files into one distributable file.

  Implementations throw util::TranscodeFailure when the output cannot be
  produced.
*/
class AudioMixer {
 public:
  virtual ~AudioMixer() = default;

  virtual std::filesystem::path ConvertSingle(const std::filesystem::path& input, const std::filesystem::path& output) = 0;

  virtual std::filesystem::path MixMany(const std::vector<MixInput>& inputs, const std::filesystem::path& output,
                                        double total_duration_s) = 0;
};

struct TranscoderOptions {
  std::string               binary  = "ffmpeg";
  std::string               codec   = "libmp3lame";
  std::string               bitrate = "128k";
  std::chrono::milliseconds timeout{std::chrono::minutes(10)};
  // Delay each input by its start offset before mixing.
  bool apply_start_offsets = false;
};

class FfmpegMixer final : public AudioMixer {
 public:
  explicit FfmpegMixer(TranscoderOptions options);

  std::filesystem::path ConvertSingle(const std::filesystem::path& input, const std::filesystem::path& output) override;

  std::filesystem::path MixMany(const std::vector<MixInput>& inputs, const std::filesystem::path& output,
                                double total_duration_s) override;

  std::vector<std::string> BuildConvertArgs(const std::filesystem::path& input, const std::filesystem::path& output) const;
  std::vector<std::string> BuildMixArgs(const std::vector<MixInput>& inputs, const std::filesystem::path& output) const;

 private:
  void Run(const std::vector<std::string>& args) const;

  TranscoderOptions options_;
};

} // namespace soundscribe::audio
