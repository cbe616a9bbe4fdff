#include "audio_mixer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "internal/audio/process_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace soundscribe::audio {

namespace {

constexpr std::size_t kStderrExcerptBytes = 2000;

std::string Tail(const std::string& text, std::size_t max) {
  if (text.size() <= max) return text;
  return text.substr(text.size() - max);
}

std::string JoinArgs(const std::vector<std::string>& args) {
  std::ostringstream out;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i) out << ' ';
    out << args[i];
  }
  return out.str();
}

} // namespace

FfmpegMixer::FfmpegMixer(TranscoderOptions options) : options_(std::move(options)) {
}

std::vector<std::string> FfmpegMixer::BuildConvertArgs(const std::filesystem::path& input, const std::filesystem::path& output) const {
  return {options_.binary, "-y", "-i", input.string(), "-acodec", options_.codec, "-ab", options_.bitrate, output.string()};
}

std::vector<std::string> FfmpegMixer::BuildMixArgs(const std::vector<MixInput>& inputs, const std::filesystem::path& output) const {
  std::vector<std::string> args{options_.binary, "-y"};
  for (const auto& input : inputs) {
    args.push_back("-i");
    args.push_back(input.path.string());
  }

  const auto         count = inputs.size();
  std::ostringstream graph;
  if (options_.apply_start_offsets) {
    for (std::size_t i = 0; i < count; ++i) {
      const auto delay_ms = static_cast<long long>(std::llround(std::max(0.0, inputs[i].start_offset_s) * 1000.0));
      graph << '[' << i << ":a]adelay=delays=" << delay_ms << ":all=1[d" << i << "];";
    }
    for (std::size_t i = 0; i < count; ++i) graph << "[d" << i << ']';
  }
  graph << "amix=inputs=" << count << ":duration=longest:dropout_transition=2";

  args.insert(args.end(), {"-filter_complex", graph.str(), "-acodec", options_.codec, "-ab", options_.bitrate, output.string()});
  return args;
}

std::filesystem::path FfmpegMixer::ConvertSingle(const std::filesystem::path& input, const std::filesystem::path& output) {
  Run(BuildConvertArgs(input, output));
  SOUNDSCRIBE_LOG_INFO("Converted single file",
                       {observability::StringField("input", input.string()), observability::StringField("output", output.string())});
  return output;
}

std::filesystem::path FfmpegMixer::MixMany(const std::vector<MixInput>& inputs, const std::filesystem::path& output,
                                           double total_duration_s) {
  if (inputs.empty()) {
    throw std::invalid_argument("no audio files to mix");
  }

  Run(BuildMixArgs(inputs, output));
  SOUNDSCRIBE_LOG_INFO("Mixed audio files", {observability::IntField("inputs", static_cast<int64_t>(inputs.size())),
                                             observability::DoubleField("duration_s", total_duration_s),
                                             observability::StringField("output", output.string())});
  return output;
}

void FfmpegMixer::Run(const std::vector<std::string>& args) const {
  SOUNDSCRIBE_LOG_DEBUG("Running transcoder", {observability::StringField("cmd", JoinArgs(args))});

  const auto result = RunProcess(args, options_.timeout);
  if (result.timed_out) {
    std::ostringstream reason;
    reason << "timed out after " << options_.timeout.count() << "ms; " << Tail(result.stderr_data, kStderrExcerptBytes);
    SOUNDSCRIBE_LOG_ERROR("Transcoder timed out", {observability::StringField("binary", options_.binary)});
    throw util::TranscodeFailure(result.exit_code, reason.str());
  }
  if (result.exit_code != 0) {
    SOUNDSCRIBE_LOG_ERROR("Transcoder failed", {observability::StringField("binary", options_.binary),
                                                observability::IntField("exit_code", result.exit_code)});
    throw util::TranscodeFailure(result.exit_code, Tail(result.stderr_data, kStderrExcerptBytes));
  }

  SOUNDSCRIBE_LOG_DEBUG("Transcoder completed");
}

} // namespace soundscribe::audio
