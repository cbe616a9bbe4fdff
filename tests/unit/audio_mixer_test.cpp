#include "internal/audio/audio_mixer.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using soundscribe::audio::FfmpegMixer;
using soundscribe::audio::MixInput;
using soundscribe::audio::TranscoderOptions;

std::filesystem::path TestDir() {
  const auto dir = std::filesystem::temp_directory_path() / "soundscribe_audio_mixer_tests";
  std::filesystem::create_directories(dir);
  return dir;
}

std::filesystem::path WriteScript(const std::string& name, const std::string& body) {
  const auto    path = TestDir() / name;
  std::ofstream out(path);
  out << "#!/bin/sh\n" << body;
  out.close();
  std::filesystem::permissions(path, std::filesystem::perms::owner_all, std::filesystem::perm_options::add);
  return path;
}

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void TestConvertArgs() {
  FfmpegMixer mixer(TranscoderOptions{});
  const auto  args = mixer.BuildConvertArgs("/tmp/a.wav", "/tmp/out.mp3");

  const std::vector<std::string> expected{"ffmpeg", "-y", "-i", "/tmp/a.wav", "-acodec", "libmp3lame", "-ab", "128k", "/tmp/out.mp3"};
  assert(args == expected);
}

void TestMixArgsWithoutOffsets() {
  FfmpegMixer mixer(TranscoderOptions{});
  const auto  args = mixer.BuildMixArgs({{"/tmp/a.wav", 1.0}, {"/tmp/b.wav", 2.0}}, "/tmp/out.mp3");

  const std::vector<std::string> expected{"ffmpeg",      "-y",         "-i",  "/tmp/a.wav",
                                          "-i",          "/tmp/b.wav", "-filter_complex",
                                          "amix=inputs=2:duration=longest:dropout_transition=2",
                                          "-acodec",     "libmp3lame", "-ab", "128k",
                                          "/tmp/out.mp3"};
  assert(args == expected);
}

void TestMixArgsWithOffsets() {
  TranscoderOptions options;
  options.apply_start_offsets = true;
  options.codec               = "libopus";
  options.bitrate             = "64k";

  FfmpegMixer mixer(options);
  const auto  args = mixer.BuildMixArgs({{"/tmp/a.wav", 0.0}, {"/tmp/b.wav", 1.5}, {"/tmp/c.wav", 2.25}}, "/tmp/out.ogg");

  assert(args[8] == "-filter_complex");
  assert(args[9] ==
         "[0:a]adelay=delays=0:all=1[d0];[1:a]adelay=delays=1500:all=1[d1];[2:a]adelay=delays=2250:all=1[d2];"
         "[d0][d1][d2]amix=inputs=3:duration=longest:dropout_transition=2");
  assert(args[11] == "libopus");
  assert(args[13] == "64k");
  assert(args.back() == "/tmp/out.ogg");
}

void TestFakeTranscoderProducesOutput() {
  const auto args_file = TestDir() / "recorded_args.txt";
  const auto script    = WriteScript("fake_ffmpeg.sh", "printf '%s\\n' \"$@\" > '" + args_file.string() +
                                                           "'\nfor last; do :; done\nprintf 'mixed' > \"$last\"\n");

  TranscoderOptions options;
  options.binary = script.string();
  FfmpegMixer mixer(options);

  const auto output = TestDir() / "mixed.mp3";
  std::filesystem::remove(output);

  const auto produced = mixer.MixMany({{TestDir() / "a.wav", 0.0}, {TestDir() / "b.wav", 0.0}}, output, 5.0);
  assert(produced == output);
  assert(ReadAll(output) == "mixed");

  const auto recorded = ReadAll(args_file);
  assert(recorded.find("amix=inputs=2:duration=longest:dropout_transition=2") != std::string::npos);

  const auto single = TestDir() / "single.mp3";
  assert(mixer.ConvertSingle(TestDir() / "a.wav", single) == single);
  assert(ReadAll(single) == "mixed");
}

void TestNonZeroExitRaisesTranscodeFailure() {
  const auto script = WriteScript("failing_ffmpeg.sh", "echo 'Unknown encoder libmp3lame' >&2\nexit 3\n");

  TranscoderOptions options;
  options.binary = script.string();
  FfmpegMixer mixer(options);

  bool threw = false;
  try {
    (void)mixer.ConvertSingle(TestDir() / "a.wav", TestDir() / "never.mp3");
  } catch (const soundscribe::util::TranscodeFailure& e) {
    threw = true;
    assert(e.ExitCode() == 3);
    assert(e.StderrExcerpt().find("Unknown encoder") != std::string::npos);
  }
  assert(threw);
}

void TestTimeoutRaisesTranscodeFailure() {
  const auto script = WriteScript("slow_ffmpeg.sh", "sleep 30\n");

  TranscoderOptions options;
  options.binary  = script.string();
  options.timeout = std::chrono::milliseconds(300);
  FfmpegMixer mixer(options);

  bool threw = false;
  try {
    (void)mixer.MixMany({{TestDir() / "a.wav", 0.0}}, TestDir() / "slow.mp3", 1.0);
  } catch (const soundscribe::util::TranscodeFailure& e) {
    threw = true;
    assert(std::string(e.what()).find("timed out") != std::string::npos);
  }
  assert(threw);
}

void TestMissingBinaryRaisesTranscodeFailure() {
  TranscoderOptions options;
  options.binary = "/nonexistent/ffmpeg";
  FfmpegMixer mixer(options);

  bool threw = false;
  try {
    (void)mixer.ConvertSingle(TestDir() / "a.wav", TestDir() / "missing.mp3");
  } catch (const soundscribe::util::TranscodeFailure& e) {
    threw = true;
    assert(e.ExitCode() == 127);
  }
  assert(threw);
}

void TestMixManyRejectsEmptyInput() {
  FfmpegMixer mixer(TranscoderOptions{});

  bool threw = false;
  try {
    (void)mixer.MixMany({}, TestDir() / "empty.mp3", 0.0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestConvertArgs();
  TestMixArgsWithoutOffsets();
  TestMixArgsWithOffsets();
  TestFakeTranscoderProducesOutput();
  TestNonZeroExitRaisesTranscodeFailure();
  TestTimeoutRaisesTranscodeFailure();
  TestMissingBinaryRaisesTranscodeFailure();
  TestMixManyRejectsEmptyInput();

  std::cout << "soundscribe_unit_audio_mixer: pass\n";
  return 0;
}
