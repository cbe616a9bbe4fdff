#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "soundscribe_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestEmptyDocumentYieldsDefaults() {
  const auto yaml_path = WriteYaml("empty", "");

  auto config = soundscribe::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().host() == "127.0.0.1");
  assert(config.server().port() == 8000);
  assert(config.server().threads() == 2);
  assert(config.server().shutdown_grace().seconds() == 5);
  assert(config.control().bind_address() == "127.0.0.1:50061");
  assert(config.recording().output_dir() == "recordings");
  assert(config.recording().artifact_extension() == "mp3");
  assert(config.recording().pcm().sample_rate() == 48000);
  assert(config.recording().pcm().channels() == 2);
  assert(config.recording().pcm().bits_per_sample() == 16);
  assert(config.recording().transcoder().path() == "ffmpeg");
  assert(config.recording().transcoder().codec() == "libmp3lame");
  assert(config.recording().transcoder().bitrate() == "128k");
  assert(config.recording().transcoder().timeout().seconds() == 600);
  assert(!config.recording().transcoder().apply_start_offsets());
  assert(config.downloads().token_ttl().seconds() == 3600);
  assert(config.logging().level() == "info");
}

void TestExplicitValuesOverrideDefaults() {
  const auto yaml_path = WriteYaml("explicit",
                                   R"(server:
  host: 0.0.0.0
  port: 0
  threads: 4
  public_base_url: "https://files.example.org/"
  shutdown_grace: 2s
control:
  bind_address: "unix:///tmp/soundscribe.sock"
recording:
  output_dir: /var/lib/soundscribe
  artifact_extension: ogg
  transcoder:
    path: /usr/local/bin/ffmpeg
    codec: libopus
    bitrate: 64k
    timeout: 30s
    apply_start_offsets: true
downloads:
  token_ttl: 60s
logging:
  level: debug
  file: soundscribe.log
)");

  auto config = soundscribe::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().host() == "0.0.0.0");
  assert(config.server().has_port() && config.server().port() == 0);
  assert(config.server().threads() == 4);
  assert(config.server().public_base_url() == "https://files.example.org/");
  assert(config.server().shutdown_grace().seconds() == 2);
  assert(config.control().bind_address() == "unix:///tmp/soundscribe.sock");
  assert(config.recording().output_dir() == "/var/lib/soundscribe");
  assert(config.recording().artifact_extension() == "ogg");
  assert(config.recording().transcoder().codec() == "libopus");
  assert(config.recording().transcoder().timeout().seconds() == 30);
  assert(config.recording().transcoder().apply_start_offsets());
  assert(config.downloads().token_ttl().seconds() == 60);
  assert(config.logging().level() == "debug");
  assert(config.logging().file() == "soundscribe.log");
}

void TestPartialSectionsStillGetDurationDefaults() {
  auto only_ttl = soundscribe::config::ConfigLoader::LoadFromYaml(WriteYaml("only_ttl", "downloads:\n  token_ttl: 60s\n").string());
  assert(only_ttl.downloads().token_ttl().seconds() == 60);
  assert(only_ttl.recording().transcoder().timeout().seconds() == 600);
  assert(only_ttl.server().shutdown_grace().seconds() == 5);

  auto only_timeout =
      soundscribe::config::ConfigLoader::LoadFromYaml(WriteYaml("only_timeout", "recording:\n  transcoder:\n    timeout: 30s\n").string());
  assert(only_timeout.recording().transcoder().timeout().seconds() == 30);
  assert(only_timeout.downloads().token_ttl().seconds() == 3600);

  auto only_host = soundscribe::config::ConfigLoader::LoadFromYaml(WriteYaml("only_host", "server:\n  host: 0.0.0.0\n").string());
  assert(only_host.server().shutdown_grace().seconds() == 5);
  assert(only_host.server().shutdown_grace().nanos() == 0);
}

void TestFractionalDurationsAreAccepted() {
  auto config = soundscribe::config::ConfigLoader::LoadFromYaml(WriteYaml("fractional",
                                                                          R"(server:
  shutdown_grace: 0s
recording:
  transcoder:
    timeout: 0.5s
downloads:
  token_ttl: 1.5s
)")
                                                                    .string());
  assert(config.server().shutdown_grace().seconds() == 0);
  assert(config.recording().transcoder().timeout().seconds() == 0);
  assert(config.recording().transcoder().timeout().nanos() == 500000000);
  assert(config.downloads().token_ttl().seconds() == 1);
  assert(config.downloads().token_ttl().nanos() == 500000000);
}

void TestQuotedNumbersStayStrings() {
  const auto yaml_path = WriteYaml("quoted_number",
                                   R"(recording:
  artifact_extension: "3"
  transcoder:
    bitrate: "128"
)");

  auto config = soundscribe::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.recording().artifact_extension() == "3");
  assert(config.recording().transcoder().bitrate() == "128");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  port: 8000
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)soundscribe::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestValidationRejectsBadValues() {
  const auto expect_invalid = [](const std::string& name, const std::string& yaml) {
    const auto yaml_path = WriteYaml(name, yaml);
    bool       threw     = false;
    try {
      (void)soundscribe::config::ConfigLoader::LoadFromYaml(yaml_path.string());
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  };

  expect_invalid("port_too_large", "server:\n  port: 70000\n");
  expect_invalid("zero_ttl", "downloads:\n  token_ttl: 0s\n");
  expect_invalid("negative_timeout", "recording:\n  transcoder:\n    timeout: -5s\n");
  expect_invalid("odd_bit_depth", "recording:\n  pcm:\n    bits_per_sample: 12\n");
  expect_invalid("slash_extension", "recording:\n  artifact_extension: a/b\n");
  expect_invalid("too_many_channels", "recording:\n  pcm:\n    channels: 70000\n");
  expect_invalid("rate_too_high", "recording:\n  pcm:\n    sample_rate: 4000000000\n");
  expect_invalid("rate_too_low", "recording:\n  pcm:\n    sample_rate: 100\n");
  expect_invalid("negative_grace", "server:\n  shutdown_grace: -1s\n");
  expect_invalid("sub_ms_ttl", "downloads:\n  token_ttl: 0.0001s\n");
}

void TestMissingFileFails() {
  bool threw = false;
  try {
    (void)soundscribe::config::ConfigLoader::LoadFromYaml("/nonexistent/soundscribe.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyDocumentYieldsDefaults();
  TestExplicitValuesOverrideDefaults();
  TestPartialSectionsStillGetDurationDefaults();
  TestFractionalDurationsAreAccepted();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestValidationRejectsBadValues();
  TestMissingFileFails();

  std::cout << "soundscribe_unit_config_loader: pass\n";
  return 0;
}
