#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace soundscribe::config {

using google::protobuf::util::TimeUtil;
using soundscribe::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// mutable_*() creates the submessage, so presence must be read first.
static void SetSeconds(google::protobuf::Duration* duration, int64_t seconds) {
  duration->set_seconds(seconds);
  duration->set_nanos(0);
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty document means "all defaults"
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->host().empty()) server->set_host("127.0.0.1");
  if (!server->has_port()) server->set_port(8000);
  if (server->threads() == 0) server->set_threads(2);
  if (!server->has_shutdown_grace()) SetSeconds(server->mutable_shutdown_grace(), 5);

  auto* control = config.mutable_control();
  if (control->bind_address().empty()) control->set_bind_address("127.0.0.1:50061");

  auto* recording = config.mutable_recording();
  if (recording->output_dir().empty()) recording->set_output_dir("recordings");
  if (recording->artifact_extension().empty()) recording->set_artifact_extension("mp3");

  auto* pcm = recording->mutable_pcm();
  if (pcm->sample_rate() == 0) pcm->set_sample_rate(48000);
  if (pcm->channels() == 0) pcm->set_channels(2);
  if (pcm->bits_per_sample() == 0) pcm->set_bits_per_sample(16);

  auto* transcoder = recording->mutable_transcoder();
  if (transcoder->path().empty()) transcoder->set_path("ffmpeg");
  if (transcoder->codec().empty()) transcoder->set_codec("libmp3lame");
  if (transcoder->bitrate().empty()) transcoder->set_bitrate("128k");
  if (!transcoder->has_timeout()) SetSeconds(transcoder->mutable_timeout(), 600);

  auto* downloads = config.mutable_downloads();
  if (!downloads->has_token_ttl()) SetSeconds(downloads->mutable_token_ttl(), 3600);

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.server().port() > 65535) {
    throw std::invalid_argument("server.port must be <= 65535");
  }
  if (config.server().threads() > 64) {
    throw std::invalid_argument("server.threads must be <= 64");
  }
  if (config.recording().output_dir().empty()) {
    throw std::invalid_argument("recording.output_dir must not be empty");
  }
  if (config.recording().artifact_extension().find('/') != std::string::npos) {
    throw std::invalid_argument("recording.artifact_extension must not contain '/'");
  }
  const auto& pcm = config.recording().pcm();
  if (pcm.bits_per_sample() != 8 && pcm.bits_per_sample() != 16 && pcm.bits_per_sample() != 24 && pcm.bits_per_sample() != 32) {
    throw std::invalid_argument("recording.pcm.bits_per_sample must be 8, 16, 24 or 32");
  }
  if (pcm.channels() < 1 || pcm.channels() > 8) {
    throw std::invalid_argument("recording.pcm.channels must be between 1 and 8");
  }
  if (pcm.sample_rate() < 8000 || pcm.sample_rate() > 384000) {
    throw std::invalid_argument("recording.pcm.sample_rate must be between 8000 and 384000");
  }
  if (TimeUtil::DurationToMilliseconds(config.server().shutdown_grace()) < 0) {
    throw std::invalid_argument("server.shutdown_grace must not be negative");
  }
  if (TimeUtil::DurationToMilliseconds(config.recording().transcoder().timeout()) <= 0) {
    throw std::invalid_argument("recording.transcoder.timeout must be at least 1ms");
  }
  if (TimeUtil::DurationToMilliseconds(config.downloads().token_ttl()) <= 0) {
    throw std::invalid_argument("downloads.token_ttl must be at least 1ms");
  }
}

} // namespace soundscribe::config
