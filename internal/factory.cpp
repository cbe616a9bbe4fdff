#include "factory.hpp"

#include <memory>
#include <utility>

#include <google/protobuf/util/time_util.h>

#include "internal/capture/remote_capture.hpp"
#include "internal/grpc/control_server.hpp"
#include "internal/service/control_service.hpp"
#include "internal/service/service_context.hpp"

namespace soundscribe::factory {

using google::protobuf::util::TimeUtil;
using soundscribe::runtime::config::RuntimeConfig;

recording::SessionOptions SessionOptionsFrom(const RuntimeConfig& config) {
  const auto& rec = config.recording();

  recording::SessionOptions options;
  options.output_dir             = rec.output_dir();
  options.artifact_extension     = rec.artifact_extension();
  options.pcm.sample_rate        = rec.pcm().sample_rate();
  options.pcm.channels           = static_cast<uint16_t>(rec.pcm().channels());
  options.pcm.bits_per_sample    = static_cast<uint16_t>(rec.pcm().bits_per_sample());
  return options;
}

audio::TranscoderOptions TranscoderOptionsFrom(const RuntimeConfig& config) {
  const auto& transcoder = config.recording().transcoder();

  audio::TranscoderOptions options;
  options.binary              = transcoder.path();
  options.codec               = transcoder.codec();
  options.bitrate             = transcoder.bitrate();
  options.timeout             = std::chrono::milliseconds(TimeUtil::DurationToMilliseconds(transcoder.timeout()));
  options.apply_start_offsets = transcoder.apply_start_offsets();
  return options;
}

download::DownloadServerOptions DownloadOptionsFrom(const RuntimeConfig& config) {
  const auto& server = config.server();

  download::DownloadServerOptions options;
  options.host            = server.host();
  options.port            = static_cast<uint16_t>(server.port());
  options.threads         = server.threads();
  options.public_base_url = server.public_base_url();
  options.token_ttl       = std::chrono::milliseconds(TimeUtil::DurationToMilliseconds(config.downloads().token_ttl()));
  options.shutdown_grace  = std::chrono::milliseconds(TimeUtil::DurationToMilliseconds(server.shutdown_grace()));
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, util::ClockFn clock) {
  Application app;

  // ------------------------------------------------------------------
  // Recording pipeline
  // ------------------------------------------------------------------
  auto mixer = std::make_shared<audio::FfmpegMixer>(TranscoderOptionsFrom(config));

  app.coordinator = std::make_shared<recording::RecordingCoordinator>(SessionOptionsFrom(config), mixer, clock);
  app.capture     = std::make_shared<capture::RemoteVoiceCapture>();

  // ------------------------------------------------------------------
  // Download server
  // ------------------------------------------------------------------
  app.downloads = std::make_shared<download::DownloadServer>(DownloadOptionsFrom(config), clock);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.coordinator = app.coordinator;
  ctx.downloads   = app.downloads;
  ctx.capture     = app.capture;

  auto control_service = std::make_shared<service::ControlService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ControlServer>(control_service));

  return app;
}

} // namespace soundscribe::factory
