#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/audio/audio_mixer.hpp"
#include "internal/download/download_server.hpp"
#include "internal/recording/recording_coordinator.hpp"
#include "internal/util/time.hpp"

namespace soundscribe::capture { class RemoteVoiceCapture; }

namespace soundscribe::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<recording::RecordingCoordinator> coordinator;
  std::shared_ptr<download::DownloadServer>        downloads;
  std::shared_ptr<capture::RemoteVoiceCapture>     capture;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

recording::SessionOptions         SessionOptionsFrom(const soundscribe::runtime::config::RuntimeConfig& config);
audio::TranscoderOptions          TranscoderOptionsFrom(const soundscribe::runtime::config::RuntimeConfig& config);
download::DownloadServerOptions   DownloadOptionsFrom(const soundscribe::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend from runtime config. This is the
  composition root: the only place that knows the concrete mixer and
  capture types. Servers are built but not started.
*/
Application Build(const soundscribe::runtime::config::RuntimeConfig& config, util::ClockFn clock = util::SystemClock());

} // namespace soundscribe::factory
