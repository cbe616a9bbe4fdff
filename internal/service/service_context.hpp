#pragma once

#include <memory>

namespace soundscribe::recording { class RecordingCoordinator; }
namespace soundscribe::download { class DownloadServer; }
namespace soundscribe::capture { class RemoteVoiceCapture; }

namespace soundscribe::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<soundscribe::recording::RecordingCoordinator> coordinator;
  std::shared_ptr<soundscribe::download::DownloadServer> downloads;
  std::shared_ptr<soundscribe::capture::RemoteVoiceCapture> capture;
};

}
