#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "api/soundscribe/control/v1.hpp"
#include "internal/service/control_service.hpp"

namespace soundscribe::grpc {

class ControlServer final : public soundscribe::control::v1::RecordingControlService::Service {
public:
  explicit ControlServer(std::shared_ptr<soundscribe::service::ControlService> svc);

  ::grpc::Status StartRecording(::grpc::ServerContext*,
                                const soundscribe::control::v1::StartRecordingRequest*,
                                soundscribe::control::v1::StartRecordingResponse*) override;

  ::grpc::Status StopRecording(::grpc::ServerContext*,
                               const soundscribe::control::v1::StopRecordingRequest*,
                               soundscribe::control::v1::StopRecordingResponse*) override;

  ::grpc::Status PushAudio(::grpc::ServerContext*,
                           ::grpc::ServerReader<soundscribe::control::v1::AudioChunk>*,
                           soundscribe::control::v1::PushAudioResponse*) override;

  ::grpc::Status ReportVoiceState(::grpc::ServerContext*,
                                  const soundscribe::control::v1::VoiceStateEvent*,
                                  soundscribe::control::v1::ReportVoiceStateResponse*) override;

  ::grpc::Status GetLatestRecording(::grpc::ServerContext*,
                                    const soundscribe::control::v1::GetLatestRecordingRequest*,
                                    soundscribe::control::v1::GetLatestRecordingResponse*) override;

  ::grpc::Status CreateDownloadLink(::grpc::ServerContext*,
                                    const soundscribe::control::v1::CreateDownloadLinkRequest*,
                                    soundscribe::control::v1::CreateDownloadLinkResponse*) override;

  ::grpc::Status GetStats(::grpc::ServerContext*,
                          const soundscribe::control::v1::GetStatsRequest*,
                          soundscribe::control::v1::GetStatsResponse*) override;

private:
  std::shared_ptr<soundscribe::service::ControlService> service_;
};

}
