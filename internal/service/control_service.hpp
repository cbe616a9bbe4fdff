#pragma once

#include "api/soundscribe/control/v1.hpp"
#include "service_context.hpp"

namespace soundscribe::service {

/*
  Transport-independent recording control operations.

  Errors propagate as the exception types in util/errors.hpp.
*/
class ControlService {
public:
  explicit ControlService(ServiceContext ctx);

  soundscribe::control::v1::StartRecordingResponse
  StartRecording(const soundscribe::control::v1::StartRecordingRequest& req);

  soundscribe::control::v1::StopRecordingResponse
  StopRecording(const soundscribe::control::v1::StopRecordingRequest& req);

  // Feeds one chunk to the running capture and updates the stream tally.
  void AcceptAudio(const soundscribe::control::v1::AudioChunk& chunk,
                   soundscribe::control::v1::PushAudioResponse* tally);

  soundscribe::control::v1::ReportVoiceStateResponse
  ReportVoiceState(const soundscribe::control::v1::VoiceStateEvent& event);

  soundscribe::control::v1::GetLatestRecordingResponse
  GetLatestRecording(const soundscribe::control::v1::GetLatestRecordingRequest& req);

  soundscribe::control::v1::CreateDownloadLinkResponse
  CreateDownloadLink(const soundscribe::control::v1::CreateDownloadLinkRequest& req);

  soundscribe::control::v1::GetStatsResponse
  GetStats(const soundscribe::control::v1::GetStatsRequest& req);

private:
  ServiceContext ctx_;
};

}
