#include "control_service.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/capture/remote_capture.hpp"
#include "internal/download/download_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recording/recording_coordinator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace soundscribe::service {

using namespace soundscribe::control::v1;
using soundscribe::observability::StringField;

namespace {

template <typename Fn>
auto Guarded(const char* route, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    SOUNDSCRIBE_LOG_WARN("RPC failed", {StringField("route", route), StringField("error", ex.what())});
    throw;
  }
}

} // namespace

ControlService::ControlService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.coordinator || !ctx_.downloads || !ctx_.capture) {
    throw std::invalid_argument("ControlService: incomplete service context");
  }
}

StartRecordingResponse ControlService::StartRecording(const StartRecordingRequest& req) {
  return Guarded("ControlService.StartRecording", [&] {
    StartRecordingResponse resp;
    resp.set_session_id(ctx_.coordinator->Start(req.guild_id(), ctx_.capture));
    return resp;
  });
}

StopRecordingResponse ControlService::StopRecording(const StopRecordingRequest&) {
  return Guarded("ControlService.StopRecording", [&] {
    StopRecordingResponse resp;
    const auto artifact = ctx_.coordinator->Stop();
    if (!artifact) {
      resp.set_has_artifact(false);
      return resp;
    }

    resp.set_has_artifact(true);
    resp.set_artifact_path(artifact->string());
    try {
      resp.set_download_url(ctx_.downloads->CreateLink(*artifact));
    } catch (const util::FileNotFound& ex) {
      SOUNDSCRIBE_LOG_WARN("Artifact vanished before link creation", {StringField("path", artifact->string()), StringField("error", ex.what())});
    }
    return resp;
  });
}

void ControlService::AcceptAudio(const AudioChunk& chunk, PushAudioResponse* tally) {
  const auto& pcm = chunk.pcm();
  const bool  accepted =
      ctx_.capture->Deliver(chunk.participant_id(), reinterpret_cast<const uint8_t*>(pcm.data()), pcm.size());

  if (accepted) {
    tally->set_accepted_chunks(tally->accepted_chunks() + 1);
    tally->set_accepted_bytes(tally->accepted_bytes() + pcm.size());
  } else {
    tally->set_dropped_chunks(tally->dropped_chunks() + 1);
  }
}

ReportVoiceStateResponse ControlService::ReportVoiceState(const VoiceStateEvent& event) {
  ReportVoiceStateResponse resp;
  resp.set_routed(ctx_.coordinator->RouteVoiceActivity(event.participant_id(), event.joined(), util::Now()));
  return resp;
}

GetLatestRecordingResponse ControlService::GetLatestRecording(const GetLatestRecordingRequest&) {
  return Guarded("ControlService.GetLatestRecording", [&] {
    const auto latest = ctx_.coordinator->LatestArtifact();
    if (!latest) {
      throw util::FileNotFound("No recordings found");
    }

    GetLatestRecordingResponse resp;
    resp.set_artifact_path(latest->string());
    resp.set_download_url(ctx_.downloads->CreateLink(*latest));
    return resp;
  });
}

CreateDownloadLinkResponse ControlService::CreateDownloadLink(const CreateDownloadLinkRequest& req) {
  return Guarded("ControlService.CreateDownloadLink", [&] {
    if (req.path().empty()) {
      throw std::invalid_argument("path is required");
    }

    CreateDownloadLinkResponse resp;
    resp.set_download_url(ctx_.downloads->CreateLink(req.path()));
    return resp;
  });
}

GetStatsResponse ControlService::GetStats(const GetStatsRequest&) {
  GetStatsResponse resp;
  resp.set_recording(ctx_.coordinator->IsRecording());
  if (const auto id = ctx_.coordinator->ActiveSessionId()) {
    resp.set_active_session_id(*id);
  }
  resp.set_active_tokens(ctx_.downloads->Health().active_tokens);
  resp.set_delivered_chunks(ctx_.capture->DeliveredChunks());
  return resp;
}

} // namespace soundscribe::service
