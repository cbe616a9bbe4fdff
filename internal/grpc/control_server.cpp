#include "control_server.hpp"

#include "grpc_error.hpp"

namespace soundscribe::grpc {

using namespace soundscribe::control::v1;

ControlServer::ControlServer(std::shared_ptr<soundscribe::service::ControlService> svc) : service_(std::move(svc)) {
}

::grpc::Status ControlServer::StartRecording(::grpc::ServerContext*, const StartRecordingRequest* req, StartRecordingResponse* resp) {
  try {
    *resp = service_->StartRecording(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::StopRecording(::grpc::ServerContext*, const StopRecordingRequest* req, StopRecordingResponse* resp) {
  try {
    *resp = service_->StopRecording(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::PushAudio(::grpc::ServerContext* ctx, ::grpc::ServerReader<AudioChunk>* reader, PushAudioResponse* resp) {
  try {
    AudioChunk chunk;
    while (reader->Read(&chunk)) {
      if (ctx->IsCancelled()) {
        return {::grpc::StatusCode::CANCELLED, "audio stream cancelled by client"};
      }
      service_->AcceptAudio(chunk, resp);
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::ReportVoiceState(::grpc::ServerContext*, const VoiceStateEvent* req, ReportVoiceStateResponse* resp) {
  try {
    *resp = service_->ReportVoiceState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::GetLatestRecording(::grpc::ServerContext*, const GetLatestRecordingRequest* req,
                                                 GetLatestRecordingResponse* resp) {
  try {
    *resp = service_->GetLatestRecording(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::CreateDownloadLink(::grpc::ServerContext*, const CreateDownloadLinkRequest* req,
                                                 CreateDownloadLinkResponse* resp) {
  try {
    *resp = service_->CreateDownloadLink(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::GetStats(::grpc::ServerContext*, const GetStatsRequest* req, GetStatsResponse* resp) {
  try {
    *resp = service_->GetStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace soundscribe::grpc
