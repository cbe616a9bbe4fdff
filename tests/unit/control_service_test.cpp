#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "api/soundscribe/control/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/download/download_server.hpp"
#include "internal/factory.hpp"
#include "internal/recording/recording_coordinator.hpp"
#include "internal/runtime/server.hpp"

namespace {

using namespace soundscribe::control::v1;

std::filesystem::path TestDir() {
  const auto dir = std::filesystem::temp_directory_path() / "soundscribe_control_service_tests";
  std::filesystem::create_directories(dir);
  return dir;
}

// Stands in for ffmpeg: writes the inputs it was given into the output file.
std::filesystem::path WriteFakeTranscoder() {
  const auto    path = TestDir() / "fake_ffmpeg.sh";
  std::ofstream out(path);
  out << "#!/bin/sh\n"
      << "for last; do :; done\n"
      << "printf '%s\\n' \"$@\" > \"$last\"\n";
  out.close();
  std::filesystem::permissions(path, std::filesystem::perms::owner_all, std::filesystem::perm_options::add);
  return path;
}

soundscribe::runtime::config::RuntimeConfig TestConfig() {
  soundscribe::runtime::config::RuntimeConfig config;
  config.mutable_server()->set_port(0);
  config.mutable_control()->set_bind_address("127.0.0.1:0");

  const auto recordings = TestDir() / "recordings";
  std::filesystem::remove_all(recordings);
  config.mutable_recording()->set_output_dir(recordings.string());
  config.mutable_recording()->mutable_transcoder()->set_path(WriteFakeTranscoder().string());

  soundscribe::config::ConfigLoader::ApplyDefaults(config);
  soundscribe::config::ConfigLoader::Validate(config);
  return config;
}

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

PushAudioResponse PushFrames(RecordingControlService::Stub& stub, uint64_t participant, int frames) {
  ::grpc::ClientContext ctx;
  PushAudioResponse     resp;
  auto                  writer = stub.PushAudio(&ctx, &resp);

  for (int i = 0; i < frames; ++i) {
    AudioChunk chunk;
    chunk.set_participant_id(participant);
    chunk.set_pcm(std::string(3840, static_cast<char>(i)));
    assert(writer->Write(chunk));
  }
  writer->WritesDone();
  assert(writer->Finish().ok());
  return resp;
}

void TestRecordingRoundTripOverLoopback() {
  const auto config = TestConfig();
  auto       app    = soundscribe::factory::Build(config);

  soundscribe::runtime::Server server(config.control().bind_address(), std::move(app.grpc_services));
  app.downloads->Start();
  server.Start();
  assert(server.Port() != 0);

  auto channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server.Port()), ::grpc::InsecureChannelCredentials());
  auto stub    = RecordingControlService::NewStub(channel);

  // Nothing recorded yet.
  {
    ::grpc::ClientContext      ctx;
    GetLatestRecordingResponse resp;
    assert(stub->GetLatestRecording(&ctx, GetLatestRecordingRequest{}, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }

  // Audio without a session is dropped.
  {
    const auto resp = PushFrames(*stub, 1, 2);
    assert(resp.accepted_chunks() == 0);
    assert(resp.dropped_chunks() == 2);
  }

  std::string session_id;
  {
    ::grpc::ClientContext  ctx;
    StartRecordingRequest  req;
    StartRecordingResponse resp;
    req.set_guild_id(42);
    assert(stub->StartRecording(&ctx, req, &resp).ok());
    session_id = resp.session_id();
    assert(session_id.rfind("recording_42_", 0) == 0);
  }

  {
    ::grpc::ClientContext    ctx;
    VoiceStateEvent          req;
    ReportVoiceStateResponse resp;
    req.set_participant_id(1);
    req.set_joined(true);
    assert(stub->ReportVoiceState(&ctx, req, &resp).ok());
    assert(resp.routed());
  }

  {
    const auto a = PushFrames(*stub, 1, 3);
    assert(a.accepted_chunks() == 3);
    assert(a.accepted_bytes() == 3 * 3840);
    const auto b = PushFrames(*stub, 2, 1);
    assert(b.accepted_chunks() == 1);
  }

  {
    ::grpc::ClientContext ctx;
    GetStatsResponse      resp;
    assert(stub->GetStats(&ctx, GetStatsRequest{}, &resp).ok());
    assert(resp.recording());
    assert(resp.active_session_id() == session_id);
    assert(resp.delivered_chunks() == 4);
  }

  std::string artifact_path;
  {
    ::grpc::ClientContext ctx;
    StopRecordingResponse resp;
    assert(stub->StopRecording(&ctx, StopRecordingRequest{}, &resp).ok());
    assert(resp.has_artifact());
    artifact_path = resp.artifact_path();
    assert(std::filesystem::path(artifact_path).filename() == session_id + ".mp3");
    assert(resp.download_url().rfind(app.downloads->BaseUrl() + "/download/", 0) == 0);

    // The fake transcoder wrote its argv: a two-input amix run.
    const auto argv = ReadAll(artifact_path);
    assert(argv.find("amix=inputs=2:duration=longest:dropout_transition=2") != std::string::npos);
    assert(argv.find(session_id + "_user_1.wav") != std::string::npos);
    assert(argv.find(session_id + "_user_2.wav") != std::string::npos);

    const auto token = resp.download_url().substr(resp.download_url().rfind('/') + 1);
    const auto redeemed = app.downloads->Redeem(token);
    assert(redeemed.ok());
    assert(std::filesystem::equivalent(redeemed.path, artifact_path));
  }

  // Temp files are gone once the artifact exists.
  assert(!std::filesystem::exists(std::filesystem::path(config.recording().output_dir()) / (session_id + "_user_1.wav")));

  {
    ::grpc::ClientContext      ctx;
    GetLatestRecordingResponse resp;
    assert(stub->GetLatestRecording(&ctx, GetLatestRecordingRequest{}, &resp).ok());
    assert(std::filesystem::equivalent(resp.artifact_path(), artifact_path));
    assert(!resp.download_url().empty());
  }

  {
    ::grpc::ClientContext ctx;
    GetStatsResponse      resp;
    assert(stub->GetStats(&ctx, GetStatsRequest{}, &resp).ok());
    assert(!resp.recording());
    assert(resp.active_session_id().empty());
    assert(resp.active_tokens() == 2);
  }

  {
    ::grpc::ClientContext ctx;
    StopRecordingResponse resp;
    assert(stub->StopRecording(&ctx, StopRecordingRequest{}, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  }

  {
    ::grpc::ClientContext    ctx;
    VoiceStateEvent          req;
    ReportVoiceStateResponse resp;
    req.set_participant_id(1);
    assert(stub->ReportVoiceState(&ctx, req, &resp).ok());
    assert(!resp.routed());
  }

  app.coordinator->Shutdown();
  server.Stop();
  app.downloads->Stop();
}

void TestSilentSessionHasNoArtifact() {
  const auto config = TestConfig();
  auto       app    = soundscribe::factory::Build(config);

  soundscribe::runtime::Server server(config.control().bind_address(), std::move(app.grpc_services));
  server.Start();

  auto channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(server.Port()), ::grpc::InsecureChannelCredentials());
  auto stub    = RecordingControlService::NewStub(channel);

  {
    ::grpc::ClientContext  ctx;
    StartRecordingRequest  req;
    StartRecordingResponse resp;
    req.set_guild_id(7);
    assert(stub->StartRecording(&ctx, req, &resp).ok());
  }
  {
    ::grpc::ClientContext ctx;
    StopRecordingResponse resp;
    assert(stub->StopRecording(&ctx, StopRecordingRequest{}, &resp).ok());
    assert(!resp.has_artifact());
    assert(resp.download_url().empty());
  }

  app.coordinator->Shutdown();
  server.Stop();
}

void TestOptionsFromConfig() {
  auto config = TestConfig();
  config.mutable_server()->set_public_base_url("https://rec.example.org");
  config.mutable_recording()->mutable_transcoder()->set_apply_start_offsets(true);

  const auto session = soundscribe::factory::SessionOptionsFrom(config);
  assert(session.artifact_extension == "mp3");
  assert(session.pcm.sample_rate == 48000);
  assert(session.pcm.channels == 2);

  const auto transcoder = soundscribe::factory::TranscoderOptionsFrom(config);
  assert(transcoder.codec == "libmp3lame");
  assert(transcoder.bitrate == "128k");
  assert(transcoder.timeout == std::chrono::minutes(10));
  assert(transcoder.apply_start_offsets);

  const auto downloads = soundscribe::factory::DownloadOptionsFrom(config);
  assert(downloads.port == 0);
  assert(downloads.token_ttl == std::chrono::hours(1));
  assert(downloads.shutdown_grace == std::chrono::seconds(5));
  assert(downloads.public_base_url == "https://rec.example.org");

  config.mutable_downloads()->mutable_token_ttl()->set_seconds(0);
  config.mutable_downloads()->mutable_token_ttl()->set_nanos(500000000);
  assert(soundscribe::factory::DownloadOptionsFrom(config).token_ttl == std::chrono::milliseconds(500));
}

} // namespace

int main() {
  TestRecordingRoundTripOverLoopback();
  TestSilentSessionHasNoArtifact();
  TestOptionsFromConfig();

  std::cout << "soundscribe_unit_control_service: pass\n";
  return 0;
}
