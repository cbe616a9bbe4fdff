#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "api/soundscribe/control/v1.hpp"

using namespace soundscribe::control::v1;

// 20 ms of 48 kHz stereo s16le, the gateway's frame size.
static constexpr std::size_t kDefaultChunkBytes = 3840;

static void Usage() {
  std::cout << "Usage:\n"
            << "  soundscribectl <addr> start <guild_id>\n"
            << "  soundscribectl <addr> stop\n"
            << "  soundscribectl <addr> push <participant_id> <pcm_file> [chunk_bytes]\n"
            << "  soundscribectl <addr> voice <participant_id> join|leave\n"
            << "  soundscribectl <addr> latest\n"
            << "  soundscribectl <addr> link <path>\n"
            << "  soundscribectl <addr> stats\n";
}

static uint64_t ParseId(const char* value, const char* what) {
  try {
    std::size_t consumed = 0;
    const auto  parsed   = std::stoull(value, &consumed);
    if (consumed == std::string(value).size()) return parsed;
  } catch (const std::exception&) {
  }
  std::cerr << "invalid " << what << ": '" << value << "'\n";
  std::exit(1);
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = RecordingControlService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "start") {
    if (argc < 4) return 1;

    StartRecordingRequest req;
    req.set_guild_id(ParseId(argv[3], "guild id"));

    StartRecordingResponse resp;

    auto status = stub->StartRecording(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "session_id=" << resp.session_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stop") {
    StopRecordingRequest  req;
    StopRecordingResponse resp;

    auto status = stub->StopRecording(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    if (!resp.has_artifact()) {
      std::cout << "no audio recorded\n";
      return 0;
    }
    std::cout << "artifact=" << resp.artifact_path() << "\n";
    if (!resp.download_url().empty()) {
      std::cout << "download_url=" << resp.download_url() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "push") {
    if (argc < 5) return 1;

    const auto  participant = ParseId(argv[3], "participant id");
    std::size_t chunk_bytes = kDefaultChunkBytes;
    if (argc >= 6) {
      chunk_bytes = static_cast<std::size_t>(ParseId(argv[5], "chunk size"));
      if (chunk_bytes == 0) {
        std::cerr << "chunk size must be positive\n";
        return 1;
      }
    }

    std::ifstream in(argv[4], std::ios::binary);
    if (!in) {
      std::cerr << "cannot open " << argv[4] << "\n";
      return 1;
    }

    PushAudioResponse resp;
    auto              writer = stub->PushAudio(&ctx, &resp);

    std::vector<char> buffer(chunk_bytes);
    while (in) {
      in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      const auto got = in.gcount();
      if (got <= 0) break;

      AudioChunk chunk;
      chunk.set_participant_id(participant);
      chunk.set_pcm(buffer.data(), static_cast<std::size_t>(got));
      if (!writer->Write(chunk)) break;
    }
    writer->WritesDone();

    auto status = writer->Finish();

    if (!status.ok()) return Fail(status);

    std::cout << "accepted_chunks=" << resp.accepted_chunks() << " dropped_chunks=" << resp.dropped_chunks()
              << " accepted_bytes=" << resp.accepted_bytes() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "voice") {
    if (argc < 5) return 1;

    const std::string action = argv[4];
    if (action != "join" && action != "leave") {
      std::cerr << "unsupported voice action: " << action << "\n";
      return 1;
    }

    VoiceStateEvent req;
    req.set_participant_id(ParseId(argv[3], "participant id"));
    req.set_joined(action == "join");

    ReportVoiceStateResponse resp;

    auto status = stub->ReportVoiceState(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << (resp.routed() ? "routed\n" : "ignored (not recording)\n");
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "latest") {
    GetLatestRecordingRequest  req;
    GetLatestRecordingResponse resp;

    auto status = stub->GetLatestRecording(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "artifact=" << resp.artifact_path() << "\n"
              << "download_url=" << resp.download_url() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "link") {
    if (argc < 4) return 1;

    CreateDownloadLinkRequest req;
    req.set_path(argv[3]);

    CreateDownloadLinkResponse resp;

    auto status = stub->CreateDownloadLink(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << resp.download_url() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    GetStatsRequest  req;
    GetStatsResponse resp;

    auto status = stub->GetStats(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "recording=" << (resp.recording() ? "true" : "false") << "\n";
    if (!resp.active_session_id().empty()) {
      std::cout << "active_session_id=" << resp.active_session_id() << "\n";
    }
    std::cout << "active_tokens=" << resp.active_tokens() << "\n";
    std::cout << "delivered_chunks=" << resp.delivered_chunks() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
