#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/audio/audio_mixer.hpp"
#include "internal/capture/voice_capture.hpp"
#include "internal/recording/finalize_queue.hpp"
#include "internal/recording/finalize_worker.hpp"
#include "internal/recording/recording_session.hpp"
#include "internal/util/time.hpp"

namespace soundscribe::recording {

/*
  Owner of the process-wide recording slot.

  At most one session is ACTIVE or FINALIZING at any time, across all
  guilds. A second Start while the slot is taken fails with
  util::AlreadyRecording; a failed Start leaves the slot empty.
*/
class RecordingCoordinator {
 public:
  RecordingCoordinator(SessionOptions options, std::shared_ptr<audio::AudioMixer> mixer, util::ClockFn clock = util::SystemClock());
  ~RecordingCoordinator();

  RecordingCoordinator(const RecordingCoordinator&)            = delete;
  RecordingCoordinator& operator=(const RecordingCoordinator&) = delete;

  // Returns the new session id.
  std::string Start(uint64_t guild_id, std::shared_ptr<capture::VoiceCapture> capture);

  // Blocks until the session is COMPLETE. Throws util::NotRecording.
  ArtifactResult Stop();

  // Presence changes while recording; diagnostic only. False when idle.
  bool RouteVoiceActivity(audio::ParticipantId participant, bool joined, util::TimePoint at);

  // Newest artifact in the output directory by modification time.
  std::optional<std::filesystem::path> LatestArtifact() const;

  bool                       IsRecording() const;
  std::optional<std::string> ActiveSessionId() const;

  // Stops any running session and the finalize worker. Idempotent.
  void Shutdown();

 private:
  class SessionSink;

  struct Slot {
    std::shared_ptr<RecordingSession>       session;
    std::shared_ptr<capture::VoiceCapture>  capture;
    std::shared_ptr<SessionSink>            sink;
    bool                                    starting = false;
  };

  static bool Occupied(const Slot& slot);

  void OnCaptureStopped(const std::shared_ptr<RecordingSession>& session);
  void Release(const std::shared_ptr<RecordingSession>& session);

  const SessionOptions               options_;
  std::shared_ptr<audio::AudioMixer> mixer_;
  util::ClockFn                      clock_;

  mutable std::mutex mutex_;
  Slot               slot_;

  std::shared_ptr<FinalizeQueue>  queue_;
  std::unique_ptr<FinalizeWorker> worker_;
};

} // namespace soundscribe::recording
