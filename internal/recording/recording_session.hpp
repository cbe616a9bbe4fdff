#pragma once

#include <cstdint>
#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <string>

#include "internal/audio/audio_mixer.hpp"
#include "internal/audio/participant_buffer.hpp"
#include "internal/audio/wav_file.hpp"
#include "internal/recording/session_state.hpp"
#include "internal/util/time.hpp"

namespace soundscribe::recording {

struct SessionOptions {
  std::filesystem::path output_dir         = "recordings";
  std::string           artifact_extension = "mp3";
  audio::PcmFormat      pcm;
};

using ArtifactResult = std::optional<std::filesystem::path>;

/*
  One recording episode.

  ACTIVE      accepts audio
  FINALIZING  capture stopped, audio rejected, waiting for Finalize
  COMPLETE    artifact (or its absence) published through Completion()

  Each transition happens exactly once; a session is never restarted.
*/
class RecordingSession {
 public:
  RecordingSession(uint64_t guild_id, SessionOptions options, util::ClockFn clock = util::SystemClock());

  RecordingSession(const RecordingSession&)            = delete;
  RecordingSession& operator=(const RecordingSession&) = delete;

  const std::string& Id() const {
    return id_;
  }

  uint64_t GuildId() const {
    return guild_id_;
  }

  util::TimePoint StartedAt() const {
    return started_at_;
  }

  SessionState State() const;

  // Appends to the participant's buffer while ACTIVE; false otherwise.
  bool OnAudioBytes(audio::ParticipantId participant, const uint8_t* data, std::size_t size);

  // ACTIVE -> FINALIZING. False if the session already left ACTIVE.
  bool BeginFinalize();

  /*
    Flushes buffers to temp files and hands them to the mixer:
      0 files  -> no artifact
      1 file   -> mixer.ConvertSingle
      N files  -> mixer.MixMany with the session duration

    Mixer failures are logged and yield no artifact. Always ends in
    COMPLETE. Throws util::InvalidState when called a second time.
  */
  ArtifactResult Finalize(audio::AudioMixer& mixer);

  std::shared_future<ArtifactResult> Completion() const {
    return completion_future_;
  }

  // Seconds between start and BeginFinalize (or now, while ACTIVE).
  double DurationSeconds() const;

  // Seconds since start, by the session clock.
  double OffsetNow() const;

  std::filesystem::path TempFilePath(audio::ParticipantId participant) const;
  std::filesystem::path ArtifactTarget() const;

  const audio::MultiStreamSink& Sink() const {
    return sink_;
  }

  static std::string MakeSessionId(uint64_t guild_id, util::TimePoint created);

 private:
  ArtifactResult Produce(audio::AudioMixer& mixer);
  void           Complete(ArtifactResult artifact);

  const uint64_t        guild_id_;
  const SessionOptions  options_;
  const util::ClockFn   clock_;
  const util::TimePoint started_at_;
  const std::string     id_;

  mutable std::mutex             mutex_;
  SessionState                   state_ = SessionState::kActive;
  bool                           finalize_started_ = false;
  std::optional<util::TimePoint> stopped_at_;

  audio::MultiStreamSink sink_;

  std::promise<ArtifactResult>       completion_;
  std::shared_future<ArtifactResult> completion_future_;
};

} // namespace soundscribe::recording
