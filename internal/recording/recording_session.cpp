#include "recording_session.hpp"

#include <atomic>
#include <system_error>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace soundscribe::recording {

namespace {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

std::atomic<uint64_t> g_session_sequence{0};

} // namespace

std::string RecordingSession::MakeSessionId(uint64_t guild_id, util::TimePoint created) {
  const auto seq = ++g_session_sequence;
  return "recording_" + std::to_string(guild_id) + "_" + util::FormatCompactLocal(created) + "_" + std::to_string(seq);
}

RecordingSession::RecordingSession(uint64_t guild_id, SessionOptions options, util::ClockFn clock)
    : guild_id_(guild_id),
      options_(std::move(options)),
      clock_(clock ? std::move(clock) : util::SystemClock()),
      started_at_(clock_()),
      id_(MakeSessionId(guild_id_, started_at_)),
      completion_future_(completion_.get_future().share()) {
}

SessionState RecordingSession::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

bool RecordingSession::OnAudioBytes(audio::ParticipantId participant, const uint8_t* data, std::size_t size) {
  // The sink is closed on BeginFinalize, so it alone decides acceptance.
  return sink_.Write(participant, data, size, OffsetNow());
}

bool RecordingSession::BeginFinalize() {
  std::lock_guard lock(mutex_);
  if (!CanTransition(state_, SessionState::kFinalizing)) {
    return false;
  }
  state_      = SessionState::kFinalizing;
  stopped_at_ = clock_();
  sink_.Close();
  return true;
}

double RecordingSession::DurationSeconds() const {
  std::lock_guard lock(mutex_);
  return util::SecondsBetween(started_at_, stopped_at_.value_or(clock_()));
}

double RecordingSession::OffsetNow() const {
  return util::SecondsBetween(started_at_, clock_());
}

std::filesystem::path RecordingSession::TempFilePath(audio::ParticipantId participant) const {
  return options_.output_dir / (id_ + "_user_" + std::to_string(participant) + ".wav");
}

std::filesystem::path RecordingSession::ArtifactTarget() const {
  return options_.output_dir / (id_ + "." + options_.artifact_extension);
}

ArtifactResult RecordingSession::Finalize(audio::AudioMixer& mixer) {
  {
    std::lock_guard lock(mutex_);
    if (finalize_started_ || state_ == SessionState::kComplete) {
      throw util::InvalidState("session " + id_ + " already finalized");
    }
    finalize_started_ = true;
  }

  // Capture may end on its own; treat that as the stop.
  BeginFinalize();

  ArtifactResult artifact;
  try {
    artifact = Produce(mixer);
  } catch (const std::exception& e) {
    SOUNDSCRIBE_LOG_ERROR("Failed to process recording session", {StringField("session_id", id_), StringField("error", e.what())});
    artifact.reset();
  }

  Complete(artifact);
  return artifact;
}

ArtifactResult RecordingSession::Produce(audio::AudioMixer& mixer) {
  auto buffers = sink_.Drain();

  std::vector<audio::MixInput> inputs;
  std::error_code              ec;
  std::filesystem::create_directories(options_.output_dir, ec);
  if (ec) {
    throw std::runtime_error("cannot create " + options_.output_dir.string() + ": " + ec.message());
  }

  for (auto& [participant, buffer] : buffers) {
    if (buffer.bytes.empty()) continue;

    const auto temp_path = TempFilePath(participant);
    audio::WriteWavFile(temp_path, options_.pcm, buffer.bytes);
    inputs.push_back({temp_path, buffer.first_offset_s});

    SOUNDSCRIBE_LOG_DEBUG("Saved participant audio", {StringField("session_id", id_), IntField("participant", static_cast<int64_t>(participant)),
                                                      IntField("bytes", static_cast<int64_t>(buffer.bytes.size())),
                                                      StringField("path", temp_path.string())});
    std::vector<uint8_t>().swap(buffer.bytes);
  }

  if (inputs.empty()) {
    SOUNDSCRIBE_LOG_WARN("No audio data recorded", {StringField("session_id", id_)});
    return std::nullopt;
  }

  const auto target   = ArtifactTarget();
  const auto duration = DurationSeconds();

  std::filesystem::path produced;
  try {
    if (inputs.size() == 1) {
      produced = mixer.ConvertSingle(inputs.front().path, target);
    } else {
      produced = mixer.MixMany(inputs, target, duration);
    }
  } catch (const util::TranscodeFailure& e) {
    SOUNDSCRIBE_LOG_ERROR("Mixing failed, session has no artifact",
                          {StringField("session_id", id_), IntField("exit_code", e.ExitCode()), StringField("stderr", e.StderrExcerpt())});
    return std::nullopt;
  }

  for (const auto& input : inputs) {
    std::error_code remove_ec;
    std::filesystem::remove(input.path, remove_ec);
    if (remove_ec) {
      SOUNDSCRIBE_LOG_WARN("Failed to delete temp file", {StringField("path", input.path.string()), StringField("error", remove_ec.message())});
    }
  }

  SOUNDSCRIBE_LOG_INFO("Recording session complete", {StringField("session_id", id_), StringField("artifact", produced.string()),
                                                      IntField("participants", static_cast<int64_t>(inputs.size())),
                                                      DoubleField("duration_s", duration)});
  return produced;
}

void RecordingSession::Complete(ArtifactResult artifact) {
  {
    std::lock_guard lock(mutex_);
    state_ = SessionState::kComplete;
  }
  completion_.set_value(std::move(artifact));
}

} // namespace soundscribe::recording
