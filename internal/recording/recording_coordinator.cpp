#include "recording_coordinator.hpp"

#include <atomic>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace soundscribe::recording {

using observability::BoolField;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

/*
  Bridges a capture backend to one session. Stop notifications are
  forwarded once, whichever side reports first.
*/
class RecordingCoordinator::SessionSink final : public capture::CaptureSink {
 public:
  SessionSink(RecordingCoordinator* owner, std::shared_ptr<RecordingSession> session)
      : owner_(owner),
        session_(std::move(session)) {
  }

  bool OnAudio(audio::ParticipantId participant, const uint8_t* data, std::size_t size) override {
    return session_->OnAudioBytes(participant, data, size);
  }

  void OnCaptureStopped() override {
    if (stopped_.exchange(true)) return;
    owner_->OnCaptureStopped(session_);
  }

 private:
  RecordingCoordinator*             owner_;
  std::shared_ptr<RecordingSession> session_;
  std::atomic<bool>                 stopped_{false};
};

RecordingCoordinator::RecordingCoordinator(SessionOptions options, std::shared_ptr<audio::AudioMixer> mixer, util::ClockFn clock)
    : options_(std::move(options)),
      mixer_(std::move(mixer)),
      clock_(clock ? std::move(clock) : util::SystemClock()),
      queue_(std::make_shared<FinalizeQueue>()) {
  std::error_code ec;
  std::filesystem::create_directories(options_.output_dir, ec);
  if (ec) {
    throw std::runtime_error("cannot create recordings directory " + options_.output_dir.string() + ": " + ec.message());
  }

  worker_ = std::make_unique<FinalizeWorker>(queue_, mixer_, [this](const std::shared_ptr<RecordingSession>& session) { Release(session); });
  worker_->Start();
}

RecordingCoordinator::~RecordingCoordinator() {
  try {
    Shutdown();
  } catch (const std::exception& e) {
    SOUNDSCRIBE_LOG_ERROR("Recording coordinator shutdown failed", {StringField("error", e.what())});
  }
}

bool RecordingCoordinator::Occupied(const Slot& slot) {
  return slot.session && slot.session->State() != SessionState::kComplete;
}

std::string RecordingCoordinator::Start(uint64_t guild_id, std::shared_ptr<capture::VoiceCapture> capture) {
  if (!capture) {
    throw util::CaptureBackendError("no voice capture handle supplied");
  }

  std::shared_ptr<RecordingSession> session;
  std::shared_ptr<SessionSink>      sink;
  {
    std::lock_guard lock(mutex_);
    if (Occupied(slot_)) {
      throw util::AlreadyRecording("Already recording session " + slot_.session->Id());
    }

    session = std::make_shared<RecordingSession>(guild_id, options_, clock_);
    sink    = std::make_shared<SessionSink>(this, session);
    slot_   = Slot{session, capture, sink, true};
  }

  try {
    capture->StartCapture(sink);
  } catch (const std::exception& e) {
    Release(session);
    SOUNDSCRIBE_LOG_WARN("Failed to start capture", {IntField("guild_id", static_cast<int64_t>(guild_id)), StringField("error", e.what())});
    if (dynamic_cast<const util::CaptureBackendError*>(&e)) {
      throw;
    }
    throw util::CaptureBackendError(e.what());
  }

  {
    std::lock_guard lock(mutex_);
    if (slot_.session == session) {
      slot_.starting = false;
    }
  }

  SOUNDSCRIBE_LOG_INFO("Started recording session", {StringField("session_id", session->Id()), IntField("guild_id", static_cast<int64_t>(guild_id))});
  return session->Id();
}

ArtifactResult RecordingCoordinator::Stop() {
  std::shared_ptr<RecordingSession>      session;
  std::shared_ptr<capture::VoiceCapture> capture;
  std::shared_ptr<SessionSink>           sink;
  bool                                   initiated = false;
  {
    std::lock_guard lock(mutex_);
    if (!Occupied(slot_)) {
      throw util::NotRecording("Not currently recording");
    }
    if (slot_.starting) {
      throw util::InvalidState("recording session " + slot_.session->Id() + " is still starting");
    }
    session   = slot_.session;
    capture   = slot_.capture;
    sink      = slot_.sink;
    initiated = session->BeginFinalize();
  }

  if (initiated) {
    SOUNDSCRIBE_LOG_INFO("Stopping recording session", {StringField("session_id", session->Id())});
    try {
      capture->StopCapture();
    } catch (const std::exception& e) {
      // The backend may never report the stop now; finalize regardless.
      SOUNDSCRIBE_LOG_ERROR("Capture backend failed to stop", {StringField("session_id", session->Id()), StringField("error", e.what())});
      sink->OnCaptureStopped();
    }
  }

  auto artifact = session->Completion().get();
  Release(session);

  if (const auto rejected = session->Sink().RejectedWrites(); rejected > 0) {
    SOUNDSCRIBE_LOG_WARN("Audio dropped after capture stopped",
                         {StringField("session_id", session->Id()), IntField("rejected_writes", static_cast<int64_t>(rejected))});
  }
  return artifact;
}

void RecordingCoordinator::OnCaptureStopped(const std::shared_ptr<RecordingSession>& session) {
  SOUNDSCRIBE_LOG_DEBUG("Capture stopped", {StringField("session_id", session->Id()), StringField("state", ToString(session->State()))});

  if (queue_->Enqueue(FinalizeTask{session})) {
    return;
  }

  // Worker already gone during shutdown.
  try {
    session->Finalize(*mixer_);
  } catch (const std::exception& e) {
    SOUNDSCRIBE_LOG_ERROR("Finalize failed", {StringField("session_id", session->Id()), StringField("error", e.what())});
  }
  Release(session);
}

void RecordingCoordinator::Release(const std::shared_ptr<RecordingSession>& session) {
  std::lock_guard lock(mutex_);
  if (slot_.session == session) {
    slot_ = Slot{};
  }
}

bool RecordingCoordinator::RouteVoiceActivity(audio::ParticipantId participant, bool joined, util::TimePoint at) {
  std::shared_ptr<RecordingSession> session;
  {
    std::lock_guard lock(mutex_);
    if (!slot_.session || slot_.session->State() != SessionState::kActive) {
      return false;
    }
    session = slot_.session;
  }

  SOUNDSCRIBE_LOG_DEBUG(joined ? "Participant joined" : "Participant left",
                        {StringField("session_id", session->Id()), IntField("participant", static_cast<int64_t>(participant)),
                         DoubleField("offset_s", util::SecondsBetween(session->StartedAt(), at))});
  return true;
}

std::optional<std::filesystem::path> RecordingCoordinator::LatestArtifact() const {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_directory(options_.output_dir, ec)) {
    return std::nullopt;
  }

  const auto                      extension = "." + options_.artifact_extension;
  std::optional<fs::path>         latest;
  fs::file_time_type              latest_time{};

  for (fs::directory_iterator it(options_.output_dir, ec), end; !ec && it != end; it.increment(ec)) {
    const auto& entry = *it;
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec) || entry.path().extension() != extension) continue;
    if (entry.path().stem().string().find("_user_") != std::string::npos) continue;

    const auto mtime = entry.last_write_time(entry_ec);
    if (entry_ec) continue;
    if (!latest || mtime > latest_time) {
      latest      = entry.path();
      latest_time = mtime;
    }
  }

  if (ec) {
    SOUNDSCRIBE_LOG_WARN("Failed to list recordings", {StringField("dir", options_.output_dir.string()), StringField("error", ec.message())});
  }
  return latest;
}

bool RecordingCoordinator::IsRecording() const {
  std::lock_guard lock(mutex_);
  return Occupied(slot_);
}

std::optional<std::string> RecordingCoordinator::ActiveSessionId() const {
  std::lock_guard lock(mutex_);
  if (!Occupied(slot_)) return std::nullopt;
  return slot_.session->Id();
}

void RecordingCoordinator::Shutdown() {
  bool recording = false;
  {
    std::lock_guard lock(mutex_);
    recording = Occupied(slot_) && !slot_.starting;
  }

  if (recording) {
    try {
      const auto artifact = Stop();
      SOUNDSCRIBE_LOG_INFO("Stopped recording on shutdown", {BoolField("has_artifact", artifact.has_value())});
    } catch (const util::NotRecording&) {
      // finished concurrently
    }
  }

  if (worker_) {
    worker_->Stop();
  }
}

} // namespace soundscribe::recording
