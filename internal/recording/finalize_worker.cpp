#include "finalize_worker.hpp"

#include "internal/audio/audio_mixer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recording/recording_session.hpp"

namespace soundscribe::recording {

FinalizeWorker::FinalizeWorker(std::shared_ptr<FinalizeQueue> queue, std::shared_ptr<audio::AudioMixer> mixer, DoneCallback on_done)
    : queue_(std::move(queue)),
      mixer_(std::move(mixer)),
      on_done_(std::move(on_done)) {
}

FinalizeWorker::~FinalizeWorker() {
  Stop();
}

void FinalizeWorker::Start() {
  if (thread_.joinable()) return;
  thread_ = std::thread(&FinalizeWorker::Run, this);
}

void FinalizeWorker::Stop() {
  queue_->Shutdown();
  if (thread_.joinable())
    thread_.join();
}

void FinalizeWorker::Run() {
  while (auto task = queue_->Dequeue()) {
    const auto& session = task->session;
    if (!session) continue;

    try {
      session->Finalize(*mixer_);
    }
    catch (const std::exception& e) {
      SOUNDSCRIBE_LOG_ERROR("Finalize failed", {observability::StringField("session_id", session->Id()),
                                                observability::StringField("error", e.what())});
    }

    if (on_done_) {
      on_done_(session);
    }
  }
}

} // namespace soundscribe::recording
