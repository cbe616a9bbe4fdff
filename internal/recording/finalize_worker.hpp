#pragma once

#include <functional>
#include <memory>
#include <thread>

#include "finalize_queue.hpp"

namespace soundscribe::audio {
class AudioMixer;
}

namespace soundscribe::recording {

/*
  Background worker that turns stopped sessions into artifacts.

  Runs RecordingSession::Finalize off the capture backend's thread so
  a slow transcoder never stalls audio delivery.
*/
class FinalizeWorker {
 public:
  using DoneCallback = std::function<void(const std::shared_ptr<RecordingSession>&)>;

  FinalizeWorker(std::shared_ptr<FinalizeQueue> queue, std::shared_ptr<audio::AudioMixer> mixer, DoneCallback on_done = {});
  ~FinalizeWorker();

  FinalizeWorker(const FinalizeWorker&)            = delete;
  FinalizeWorker& operator=(const FinalizeWorker&) = delete;

  void Start();
  // Drains queued sessions, then joins.
  void Stop();

 private:
  void Run();

  std::shared_ptr<FinalizeQueue>     queue_;
  std::shared_ptr<audio::AudioMixer> mixer_;
  DoneCallback                       on_done_;

  std::thread thread_;
};

} // namespace soundscribe::recording
