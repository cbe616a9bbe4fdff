#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>

namespace soundscribe::recording {

class RecordingSession;

struct FinalizeTask {
  std::shared_ptr<RecordingSession> session;
};

/*
  Thread-safe blocking queue feeding the finalize worker.
*/
class FinalizeQueue {
 public:
  // False once shut down; the caller must finalize the task itself.
  bool Enqueue(FinalizeTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<FinalizeTask> Dequeue();

  void Shutdown();

 private:
  std::mutex               mutex_;
  std::condition_variable  cv_;
  std::queue<FinalizeTask> queue_;
  bool                     shutdown_ = false;
};

} // namespace soundscribe::recording
