#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

#include "internal/capture/voice_capture.hpp"

namespace soundscribe::capture {

/*
  Capture handle fed by an out-of-process voice gateway.

  The gateway pushes decoded PCM through the control service; Deliver
  routes it to whichever sink is attached at that moment.
*/
class RemoteVoiceCapture final : public VoiceCapture {
 public:
  void StartCapture(std::shared_ptr<CaptureSink> sink) override;
  void StopCapture() override;

  // False when no capture is running or the sink rejected the chunk.
  bool Deliver(audio::ParticipantId participant, const uint8_t* data, std::size_t size);

  bool IsCapturing() const;

  uint64_t DeliveredChunks() const {
    return delivered_chunks_.load();
  }

 private:
  mutable std::mutex           mutex_;
  std::shared_ptr<CaptureSink> sink_;

  std::atomic<uint64_t> delivered_chunks_{0};
};

} // namespace soundscribe::capture
