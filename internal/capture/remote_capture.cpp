#include "remote_capture.hpp"

#include "internal/util/errors.hpp"

namespace soundscribe::capture {

void RemoteVoiceCapture::StartCapture(std::shared_ptr<CaptureSink> sink) {
  if (!sink) {
    throw util::CaptureBackendError("capture sink must not be null");
  }

  std::lock_guard lock(mutex_);
  if (sink_) {
    throw util::CaptureBackendError("remote capture already attached to a session");
  }
  sink_ = std::move(sink);
}

void RemoteVoiceCapture::StopCapture() {
  std::shared_ptr<CaptureSink> sink;
  {
    std::lock_guard lock(mutex_);
    sink.swap(sink_);
  }

  if (sink) {
    sink->OnCaptureStopped();
  }
}

bool RemoteVoiceCapture::Deliver(audio::ParticipantId participant, const uint8_t* data, std::size_t size) {
  std::shared_ptr<CaptureSink> sink;
  {
    std::lock_guard lock(mutex_);
    sink = sink_;
  }

  if (!sink || !sink->OnAudio(participant, data, size)) {
    return false;
  }
  ++delivered_chunks_;
  return true;
}

bool RemoteVoiceCapture::IsCapturing() const {
  std::lock_guard lock(mutex_);
  return static_cast<bool>(sink_);
}

} // namespace soundscribe::capture
