#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

#include "internal/audio/participant_buffer.hpp"

namespace soundscribe::capture {

/*
  Receives decoded audio from a capture backend.

  OnAudio may be called from any thread, concurrently for different
  participants. OnCaptureStopped is called exactly once, after the last
  OnAudio the backend will deliver.
*/
class CaptureSink {
 public:
  virtual ~CaptureSink() = default;

  virtual bool OnAudio(audio::ParticipantId participant, const uint8_t* data, std::size_t size) = 0;
  virtual void OnCaptureStopped() = 0;
};

/*
  Handle on a voice connection able to deliver per-speaker audio.

  StartCapture throws util::CaptureBackendError when capture cannot begin.
  StopCapture must eventually lead to sink->OnCaptureStopped().
*/
class VoiceCapture {
 public:
  virtual ~VoiceCapture() = default;

  virtual void StartCapture(std::shared_ptr<CaptureSink> sink) = 0;
  virtual void StopCapture() = 0;
};

} // namespace soundscribe::capture
