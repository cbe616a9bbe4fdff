#include "internal/capture/remote_capture.hpp"

#include <atomic>
#include <chrono>
#include <cassert>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using soundscribe::capture::CaptureSink;
using soundscribe::capture::RemoteVoiceCapture;

class CountingSink final : public CaptureSink {
 public:
  bool OnAudio(soundscribe::audio::ParticipantId, const uint8_t*, std::size_t size) override {
    if (reject) return false;
    ++chunks;
    bytes += size;
    return true;
  }

  void OnCaptureStopped() override {
    ++stops;
  }

  bool                  reject = false;
  std::atomic<int>      chunks{0};
  std::atomic<uint64_t> bytes{0};
  std::atomic<int>      stops{0};
};

void TestDeliverWithoutCaptureIsDropped() {
  RemoteVoiceCapture capture;
  const uint8_t      pcm[] = {1, 2, 3, 4};
  assert(!capture.IsCapturing());
  assert(!capture.Deliver(1, pcm, sizeof(pcm)));
  assert(capture.DeliveredChunks() == 0);
}

void TestDeliverRoutesToAttachedSink() {
  RemoteVoiceCapture capture;
  auto               sink = std::make_shared<CountingSink>();
  capture.StartCapture(sink);
  assert(capture.IsCapturing());

  const uint8_t pcm[] = {1, 2, 3, 4};
  assert(capture.Deliver(1, pcm, sizeof(pcm)));
  assert(capture.Deliver(2, pcm, sizeof(pcm)));
  assert(sink->chunks == 2);
  assert(sink->bytes == 8);
  assert(capture.DeliveredChunks() == 2);

  sink->reject = true;
  assert(!capture.Deliver(1, pcm, sizeof(pcm)));
  assert(capture.DeliveredChunks() == 2);
}

void TestStopSignalsSinkOnceAndDetaches() {
  RemoteVoiceCapture capture;
  auto               sink = std::make_shared<CountingSink>();
  capture.StartCapture(sink);

  capture.StopCapture();
  capture.StopCapture();
  assert(sink->stops == 1);
  assert(!capture.IsCapturing());

  const uint8_t pcm[] = {1};
  assert(!capture.Deliver(1, pcm, sizeof(pcm)));

  // A new session may attach after the previous one detached.
  auto next = std::make_shared<CountingSink>();
  capture.StartCapture(next);
  assert(capture.Deliver(1, pcm, sizeof(pcm)));
  capture.StopCapture();
  assert(next->stops == 1);
}

void TestSecondAttachIsRejected() {
  RemoteVoiceCapture capture;
  capture.StartCapture(std::make_shared<CountingSink>());

  bool threw = false;
  try {
    capture.StartCapture(std::make_shared<CountingSink>());
  } catch (const soundscribe::util::CaptureBackendError&) {
    threw = true;
  }
  assert(threw);

  bool null_threw = false;
  try {
    RemoteVoiceCapture other;
    other.StartCapture(nullptr);
  } catch (const soundscribe::util::CaptureBackendError&) {
    null_threw = true;
  }
  assert(null_threw);
}

void TestConcurrentDeliveryDuringStop() {
  RemoteVoiceCapture capture;
  auto               sink = std::make_shared<CountingSink>();
  capture.StartCapture(sink);

  std::atomic<bool>        stop{false};
  std::vector<std::thread> producers;
  for (int p = 0; p < 4; ++p) {
    producers.emplace_back([&capture, &stop, p] {
      const uint8_t pcm[] = {0, 0, 0, 0};
      while (!stop) capture.Deliver(static_cast<uint64_t>(p), pcm, sizeof(pcm));
    });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  capture.StopCapture();
  stop = true;
  for (auto& producer : producers) producer.join();

  assert(sink->stops == 1);
  assert(static_cast<uint64_t>(sink->chunks.load()) == capture.DeliveredChunks());
}

} // namespace

int main() {
  TestDeliverWithoutCaptureIsDropped();
  TestDeliverRoutesToAttachedSink();
  TestStopSignalsSinkOnceAndDetaches();
  TestSecondAttachIsRejected();
  TestConcurrentDeliveryDuringStop();

  std::cout << "soundscribe_unit_remote_capture: pass\n";
  return 0;
}
