#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace soundscribe::audio {

using ParticipantId = uint64_t;

/*
  Raw decoded audio for one speaker, in arrival order.
*/
struct ParticipantBuffer {
  std::vector<uint8_t> bytes;
  // Seconds from session start to the first chunk.
  double   first_offset_s = 0.0;
  uint64_t chunks         = 0;
};

/*
  Thread-safe collection of per-participant buffers.

  Buffers are created on the first byte from a participant. Once closed,
  every further write is dropped so a finalizing session sees a stable
  snapshot.
*/
class MultiStreamSink {
 public:
  // Returns false if the sink is closed or the chunk is empty.
  bool Write(ParticipantId participant, const uint8_t* data, std::size_t size, double offset_s);

  void Close();
  bool IsClosed() const;

  // Moves all buffers out. The sink stays closed afterwards.
  std::map<ParticipantId, ParticipantBuffer> Drain();

  std::size_t ParticipantCount() const;
  std::size_t TotalBytes() const;
  uint64_t    RejectedWrites() const;

 private:
  mutable std::mutex                         mutex_;
  std::map<ParticipantId, ParticipantBuffer> buffers_;
  bool                                       closed_   = false;
  uint64_t                                   rejected_ = 0;
};

} // namespace soundscribe::audio
