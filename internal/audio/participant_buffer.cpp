#include "participant_buffer.hpp"

namespace soundscribe::audio {

bool MultiStreamSink::Write(ParticipantId participant, const uint8_t* data, std::size_t size, double offset_s) {
  std::lock_guard lock(mutex_);

  if (closed_) {
    ++rejected_;
    return false;
  }
  if (size == 0) return false;

  auto [it, inserted] = buffers_.try_emplace(participant);
  if (inserted) {
    it->second.first_offset_s = offset_s;
  }
  it->second.bytes.insert(it->second.bytes.end(), data, data + size);
  ++it->second.chunks;
  return true;
}

void MultiStreamSink::Close() {
  std::lock_guard lock(mutex_);
  closed_ = true;
}

bool MultiStreamSink::IsClosed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::map<ParticipantId, ParticipantBuffer> MultiStreamSink::Drain() {
  std::lock_guard lock(mutex_);
  closed_ = true;

  std::map<ParticipantId, ParticipantBuffer> out;
  out.swap(buffers_);
  return out;
}

std::size_t MultiStreamSink::ParticipantCount() const {
  std::lock_guard lock(mutex_);
  return buffers_.size();
}

std::size_t MultiStreamSink::TotalBytes() const {
  std::lock_guard lock(mutex_);
  std::size_t total = 0;
  for (const auto& [_, buffer] : buffers_) total += buffer.bytes.size();
  return total;
}

uint64_t MultiStreamSink::RejectedWrites() const {
  std::lock_guard lock(mutex_);
  return rejected_;
}

} // namespace soundscribe::audio
