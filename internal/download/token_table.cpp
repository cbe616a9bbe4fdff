#include "token_table.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/token.hpp"

namespace soundscribe::download {

std::string_view RedeemResult::Reason() const {
  switch (status) {
    case RedeemStatus::kOk:
      return "";
    case RedeemStatus::kUnknown:
      return "Invalid or expired download link";
    case RedeemStatus::kExpired:
      return "Download link has expired";
    case RedeemStatus::kFileMissing:
      return "File not found";
  }
  return "Invalid or expired download link";
}

DownloadTokenTable::DownloadTokenTable(util::ClockFn clock) : clock_(clock ? std::move(clock) : util::SystemClock()) {
}

bool DownloadTokenTable::IsExpired(const DownloadToken& token, util::TimePoint now) {
  return now > token.expires_at;
}

DownloadToken DownloadTokenTable::Insert(const std::filesystem::path& path, std::chrono::milliseconds ttl) {
  const auto now = clock_();

  DownloadToken entry{util::GenerateToken(), path, now + ttl};

  std::lock_guard lock(mutex_);
  while (!tokens_.try_emplace(entry.token, entry).second) {
    entry.token = util::GenerateToken();
  }

  const auto swept = SweepExpiredLocked(now);
  if (swept > 0) {
    SOUNDSCRIBE_LOG_DEBUG("Cleaned up expired tokens", {observability::IntField("count", static_cast<int64_t>(swept))});
  }
  return entry;
}

RedeemResult DownloadTokenTable::Redeem(const std::string& token) {
  const auto now = clock_();

  std::lock_guard lock(mutex_);

  auto it = tokens_.find(token);
  if (it == tokens_.end()) {
    return {RedeemStatus::kUnknown, {}};
  }

  if (IsExpired(it->second, now)) {
    tokens_.erase(it);
    return {RedeemStatus::kExpired, {}};
  }

  std::error_code ec;
  if (!std::filesystem::exists(it->second.path, ec)) {
    tokens_.erase(it);
    return {RedeemStatus::kFileMissing, {}};
  }

  return {RedeemStatus::kOk, it->second.path};
}

std::size_t DownloadTokenTable::SweepExpired() {
  const auto now = clock_();

  std::lock_guard lock(mutex_);
  return SweepExpiredLocked(now);
}

std::size_t DownloadTokenTable::SweepExpiredLocked(util::TimePoint now) {
  std::size_t removed = 0;
  for (auto it = tokens_.begin(); it != tokens_.end();) {
    if (IsExpired(it->second, now)) {
      it = tokens_.erase(it);
      ++removed;
      continue;
    }
    ++it;
  }
  return removed;
}

std::size_t DownloadTokenTable::Size() const {
  std::lock_guard lock(mutex_);
  return tokens_.size();
}

} // namespace soundscribe::download
