#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace soundscribe::download {

struct DownloadToken {
  std::string           token;
  std::filesystem::path path;
  util::TimePoint       expires_at;
};

enum class RedeemStatus {
  kOk,
  kUnknown,
  kExpired,
  kFileMissing,
};

struct RedeemResult {
  RedeemStatus          status = RedeemStatus::kUnknown;
  std::filesystem::path path;

  bool ok() const {
    return status == RedeemStatus::kOk;
  }

  // Client-facing reason for a failed redemption.
  std::string_view Reason() const;
};

/*
  Token -> artifact map with expiry.

  A token stays valid for repeat downloads until it expires. Expired
  entries are dropped when redeemed and by the full sweep that runs on
  every Insert.
*/
class DownloadTokenTable {
 public:
  explicit DownloadTokenTable(util::ClockFn clock = util::SystemClock());

  // Mints a fresh token for path; never reuses one from an earlier call.
  DownloadToken Insert(const std::filesystem::path& path, std::chrono::milliseconds ttl);

  RedeemResult Redeem(const std::string& token);

  // Returns the number of entries removed.
  std::size_t SweepExpired();

  // Includes expired entries not yet swept.
  std::size_t Size() const;

 private:
  static bool IsExpired(const DownloadToken& token, util::TimePoint now);

  std::size_t SweepExpiredLocked(util::TimePoint now);

  util::ClockFn clock_;

  mutable std::mutex                             mutex_;
  std::unordered_map<std::string, DownloadToken> tokens_;
};

} // namespace soundscribe::download
