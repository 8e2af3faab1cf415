#pragma once

#include <atomic>
#include <cstdint>
#include <optional>

namespace httpload {

/**
 * Shared request budget. Indices 1..total are handed out exactly once
 * across all threads; afterwards every claim returns std::nullopt.
 */
class WorkCounter {
public:
  explicit WorkCounter(uint64_t total);

  WorkCounter(const WorkCounter &) = delete;
  WorkCounter &operator=(const WorkCounter &) = delete;

  std::optional<uint64_t> claimNext();

  uint64_t total() const { return total_; }

  // Work units handed out so far, never more than total()
  uint64_t claimed() const;

private:
  const uint64_t total_;
  std::atomic<uint64_t> next_{0};
};

} // namespace httpload
