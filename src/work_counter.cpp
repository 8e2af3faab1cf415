#include "work_counter.hpp"
#include <algorithm>

namespace httpload {

WorkCounter::WorkCounter(uint64_t total) : total_(total) {}

std::optional<uint64_t> WorkCounter::claimNext() {
  // Claims past the budget still advance the counter.
  uint64_t index = next_.fetch_add(1, std::memory_order_relaxed) + 1;
  if (index > total_) {
    return std::nullopt;
  }
  return index;
}

uint64_t WorkCounter::claimed() const {
  return std::min(next_.load(std::memory_order_relaxed), total_);
}

} // namespace httpload
