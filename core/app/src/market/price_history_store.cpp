#include "tradeloop/market/price_history_store.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

namespace tradeloop {

PriceHistoryStore::PriceHistoryStore(std::size_t capacity)
    : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("PriceHistoryStore capacity must be > 0");
  }
}

// -----------------------------------------------------------------------------
// append: push back, then evict from the front while over capacity
// -----------------------------------------------------------------------------
void PriceHistoryStore::append(domain::PricePoint point) {
  std::unique_lock lock(mutex_);
  auto& sequence = history_[point.instrument];
  sequence.push_back(std::move(point));
  while (sequence.size() > capacity_) {
    sequence.pop_front();
  }
}

std::vector<domain::PricePoint> PriceHistoryStore::history(
    const std::string& instrument) const {
  std::shared_lock lock(mutex_);
  auto it = history_.find(instrument);
  if (it == history_.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

std::map<std::string, std::vector<domain::PricePoint>>
PriceHistoryStore::snapshot() const {
  std::shared_lock lock(mutex_);
  std::map<std::string, std::vector<domain::PricePoint>> result;
  for (const auto& [instrument, sequence] : history_) {
    result.emplace(instrument, std::vector<domain::PricePoint>(
                                   sequence.begin(), sequence.end()));
  }
  return result;
}

std::size_t PriceHistoryStore::size(const std::string& instrument) const {
  std::shared_lock lock(mutex_);
  auto it = history_.find(instrument);
  return it == history_.end() ? 0 : it->second.size();
}

std::vector<std::string> PriceHistoryStore::instruments() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> result;
  result.reserve(history_.size());
  for (const auto& [instrument, sequence] : history_) {
    result.push_back(instrument);
  }
  return result;
}

}  // namespace tradeloop
