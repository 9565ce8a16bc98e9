/// @file src/market/registry.cpp
/// @brief MarketRegistry: id-indexed arena of market slots.

#include "flash/registry.hpp"

#include <unordered_map>

namespace flash::market {

MarketId MarketRegistry::next_market_id() noexcept {
    return next_market_.fetch_add(1, std::memory_order_relaxed);
}

PositionId MarketRegistry::next_position_id() noexcept {
    return next_position_.fetch_add(1, std::memory_order_relaxed);
}

bool MarketRegistry::insert(SlotPtr slot) {
    if (!slot) return false;
    const MarketId id = slot->market.id();
    std::unique_lock lock(mutex_);
    return slots_.emplace(id, std::move(slot)).second;
}

SlotPtr MarketRegistry::find(MarketId id) const {
    std::shared_lock lock(mutex_);
    const auto it = slots_.find(id);
    return it == slots_.end() ? nullptr : it->second;
}

bool MarketRegistry::erase(MarketId id) {
    std::unique_lock lock(mutex_);
    if (slots_.erase(id) == 0) return false;
    std::erase_if(position_index_, [id](const auto& entry) { return entry.second == id; });
    return true;
}

std::vector<SlotPtr> MarketRegistry::all() const {
    std::shared_lock lock(mutex_);
    std::vector<SlotPtr> out;
    out.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) out.push_back(slot);
    return out;
}

std::size_t MarketRegistry::size() const {
    std::shared_lock lock(mutex_);
    return slots_.size();
}

void MarketRegistry::index_position(PositionId position, MarketId market) {
    std::unique_lock lock(mutex_);
    position_index_.insert_or_assign(position, market);
}

std::optional<MarketId> MarketRegistry::market_of(PositionId position) const {
    std::shared_lock lock(mutex_);
    const auto it = position_index_.find(position);
    if (it == position_index_.end()) return std::nullopt;
    return it->second;
}

} // namespace flash::market
