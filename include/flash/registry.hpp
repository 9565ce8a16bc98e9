#pragma once

/// @file include/flash/registry.hpp
/// @brief Market arena: id-indexed slots, one mutex per market.
///
/// # Module: Market Registry
///
/// ## Locking
/// - `MarketSlot::mutex` serialises every mutation of one market (trades,
///   chains, resolution, feed updates, tick).
/// - The registry's own `std::shared_mutex` guards only the id → slot map and
///   the position index. It is the innermost lock: a slot holder may take it,
///   but no slot mutex is ever acquired while it is held.
/// - Slots are handed out as `shared_ptr`, so a reclaimed market stays alive
///   for whoever is still looking at it.
///
/// ## Ownership
/// Parents are referenced by id; the registry never links slots together.

#include "flash/market.hpp"
#include "flash/resolver.hpp"
#include "flash/types.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace flash::market {

struct MarketSlot {
    explicit MarketSlot(Market m) : market(std::move(m)) {}

    std::mutex                    mutex;
    Market                        market;
    std::map<PositionId, Position> positions;
    std::map<PositionId, QuantumPosition> quanta;
    resolver::ResolutionState     resolution;
};

using SlotPtr = std::shared_ptr<MarketSlot>;

class MarketRegistry {
public:
    [[nodiscard]] MarketId   next_market_id() noexcept;
    [[nodiscard]] PositionId next_position_id() noexcept;

    /// Returns false if the id is already taken.
    bool insert(SlotPtr slot);

    [[nodiscard]] SlotPtr find(MarketId id) const;

    /// Remove a market and every position it indexed.
    bool erase(MarketId id);

    /// All live slots, in id order.
    [[nodiscard]] std::vector<SlotPtr> all() const;

    [[nodiscard]] std::size_t size() const;

    void index_position(PositionId position, MarketId market);
    [[nodiscard]] std::optional<MarketId> market_of(PositionId position) const;

private:
    mutable std::shared_mutex                  mutex_;
    std::map<MarketId, SlotPtr>                slots_;
    std::unordered_map<PositionId, MarketId>   position_index_;
    std::atomic<MarketId>                      next_market_{1};
    std::atomic<PositionId>                    next_position_{1};
};

} // namespace flash::market
