#pragma once

#include "tradekernel/domain/identifiers.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace tradekernel {

// -----------------------------------------------------------------------------
// IdGenerator — thread-safe, monotonically increasing entity ID source
// -----------------------------------------------------------------------------
//
// @brief  Produces "ord-<n>" and "pos-<n>" identifiers from two independent
//         atomic counters. Both start at 1.
//
// @details
// std::memory_order_relaxed is enough: the only requirement is that every
// call returns a distinct value, and no other memory operation is ordered
// against the increment.
//
// Production callers may mint their own ids (exchange-assigned, UUIDs) and
// pass them straight to Order::create / Position::open; the TradeLedger uses
// this generator when it creates entities itself.
//
// Thread model:
//   next_order_id() and next_position_id() are safe to call concurrently
//   from any number of threads.
//
// Ownership:
//   Owned by TradeLedger as a value member.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  // Non-copyable, non-movable: a copy would hand out duplicate ids.
  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  domain::OrderId next_order_id() {
    const auto n = next_order_.fetch_add(1, std::memory_order_relaxed);
    return domain::OrderId::from("ord-" + std::to_string(n));
  }

  domain::PositionId next_position_id() {
    const auto n = next_position_.fetch_add(1, std::memory_order_relaxed);
    return domain::PositionId::from("pos-" + std::to_string(n));
  }

 private:
  std::atomic<std::uint64_t> next_order_{1};
  std::atomic<std::uint64_t> next_position_{1};
};

}  // namespace tradekernel
