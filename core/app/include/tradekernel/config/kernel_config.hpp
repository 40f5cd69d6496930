#pragma once

#include "tradekernel/book/order_book_snapshot.hpp"
#include "tradekernel/domain/position_status.hpp"

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace tradekernel {

// -----------------------------------------------------------------------------
// KernelConfig — runtime knobs for the ledger and the demo binary
// -----------------------------------------------------------------------------
//
// @details
// JSON layout (every key optional, unknown keys ignored):
//
//   {
//     "position_profile": "extended" | "basic",
//     "liquidity_mode":   "partial"  | "strict",
//     "depth_levels":     10,
//     "display_decimals": 8
//   }
//
// Invalid values raise InvalidValueError("KernelConfig", ...).
// -----------------------------------------------------------------------------
struct KernelConfig {
  domain::PositionProfile position_profile{domain::PositionProfile::Extended};
  domain::LiquidityMode liquidity_mode{domain::LiquidityMode::Partial};
  std::size_t depth_levels{10};   // rungs used for liquidity summaries, > 0
  int display_decimals{8};        // 0..18
};

KernelConfig parseKernelConfig(const nlohmann::json& document);

// Reads and parses `path`. A missing file or malformed JSON raises
// InvalidValueError.
KernelConfig loadKernelConfig(const std::string& path);

}  // namespace tradekernel
