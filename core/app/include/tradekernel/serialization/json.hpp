#pragma once

#include "tradekernel/book/order_book_level.hpp"
#include "tradekernel/book/order_book_snapshot.hpp"
#include "tradekernel/domain/amount.hpp"
#include "tradekernel/domain/asset.hpp"
#include "tradekernel/domain/errors.hpp"
#include "tradekernel/domain/fill.hpp"
#include "tradekernel/domain/kline.hpp"
#include "tradekernel/domain/order.hpp"
#include "tradekernel/domain/order_parameters.hpp"
#include "tradekernel/domain/percentage.hpp"
#include "tradekernel/domain/position.hpp"
#include "tradekernel/domain/price.hpp"
#include "tradekernel/domain/quantity.hpp"
#include "tradekernel/domain/trading_pair.hpp"

#include <nlohmann/json.hpp>

namespace tradekernel {

// -----------------------------------------------------------------------------
// JSON projections
// -----------------------------------------------------------------------------
//
// @brief  nlohmann::json views of every value type and entity, for the API
//         adapter and the demo binary.
//
// @details
// One-way only: nothing here parses JSON back into domain objects. The
// overloads live next to the types they serialize so nlohmann finds them
// through ADL, which makes `nlohmann::json j = order;` work.
//
// Decimals collapse to doubles at this boundary and nowhere else.
// Timestamps render as ISO-8601 UTC strings ("2024-01-01T00:00:00.000Z").
// Absent optionals render as null.
// -----------------------------------------------------------------------------
namespace domain {

void to_json(nlohmann::json& j, const Asset& asset);
void to_json(nlohmann::json& j, const TradingPair& pair);
void to_json(nlohmann::json& j, const Quantity& quantity);
void to_json(nlohmann::json& j, const Percentage& percentage);
void to_json(nlohmann::json& j, const Amount& amount);
void to_json(nlohmann::json& j, const Price& price);
void to_json(nlohmann::json& j, const OrderParameters& parameters);
void to_json(nlohmann::json& j, const Fill& fill);
void to_json(nlohmann::json& j, const Order& order);
void to_json(nlohmann::json& j, const Position& position);
void to_json(nlohmann::json& j, const OrderBookLevel& level);
void to_json(nlohmann::json& j, const OrderBookSnapshot& snapshot);
void to_json(nlohmann::json& j, const MarketBuyEstimate& estimate);
void to_json(nlohmann::json& j, const MarketSellEstimate& estimate);
void to_json(nlohmann::json& j, const Kline& kline);

}  // namespace domain

// {type, message, details}. `type` is DomainError::kind(); `details` holds
// the structured fields of the concrete error.
void to_json(nlohmann::json& j, const DomainError& error);

}  // namespace tradekernel
