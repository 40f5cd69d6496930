#include "tradekernel/serialization/json.hpp"
#include "tradekernel/time/time_utils.hpp"
#include "tradekernel/time/timeframe.hpp"

#include <optional>

namespace tradekernel {

namespace {

// nlohmann 3.11 has no std::optional support; absent renders as null.
template <typename T>
nlohmann::json optionalJson(const std::optional<T>& value) {
  if (!value) {
    return nullptr;
  }
  return nlohmann::json(*value);
}

nlohmann::json optionalTime(const std::optional<Timestamp>& value) {
  if (!value) {
    return nullptr;
  }
  return format_iso8601(*value);
}

}  // namespace

namespace domain {

void to_json(nlohmann::json& j, const Asset& asset) {
  j = nlohmann::json{{"symbol", asset.symbol()},
                     {"type", toString(asset.type())}};
}

void to_json(nlohmann::json& j, const TradingPair& pair) {
  j = nlohmann::json{{"symbol", pair.symbol()},
                     {"base", pair.base().symbol()},
                     {"quote", pair.quote().symbol()}};
}

void to_json(nlohmann::json& j, const Quantity& quantity) {
  j = quantity.value();
}

void to_json(nlohmann::json& j, const Percentage& percentage) {
  j = percentage.value();
}

void to_json(nlohmann::json& j, const Amount& amount) {
  j = nlohmann::json{{"value", amount.value()},
                     {"asset", amount.asset().symbol()}};
}

void to_json(nlohmann::json& j, const Price& price) {
  j = nlohmann::json{{"value", price.value()},
                     {"pair", price.pair().symbol()},
                     {"base", price.pair().base().symbol()},
                     {"quote", price.pair().quote().symbol()}};
}

void to_json(nlohmann::json& j, const OrderParameters& parameters) {
  j = nlohmann::json{{"pair", parameters.pair()},
                     {"side", toString(parameters.side())},
                     {"type", toString(parameters.type())},
                     {"quantity", parameters.quantity()},
                     {"stopPrice", optionalJson(parameters.stopPrice())}};
}

void to_json(nlohmann::json& j, const Fill& fill) {
  j = nlohmann::json{{"pair", fill.pair().symbol()},
                     {"exchangeOrderId", fill.exchangeOrderId().value()},
                     {"tradeId", fill.tradeId()},
                     {"executedQuantity", fill.executedQuantity()},
                     {"executionPrice", fill.executionPrice()},
                     {"fee", fill.fee()},
                     {"grossTotal", fill.grossTotal()},
                     {"timestamp", format_iso8601(fill.timestamp())}};
}

// -----------------------------------------------------------------------------
// Order: parameters, lifecycle state, fills and the derived aggregates
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Order& order) {
  nlohmann::json exchange_id = nullptr;
  if (order.exchangeOrderId()) {
    exchange_id = order.exchangeOrderId()->value();
  }

  j = nlohmann::json{
      {"id", order.id().value()},
      {"exchangeOrderId", exchange_id},
      {"parameters", order.parameters()},
      {"status", toString(order.status())},
      {"fills", order.fills()},
      {"filledQuantity", order.totalFilledQuantity()},
      {"remainingQuantity", order.remainingQuantity()},
      {"averageFillPrice", optionalJson(order.averageFillPrice())},
      {"totalFees", order.feesByAsset()},
      {"feesInQuote", order.feesInQuote()},
      {"rejectionReason", optionalJson(order.rejectionReason())},
      {"timestamps",
       {{"createdAt", format_iso8601(order.createdAt())},
        {"updatedAt", format_iso8601(order.updatedAt())},
        {"submittedAt", optionalTime(order.submittedAt())},
        {"completedAt", optionalTime(order.completedAt())}}}};
}

// -----------------------------------------------------------------------------
// Position: grouped into intended / actual / orders / pnl / slippage /
// timestamps / metadata blocks
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Position& position) {
  const auto orderIdJson = [](const std::optional<OrderId>& id) {
    return id ? nlohmann::json(id->value()) : nlohmann::json(nullptr);
  };

  const PositionLevels& intended = position.intended();

  nlohmann::json exit_reason = nullptr;
  if (position.exitReason()) {
    exit_reason = toString(*position.exitReason());
  }

  nlohmann::json roi = nullptr;
  if (const auto value = position.roi()) {
    roi = toDouble(*value);
  }

  nlohmann::json duration_ms = nullptr;
  if (const auto value = position.duration()) {
    duration_ms = value->count();
  }

  j = nlohmann::json{
      {"id", position.id().value()},
      {"pair", position.pair()},
      {"side", toString(position.side())},
      {"status", toString(position.status())},
      {"profile", toString(position.profile())},
      {"intended",
       {{"entryPrice", intended.entry},
        {"stopLoss", intended.stop_loss},
        {"takeProfit", intended.take_profit},
        {"size", intended.size}}},
      {"actual",
       {{"entryPrice", optionalJson(position.actualEntryPrice())},
        {"size", optionalJson(position.actualSize())},
        {"exitPrice", optionalJson(position.exitPrice())},
        {"stopLoss", position.stopLoss()},
        {"takeProfit", position.takeProfit()},
        {"exitReason", exit_reason}}},
      {"orders",
       {{"entry", position.entryOrderId().value()},
        {"stopLoss", orderIdJson(position.stopLossOrderId())},
        {"takeProfit", orderIdJson(position.takeProfitOrderId())},
        {"exit", orderIdJson(position.exitOrderId())}}},
      {"pnl",
       {{"realized", optionalJson(position.realizedPnL())},
        {"roi", roi},
        {"entryFees", optionalJson(position.entryFees())},
        {"exitFees", optionalJson(position.exitFees())},
        {"totalFees", position.totalFees()}}},
      {"slippage",
       {{"entry", optionalJson(position.entrySlippage())},
        {"exit", optionalJson(position.exitSlippage())}}},
      {"timestamps",
       {{"createdAt", format_iso8601(position.createdAt())},
        {"updatedAt", format_iso8601(position.updatedAt())},
        {"openedAt", optionalTime(position.openedAt())},
        {"closedAt", optionalTime(position.closedAt())},
        {"durationMs", duration_ms}}},
      {"metadata",
       {{"agentId", position.agentId()},
        {"strategyId", optionalJson(position.strategyId())},
        {"tags", position.tags()}}}};
}

void to_json(nlohmann::json& j, const OrderBookLevel& level) {
  j = nlohmann::json{{"price", level.price().value()},
                     {"quantity", level.quantity().value()},
                     {"total", level.totalValue().value()}};
}

void to_json(nlohmann::json& j, const OrderBookSnapshot& snapshot) {
  j = nlohmann::json{
      {"pair", snapshot.pair()},
      {"timestamp", format_iso8601(snapshot.timestamp())},
      {"bestBid", snapshot.bestBid()},
      {"bestAsk", snapshot.bestAsk()},
      {"midPrice", snapshot.midPrice()},
      {"spread", snapshot.spread()},
      {"spreadPercent", snapshot.spreadPercent()},
      {"liquidity",
       {{"bid", snapshot.bidLiquidity()},
        {"ask", snapshot.askLiquidity()},
        {"imbalance", toDouble(snapshot.liquidityImbalance())}}},
      {"depth",
       {{"bids", snapshot.bidDepth()}, {"asks", snapshot.askDepth()}}},
      {"bids", snapshot.bids()},
      {"asks", snapshot.asks()}};
}

void to_json(nlohmann::json& j, const MarketBuyEstimate& estimate) {
  j = nlohmann::json{{"filledQuantity", estimate.filled_quantity},
                     {"totalCost", estimate.total_cost},
                     {"averagePrice", estimate.average_price},
                     {"slippage", estimate.slippage},
                     {"fullyFilled", estimate.fully_filled}};
}

void to_json(nlohmann::json& j, const MarketSellEstimate& estimate) {
  j = nlohmann::json{{"filledQuantity", estimate.filled_quantity},
                     {"totalProceeds", estimate.total_proceeds},
                     {"averagePrice", estimate.average_price},
                     {"slippage", estimate.slippage},
                     {"fullyFilled", estimate.fully_filled}};
}

void to_json(nlohmann::json& j, const Kline& kline) {
  j = nlohmann::json{{"pair", kline.pair().symbol()},
                     {"timeframe", to_string(kline.timeframe())},
                     {"openTime", format_iso8601(kline.openTime())},
                     {"closeTime", format_iso8601(kline.closeTime())},
                     {"open", kline.open().value()},
                     {"high", kline.high().value()},
                     {"low", kline.low().value()},
                     {"close", kline.close().value()},
                     {"volume", kline.volume()},
                     {"quoteVolume", optionalJson(kline.quoteVolume())},
                     {"trades", optionalJson(kline.trades())},
                     {"change", kline.priceChangePercent()},
                     {"bullish", kline.isBullish()}};
}

}  // namespace domain

// -----------------------------------------------------------------------------
// DomainError: details carry the fields of the concrete subclass
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const DomainError& error) {
  nlohmann::json details = nlohmann::json::object();

  if (const auto* e = dynamic_cast<const InvalidValueError*>(&error)) {
    details = {{"valueType", e->valueType()},
               {"reason", e->reason()},
               {"providedValue", e->providedValue()}};
  } else if (const auto* e =
                 dynamic_cast<const InvalidOperationError*>(&error)) {
    details = {{"operation", e->operation()}, {"reason", e->reason()}};
  } else if (const auto* e =
                 dynamic_cast<const InvalidStateTransitionError*>(&error)) {
    details = {{"entity", e->entity()},
               {"currentState", e->currentState()},
               {"attempted", e->attempted()}};
  } else if (const auto* e =
                 dynamic_cast<const InsufficientFundsError*>(&error)) {
    details = {{"asset", e->asset()},
               {"required", e->required()},
               {"available", e->available()}};
  } else if (const auto* e =
                 dynamic_cast<const OrderValidationError*>(&error)) {
    details = {{"reason", e->reason()}};
  } else if (const auto* e =
                 dynamic_cast<const PositionValidationError*>(&error)) {
    details = {{"reason", e->reason()}};
  }

  j = nlohmann::json{{"type", error.kind()},
                     {"message", error.what()},
                     {"details", details}};
}

}  // namespace tradekernel
