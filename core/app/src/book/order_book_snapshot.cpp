#include "tradekernel/book/order_book_snapshot.hpp"
#include "tradekernel/domain/errors.hpp"

#include <algorithm>
#include <utility>

namespace tradekernel {
namespace domain {

OrderBookSnapshot::OrderBookSnapshot(TradingPair pair,
                                     std::vector<OrderBookLevel> bids,
                                     std::vector<OrderBookLevel> asks,
                                     Timestamp timestamp)
    : pair_(std::move(pair)),
      bids_(std::move(bids)),
      asks_(std::move(asks)),
      timestamp_(timestamp) {}

// -----------------------------------------------------------------------------
// from(): validate pair membership, sort both ladders, reject crossed books
// -----------------------------------------------------------------------------
OrderBookSnapshot OrderBookSnapshot::from(const TradingPair& pair,
                                          std::vector<OrderBookLevel> bids,
                                          std::vector<OrderBookLevel> asks,
                                          Timestamp timestamp) {
  if (bids.empty()) {
    throw InvalidValueError("OrderBookSnapshot",
                            "Must have at least one bid level");
  }
  if (asks.empty()) {
    throw InvalidValueError("OrderBookSnapshot",
                            "Must have at least one ask level");
  }

  const auto foreign = [&pair](const OrderBookLevel& level) {
    return level.price().pair() != pair;
  };
  if (std::any_of(bids.begin(), bids.end(), foreign) ||
      std::any_of(asks.begin(), asks.end(), foreign)) {
    throw InvalidValueError("OrderBookSnapshot",
                            "All levels must be priced in " + pair.symbol());
  }

  // Comparing raw decimals: every level is already known to share the pair.
  std::stable_sort(bids.begin(), bids.end(),
                   [](const OrderBookLevel& a, const OrderBookLevel& b) {
                     return a.price().decimal() > b.price().decimal();
                   });
  std::stable_sort(asks.begin(), asks.end(),
                   [](const OrderBookLevel& a, const OrderBookLevel& b) {
                     return a.price().decimal() < b.price().decimal();
                   });

  const Price& best_bid = bids.front().price();
  const Price& best_ask = asks.front().price();
  if (best_bid >= best_ask) {
    throw InvalidValueError("OrderBookSnapshot",
                            "Crossed book detected: best bid >= best ask",
                            best_bid.format() + " >= " + best_ask.format());
  }

  return OrderBookSnapshot(pair, std::move(bids), std::move(asks), timestamp);
}

// -----------------------------------------------------------------------------
// Top of book
// -----------------------------------------------------------------------------
Price OrderBookSnapshot::midPrice() const {
  Decimal mid =
      (bids_.front().price().decimal() + asks_.front().price().decimal()) / 2;
  return Price::from(mid, pair_);
}

Amount OrderBookSnapshot::spread() const {
  return asks_.front().price().subtract(bids_.front().price());
}

Percentage OrderBookSnapshot::spreadPercent() const {
  Decimal percent = spread().decimal() / midPrice().decimal() * 100;
  return Percentage::from(percent, true);
}

// -----------------------------------------------------------------------------
// Liquidity
// -----------------------------------------------------------------------------
Amount OrderBookSnapshot::sumLiquidity(
    const std::vector<OrderBookLevel>& ladder,
    std::optional<std::size_t> levels, const char* operation) const {
  if (levels && *levels == 0) {
    throw InvalidOperationError(operation, "Level count must be positive");
  }
  const std::size_t count =
      levels ? std::min(*levels, ladder.size()) : ladder.size();

  Amount total = Amount::zero(pair_.quote());
  for (std::size_t i = 0; i < count; ++i) {
    total = total.add(ladder[i].totalValue());
  }
  return total;
}

Amount OrderBookSnapshot::bidLiquidity(
    std::optional<std::size_t> levels) const {
  return sumLiquidity(bids_, levels, "bidLiquidity");
}

Amount OrderBookSnapshot::askLiquidity(
    std::optional<std::size_t> levels) const {
  return sumLiquidity(asks_, levels, "askLiquidity");
}

Decimal OrderBookSnapshot::liquidityImbalance(
    std::optional<std::size_t> levels) const {
  const Decimal bid = bidLiquidity(levels).decimal();
  const Decimal ask = askLiquidity(levels).decimal();
  // Both sides are non-empty with positive prices and quantities, so the
  // denominator is strictly positive.
  Decimal imbalance = (bid - ask) / (bid + ask);
  return imbalance;
}

// -----------------------------------------------------------------------------
// sweep(): walk one ladder from the best price outward
// -----------------------------------------------------------------------------
OrderBookSnapshot::Sweep OrderBookSnapshot::sweep(
    const std::vector<OrderBookLevel>& ladder, const Amount& size,
    LiquidityMode mode, const char* operation) const {
  if (size.asset() != pair_.base()) {
    throw InvalidOperationError(operation,
                                "Size must be in base asset " +
                                    pair_.base().symbol() + ", got " +
                                    size.asset().symbol());
  }
  if (!size.isValidSize()) {
    throw InvalidOperationError(operation,
                                "Size must be positive, got " +
                                    size.toString());
  }

  Sweep result{Decimal(0), Decimal(0), false};
  Decimal remaining = size.decimal();

  for (const OrderBookLevel& level : ladder) {
    const Decimal& available = level.quantity().decimal();
    Decimal take = remaining < available ? remaining : available;
    Decimal cost = take * level.price().decimal();
    result.notional += cost;
    result.filled += take;
    remaining -= take;
    if (remaining <= 0) {
      break;
    }
  }
  result.complete = remaining <= 0;

  if (!result.complete && mode == LiquidityMode::Strict) {
    throw InvalidOperationError(operation,
                                "Insufficient liquidity: requested " +
                                    size.toString() + ", available " +
                                    formatDecimal(result.filled) + " " +
                                    pair_.base().symbol());
  }
  return result;
}

MarketBuyEstimate OrderBookSnapshot::estimateMarketBuy(
    const Amount& size, LiquidityMode mode) const {
  const Sweep swept = sweep(asks_, size, mode, "estimateMarketBuy");

  Decimal average = swept.notional / swept.filled;
  const Price average_price = Price::from(average, pair_);
  const Decimal& best_ask = asks_.front().price().decimal();
  Decimal slippage = (average - best_ask) / best_ask * 100;

  return MarketBuyEstimate{Amount::from(swept.filled, pair_.base()),
                           Amount::from(swept.notional, pair_.quote()),
                           average_price, Percentage::from(slippage, true),
                           swept.complete};
}

MarketSellEstimate OrderBookSnapshot::estimateMarketSell(
    const Amount& size, LiquidityMode mode) const {
  const Sweep swept = sweep(bids_, size, mode, "estimateMarketSell");

  Decimal average = swept.notional / swept.filled;
  const Price average_price = Price::from(average, pair_);
  const Decimal& best_bid = bids_.front().price().decimal();
  Decimal slippage = (best_bid - average) / best_bid * 100;

  return MarketSellEstimate{Amount::from(swept.filled, pair_.base()),
                            Amount::from(swept.notional, pair_.quote()),
                            average_price, Percentage::from(slippage, true),
                            swept.complete};
}

std::string OrderBookSnapshot::toString() const {
  return pair_.symbol() + " OrderBook: " + bids_.front().price().format() +
         " / " + asks_.front().price().format() + " (" +
         spreadPercent().format(3) + " spread)";
}

}  // namespace domain
}  // namespace tradekernel
