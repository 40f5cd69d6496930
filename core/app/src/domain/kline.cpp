#include "tradekernel/domain/kline.hpp"
#include "tradekernel/domain/errors.hpp"

#include <chrono>

namespace tradekernel {
namespace domain {

namespace {

void requirePair(const Price& price, const TradingPair& pair,
                 const char* field) {
  if (price.pair() != pair) {
    throw InvalidValueError("Kline",
                            std::string(field) +
                                " price must match trading pair " +
                                pair.symbol(),
                            price.toString());
  }
}

void requireOrdered(const Price& upper, const Price& lower,
                    const char* rule) {
  if (upper < lower) {
    throw InvalidValueError("Kline", rule,
                            upper.format() + " vs " + lower.format());
  }
}

}  // namespace

Kline::Kline(const KlineParams& params, Timestamp close_time)
    : pair_(params.pair),
      timeframe_(params.timeframe),
      open_time_(params.open_time),
      close_time_(close_time),
      open_(params.open),
      high_(params.high),
      low_(params.low),
      close_(params.close),
      volume_(params.volume),
      quote_volume_(params.quote_volume),
      trades_(params.trades) {}

// -----------------------------------------------------------------------------
// from(): pair membership, OHLC ordering, volume units, time grid
// -----------------------------------------------------------------------------
Kline Kline::from(const KlineParams& params) {
  const TradingPair& pair = params.pair;

  requirePair(params.open, pair, "Open");
  requirePair(params.high, pair, "High");
  requirePair(params.low, pair, "Low");
  requirePair(params.close, pair, "Close");

  requireOrdered(params.high, params.low, "High must be >= Low");
  requireOrdered(params.high, params.open, "High must be >= Open");
  requireOrdered(params.high, params.close, "High must be >= Close");
  requireOrdered(params.open, params.low, "Low must be <= Open");
  requireOrdered(params.close, params.low, "Low must be <= Close");

  if (params.volume.asset() != pair.base()) {
    throw InvalidValueError("Kline", "Volume must be in base asset " +
                                         pair.base().symbol(),
                            params.volume.toString());
  }
  if (params.volume.isNegative()) {
    throw InvalidValueError("Kline", "Volume cannot be negative",
                            params.volume.toString());
  }
  if (params.quote_volume && params.quote_volume->asset() != pair.quote()) {
    throw InvalidValueError("Kline", "Quote volume must be in quote asset " +
                                         pair.quote().symbol(),
                            params.quote_volume->toString());
  }
  if (!is_aligned(params.open_time, params.timeframe)) {
    throw InvalidValueError(
        "Kline",
        std::string("Open time must be aligned to timeframe ") +
            to_string(params.timeframe),
        format_iso8601(params.open_time));
  }
  if (params.trades && *params.trades < 0) {
    throw InvalidValueError("Kline", "Trades count cannot be negative",
                            std::to_string(*params.trades));
  }

  const Timestamp close_time =
      params.close_time.value_or(params.open_time +
                                 timeframe_duration(params.timeframe) -
                                 std::chrono::milliseconds{1});
  if (close_time <= params.open_time) {
    throw InvalidValueError("Kline", "Close time must be after open time",
                            format_iso8601(close_time));
  }

  return Kline(params, close_time);
}

// -----------------------------------------------------------------------------
// Candle geometry
// -----------------------------------------------------------------------------
Amount Kline::range() const { return high_.subtract(low_); }

Amount Kline::bodySize() const { return close_.absoluteDifference(open_); }

Amount Kline::upperWick() const {
  return high_.subtract(open_.max(close_));
}

Amount Kline::lowerWick() const {
  return open_.min(close_).subtract(low_);
}

Amount Kline::priceChange() const { return close_.subtract(open_); }

Percentage Kline::priceChangePercent() const {
  return open_.percentageChangeTo(close_);
}

Price Kline::midpoint() const {
  Decimal mid = (high_.decimal() + low_.decimal()) / 2;
  return Price::from(mid, pair_);
}

Price Kline::typicalPrice() const {
  Decimal typical = (high_.decimal() + low_.decimal() + close_.decimal()) / 3;
  return Price::from(typical, pair_);
}

Price Kline::weightedClose() const {
  Decimal weighted =
      (high_.decimal() + low_.decimal() + close_.decimal() * 2) / 4;
  return Price::from(weighted, pair_);
}

std::optional<Price> Kline::averagePrice() const {
  if (!quote_volume_ || volume_.isZero()) {
    return std::nullopt;
  }
  Decimal average = quote_volume_->decimal() / volume_.decimal();
  if (average <= 0) {
    return std::nullopt;
  }
  return Price::from(average, pair_);
}

}  // namespace domain
}  // namespace tradekernel
