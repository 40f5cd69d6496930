#pragma once

#include "tradekernel/domain/amount.hpp"
#include "tradekernel/domain/percentage.hpp"
#include "tradekernel/domain/price.hpp"
#include "tradekernel/domain/trading_pair.hpp"
#include "tradekernel/time/time_utils.hpp"
#include "tradekernel/time/timeframe.hpp"

#include <cstdint>
#include <optional>

namespace tradekernel {
namespace domain {

struct KlineParams {
  TradingPair pair;
  Timeframe timeframe;
  Timestamp open_time;
  Price open;
  Price high;
  Price low;
  Price close;
  Amount volume;                            // base asset
  std::optional<Timestamp> close_time;      // defaults to the candle end
  std::optional<Amount> quote_volume;       // quote asset
  std::optional<std::int64_t> trades;
};

// -----------------------------------------------------------------------------
// Kline — one OHLCV candle
// -----------------------------------------------------------------------------
//
// @brief  Immutable open/high/low/close/volume record for one timeframe
//         bucket of one pair.
//
// @details
// Validation (InvalidValueError, value_type "Kline"):
//   - open, high, low and close all belong to the kline pair
//   - high >= low, high >= open, high >= close, low <= open, low <= close
//   - volume in base and >= 0; quote volume (if any) in quote
//   - open time aligned to the timeframe grid
//   - close time after open time; defaults to open + timeframe - 1ms
//   - trade count (if any) >= 0
//
// Derived price metrics are all quote Amounts or Prices of the same pair.
// -----------------------------------------------------------------------------
class Kline {
 public:
  static Kline from(const KlineParams& params);

  const TradingPair& pair() const { return pair_; }
  Timeframe timeframe() const { return timeframe_; }
  Timestamp openTime() const { return open_time_; }
  Timestamp closeTime() const { return close_time_; }
  const Price& open() const { return open_; }
  const Price& high() const { return high_; }
  const Price& low() const { return low_; }
  const Price& close() const { return close_; }
  const Amount& volume() const { return volume_; }
  const std::optional<Amount>& quoteVolume() const { return quote_volume_; }
  const std::optional<std::int64_t>& trades() const { return trades_; }

  Amount range() const;
  Amount bodySize() const;
  Amount upperWick() const;
  Amount lowerWick() const;
  Amount priceChange() const;
  Percentage priceChangePercent() const;

  // (high + low) / 2
  Price midpoint() const;
  // (high + low + close) / 3
  Price typicalPrice() const;
  // (high + low + 2 * close) / 4
  Price weightedClose() const;
  // quote volume / volume, when both are known and volume is non-zero.
  std::optional<Price> averagePrice() const;

  bool isBullish() const { return close_ > open_; }
  bool isBearish() const { return close_ < open_; }

 private:
  Kline(const KlineParams& params, Timestamp close_time);

  TradingPair pair_;
  Timeframe timeframe_;
  Timestamp open_time_;
  Timestamp close_time_;
  Price open_;
  Price high_;
  Price low_;
  Price close_;
  Amount volume_;
  std::optional<Amount> quote_volume_;
  std::optional<std::int64_t> trades_;
};

}  // namespace domain
}  // namespace tradekernel
