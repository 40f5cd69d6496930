#pragma once

#include "tradekernel/domain/asset.hpp"

#include <string>

namespace tradekernel {
namespace domain {

// -----------------------------------------------------------------------------
// TradingPair — BASE/QUOTE market identity
// -----------------------------------------------------------------------------
//
// @brief  The base is the traded unit, the quote is the pricing and
//         settlement unit. base != quote is enforced at construction.
//
// @details
// Every Price is scoped to exactly one pair. Prices from different pairs
// never compare or combine; see Price.
// -----------------------------------------------------------------------------
class TradingPair {
 public:
  static TradingPair from(const Asset& base, const Asset& quote);

  // Parses "BASE/QUOTE". Exactly one '/' is accepted; each side is parsed
  // with Asset::from and therefore carries no classification.
  static TradingPair fromSymbol(const std::string& symbol);

  const Asset& base() const { return base_; }
  const Asset& quote() const { return quote_; }

  // "BTC/USDT"
  std::string symbol() const;

  TradingPair inverse() const;

  bool isStablePair() const;
  bool isStableQuoted() const;
  bool isFiatQuoted() const;
  bool isCryptoPair() const;

  bool equals(const TradingPair& other) const;

  std::string toString() const { return symbol(); }

 private:
  TradingPair(Asset base, Asset quote);

  Asset base_;
  Asset quote_;
};

inline bool operator==(const TradingPair& lhs, const TradingPair& rhs) {
  return lhs.equals(rhs);
}

inline bool operator!=(const TradingPair& lhs, const TradingPair& rhs) {
  return !lhs.equals(rhs);
}

}  // namespace domain
}  // namespace tradekernel
