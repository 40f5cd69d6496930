#include "tradekernel/domain/trading_pair.hpp"
#include "tradekernel/domain/errors.hpp"

#include <algorithm>
#include <utility>

namespace tradekernel {
namespace domain {

TradingPair::TradingPair(Asset base, Asset quote)
    : base_(std::move(base)), quote_(std::move(quote)) {}

TradingPair TradingPair::from(const Asset& base, const Asset& quote) {
  if (base == quote) {
    throw InvalidValueError("TradingPair",
                            "Base and quote assets must differ",
                            base.symbol() + "/" + quote.symbol());
  }
  return TradingPair(base, quote);
}

// -----------------------------------------------------------------------------
// fromSymbol(): split on the single '/' separator
// -----------------------------------------------------------------------------
TradingPair TradingPair::fromSymbol(const std::string& symbol) {
  if (std::count(symbol.begin(), symbol.end(), '/') != 1) {
    throw InvalidValueError("TradingPair",
                            "Symbol must have the form BASE/QUOTE", symbol);
  }
  const auto slash = symbol.find('/');
  return from(Asset::from(symbol.substr(0, slash)),
              Asset::from(symbol.substr(slash + 1)));
}

std::string TradingPair::symbol() const {
  return base_.symbol() + "/" + quote_.symbol();
}

TradingPair TradingPair::inverse() const {
  return TradingPair(quote_, base_);
}

bool TradingPair::isStablePair() const {
  return base_.isStablecoin() && quote_.isStablecoin();
}

bool TradingPair::isStableQuoted() const { return quote_.isStablecoin(); }

bool TradingPair::isFiatQuoted() const { return quote_.isFiat(); }

bool TradingPair::isCryptoPair() const {
  return base_.isCrypto() && quote_.isCrypto();
}

bool TradingPair::equals(const TradingPair& other) const {
  return base_ == other.base_ && quote_ == other.quote_;
}

}  // namespace domain
}  // namespace tradekernel
