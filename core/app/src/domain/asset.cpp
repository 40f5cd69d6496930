#include "tradekernel/domain/asset.hpp"
#include "tradekernel/domain/errors.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace tradekernel {
namespace domain {

namespace {

constexpr std::size_t kMaxSymbolLength = 10;

std::string normalizeSymbol(const std::string& raw) {
  const auto first = raw.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = raw.find_last_not_of(" \t\r\n");
  std::string symbol = raw.substr(first, last - first + 1);
  std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return symbol;
}

}  // namespace

const char* toString(AssetType type) {
  switch (type) {
    case AssetType::Cryptocurrency: return "CRYPTOCURRENCY";
    case AssetType::Stablecoin:     return "STABLECOIN";
    case AssetType::Fiat:           return "FIAT";
    case AssetType::Unknown:        return "UNKNOWN";
  }
  return "UNKNOWN";
}

Asset::Asset(std::string symbol, AssetType type)
    : symbol_(std::move(symbol)), type_(type) {}

// -----------------------------------------------------------------------------
// from(): normalize, then validate ^[A-Z0-9]{1,10}$
// -----------------------------------------------------------------------------
Asset Asset::from(const std::string& symbol, AssetType type) {
  std::string normalized = normalizeSymbol(symbol);

  if (normalized.empty()) {
    throw InvalidValueError("Asset", "Symbol must not be empty", symbol);
  }
  if (normalized.size() > kMaxSymbolLength) {
    throw InvalidValueError("Asset", "Symbol must be at most 10 characters",
                            symbol);
  }
  const bool alphanumeric =
      std::all_of(normalized.begin(), normalized.end(), [](unsigned char c) {
        return std::isdigit(c) || (c >= 'A' && c <= 'Z');
      });
  if (!alphanumeric) {
    throw InvalidValueError("Asset",
                            "Symbol must contain only letters and digits",
                            symbol);
  }

  return Asset(std::move(normalized), type);
}

Asset Asset::crypto(const std::string& symbol) {
  return from(symbol, AssetType::Cryptocurrency);
}

Asset Asset::stablecoin(const std::string& symbol) {
  return from(symbol, AssetType::Stablecoin);
}

Asset Asset::fiat(const std::string& symbol) {
  return from(symbol, AssetType::Fiat);
}

}  // namespace domain
}  // namespace tradekernel
