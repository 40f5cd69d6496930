#pragma once

#include <string>

namespace tradekernel {
namespace domain {

// Classification is metadata only; it never participates in equality.
enum class AssetType {
  Cryptocurrency,
  Stablecoin,
  Fiat,
  Unknown
};

const char* toString(AssetType type);

// -----------------------------------------------------------------------------
// Asset — canonical identity of a tradable instrument
// -----------------------------------------------------------------------------
//
// @brief  Symbol plus classification. The symbol is trimmed, uppercased and
//         validated against ^[A-Z0-9]{1,10}$ before the instance exists.
//
// @details
// Two assets are equal when their symbols are equal, so Asset::from("btc")
// and Asset::crypto("BTC") compare equal even though only the latter
// carries a classification.
// -----------------------------------------------------------------------------
class Asset {
 public:
  static Asset from(const std::string& symbol,
                    AssetType type = AssetType::Unknown);
  static Asset crypto(const std::string& symbol);
  static Asset stablecoin(const std::string& symbol);
  static Asset fiat(const std::string& symbol);

  const std::string& symbol() const { return symbol_; }
  AssetType type() const { return type_; }

  bool isCrypto() const { return type_ == AssetType::Cryptocurrency; }
  bool isStablecoin() const { return type_ == AssetType::Stablecoin; }
  bool isFiat() const { return type_ == AssetType::Fiat; }
  bool isVolatile() const { return isCrypto(); }

  bool equals(const Asset& other) const { return symbol_ == other.symbol_; }

  const std::string& toString() const { return symbol_; }

 private:
  Asset(std::string symbol, AssetType type);

  std::string symbol_;
  AssetType type_;
};

inline bool operator==(const Asset& lhs, const Asset& rhs) {
  return lhs.equals(rhs);
}

inline bool operator!=(const Asset& lhs, const Asset& rhs) {
  return !lhs.equals(rhs);
}

}  // namespace domain
}  // namespace tradekernel
