#pragma once

#include "tradekernel/domain/errors.hpp"

#include <functional>
#include <string>
#include <utility>

namespace tradekernel {
namespace domain {

// -----------------------------------------------------------------------------
// Identifier<Tag> — non-empty string id, distinct type per entity
// -----------------------------------------------------------------------------
//
// @brief  OrderId, PositionId and ExchangeOrderId share the same rules but
//         must never be mixed up; the tag makes each one its own type.
//
// @details
// from() trims surrounding whitespace and rejects an empty result. Equality
// and ordering are by value. std::hash is specialized below so identifiers
// can key unordered containers.
// -----------------------------------------------------------------------------
template <typename Tag>
class Identifier {
 public:
  static Identifier from(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
      throw InvalidValueError(Tag::kName, "Must not be empty", value);
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return Identifier(value.substr(first, last - first + 1));
  }

  const std::string& value() const { return value_; }
  const std::string& toString() const { return value_; }

  bool equals(const Identifier& other) const { return value_ == other.value_; }

 private:
  explicit Identifier(std::string value) : value_(std::move(value)) {}

  std::string value_;
};

template <typename Tag>
bool operator==(const Identifier<Tag>& lhs, const Identifier<Tag>& rhs) {
  return lhs.equals(rhs);
}

template <typename Tag>
bool operator!=(const Identifier<Tag>& lhs, const Identifier<Tag>& rhs) {
  return !lhs.equals(rhs);
}

template <typename Tag>
bool operator<(const Identifier<Tag>& lhs, const Identifier<Tag>& rhs) {
  return lhs.value() < rhs.value();
}

struct OrderIdTag {
  static constexpr const char* kName = "OrderId";
};
struct PositionIdTag {
  static constexpr const char* kName = "PositionId";
};
struct ExchangeOrderIdTag {
  static constexpr const char* kName = "ExchangeOrderId";
};

using OrderId = Identifier<OrderIdTag>;
using PositionId = Identifier<PositionIdTag>;
using ExchangeOrderId = Identifier<ExchangeOrderIdTag>;

}  // namespace domain
}  // namespace tradekernel

namespace std {

template <typename Tag>
struct hash<tradekernel::domain::Identifier<Tag>> {
  std::size_t operator()(
      const tradekernel::domain::Identifier<Tag>& id) const noexcept {
    return std::hash<std::string>{}(id.value());
  }
};

}  // namespace std
