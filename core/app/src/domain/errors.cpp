#include "tradekernel/domain/errors.hpp"

#include <utility>

namespace tradekernel {

DomainError::DomainError(const std::string& message)
    : std::runtime_error(message) {}

// -----------------------------------------------------------------------------
// InvalidValueError: "Invalid <type>: <reason> (got: <value>)"
// -----------------------------------------------------------------------------
InvalidValueError::InvalidValueError(std::string value_type,
                                     std::string reason,
                                     std::string provided_value)
    : DomainError("Invalid " + value_type + ": " + reason +
                  (provided_value.empty() ? std::string{}
                                          : " (got: " + provided_value + ")")),
      value_type_(std::move(value_type)),
      reason_(std::move(reason)),
      provided_value_(std::move(provided_value)) {}

InvalidOperationError::InvalidOperationError(std::string operation,
                                             std::string reason)
    : DomainError("Invalid operation '" + operation + "': " + reason),
      operation_(std::move(operation)),
      reason_(std::move(reason)) {}

InvalidStateTransitionError::InvalidStateTransitionError(
    std::string entity, std::string current_state, std::string attempted)
    : DomainError("Cannot " + attempted + " " + entity + " in state " +
                  current_state),
      entity_(std::move(entity)),
      current_state_(std::move(current_state)),
      attempted_(std::move(attempted)) {}

InsufficientFundsError::InsufficientFundsError(std::string asset,
                                               std::string required,
                                               std::string available)
    : DomainError("Insufficient " + asset + ": required " + required +
                  ", available " + available),
      asset_(std::move(asset)),
      required_(std::move(required)),
      available_(std::move(available)) {}

OrderValidationError::OrderValidationError(std::string reason)
    : DomainError("Order validation failed: " + reason),
      reason_(std::move(reason)) {}

PositionValidationError::PositionValidationError(std::string reason)
    : DomainError("Position validation failed: " + reason),
      reason_(std::move(reason)) {}

}  // namespace tradekernel
