#pragma once

#include <stdexcept>
#include <string>

namespace tradekernel {

// -----------------------------------------------------------------------------
// DomainError — root of every failure raised by the kernel
// -----------------------------------------------------------------------------
//
// @brief  All kernel failures are synchronous and surface to the immediate
//         caller as a subclass of DomainError. Nothing inside the kernel
//         retries or recovers.
//
// @details
// Each subclass carries the structured context an adapter needs to build a
// user-facing message (offending value, attempted transition, entity state)
// without re-deriving it. kind() names the category so adapters can map it
// to a transport status without RTTI.
//
//   InvalidValue            value type invariant broken at construction
//   InvalidOperation        runtime rule violated by a valid operation
//   InvalidStateTransition  entity method called in a state that forbids it
//   InsufficientFunds       available amount below the required amount
//   OrderValidation         cross-field order rule (fill/order mismatch)
//   PositionValidation      cross-field position rule (SL/TP direction)
// -----------------------------------------------------------------------------
class DomainError : public std::runtime_error {
 public:
  explicit DomainError(const std::string& message);

  virtual const char* kind() const noexcept = 0;
};

class InvalidValueError : public DomainError {
 public:
  InvalidValueError(std::string value_type, std::string reason,
                    std::string provided_value = {});

  const char* kind() const noexcept override { return "InvalidValue"; }

  const std::string& valueType() const { return value_type_; }
  const std::string& reason() const { return reason_; }
  const std::string& providedValue() const { return provided_value_; }

 private:
  std::string value_type_;
  std::string reason_;
  std::string provided_value_;
};

class InvalidOperationError : public DomainError {
 public:
  InvalidOperationError(std::string operation, std::string reason);

  const char* kind() const noexcept override { return "InvalidOperation"; }

  const std::string& operation() const { return operation_; }
  const std::string& reason() const { return reason_; }

 private:
  std::string operation_;
  std::string reason_;
};

class InvalidStateTransitionError : public DomainError {
 public:
  InvalidStateTransitionError(std::string entity, std::string current_state,
                              std::string attempted);

  const char* kind() const noexcept override {
    return "InvalidStateTransition";
  }

  const std::string& entity() const { return entity_; }
  const std::string& currentState() const { return current_state_; }
  const std::string& attempted() const { return attempted_; }

 private:
  std::string entity_;
  std::string current_state_;
  std::string attempted_;
};

// Amounts are carried as display strings ("1.5 BTC") so the error has no
// dependency on the value algebra.
class InsufficientFundsError : public DomainError {
 public:
  InsufficientFundsError(std::string asset, std::string required,
                         std::string available);

  const char* kind() const noexcept override { return "InsufficientFunds"; }

  const std::string& asset() const { return asset_; }
  const std::string& required() const { return required_; }
  const std::string& available() const { return available_; }

 private:
  std::string asset_;
  std::string required_;
  std::string available_;
};

class OrderValidationError : public DomainError {
 public:
  explicit OrderValidationError(std::string reason);

  const char* kind() const noexcept override { return "OrderValidation"; }

  const std::string& reason() const { return reason_; }

 private:
  std::string reason_;
};

class PositionValidationError : public DomainError {
 public:
  explicit PositionValidationError(std::string reason);

  const char* kind() const noexcept override { return "PositionValidation"; }

  const std::string& reason() const { return reason_; }

 private:
  std::string reason_;
};

}  // namespace tradekernel
