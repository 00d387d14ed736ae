// Outcome of a single validator run.

#ifndef SYMFORGE_VALIDATION_VALIDATION_RESULT_H
#define SYMFORGE_VALIDATION_VALIDATION_RESULT_H

#include <optional>
#include <string>
#include <utility>

namespace symforge {

/// @brief Immutable pass/fail record produced by one validator.
///
/// A failing result normally carries a message; a passing one may carry a
/// note (e.g. the audit text of an override).
class ValidationResult {
 public:
  ValidationResult(bool is_valid, std::string validator_name,
                   std::optional<std::string> failure_message = std::nullopt)
      : is_valid_(is_valid),
        validator_name_(std::move(validator_name)),
        failure_message_(std::move(failure_message)) {}

  static ValidationResult pass(std::string validator_name,
                               std::optional<std::string> note = std::nullopt) {
    return ValidationResult(true, std::move(validator_name), std::move(note));
  }

  static ValidationResult fail(std::string validator_name, std::string message) {
    return ValidationResult(false, std::move(validator_name), std::move(message));
  }

  bool isValid() const { return is_valid_; }
  const std::string& validatorName() const { return validator_name_; }
  const std::optional<std::string>& failureMessage() const { return failure_message_; }

 private:
  bool is_valid_;
  std::string validator_name_;
  std::optional<std::string> failure_message_;
};

}  // namespace symforge

#endif  // SYMFORGE_VALIDATION_VALIDATION_RESULT_H
