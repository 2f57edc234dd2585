#ifndef ERRORS_HPP_
#define ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace ledger {

/**
 * Every failure the ledger reports to its callers.
 */
enum class ErrorCode {
  // Caller input errors
  InvalidAmount,
  AmountTooLarge,
  SelfTransfer,
  InvalidIdempotencyKey,
  DescriptionTooLong,
  InvalidArgument,

  // Business-rule violations
  InsufficientBalance,
  BalanceOverflow,

  AccountNotFound,

  // Infrastructure faults; the caller may retry with the same idempotency key
  DuplicateIdempotencyKey,
  LockTimeout,
  Cancelled,
  Storage,
  Configuration
};

/**
 * How a failure should be surfaced to the caller.
 */
enum class ErrorClass {
  ClientFault,
  PreconditionFailed,
  NotFound,
  Internal
};

/**
 * Base exception for all ledger errors.
 */
class LedgerError : public std::runtime_error {
 public:
  explicit LedgerError(ErrorCode code);
  LedgerError(ErrorCode code, const std::string& message);

  ErrorCode code() const { return code_; }
  ErrorClass errorClass() const;

 private:
  ErrorCode code_;
};

// Stable identifier such as "INSUFFICIENT_BALANCE".
const char* errorCodeName(ErrorCode code);

// Default human readable message for a code.
const char* defaultMessage(ErrorCode code);

ErrorClass classify(ErrorCode code);
const char* errorClassName(ErrorClass error_class);

}  // namespace ledger

#endif  // ERRORS_HPP_
