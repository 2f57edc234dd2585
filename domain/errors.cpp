#include "domain/errors.hpp"

namespace ledger {

LedgerError::LedgerError(ErrorCode code)
    : std::runtime_error(defaultMessage(code)), code_(code) {}

LedgerError::LedgerError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

ErrorClass LedgerError::errorClass() const {
  return classify(code_);
}

const char* errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidAmount: return "INVALID_AMOUNT";
    case ErrorCode::AmountTooLarge: return "AMOUNT_TOO_LARGE";
    case ErrorCode::SelfTransfer: return "SELF_TRANSFER";
    case ErrorCode::InvalidIdempotencyKey: return "INVALID_IDEMPOTENCY_KEY";
    case ErrorCode::DescriptionTooLong: return "DESCRIPTION_TOO_LONG";
    case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
    case ErrorCode::InsufficientBalance: return "INSUFFICIENT_BALANCE";
    case ErrorCode::BalanceOverflow: return "BALANCE_OVERFLOW";
    case ErrorCode::AccountNotFound: return "ACCOUNT_NOT_FOUND";
    case ErrorCode::DuplicateIdempotencyKey: return "DUPLICATE_IDEMPOTENCY_KEY";
    case ErrorCode::LockTimeout: return "LOCK_TIMEOUT";
    case ErrorCode::Cancelled: return "CANCELLED";
    case ErrorCode::Storage: return "STORAGE";
    case ErrorCode::Configuration: return "CONFIGURATION";
  }
  return "UNKNOWN";
}

const char* defaultMessage(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidAmount: return "amount must be positive";
    case ErrorCode::AmountTooLarge: return "amount exceeds maximum allowed value";
    case ErrorCode::SelfTransfer: return "cannot transfer to self";
    case ErrorCode::InvalidIdempotencyKey: return "idempotency key must not be empty";
    case ErrorCode::DescriptionTooLong: return "description is too long";
    case ErrorCode::InvalidArgument: return "invalid argument";
    case ErrorCode::InsufficientBalance: return "insufficient balance";
    case ErrorCode::BalanceOverflow: return "balance would overflow";
    case ErrorCode::AccountNotFound: return "account not found";
    case ErrorCode::DuplicateIdempotencyKey: return "idempotency key already used";
    case ErrorCode::LockTimeout: return "timed out waiting for lock";
    case ErrorCode::Cancelled: return "operation cancelled";
    case ErrorCode::Storage: return "storage failure";
    case ErrorCode::Configuration: return "invalid configuration";
  }
  return "unknown error";
}

ErrorClass classify(ErrorCode code) {
  switch (code) {
    case ErrorCode::InvalidAmount:
    case ErrorCode::AmountTooLarge:
    case ErrorCode::SelfTransfer:
    case ErrorCode::InvalidIdempotencyKey:
    case ErrorCode::DescriptionTooLong:
    case ErrorCode::InvalidArgument:
      return ErrorClass::ClientFault;
    case ErrorCode::InsufficientBalance:
    case ErrorCode::BalanceOverflow:
      return ErrorClass::PreconditionFailed;
    case ErrorCode::AccountNotFound:
      return ErrorClass::NotFound;
    case ErrorCode::DuplicateIdempotencyKey:
    case ErrorCode::LockTimeout:
    case ErrorCode::Cancelled:
    case ErrorCode::Storage:
    case ErrorCode::Configuration:
      return ErrorClass::Internal;
  }
  return ErrorClass::Internal;
}

const char* errorClassName(ErrorClass error_class) {
  switch (error_class) {
    case ErrorClass::ClientFault: return "CLIENT_FAULT";
    case ErrorClass::PreconditionFailed: return "PRECONDITION_FAILED";
    case ErrorClass::NotFound: return "NOT_FOUND";
    case ErrorClass::Internal: return "INTERNAL";
  }
  return "INTERNAL";
}

}  // namespace ledger
