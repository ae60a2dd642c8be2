#include "keyward/core/error.h"

#include <kj/common.h>
#include <kj/string.h>

namespace keyward::core {

kj::String to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return kj::str("Success");
  case ErrorCode::UnknownError:
    return kj::str("Unknown Error");
  case ErrorCode::InvalidCredentials:
    return kj::str("Invalid Credentials");
  case ErrorCode::TokenInvalid:
    return kj::str("Token Invalid");
  case ErrorCode::PermissionDenied:
    return kj::str("Permission Denied");
  case ErrorCode::NotFound:
    return kj::str("Not Found");
  case ErrorCode::Conflict:
    return kj::str("Conflict");
  case ErrorCode::ValidationError:
    return kj::str("Validation Error");
  case ErrorCode::StoreUnavailable:
    return kj::str("Store Unavailable");
  case ErrorCode::ConfigurationError:
    return kj::str("Configuration Error");
  default:
    return kj::str("Invalid Error Code");
  }
}

ErrorCode to_error_code(kj::StringPtr str) {
  if (str == "Success"_kj || str == "success"_kj) {
    return ErrorCode::Success;
  } else if (str == "Invalid Credentials"_kj || str == "invalid_credentials"_kj) {
    return ErrorCode::InvalidCredentials;
  } else if (str == "Token Invalid"_kj || str == "token_invalid"_kj) {
    return ErrorCode::TokenInvalid;
  } else if (str == "Permission Denied"_kj || str == "permission_denied"_kj) {
    return ErrorCode::PermissionDenied;
  } else if (str == "Not Found"_kj || str == "not_found"_kj) {
    return ErrorCode::NotFound;
  } else if (str == "Conflict"_kj || str == "conflict"_kj) {
    return ErrorCode::Conflict;
  } else if (str == "Validation Error"_kj || str == "validation"_kj) {
    return ErrorCode::ValidationError;
  } else if (str == "Store Unavailable"_kj || str == "store_unavailable"_kj) {
    return ErrorCode::StoreUnavailable;
  } else if (str == "Configuration Error"_kj || str == "configuration"_kj) {
    return ErrorCode::ConfigurationError;
  } else {
    return ErrorCode::UnknownError;
  }
}

kj::StringPtr to_string(TokenError error) {
  switch (error) {
  case TokenError::NONE:
    return "none"_kj;
  case TokenError::INVALID_FORMAT:
    return "invalid format"_kj;
  case TokenError::INVALID_BASE64:
    return "invalid base64"_kj;
  case TokenError::INVALID_JSON:
    return "invalid json"_kj;
  case TokenError::MISSING_CLAIMS:
    return "missing claims"_kj;
  case TokenError::ALGORITHM_MISMATCH:
    return "algorithm mismatch"_kj;
  case TokenError::UNKNOWN_KEY:
    return "unknown signing key"_kj;
  case TokenError::INVALID_SIGNATURE:
    return "invalid signature"_kj;
  case TokenError::EXPIRED:
    return "expired"_kj;
  case TokenError::FUTURE_ISSUED:
    return "issued in the future"_kj;
  case TokenError::TYPE_MISMATCH:
    return "type mismatch"_kj;
  case TokenError::REVOKED:
    return "revoked"_kj;
  case TokenError::INACTIVE_SUBJECT:
    return "inactive subject"_kj;
  }
  return "unknown"_kj;
}

} // namespace keyward::core
