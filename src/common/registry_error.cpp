#include "common/registry_error.h"

namespace hivereg {
namespace {

std::string FormatKeyNameMessage(KeyNameErrc code, const std::string& paramName) {
  std::string msg = DescribeKeyNameErrc(code);
  if (!paramName.empty()) {
    msg += " (parameter '" + paramName + "')";
  }
  return msg;
}

}  // namespace

KeyNameError::KeyNameError(KeyNameErrc code, const std::string& paramName)
    : std::invalid_argument(FormatKeyNameMessage(code, paramName)), code_(code), paramName_(paramName) {}

StoreError::StoreError(const std::string& what, int sqliteCode)
    : std::runtime_error(what), sqliteCode_(sqliteCode) {}

const char* DescribeKeyNameErrc(KeyNameErrc code) {
  switch (code) {
    case KeyNameErrc::NullKeyName:
      return "Key name must not be null";
    case KeyNameErrc::InvalidKeyName:
      return "Registry key name must start with a valid base key name";
    case KeyNameErrc::SubKeyNameTooLong:
      return "Registry subkey names must not be longer than 255 characters";
  }
  return "Invalid key name";
}

}
