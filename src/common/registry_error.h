#pragma once

#include <stdexcept>
#include <string>

namespace hivereg {

enum class KeyNameErrc {
  NullKeyName,
  InvalidKeyName,
  SubKeyNameTooLong,
};

// A key name argument that cannot be resolved. Raised before any key is opened.
class KeyNameError : public std::invalid_argument {
 public:
  KeyNameError(KeyNameErrc code, const std::string& paramName);

  KeyNameErrc code() const noexcept { return code_; }
  const std::string& paramName() const noexcept { return paramName_; }

 private:
  KeyNameErrc code_;
  std::string paramName_;
};

// A value that cannot be written with the requested kind.
class ValueKindError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

// Failure reported by the backing store. sqliteCode() is the (extended)
// SQLite result code, or 0 when the failure did not come from SQLite.
class StoreError : public std::runtime_error {
 public:
  StoreError(const std::string& what, int sqliteCode);

  int sqliteCode() const noexcept { return sqliteCode_; }

 private:
  int sqliteCode_;
};

const char* DescribeKeyNameErrc(KeyNameErrc code);

}
