#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hivereg {

// Registry value types. The numeric values of the concrete kinds are the
// REG_* type codes persisted by the store.
enum class ValueKind : int32_t {
  None = -1,
  Unknown = 0,
  String = 1,
  ExpandString = 2,
  Binary = 3,
  DWord = 4,
  MultiString = 7,
  QWord = 11,
};

using RegistryValue = std::variant<std::monostate,
                                   std::wstring,
                                   uint32_t,
                                   uint64_t,
                                   std::vector<uint8_t>,
                                   std::vector<std::wstring>>;

// Stored type code for a concrete kind (None -> REG_NONE).
uint32_t StoredTypeFromKind(ValueKind kind);
ValueKind KindFromStoredType(uint32_t type);

// Kind implied by the alternative held in `value`. Throws ValueKindError for an empty value.
ValueKind InferValueKind(const RegistryValue& value);

// Serializes `value` as `kind` (Unknown infers). Throws ValueKindError when
// the value cannot be represented as that kind.
std::vector<uint8_t> EncodeValue(const RegistryValue& value, ValueKind kind);
RegistryValue DecodeValue(uint32_t storedType, const std::vector<uint8_t>& data);

std::wstring FormatValueKind(ValueKind kind);
std::optional<ValueKind> ParseValueKind(const std::wstring& name);

// Parses command-line text (REG.EXE conventions) into a value of `kind`.
// MultiString items are separated by "\0"; Binary is hex pairs with optional
// separators. Throws ValueKindError on malformed text.
RegistryValue ParseValueData(ValueKind kind, const std::wstring& text);

// Human-readable rendering, truncated after maxBytes of payload.
std::wstring FormatValuePreview(const RegistryValue& value, size_t maxBytes = 1024);

}
