#pragma once

#include "registry/root_hive.h"

#include <optional>
#include <string>
#include <string_view>

namespace hivereg {

// HKEY_CLASSES_ROOT and HKEY_CURRENT_USER share a length; they differ at this
// index (C[L]ASSES vs C[U]RRENT).
constexpr size_t kRootNameUniqueCharIndex = 6;

// Candidate root for a root segment of `length` characters. `uniqueChar` is
// the character at kRootNameUniqueCharIndex and only matters for length 17.
std::optional<RootHive> DispatchRootName(size_t length, wchar_t uniqueChar);

// True when keyName starts with the canonical name of `hive` (ASCII
// case-insensitive) followed by a separator or the end of the string.
bool MatchesRootName(RootHive hive, std::wstring_view keyName);

struct ResolvedKeyName {
  RootHive hive;
  // Everything after the first separator, unmodified.
  std::wstring subKeyName;
};

std::optional<ResolvedKeyName> TryResolveKeyName(std::wstring_view keyName);

// Throws KeyNameError: NullKeyName for a null pointer, InvalidKeyName when the
// root segment names no known root.
ResolvedKeyName ResolveKeyName(const wchar_t* keyName);
ResolvedKeyName ResolveKeyName(const std::wstring& keyName);

}
