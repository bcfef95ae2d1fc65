#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace hivereg {

constexpr wchar_t kKeySeparator = L'\\';

// Longest single key name segment the registry accepts.
constexpr size_t kMaxKeySegmentLength = 255;

// Strips leading/trailing separators and collapses separator runs.
// Forward slashes are legal key name characters and are left alone.
std::wstring CanonicalizeSubKey(const std::wstring& s);

std::wstring JoinKeyPath(const std::wstring& base, const std::wstring& sub);
std::vector<std::wstring> SplitKeyPath(const std::wstring& path);

// Length of the longest separator-delimited segment.
size_t LongestSegmentLength(const std::wstring& path);

// Ordinal comparison folding only ASCII letters, matching SQLite's NOCASE collation.
wchar_t FoldAscii(wchar_t ch);
bool EqualsNoCaseAscii(std::wstring_view a, std::wstring_view b);
std::wstring CaseFoldAscii(const std::wstring& s);

}
