#include "common/key_path.h"

namespace hivereg {

std::wstring CanonicalizeSubKey(const std::wstring& s) {
  std::wstring out;
  out.reserve(s.size());
  for (wchar_t ch : s) {
    if (ch == kKeySeparator && (out.empty() || out.back() == kKeySeparator)) {
      continue;
    }
    out.push_back(ch);
  }
  while (!out.empty() && out.back() == kKeySeparator) {
    out.pop_back();
  }
  return out;
}

std::wstring JoinKeyPath(const std::wstring& base, const std::wstring& sub) {
  if (sub.empty()) {
    return base;
  }
  if (base.empty()) {
    return sub;
  }
  if (base.back() == kKeySeparator) {
    return base + sub;
  }
  return base + kKeySeparator + sub;
}

std::vector<std::wstring> SplitKeyPath(const std::wstring& path) {
  std::vector<std::wstring> parts;
  size_t start = 0;
  while (start <= path.size()) {
    size_t pos = path.find(kKeySeparator, start);
    size_t end = (pos == std::wstring::npos) ? path.size() : pos;
    if (end > start) {
      parts.push_back(path.substr(start, end - start));
    }
    if (pos == std::wstring::npos) {
      break;
    }
    start = pos + 1;
  }
  return parts;
}

size_t LongestSegmentLength(const std::wstring& path) {
  size_t longest = 0;
  size_t current = 0;
  for (wchar_t ch : path) {
    if (ch == kKeySeparator) {
      current = 0;
      continue;
    }
    current++;
    if (current > longest) {
      longest = current;
    }
  }
  return longest;
}

wchar_t FoldAscii(wchar_t ch) {
  if (ch >= L'a' && ch <= L'z') {
    return (wchar_t)(ch - L'a' + L'A');
  }
  return ch;
}

bool EqualsNoCaseAscii(std::wstring_view a, std::wstring_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); i++) {
    if (FoldAscii(a[i]) != FoldAscii(b[i])) {
      return false;
    }
  }
  return true;
}

std::wstring CaseFoldAscii(const std::wstring& s) {
  std::wstring out;
  out.resize(s.size());
  for (size_t i = 0; i < s.size(); i++) {
    out[i] = FoldAscii(s[i]);
  }
  return out;
}

}
