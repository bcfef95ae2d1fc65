#include "common/text_encoding.h"

namespace hivereg {
namespace {

constexpr uint32_t kMaxCodePoint = 0x10FFFF;

bool IsHighSurrogate(uint32_t c) {
  return c >= 0xD800 && c <= 0xDBFF;
}

bool IsLowSurrogate(uint32_t c) {
  return c >= 0xDC00 && c <= 0xDFFF;
}

// Reads one code point from a wide string, combining surrogate pairs when
// wchar_t is 16 bits wide. Returns false on an unpaired surrogate.
bool NextCodePoint(const std::wstring& s, size_t& i, uint32_t& cp) {
  uint32_t c = (uint32_t)s[i++];
  if constexpr (sizeof(wchar_t) == 2) {
    c &= 0xFFFF;
    if (IsHighSurrogate(c)) {
      if (i >= s.size()) {
        return false;
      }
      uint32_t lo = (uint32_t)s[i] & 0xFFFF;
      if (!IsLowSurrogate(lo)) {
        return false;
      }
      i++;
      cp = 0x10000 + ((c - 0xD800) << 10) + (lo - 0xDC00);
      return true;
    }
  }
  if (IsHighSurrogate(c) || IsLowSurrogate(c) || c > kMaxCodePoint) {
    return false;
  }
  cp = c;
  return true;
}

void AppendWide(std::wstring& out, uint32_t cp) {
  if constexpr (sizeof(wchar_t) == 2) {
    if (cp >= 0x10000) {
      cp -= 0x10000;
      out.push_back((wchar_t)(0xD800 + (cp >> 10)));
      out.push_back((wchar_t)(0xDC00 + (cp & 0x3FF)));
      return;
    }
  }
  out.push_back((wchar_t)cp);
}

}  // namespace

std::string WideToUtf8(const std::wstring& s) {
  std::string out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    uint32_t cp = 0;
    if (!NextCodePoint(s, i, cp)) {
      return {};
    }
    if (cp < 0x80) {
      out.push_back((char)cp);
    } else if (cp < 0x800) {
      out.push_back((char)(0xC0 | (cp >> 6)));
      out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back((char)(0xE0 | (cp >> 12)));
      out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
      out.push_back((char)(0xF0 | (cp >> 18)));
      out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back((char)(0x80 | (cp & 0x3F)));
    }
  }
  return out;
}

std::wstring Utf8ToWide(const std::string& s) {
  std::wstring out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    uint8_t lead = (uint8_t)s[i++];
    uint32_t cp = 0;
    size_t extra = 0;
    uint32_t minCp = 0;
    if (lead < 0x80) {
      cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      cp = lead & 0x1F;
      extra = 1;
      minCp = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      cp = lead & 0x0F;
      extra = 2;
      minCp = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      cp = lead & 0x07;
      extra = 3;
      minCp = 0x10000;
    } else {
      return {};
    }
    if (i + extra > s.size()) {
      return {};
    }
    for (size_t k = 0; k < extra; k++) {
      uint8_t cont = (uint8_t)s[i++];
      if ((cont & 0xC0) != 0x80) {
        return {};
      }
      cp = (cp << 6) | (cont & 0x3F);
    }
    // Reject overlong forms, surrogates and out-of-range values.
    if (cp < minCp || cp > kMaxCodePoint || IsHighSurrogate(cp) || IsLowSurrogate(cp)) {
      return {};
    }
    AppendWide(out, cp);
  }
  return out;
}

std::vector<uint8_t> WideToUtf16Le(const std::wstring& s) {
  std::vector<uint8_t> out;
  out.reserve(s.size() * 2);
  auto put = [&out](uint32_t unit) {
    out.push_back((uint8_t)(unit & 0xFF));
    out.push_back((uint8_t)((unit >> 8) & 0xFF));
  };
  size_t i = 0;
  while (i < s.size()) {
    uint32_t cp = 0;
    if (!NextCodePoint(s, i, cp)) {
      // Keep the lone unit as-is; the registry itself stores unpaired surrogates.
      put((uint32_t)s[i - 1]);
      continue;
    }
    if (cp >= 0x10000) {
      cp -= 0x10000;
      put(0xD800 + (cp >> 10));
      put(0xDC00 + (cp & 0x3FF));
    } else {
      put(cp);
    }
  }
  return out;
}

std::wstring Utf16LeToWide(const uint8_t* data, size_t size) {
  std::wstring out;
  if (!data) {
    return out;
  }
  const size_t units = size / 2;
  out.reserve(units);
  for (size_t i = 0; i < units; i++) {
    uint32_t c = (uint32_t)data[2 * i] | ((uint32_t)data[2 * i + 1] << 8);
    if (IsHighSurrogate(c) && i + 1 < units) {
      uint32_t lo = (uint32_t)data[2 * i + 2] | ((uint32_t)data[2 * i + 3] << 8);
      if (IsLowSurrogate(lo)) {
        AppendWide(out, 0x10000 + ((c - 0xD800) << 10) + (lo - 0xDC00));
        i++;
        continue;
      }
    }
    out.push_back((wchar_t)c);
  }
  return out;
}

}
