#include "common/registry_value.h"

#include "common/key_path.h"
#include "common/registry_error.h"
#include "common/text_encoding.h"

#include <cwchar>
#include <cwctype>
#include <limits>
#include <stdexcept>

namespace hivereg {
namespace {

struct KindName {
  ValueKind kind;
  const wchar_t* name;
};

constexpr KindName kKindNames[] = {
    {ValueKind::None, L"REG_NONE"},
    {ValueKind::String, L"REG_SZ"},
    {ValueKind::ExpandString, L"REG_EXPAND_SZ"},
    {ValueKind::Binary, L"REG_BINARY"},
    {ValueKind::DWord, L"REG_DWORD"},
    {ValueKind::MultiString, L"REG_MULTI_SZ"},
    {ValueKind::QWord, L"REG_QWORD"},
};

[[noreturn]] void ThrowMismatch(ValueKind kind) {
  std::string msg = "value cannot be stored as ";
  msg += WideToUtf8(FormatValueKind(kind));
  throw ValueKindError(msg);
}

void AppendTerminatedUtf16(std::vector<uint8_t>& out, const std::wstring& s) {
  const auto bytes = WideToUtf16Le(s);
  out.insert(out.end(), bytes.begin(), bytes.end());
  out.push_back(0);
  out.push_back(0);
}

template <typename T>
std::vector<uint8_t> LittleEndianBytes(T v) {
  std::vector<uint8_t> out(sizeof(T));
  for (size_t i = 0; i < sizeof(T); i++) {
    out[i] = (uint8_t)((v >> (8 * i)) & 0xFF);
  }
  return out;
}

template <typename T>
T FromLittleEndian(const std::vector<uint8_t>& data) {
  T v = 0;
  for (size_t i = 0; i < sizeof(T); i++) {
    v |= (T)data[i] << (8 * i);
  }
  return v;
}

std::wstring StringFromUtf16(const std::vector<uint8_t>& data) {
  std::wstring s = Utf16LeToWide(data.data(), data.size());
  auto nul = s.find(L'\0');
  if (nul != std::wstring::npos) {
    s.resize(nul);
  }
  return s;
}

std::vector<std::wstring> MultiStringFromUtf16(const std::vector<uint8_t>& data) {
  const std::wstring blob = Utf16LeToWide(data.data(), data.size());
  std::vector<std::wstring> out;
  size_t cur = 0;
  const size_t len = blob.size();
  while (cur < len) {
    size_t next = blob.find(L'\0', cur);
    if (next == std::wstring::npos) {
      out.push_back(blob.substr(cur));
      break;
    }
    // Empty entries are kept, except the list terminator itself.
    if (next > cur || next != len - 1) {
      out.push_back(blob.substr(cur, next - cur));
    }
    cur = next + 1;
  }
  return out;
}

unsigned long long ParseUnsigned(const std::wstring& text, unsigned long long max) {
  size_t start = 0;
  while (start < text.size() && iswspace(text[start])) {
    start++;
  }
  if (start == text.size() || text[start] == L'-') {
    throw ValueKindError("expected an unsigned number");
  }
  size_t used = 0;
  unsigned long long v = 0;
  try {
    v = std::stoull(text, &used, 0);
  } catch (const std::exception&) {
    throw ValueKindError("expected an unsigned number");
  }
  if (used != text.size() || v > max) {
    throw ValueKindError("number is malformed or out of range");
  }
  return v;
}

int HexDigit(wchar_t ch) {
  if (ch >= L'0' && ch <= L'9') return ch - L'0';
  if (ch >= L'a' && ch <= L'f') return 10 + (ch - L'a');
  if (ch >= L'A' && ch <= L'F') return 10 + (ch - L'A');
  return -1;
}

}  // namespace

uint32_t StoredTypeFromKind(ValueKind kind) {
  if (kind == ValueKind::None || kind == ValueKind::Unknown) {
    return 0;
  }
  return (uint32_t)kind;
}

ValueKind KindFromStoredType(uint32_t type) {
  switch (type) {
    case 0:
      return ValueKind::None;
    case 1:
    case 2:
    case 3:
    case 4:
    case 7:
    case 11:
      return (ValueKind)type;
    default:
      return ValueKind::Unknown;
  }
}

ValueKind InferValueKind(const RegistryValue& value) {
  switch (value.index()) {
    case 1:
      return ValueKind::String;
    case 2:
      return ValueKind::DWord;
    case 3:
      return ValueKind::QWord;
    case 4:
      return ValueKind::Binary;
    case 5:
      return ValueKind::MultiString;
    default:
      throw ValueKindError("cannot infer the kind of an empty value");
  }
}

std::vector<uint8_t> EncodeValue(const RegistryValue& value, ValueKind kind) {
  if (kind == ValueKind::Unknown) {
    kind = InferValueKind(value);
  }

  std::vector<uint8_t> out;
  switch (kind) {
    case ValueKind::String:
    case ValueKind::ExpandString:
      if (auto s = std::get_if<std::wstring>(&value)) {
        AppendTerminatedUtf16(out, *s);
      } else if (auto d = std::get_if<uint32_t>(&value)) {
        AppendTerminatedUtf16(out, std::to_wstring(*d));
      } else if (auto q = std::get_if<uint64_t>(&value)) {
        AppendTerminatedUtf16(out, std::to_wstring(*q));
      } else {
        ThrowMismatch(kind);
      }
      return out;

    case ValueKind::MultiString:
      if (auto list = std::get_if<std::vector<std::wstring>>(&value)) {
        for (const auto& item : *list) {
          if (item.find(L'\0') != std::wstring::npos) {
            throw ValueKindError("REG_MULTI_SZ entries must not contain NUL characters");
          }
          AppendTerminatedUtf16(out, item);
        }
        out.push_back(0);
        out.push_back(0);
        return out;
      }
      ThrowMismatch(kind);

    case ValueKind::DWord:
      if (auto d = std::get_if<uint32_t>(&value)) {
        return LittleEndianBytes<uint32_t>(*d);
      }
      if (auto q = std::get_if<uint64_t>(&value); q && *q <= std::numeric_limits<uint32_t>::max()) {
        return LittleEndianBytes<uint32_t>((uint32_t)*q);
      }
      ThrowMismatch(kind);

    case ValueKind::QWord:
      if (auto q = std::get_if<uint64_t>(&value)) {
        return LittleEndianBytes<uint64_t>(*q);
      }
      if (auto d = std::get_if<uint32_t>(&value)) {
        return LittleEndianBytes<uint64_t>(*d);
      }
      ThrowMismatch(kind);

    case ValueKind::Binary:
    case ValueKind::None:
      if (auto bytes = std::get_if<std::vector<uint8_t>>(&value)) {
        return *bytes;
      }
      if (kind == ValueKind::None && std::holds_alternative<std::monostate>(value)) {
        return out;
      }
      ThrowMismatch(kind);

    case ValueKind::Unknown:
      break;
  }
  ThrowMismatch(kind);
}

RegistryValue DecodeValue(uint32_t storedType, const std::vector<uint8_t>& data) {
  switch (KindFromStoredType(storedType)) {
    case ValueKind::String:
    case ValueKind::ExpandString:
      return StringFromUtf16(data);
    case ValueKind::MultiString:
      return MultiStringFromUtf16(data);
    case ValueKind::DWord:
      if (data.size() == sizeof(uint32_t)) {
        return FromLittleEndian<uint32_t>(data);
      }
      return data;
    case ValueKind::QWord:
      if (data.size() == sizeof(uint64_t)) {
        return FromLittleEndian<uint64_t>(data);
      }
      return data;
    default:
      return data;
  }
}

std::wstring FormatValueKind(ValueKind kind) {
  for (const auto& entry : kKindNames) {
    if (entry.kind == kind) {
      return entry.name;
    }
  }
  return L"REG_UNKNOWN";
}

std::optional<ValueKind> ParseValueKind(const std::wstring& name) {
  for (const auto& entry : kKindNames) {
    if (EqualsNoCaseAscii(name, entry.name)) {
      return entry.kind;
    }
  }
  return std::nullopt;
}

RegistryValue ParseValueData(ValueKind kind, const std::wstring& text) {
  switch (kind) {
    case ValueKind::DWord:
      return (uint32_t)ParseUnsigned(text, std::numeric_limits<uint32_t>::max());
    case ValueKind::QWord:
      return (uint64_t)ParseUnsigned(text, std::numeric_limits<uint64_t>::max());
    case ValueKind::Binary:
    case ValueKind::None: {
      // Hex pairs with optional separators (comma/space).
      std::vector<uint8_t> out;
      int hi = -1;
      for (wchar_t ch : text) {
        int v = HexDigit(ch);
        if (v < 0) {
          if (ch == L',' || ch == L' ' || ch == L'\t') {
            continue;
          }
          throw ValueKindError("binary data must be hex digits");
        }
        if (hi < 0) {
          hi = v;
        } else {
          out.push_back((uint8_t)((hi << 4) | v));
          hi = -1;
        }
      }
      if (hi >= 0) {
        throw ValueKindError("binary data has an odd number of hex digits");
      }
      return out;
    }
    case ValueKind::MultiString: {
      std::vector<std::wstring> items;
      if (text.empty()) {
        return items;
      }
      size_t start = 0;
      while (true) {
        size_t pos = text.find(L"\\0", start);
        if (pos == std::wstring::npos) {
          items.push_back(text.substr(start));
          break;
        }
        items.push_back(text.substr(start, pos - start));
        start = pos + 2;
      }
      return items;
    }
    default:
      return text;
  }
}

std::wstring FormatValuePreview(const RegistryValue& value, size_t maxBytes) {
  auto clip = [maxBytes](const std::wstring& s) {
    const size_t maxChars = maxBytes / 2;
    if (s.size() <= maxChars) {
      return s;
    }
    return s.substr(0, maxChars) + L"...";
  };

  wchar_t buf[64];
  switch (value.index()) {
    case 1:
      return L"\"" + clip(std::get<std::wstring>(value)) + L"\"";
    case 2: {
      const uint32_t v = std::get<uint32_t>(value);
      swprintf(buf, sizeof(buf) / sizeof(buf[0]), L"0x%08x (%u)", v, v);
      return buf;
    }
    case 3: {
      const uint64_t v = std::get<uint64_t>(value);
      swprintf(buf, sizeof(buf) / sizeof(buf[0]), L"0x%016llx (%llu)", (unsigned long long)v, (unsigned long long)v);
      return buf;
    }
    case 4: {
      static const wchar_t* hexd = L"0123456789abcdef";
      const auto& bytes = std::get<std::vector<uint8_t>>(value);
      std::wstring out;
      const size_t n = bytes.size() < maxBytes ? bytes.size() : maxBytes;
      for (size_t i = 0; i < n; i++) {
        if (i) out.push_back(L',');
        out.push_back(hexd[(bytes[i] >> 4) & 0xF]);
        out.push_back(hexd[bytes[i] & 0xF]);
      }
      if (n < bytes.size()) {
        out.append(L",...");
      }
      return out;
    }
    case 5: {
      std::wstring joined;
      for (const auto& item : std::get<std::vector<std::wstring>>(value)) {
        if (!joined.empty()) joined.append(L"\\0");
        joined.append(item);
      }
      return clip(joined);
    }
    default:
      return L"(empty)";
  }
}

}
