#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hivereg {

// Empty output on empty input or on invalid code points / malformed UTF-8.
std::string WideToUtf8(const std::wstring& s);
std::wstring Utf8ToWide(const std::string& s);

// Registry string payloads are UTF-16LE regardless of the width of wchar_t.
std::vector<uint8_t> WideToUtf16Le(const std::wstring& s);
std::wstring Utf16LeToWide(const uint8_t* data, size_t size);

}
