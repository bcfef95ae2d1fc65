#include "common/trace.h"

#include "common/text_encoding.h"
#include "config/hivereg_config.h"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <cwctype>
#include <mutex>

namespace hivereg {
namespace {

std::once_flag g_traceInitOnce;
TraceFilter g_traceFilter;
FILE* g_traceFile = nullptr;
std::mutex g_traceMutex;

std::wstring TrimCopy(const std::wstring& value) {
  size_t begin = 0;
  while (begin < value.size() && std::iswspace(value[begin])) {
    begin++;
  }
  size_t end = value.size();
  while (end > begin && std::iswspace(value[end - 1])) {
    end--;
  }
  return value.substr(begin, end - begin);
}

std::wstring NormalizeToken(const std::wstring& in) {
  std::wstring out;
  out.reserve(in.size());
  for (wchar_t ch : in) {
    if (!std::iswspace(ch)) {
      out.push_back((wchar_t)std::towlower(ch));
    }
  }
  return out;
}

// Registered with atexit; later records go to stderr.
void CloseTraceFile() {
  std::lock_guard<std::mutex> lock(g_traceMutex);
  if (g_traceFile) {
    std::fclose(g_traceFile);
    g_traceFile = nullptr;
  }
}

void InitializeTraceConfig() {
  std::call_once(g_traceInitOnce, [] {
    const char* tokens = std::getenv(HIVEREG_TRACE_ENV);
    if (!tokens || !*tokens) {
      return;
    }
    g_traceFilter = ParseTraceFilter(Utf8ToWide(tokens));

    if (const char* path = std::getenv(HIVEREG_TRACE_FILE_ENV); path && *path) {
      g_traceFile = std::fopen(path, "a");
      if (g_traceFile) {
        std::atexit(CloseTraceFile);
      }
    }
  });
}

// Keeps control characters out of single-line trace records.
std::string Sanitize(const std::wstring& s) {
  std::wstring out;
  out.reserve(s.size());
  for (wchar_t ch : s) {
    if (ch == L'\0') {
      out.append(L"\\0");
    } else if (ch == L'\r' || ch == L'\n' || ch == L'\t') {
      out.push_back(L' ');
    } else {
      out.push_back(ch);
    }
  }
  return WideToUtf8(out);
}

}  // namespace

TraceFilter ParseTraceFilter(const std::wstring& csv) {
  TraceFilter filter;
  size_t start = 0;
  while (start <= csv.size()) {
    size_t comma = csv.find(L',', start);
    size_t end = (comma == std::wstring::npos) ? csv.size() : comma;
    std::wstring token = NormalizeToken(TrimCopy(csv.substr(start, end - start)));
    if (!token.empty()) {
      if (token == L"all") {
        filter.all = true;
        filter.tokens.clear();
        break;
      }
      filter.tokens.push_back(token);
    }
    if (comma == std::wstring::npos) {
      break;
    }
    start = comma + 1;
  }
  return filter;
}

bool TraceFilterMatches(const TraceFilter& filter, const wchar_t* opName) {
  if (filter.all) {
    return true;
  }
  if (filter.tokens.empty() || !opName) {
    return false;
  }
  const std::wstring op = NormalizeToken(opName);
  for (const auto& token : filter.tokens) {
    if (token == op) {
      return true;
    }
  }
  return false;
}

bool ShouldTrace(const wchar_t* opName) {
  InitializeTraceConfig();
  return TraceFilterMatches(g_traceFilter, opName);
}

namespace {

void WriteTraceRecord(const wchar_t* opName,
                      const std::wstring& keyPath,
                      const std::wstring& valueName,
                      const std::wstring& detail) {
  if (!ShouldTrace(opName)) {
    return;
  }

  char stamp[32] = {};
  std::time_t now = std::time(nullptr);
  std::tm tmNow{};
  if (localtime_r(&now, &tmNow)) {
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tmNow);
  }

  std::string line = "[hivereg] ";
  line += stamp;
  line += " op=" + WideToUtf8(opName);
  line += " key=" + Sanitize(keyPath);
  if (!valueName.empty()) {
    line += " value=" + Sanitize(valueName);
  }
  if (!detail.empty()) {
    line += " " + Sanitize(detail);
  }
  line.push_back('\n');

  std::lock_guard<std::mutex> lock(g_traceMutex);
  FILE* out = g_traceFile ? g_traceFile : stderr;
  std::fwrite(line.data(), 1, line.size(), out);
  std::fflush(out);
}

}  // namespace

void TraceEvent(const wchar_t* opName,
                const std::wstring& keyPath,
                const std::wstring& valueName,
                const std::wstring& detail) noexcept {
  try {
    WriteTraceRecord(opName, keyPath, valueName, detail);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[hivereg] trace record dropped: %s\n", e.what());
  }
}

}
