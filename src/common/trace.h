#pragma once

#include <string>
#include <vector>

namespace hivereg {

// Operation tokens accepted in HIVEREG_TRACE.
namespace trace_op {
inline constexpr const wchar_t* kOpen = L"open";
inline constexpr const wchar_t* kCreate = L"create";
inline constexpr const wchar_t* kGet = L"get";
inline constexpr const wchar_t* kSet = L"set";
inline constexpr const wchar_t* kDelete = L"delete";
inline constexpr const wchar_t* kEnum = L"enum";
inline constexpr const wchar_t* kResolve = L"resolve";
inline constexpr const wchar_t* kClose = L"close";
}  // namespace trace_op

struct TraceFilter {
  bool all = false;
  std::vector<std::wstring> tokens;
};

// Parses a comma-separated token list; "all" anywhere enables every operation.
TraceFilter ParseTraceFilter(const std::wstring& csv);
bool TraceFilterMatches(const TraceFilter& filter, const wchar_t* opName);

// Reads HIVEREG_TRACE once per process.
bool ShouldTrace(const wchar_t* opName);

// Never throws; a record that cannot be formatted is reported on stderr and dropped.
void TraceEvent(const wchar_t* opName,
                const std::wstring& keyPath,
                const std::wstring& valueName,
                const std::wstring& detail) noexcept;

}
