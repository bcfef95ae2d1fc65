#include "common/registry_error.h"
#include "common/store_location.h"
#include "common/text_encoding.h"
#include "registry/key_name.h"
#include "registry/registry.h"

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace hivereg;

static void PrintUsage() {
  std::cerr << "hivereg [--db <path>] <query|add|delete> [options]\n"
               "\n"
               "Commands (REG-like subset):\n"
               "  query  <KeyName> [/v <ValueName> | /ve]\n"
               "  add    <KeyName> [/v <ValueName> | /ve] [/t <Type>] [/d <Data>]\n"
               "  delete <KeyName> [/v <ValueName> | /ve]\n"
               "\n"
               "KeyName example: HKEY_CURRENT_USER\\Software\\MyApp\n"
               "Type: REG_SZ | REG_EXPAND_SZ | REG_MULTI_SZ | REG_DWORD | REG_QWORD | REG_BINARY | REG_NONE\n"
               "      (default: REG_SZ)\n"
               "Store: --db, else $HIVEREG_DB_PATH, else ~/.local/share/hivereg/registry.sqlite\n";
}

static void PrintLine(const std::wstring& s) {
  std::cout << WideToUtf8(s) << "\n";
}

static std::wstring DisplayValueName(const std::wstring& name) {
  return name.empty() ? L"(Default)" : name;
}

static void PrintValue(RegistryKey& key, const std::wstring& name) {
  const auto kind = key.GetValueKind(name);
  const RegistryValue value = key.GetValue(name, RegistryValue{});
  PrintLine(L"    " + DisplayValueName(name) + L"    " + FormatValueKind(kind.value_or(ValueKind::Unknown)) + L"    " +
            FormatValuePreview(value));
}

struct ValueOptions {
  std::optional<std::wstring> valueName;
  std::wstring typeName = L"REG_SZ";
  std::optional<std::wstring> data;
};

// Parses /v, /ve, /t, /d. Returns false on malformed options.
static bool ParseValueOptions(const std::vector<std::wstring>& args, size_t i, bool allowData, ValueOptions& out) {
  while (i < args.size()) {
    const std::wstring& a = args[i++];
    if ((a == L"/v" || a == L"-v") && i < args.size()) {
      out.valueName = args[i++];
    } else if (a == L"/ve" || a == L"-ve") {
      out.valueName = std::wstring();
    } else if (allowData && (a == L"/t" || a == L"-t") && i < args.size()) {
      out.typeName = args[i++];
    } else if (allowData && (a == L"/d" || a == L"-d") && i < args.size()) {
      out.data = args[i++];
    } else if (a == L"/f" || a == L"-f") {
      // Accepted for REG.EXE compatibility; nothing prompts.
    } else {
      return false;
    }
  }
  return true;
}

static int RunQuery(const RootKeyTable& roots, const std::wstring& keyName, const ValueOptions& opts) {
  const ResolvedKeyName resolved = ResolveKeyName(keyName);
  auto key = roots.Get(resolved.hive).OpenSubKey(resolved.subKeyName);
  if (!key) {
    std::cerr << "ERROR: The system was unable to find the specified registry key or value.\n";
    return 1;
  }

  PrintLine(key->Name());
  if (opts.valueName) {
    if (!key->GetValueKind(*opts.valueName)) {
      std::cerr << "ERROR: The system was unable to find the specified registry key or value.\n";
      return 1;
    }
    PrintValue(*key, *opts.valueName);
    return 0;
  }

  for (const auto& name : key->GetValueNames()) {
    PrintValue(*key, name);
  }
  for (const auto& sub : key->GetSubKeyNames()) {
    PrintLine(L"");
    PrintLine(key->Name() + L"\\" + sub);
  }
  return 0;
}

static int RunAdd(const RootKeyTable& roots, const std::wstring& keyName, const ValueOptions& opts) {
  const auto kind = ParseValueKind(opts.typeName);
  if (!kind) {
    std::cerr << "ERROR: Invalid type: " << WideToUtf8(opts.typeName) << "\n";
    return 2;
  }

  if (!opts.valueName && !opts.data) {
    const ResolvedKeyName resolved = ResolveKeyName(keyName);
    auto key = roots.Get(resolved.hive).CreateSubKey(resolved.subKeyName);
    return key ? 0 : 1;
  }

  const std::wstring name = opts.valueName.value_or(std::wstring());
  const RegistryValue value = ParseValueData(*kind, opts.data.value_or(std::wstring()));
  SetValue(roots, keyName.c_str(), name.c_str(), value, *kind);
  return 0;
}

static int RunDelete(const RootKeyTable& roots, const std::wstring& keyName, const ValueOptions& opts) {
  const ResolvedKeyName resolved = ResolveKeyName(keyName);
  RegistryKey& root = roots.Get(resolved.hive);

  if (opts.valueName) {
    auto key = root.OpenSubKey(resolved.subKeyName);
    if (!key || !key->DeleteValue(*opts.valueName)) {
      std::cerr << "ERROR: The system was unable to find the specified registry key or value.\n";
      return 1;
    }
    return 0;
  }

  if (resolved.subKeyName.empty()) {
    std::cerr << "ERROR: Cannot delete a root key.\n";
    return 2;
  }
  if (!root.DeleteSubKeyTree(resolved.subKeyName)) {
    std::cerr << "ERROR: The system was unable to find the specified registry key or value.\n";
    return 1;
  }
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::wstring> args;
  for (int a = 1; a < argc; a++) {
    args.push_back(Utf8ToWide(argv[a]));
  }

  size_t i = 0;
  std::optional<std::wstring> dbPath;
  if (i < args.size() && args[i] == L"--db") {
    if (i + 1 >= args.size()) {
      PrintUsage();
      return 2;
    }
    dbPath = args[i + 1];
    i += 2;
  }
  if (i + 2 > args.size()) {
    PrintUsage();
    return 2;
  }
  const std::wstring cmd = args[i++];
  const std::wstring keyName = args[i++];

  ValueOptions opts;
  if (!ParseValueOptions(args, i, cmd == L"add", opts)) {
    PrintUsage();
    return 2;
  }

  try {
    auto store = OpenStore(dbPath ? std::filesystem::path(WideToUtf8(*dbPath)) : ResolveStorePath());
    const RootKeyTable roots = OpenRootKeys(store);

    if (cmd == L"query") {
      return RunQuery(roots, keyName, opts);
    }
    if (cmd == L"add") {
      return RunAdd(roots, keyName, opts);
    }
    if (cmd == L"delete") {
      return RunDelete(roots, keyName, opts);
    }
    PrintUsage();
    return 2;
  } catch (const KeyNameError& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 2;
  } catch (const ValueKindError& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 2;
  } catch (const StoreError& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
