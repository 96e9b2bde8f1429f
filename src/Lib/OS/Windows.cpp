/**
 * @file   Windows.cpp
 * @brief  Windows implementation of process spawning, OS classification and host queries.
 *
 * @details Uses the Win32 API throughout:
 * - `CreateProcessW` with anonymous pipes for running PowerShell queries
 * - `RtlGetVersion` for the kernel version (not subject to manifest-based version lies)
 * - Winsock `getaddrinfo` for name resolution
 * - IP Helper `GetAdaptersAddresses` for the hardware address
 */

#ifdef _WIN32

  #ifndef NOMINMAX
    #define NOMINMAX
  #endif

  // clang-format off
  #include <winsock2.h> // WSAStartup, gethostname
  #include <ws2tcpip.h> // getaddrinfo, inet_ntop
  #include <windows.h>  // CreateProcessW, CreatePipe, GetNativeSystemInfo, GetUserNameW
  #include <iphlpapi.h> // GetAdaptersAddresses
  #include <lmcons.h>   // UNLEN
  // clang-format on

  #include <algorithm>   // std::max
  #include <ctime>       // _tzset, _get_tzname, localtime_s
  #include <format>      // std::format
  #include <matchit.hpp> // matchit::{match, is, or_, _}
  #include <thread>      // std::jthread
  #include <utility>     // std::exchange

  #include "HostFacts/Core/Command.hpp"
  #include "HostFacts/Core/Host.hpp"
  #include "HostFacts/Core/OSClassifier.hpp"

  #include "HostFacts/Utils/Env.hpp"
  #include "HostFacts/Utils/Error.hpp"
  #include "HostFacts/Utils/Logging.hpp"
  #include "HostFacts/Utils/Types.hpp"

using hostfacts::utils::error::FactsError;
using enum hostfacts::utils::error::FactsErrorCode;
using namespace hostfacts::utils::types;

namespace {
  namespace helpers {
    auto ConvertWStringToUTF8(const std::wstring_view wstr) -> Result<String> {
      if (wstr.empty())
        return String {};

      const i32 sizeNeeded = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<i32>(wstr.size()), nullptr, 0, nullptr, nullptr);

      if (sizeNeeded == 0)
        ERR_FMT(InternalError, "Failed to get buffer size for UTF-8 conversion. Error code: {}", GetLastError());

      String result(static_cast<usize>(sizeNeeded), '\0');

      if (WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<i32>(wstr.size()), result.data(), sizeNeeded, nullptr, nullptr) == 0)
        ERR_FMT(InternalError, "Failed to convert wide string to UTF-8. Error code: {}", GetLastError());

      return result;
    }

    auto ConvertUTF8ToWString(const StringView str) -> Result<std::wstring> {
      if (str.empty())
        return std::wstring {};

      const i32 sizeNeeded = MultiByteToWideChar(CP_UTF8, 0, str.data(), static_cast<i32>(str.size()), nullptr, 0);

      if (sizeNeeded == 0)
        ERR_FMT(InternalError, "Failed to get buffer size for UTF-16 conversion. Error code: {}", GetLastError());

      std::wstring result(static_cast<usize>(sizeNeeded), L'\0');

      if (MultiByteToWideChar(CP_UTF8, 0, str.data(), static_cast<i32>(str.size()), result.data(), sizeNeeded) == 0)
        ERR_FMT(InternalError, "Failed to convert UTF-8 to wide string. Error code: {}", GetLastError());

      return result;
    }

    auto FromLastError(const StringView context, const DWORD code = GetLastError()) -> FactsError {
      using namespace matchit;

      const auto errc = match(code)(
        is | or_(ERROR_FILE_NOT_FOUND, ERROR_PATH_NOT_FOUND) = NotFound,
        is | ERROR_ACCESS_DENIED                             = PermissionDenied,
        is | or_(ERROR_NOT_ENOUGH_MEMORY, ERROR_OUTOFMEMORY) = OutOfMemory,
        is | _                                               = PlatformSpecific
      );

      return { errc, std::format("{} failed (error {})", context, code) };
    }

    // RAII wrapper for Windows handles
    class HandleWrapper {
     public:
      HandleWrapper() = default;

      explicit HandleWrapper(HANDLE handle)
        : m_handle(handle) {}

      ~HandleWrapper() {
        reset();
      }

      HandleWrapper(const HandleWrapper&)                    = delete;
      auto operator=(const HandleWrapper&) -> HandleWrapper& = delete;

      HandleWrapper(HandleWrapper&& other) noexcept
        : m_handle(std::exchange(other.m_handle, nullptr)) {}

      auto operator=(HandleWrapper&& other) noexcept -> HandleWrapper& {
        if (this != &other) {
          reset();
          m_handle = std::exchange(other.m_handle, nullptr);
        }
        return *this;
      }

      auto reset() -> void {
        if (m_handle && m_handle != INVALID_HANDLE_VALUE)
          CloseHandle(m_handle);
        m_handle = nullptr;
      }

      [[nodiscard]] auto get() const -> HANDLE {
        return m_handle;
      }

     private:
      HANDLE m_handle = nullptr;
    };

    struct Pipe {
      HandleWrapper readEnd;
      HandleWrapper writeEnd;
    };

    // The write end is inherited by the child; the read end stays private to this process.
    auto OpenPipe() -> Result<Pipe> {
      SECURITY_ATTRIBUTES attributes { .nLength = sizeof(SECURITY_ATTRIBUTES), .lpSecurityDescriptor = nullptr, .bInheritHandle = TRUE };

      HANDLE readHandle  = nullptr;
      HANDLE writeHandle = nullptr;

      if (!CreatePipe(&readHandle, &writeHandle, &attributes, 0))
        return Err(FromLastError("CreatePipe"));

      Pipe result { .readEnd = HandleWrapper(readHandle), .writeEnd = HandleWrapper(writeHandle) };

      if (!SetHandleInformation(readHandle, HANDLE_FLAG_INHERIT, 0))
        return Err(FromLastError("SetHandleInformation"));

      return result;
    }

    auto ReadAll(HANDLE handle) -> String {
      String          output;
      Array<char, 4096> buffer {};
      DWORD           count = 0;

      while (ReadFile(handle, buffer.data(), static_cast<DWORD>(buffer.size()), &count, nullptr) && count > 0)
        output.append(buffer.data(), count);

      return output;
    }

    /// Quotes one argument following the CommandLineToArgvW rules.
    auto QuoteArgument(const std::wstring& arg) -> std::wstring {
      if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos)
        return arg;

      std::wstring quoted = L"\"";

      for (auto iter = arg.begin();; ++iter) {
        usize backslashes = 0;

        while (iter != arg.end() && *iter == L'\\') {
          ++iter;
          ++backslashes;
        }

        if (iter == arg.end()) {
          quoted.append(backslashes * 2, L'\\');
          break;
        }

        if (*iter == L'"')
          quoted.append((backslashes * 2) + 1, L'\\');
        else
          quoted.append(backslashes, L'\\');

        quoted.push_back(*iter);
      }

      quoted.push_back(L'"');
      return quoted;
    }

    // Winsock has to be initialized once before any name lookups.
    auto EnsureWinsock() -> Result<> {
      static const int Status = [] -> int {
        WSADATA data {};
        return WSAStartup(MAKEWORD(2, 2), &data);
      }();

      if (Status != 0)
        ERR_FMT(NetworkError, "WSAStartup failed (error {})", Status);

      return {};
    }

    using AddrInfoList = UniquePointer<addrinfo, decltype(&freeaddrinfo)>;

    auto Resolve(const StringView host, const int family, const int flags) -> Result<AddrInfoList> {
      TRY_VOID(EnsureWinsock());

      addrinfo hints {};
      hints.ai_family   = family;
      hints.ai_socktype = SOCK_STREAM;
      hints.ai_flags    = flags;

      addrinfo*    raw  = nullptr;
      const String name(host);

      if (const int status = getaddrinfo(name.c_str(), nullptr, &hints, &raw); status != 0)
        ERR_FMT(NetworkError, "getaddrinfo({}) failed (error {})", name, status);

      return AddrInfoList(raw, &freeaddrinfo);
    }

    struct KernelVersion {
      u32 major;
      u32 minor;
      u32 build;
    };

    auto GetKernelVersion() -> Result<KernelVersion> {
      using RtlGetVersionFn = LONG(WINAPI*)(PRTL_OSVERSIONINFOW);

      const HMODULE ntdll = GetModuleHandleW(L"ntdll.dll");

      if (!ntdll)
        return Err(FromLastError("GetModuleHandleW(ntdll.dll)"));

      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      const auto rtlGetVersion = reinterpret_cast<RtlGetVersionFn>(GetProcAddress(ntdll, "RtlGetVersion"));

      if (!rtlGetVersion)
        return Err(FromLastError("GetProcAddress(RtlGetVersion)"));

      RTL_OSVERSIONINFOW info {};
      info.dwOSVersionInfoSize = sizeof(info);

      if (rtlGetVersion(&info) != 0)
        ERR(ApiUnavailable, "RtlGetVersion failed");

      return KernelVersion { .major = info.dwMajorVersion, .minor = info.dwMinorVersion, .build = info.dwBuildNumber };
    }
  } // namespace helpers
} // namespace

namespace hostfacts::core::command {
  auto ProcessCommandRunner::run(const Vec<String>& argv) -> Result<CommandResult> {
    using namespace helpers;

    if (argv.empty())
      ERR(InvalidArgument, "Cannot run an empty command");

    std::wstring commandLine;

    for (const String& arg : argv) {
      if (!commandLine.empty())
        commandLine.push_back(L' ');

      commandLine += QuoteArgument(TRY(ConvertUTF8ToWString(arg)));
    }

    Pipe out = TRY(OpenPipe());
    Pipe err = TRY(OpenPipe());

    STARTUPINFOW startup {};
    startup.cb         = sizeof(startup);
    startup.dwFlags    = STARTF_USESTDHANDLES;
    startup.hStdInput  = GetStdHandle(STD_INPUT_HANDLE);
    startup.hStdOutput = out.writeEnd.get();
    startup.hStdError  = err.writeEnd.get();

    PROCESS_INFORMATION process {};

    if (!CreateProcessW(nullptr, commandLine.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW, nullptr, nullptr, &startup, &process))
      return Err(FromLastError(std::format("CreateProcessW({})", argv.front())));

    const HandleWrapper processHandle(process.hProcess);
    const HandleWrapper threadHandle(process.hThread);

    out.writeEnd.reset();
    err.writeEnd.reset();

    CommandResult result;

    {
      // stderr is drained on its own thread so a chatty child cannot block on a full pipe.
      std::jthread stderrReader([&result, handle = err.readEnd.get()] -> void { result.stdErr = ReadAll(handle); });
      result.stdOut = ReadAll(out.readEnd.get());
    }

    if (WaitForSingleObject(processHandle.get(), INFINITE) == WAIT_FAILED)
      return Err(FromLastError("WaitForSingleObject"));

    DWORD exitCode = 0;

    if (!GetExitCodeProcess(processHandle.get(), &exitCode))
      return Err(FromLastError("GetExitCodeProcess"));

    result.exitCode = static_cast<i32>(exitCode);

    return result;
  }
} // namespace hostfacts::core::command

namespace hostfacts::core::os {
  auto OSClassifier::Detect() -> Result<OSClassifier> {
    const auto [major, minor, build] = TRY(helpers::GetKernelVersion());

    return OSClassifier(OsDescription {
      .type     = "windows",
      .version  = std::format("{}.{}.{}", major, minor, build),
      .family   = String(family::WinSrv),
      .netTools = NetToolsFormat::Modern,
      .windows  = true,
    });
  }
} // namespace hostfacts::core::os

namespace hostfacts::core::host {
  using utils::env::GetEnv;

  auto GetCurrentUser() -> Result<String> {
    Array<wchar_t, UNLEN + 1> buffer {};
    DWORD                     size = static_cast<DWORD>(buffer.size());

    if (GetUserNameW(buffer.data(), &size) && size > 1)
      return helpers::ConvertWStringToUTF8(std::wstring_view(buffer.data(), size - 1));

    if (Result<String> user = GetEnv("USERNAME"); user && !user->empty())
      return user;

    return Err(helpers::FromLastError("GetUserNameW"));
  }

  auto GetKernelName() -> Result<String> {
    return String("Windows");
  }

  auto GetHostName() -> Result<String> {
    TRY_VOID(helpers::EnsureWinsock());

    Array<char, 256> buffer {};

    if (gethostname(buffer.data(), static_cast<int>(buffer.size())) != 0)
      ERR_FMT(NetworkError, "gethostname failed (error {})", WSAGetLastError());

    return String(buffer.data());
  }

  auto GetCanonicalName(const StringView host) -> Result<String> {
    const helpers::AddrInfoList list = TRY(helpers::Resolve(host, AF_UNSPEC, AI_CANONNAME));

    if (list->ai_canonname == nullptr || *list->ai_canonname == '\0')
      ERR_FMT(NetworkError, "{} has no canonical name", host);

    return String(list->ai_canonname);
  }

  auto ResolveHostAddress(const StringView host) -> Result<String> {
    const helpers::AddrInfoList list = TRY(helpers::Resolve(host, AF_INET, 0));

    for (const addrinfo* entry = list.get(); entry != nullptr; entry = entry->ai_next) {
      if (entry->ai_family != AF_INET || entry->ai_addr == nullptr)
        continue;

      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      const auto*                  addr = reinterpret_cast<const sockaddr_in*>(entry->ai_addr);
      Array<char, INET_ADDRSTRLEN> text {};

      if (inet_ntop(AF_INET, &addr->sin_addr, text.data(), text.size()) != nullptr)
        return String(text.data());
    }

    ERR_FMT(NetworkError, "{} has no IPv4 address", host);
  }

  auto GetMachineArch() -> Result<String> {
    using namespace matchit;

    SYSTEM_INFO info {};
    GetNativeSystemInfo(&info);

    const StringView arch = match(info.wProcessorArchitecture)(
      is | PROCESSOR_ARCHITECTURE_AMD64 = StringView("AMD64"),
      is | PROCESSOR_ARCHITECTURE_INTEL = StringView("x86"),
      is | PROCESSOR_ARCHITECTURE_ARM64 = StringView("ARM64"),
      is | PROCESSOR_ARCHITECTURE_ARM   = StringView("ARM"),
      is | _                            = StringView()
    );

    if (arch.empty())
      ERR_FMT(NotSupported, "Unknown processor architecture {}", info.wProcessorArchitecture);

    return String(arch);
  }

  auto GetKernelRelease() -> Result<String> {
    const auto [major, minor, build] = TRY(helpers::GetKernelVersion());
    return std::format("{}.{}.{}", major, minor, build);
  }

  auto GetTimeZoneName() -> Result<String> {
    _tzset();

    const std::time_t now = std::time(nullptr);
    std::tm           local {};

    if (localtime_s(&local, &now) != 0)
      ERR(InternalError, "localtime_s failed");

    Array<char, 64> buffer {};
    usize           length = 0;

    if (_get_tzname(&length, buffer.data(), buffer.size(), local.tm_isdst > 0 ? 1 : 0) != 0 || buffer[0] == '\0')
      ERR(NotFound, "Time zone name is empty");

    return String(buffer.data());
  }

  auto GetProcessorCount() -> i64 {
    return std::max<i64>(1, GetActiveProcessorCount(ALL_PROCESSOR_GROUPS));
  }

  auto GetHardwareNode() -> Result<u64> {
    ULONG     size = 15 * 1024;
    Vec<BYTE> buffer;
    ULONG     status = ERROR_BUFFER_OVERFLOW;

    for (i32 attempt = 0; attempt < 3 && status == ERROR_BUFFER_OVERFLOW; ++attempt) {
      buffer.resize(size);
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      status = GetAdaptersAddresses(AF_UNSPEC, GAA_FLAG_SKIP_ANYCAST | GAA_FLAG_SKIP_MULTICAST | GAA_FLAG_SKIP_DNS_SERVER, nullptr, reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data()), &size);
    }

    if (status != NO_ERROR)
      return Err(helpers::FromLastError("GetAdaptersAddresses", status));

    Map<String, u64> nodes;

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    for (auto* adapter = reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data()); adapter != nullptr; adapter = adapter->Next) {
      if (adapter->IfType == IF_TYPE_SOFTWARE_LOOPBACK || adapter->PhysicalAddressLength != 6)
        continue;

      u64 node = 0;

      for (ULONG i = 0; i < adapter->PhysicalAddressLength; ++i)
        node = (node << 8U) | adapter->PhysicalAddress[i];

      if (node != 0)
        nodes.try_emplace(adapter->AdapterName, node);
    }

    if (nodes.empty())
      ERR(NotFound, "No adapter with a hardware address found");

    return nodes.begin()->second;
  }
} // namespace hostfacts::core::host

#endif // _WIN32
