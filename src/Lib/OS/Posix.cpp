#ifndef _WIN32

  #include <algorithm>     // std::max
  #include <arpa/inet.h>   // inet_ntop
  #include <cerrno>        // errno, EINTR
  #include <ctime>         // tzset, tzname, localtime_r
  #include <fcntl.h>       // fcntl, open, FD_CLOEXEC, O_RDONLY
  #include <format>        // std::format
  #include <fstream>       // std::ifstream
  #include <ifaddrs.h>     // getifaddrs, freeifaddrs, ifaddrs
  #include <iterator>      // std::istreambuf_iterator
  #include <matchit.hpp>   // matchit::{match, is, _}
  #include <net/if.h>      // IFF_LOOPBACK
  #include <netdb.h>       // getaddrinfo, freeaddrinfo, gai_strerror, AI_CANONNAME
  #include <netinet/in.h>  // sockaddr_in
  #include <poll.h>        // poll, pollfd
  #include <pwd.h>         // getpwuid_r, passwd
  #include <sys/socket.h>  // AF_INET
  #include <sys/utsname.h> // uname, utsname
  #include <sys/wait.h>    // waitpid, WIFEXITED, WEXITSTATUS, WIFSIGNALED, WTERMSIG
  #include <unistd.h>      // fork, execvp, pipe, dup2, read, write, _exit, gethostname, sysconf
  #include <utility>       // std::exchange

  #ifdef __linux__
    #include <linux/if_packet.h> // sockaddr_ll
  #else
    #include <net/if_dl.h> // sockaddr_dl, LLADDR
  #endif

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
  /**
   * @brief Owns a file descriptor and closes it on destruction.
   */
  class FdGuard {
    int m_fd = -1;

   public:
    FdGuard() = default;

    explicit FdGuard(const int descriptor)
      : m_fd(descriptor) {}

    ~FdGuard() {
      reset();
    }

    FdGuard(const FdGuard&)                    = delete;
    auto operator=(const FdGuard&) -> FdGuard& = delete;

    FdGuard(FdGuard&& other) noexcept
      : m_fd(std::exchange(other.m_fd, -1)) {}

    auto operator=(FdGuard&& other) noexcept -> FdGuard& {
      if (this != &other) {
        reset();
        m_fd = std::exchange(other.m_fd, -1);
      }
      return *this;
    }

    auto reset() -> void {
      if (m_fd != -1)
        close(m_fd);
      m_fd = -1;
    }

    [[nodiscard]] auto get() const noexcept -> int {
      return m_fd;
    }
  };

  struct Pipe {
    FdGuard readEnd;
    FdGuard writeEnd;
  };

  // Both ends are close-on-exec; dup2 in the child clears the flag on the copies it makes.
  auto OpenPipe() -> Result<Pipe> {
    Array<int, 2> fds {};

    if (pipe(fds.data()) == -1)
      return Err(FactsError::fromErrno(errno, "pipe"));

    Pipe result { .readEnd = FdGuard(fds[0]), .writeEnd = FdGuard(fds[1]) };

    for (const int descriptor : fds)
      if (fcntl(descriptor, F_SETFD, FD_CLOEXEC) == -1)
        return Err(FactsError::fromErrno(errno, "fcntl(FD_CLOEXEC)"));

    return result;
  }

  auto WaitForChild(const pid_t pid) -> Result<i32> {
    int status = 0;

    while (waitpid(pid, &status, 0) == -1)
      if (errno != EINTR)
        return Err(FactsError::fromErrno(errno, "waitpid"));

    if (WIFEXITED(status))
      return WEXITSTATUS(status);

    if (WIFSIGNALED(status))
      return 128 + WTERMSIG(status);

    return -1;
  }

  /// Reads stdout and stderr together so neither pipe can fill up and stall the child.
  auto DrainOutput(const Pipe& out, const Pipe& err, String& stdOut, String& stdErr) -> Result<> {
    Array<pollfd, 2>  fds     = { { { out.readEnd.get(), POLLIN, 0 }, { err.readEnd.get(), POLLIN, 0 } } };
    Array<String*, 2> sinks   = { &stdOut, &stdErr };
    usize             pending = fds.size();
    Array<char, 4096> buffer {};

    while (pending > 0) {
      if (poll(fds.data(), fds.size(), -1) == -1) {
        if (errno == EINTR)
          continue;

        return Err(FactsError::fromErrno(errno, "poll"));
      }

      for (usize i = 0; i < fds.size(); ++i) {
        if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
          continue;

        const ssize_t count = read(fds[i].fd, buffer.data(), buffer.size());

        if (count > 0) {
          sinks[i]->append(buffer.data(), static_cast<usize>(count));
          continue;
        }

        if (count == -1 && errno == EINTR)
          continue;

        fds[i].fd = -1;
        --pending;
      }
    }

    return {};
  }

  auto Uname() -> Result<utsname> {
    utsname uts {};

    if (uname(&uts) == -1)
      return Err(FactsError::fromErrno(errno, "uname"));

    return uts;
  }

  auto NonEmpty(const PCStr value, const StringView what) -> Result<String> {
    if (value == nullptr || *value == '\0')
      ERR_FMT(NotFound, "{} is empty", what);

    return String(value);
  }

  auto ReadWholeFile(const PCStr path) -> Result<String> {
    std::ifstream file(path);

    if (!file.is_open())
      ERR_FMT(NotFound, "Failed to open {}", path);

    return String(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  }

  using AddrInfoList = UniquePointer<addrinfo, decltype(&freeaddrinfo)>;

  auto Resolve(const StringView host, const int family, const int flags) -> Result<AddrInfoList> {
    addrinfo hints {};
    hints.ai_family   = family;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = flags;

    addrinfo*    raw  = nullptr;
    const String name(host);

    if (const int status = getaddrinfo(name.c_str(), nullptr, &hints, &raw); status != 0)
      ERR_FMT(NetworkError, "getaddrinfo({}) failed: {}", name, gai_strerror(status));

    return AddrInfoList(raw, &freeaddrinfo);
  }

  /// 48-bit link-layer address of an interface entry, if it carries one.
  auto LinkLayerNode(const sockaddr* addr) -> Option<u64> {
    using matchit::match, matchit::is, matchit::_;

    const u8* bytes  = nullptr;
    usize     length = 0;

  #ifdef __linux__
    constexpr int LinkFamily = AF_PACKET;
  #else
    constexpr int LinkFamily = AF_LINK;
  #endif

    match(addr->sa_family)(
      is | LinkFamily = [&]() -> void {
  #ifdef __linux__
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        const auto* sll = reinterpret_cast<const sockaddr_ll*>(addr);
        bytes           = sll->sll_addr;
        length          = sll->sll_halen;
  #else
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        const auto* sdl = reinterpret_cast<const sockaddr_dl*>(addr);
        bytes           = reinterpret_cast<const u8*>(LLADDR(sdl)); // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
        length          = sdl->sdl_alen;
  #endif
      },
      is | _ = [&]() -> void {}
    );

    if (bytes == nullptr || length != 6)
      return None;

    u64 node = 0;

    for (usize i = 0; i < length; ++i)
      node = (node << 8U) | bytes[i];

    if (node == 0)
      return None;

    return node;
  }
} // namespace

namespace hostfacts::core::command {
  auto ProcessCommandRunner::run(const Vec<String>& argv) -> Result<CommandResult> {
    if (argv.empty())
      ERR(InvalidArgument, "Cannot run an empty command");

    Pipe out    = TRY(OpenPipe());
    Pipe err    = TRY(OpenPipe());
    Pipe status = TRY(OpenPipe());

    Vec<char*> cargv;
    cargv.reserve(argv.size() + 1);

    for (const String& arg : argv)
      cargv.push_back(const_cast<char*>(arg.c_str())); // NOLINT(cppcoreguidelines-pro-type-const-cast)

    cargv.push_back(nullptr);

    const pid_t pid = fork();

    if (pid == -1)
      return Err(FactsError::fromErrno(errno, "fork"));

    if (pid == 0) {
      const int devNull = open("/dev/null", O_RDONLY);

      if (devNull != -1)
        dup2(devNull, STDIN_FILENO);

      dup2(out.writeEnd.get(), STDOUT_FILENO);
      dup2(err.writeEnd.get(), STDERR_FILENO);

      execvp(cargv[0], cargv.data());

      // Only reached when exec failed; report errno to the parent through the status pipe.
      const int code = errno;
      (void)!write(status.writeEnd.get(), &code, sizeof(code));
      _exit(127);
    }

    out.writeEnd.reset();
    err.writeEnd.reset();
    status.writeEnd.reset();

    int     childErrno = 0;
    ssize_t received   = 0;

    do
      received = read(status.readEnd.get(), &childErrno, sizeof(childErrno));
    while (received == -1 && errno == EINTR);

    if (received == static_cast<ssize_t>(sizeof(childErrno))) {
      TRY(WaitForChild(pid));
      return Err(FactsError::fromErrno(childErrno, std::format("Cannot execute {}", argv.front())));
    }

    CommandResult result;

    if (Result<> drained = DrainOutput(out, err, result.stdOut, result.stdErr); !drained) {
      TRY(WaitForChild(pid));
      return Err(drained.error());
    }

    result.exitCode = TRY(WaitForChild(pid));

    return result;
  }
} // namespace hostfacts::core::command

namespace hostfacts::core::os {
  auto OSClassifier::Detect() -> Result<OSClassifier> {
    Result<String> content = ReadWholeFile("/etc/os-release");

    if (!content) {
      debug_at(content.error());
      content = ReadWholeFile("/usr/lib/os-release");
    }

    if (!content)
      ERR(NotFound, "Neither /etc/os-release nor /usr/lib/os-release could be read");

    const OsRelease release = TRY(ParseOsRelease(*content));

    return OSClassifier(DescribeOsRelease(release));
  }
} // namespace hostfacts::core::os

namespace hostfacts::core::host {
  using utils::env::GetEnv;

  auto GetCurrentUser() -> Result<String> {
    const long   suggested = sysconf(_SC_GETPW_R_SIZE_MAX);
    Vec<char>    buffer(suggested > 0 ? static_cast<usize>(suggested) : 16384);
    passwd       entry {};
    passwd*      found = nullptr;

    if (getpwuid_r(geteuid(), &entry, buffer.data(), buffer.size(), &found) == 0 && found != nullptr && found->pw_name != nullptr)
      return String(found->pw_name);

    if (Result<String> user = GetEnv("USER"); user && !user->empty())
      return user;

    if (Result<String> logName = GetEnv("LOGNAME"); logName && !logName->empty())
      return logName;

    ERR(NotFound, "No password entry for the effective user and USER/LOGNAME are unset");
  }

  auto GetKernelName() -> Result<String> {
    const utsname uts = TRY(Uname());
    return NonEmpty(uts.sysname, "uname() sysname");
  }

  auto GetHostName() -> Result<String> {
    Array<char, 256> buffer {};

    if (gethostname(buffer.data(), buffer.size() - 1) == -1)
      return Err(FactsError::fromErrno(errno, "gethostname"));

    return NonEmpty(buffer.data(), "gethostname()");
  }

  auto GetCanonicalName(const StringView host) -> Result<String> {
    const AddrInfoList list = TRY(Resolve(host, AF_UNSPEC, AI_CANONNAME));

    if (list->ai_canonname == nullptr || *list->ai_canonname == '\0')
      ERR_FMT(NetworkError, "{} has no canonical name", host);

    return String(list->ai_canonname);
  }

  auto ResolveHostAddress(const StringView host) -> Result<String> {
    const AddrInfoList list = TRY(Resolve(host, AF_INET, 0));

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
    const utsname uts = TRY(Uname());
    return NonEmpty(uts.machine, "uname() machine");
  }

  auto GetKernelRelease() -> Result<String> {
    const utsname uts = TRY(Uname());
    return NonEmpty(uts.release, "uname() release");
  }

  auto GetTimeZoneName() -> Result<String> {
    tzset();

    const std::time_t now = std::time(nullptr);
    std::tm           local {};

    if (localtime_r(&now, &local) == nullptr)
      return Err(FactsError::fromErrno(errno, "localtime_r"));

    return NonEmpty(tzname[local.tm_isdst > 0 ? 1 : 0], "time zone name");
  }

  auto GetProcessorCount() -> i64 {
    return std::max<i64>(1, sysconf(_SC_NPROCESSORS_ONLN));
  }

  auto GetHardwareNode() -> Result<u64> {
    ifaddrs* rawList = nullptr;

    if (getifaddrs(&rawList) == -1)
      return Err(FactsError::fromErrno(errno, "getifaddrs"));

    const UniquePointer<ifaddrs, decltype(&freeifaddrs)> list(rawList, &freeifaddrs);

    Map<String, u64> nodes;

    for (const ifaddrs* ifa = list.get(); ifa != nullptr; ifa = ifa->ifa_next) {
      if (ifa->ifa_addr == nullptr || (ifa->ifa_flags & IFF_LOOPBACK) != 0)
        continue;

      if (const Option<u64> node = LinkLayerNode(ifa->ifa_addr))
        nodes.try_emplace(ifa->ifa_name, *node);
    }

    if (nodes.empty())
      ERR(NotFound, "No interface with a hardware address found");

    return nodes.begin()->second;
  }
} // namespace hostfacts::core::host

#endif // !_WIN32
