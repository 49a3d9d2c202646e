#if !defined(_WIN32)

#include "backranq/engine/uci/uci_engine_process.hpp"

#include <cerrno>
#include <csignal>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace backranq::engine::uci
{
  struct UciEngineProcess::Impl
  {
    pid_t pid{-1};
    int stdinWrite{-1}; // parent -> child stdin
    int stdoutRead{-1}; // child stdout/stderr -> parent
    std::string readBuf;
  };

  void UciEngineProcess::ImplDeleter::operator()(Impl *p) noexcept
  {
    delete p;
  }

  static void closeFd(int &fd)
  {
    if (fd >= 0)
    {
      ::close(fd);
      fd = -1;
    }
  }

  // A dead engine must surface as a failed write, not kill the host process.
  static void ignoreSigpipe()
  {
    static std::once_flag once;
    std::call_once(once, []
                   { std::signal(SIGPIPE, SIG_IGN); });
  }

  static void setCloexec(int fd)
  {
    int flags = ::fcntl(fd, F_GETFD);
    if (flags >= 0)
      ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
  }

  bool UciEngineProcess::platformStart(const std::string &exePath, const std::vector<std::string> &args)
  {
    platformStop();
    ignoreSigpipe();
    m_impl.reset(new Impl()); // not make_unique: the deleter type must match

    int inPipe[2] = {-1, -1};  // child reads [0], parent writes [1]
    int outPipe[2] = {-1, -1}; // parent reads [0], child writes [1]

    if (::pipe(inPipe) != 0)
      return false;

    if (::pipe(outPipe) != 0)
    {
      ::close(inPipe[0]);
      ::close(inPipe[1]);
      return false;
    }

    // argv must be built before fork; the child only calls async-signal-safe functions.
    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(exePath.c_str()));
    for (const auto &a : args)
      argv.push_back(const_cast<char *>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
    {
      ::close(inPipe[0]);
      ::close(inPipe[1]);
      ::close(outPipe[0]);
      ::close(outPipe[1]);
      return false;
    }

    if (pid == 0)
    {
      // Child
      ::dup2(inPipe[0], STDIN_FILENO);
      ::dup2(outPipe[1], STDOUT_FILENO);
      ::dup2(outPipe[1], STDERR_FILENO);

      ::close(inPipe[0]);
      ::close(inPipe[1]);
      ::close(outPipe[0]);
      ::close(outPipe[1]);

      ::signal(SIGPIPE, SIG_DFL);
      ::execvp(exePath.c_str(), argv.data());
      _exit(127);
    }

    // Parent
    ::close(inPipe[0]);
    ::close(outPipe[1]);
    setCloexec(inPipe[1]);
    setCloexec(outPipe[0]);

    m_impl->pid = pid;
    m_impl->stdinWrite = inPipe[1];
    m_impl->stdoutRead = outPipe[0];

    return true;
  }

  void UciEngineProcess::platformStop()
  {
    if (!m_impl)
      return;

    closeFd(m_impl->stdinWrite);
    closeFd(m_impl->stdoutRead);

    if (m_impl->pid > 0)
    {
      int status = 0;
      for (int i = 0; i < 50; ++i)
      {
        pid_t r = ::waitpid(m_impl->pid, &status, WNOHANG);
        if (r == m_impl->pid || r < 0)
        {
          m_impl->pid = -1;
          break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }

      if (m_impl->pid > 0)
      {
        ::kill(m_impl->pid, SIGKILL);
        ::waitpid(m_impl->pid, &status, 0);
        m_impl->pid = -1;
      }
    }

    m_impl.reset();
  }

  bool UciEngineProcess::platformWrite(const std::string &s)
  {
    if (!m_impl || m_impl->stdinWrite < 0)
      return false;

    const char *p = s.data();
    size_t remaining = s.size();

    while (remaining > 0)
    {
      ssize_t n = ::write(m_impl->stdinWrite, p, remaining);
      if (n < 0)
      {
        if (errno == EINTR)
          continue;
        return false; // EPIPE once the engine is gone
      }
      p += n;
      remaining -= (size_t)n;
    }
    return true;
  }

  UciEngineProcess::ReadStatus UciEngineProcess::platformReadLine(std::string &outLine, int pollMs)
  {
    outLine.clear();
    if (!m_impl || m_impl->stdoutRead < 0)
      return ReadStatus::Closed;

    for (;;)
    {
      auto pos = m_impl->readBuf.find('\n');
      if (pos != std::string::npos)
      {
        outLine = m_impl->readBuf.substr(0, pos + 1);
        m_impl->readBuf.erase(0, pos + 1);
        return ReadStatus::Line;
      }

      pollfd pfd{};
      pfd.fd = m_impl->stdoutRead;
      pfd.events = POLLIN;
      int pr = ::poll(&pfd, 1, pollMs);
      if (pr < 0)
      {
        if (errno == EINTR)
          continue;
        return ReadStatus::Closed;
      }
      if (pr == 0)
        return ReadStatus::Timeout;

      char tmp[4096];
      ssize_t n = ::read(m_impl->stdoutRead, tmp, sizeof(tmp));
      if (n < 0)
      {
        if (errno == EINTR || errno == EAGAIN)
          continue;
        return ReadStatus::Closed;
      }
      if (n == 0)
      {
        if (!m_impl->readBuf.empty())
        {
          outLine = std::move(m_impl->readBuf);
          m_impl->readBuf.clear();
          return ReadStatus::Line;
        }
        return ReadStatus::Closed;
      }

      m_impl->readBuf.append(tmp, tmp + n);
    }
  }

} // namespace backranq::engine::uci

#endif // !_WIN32
