#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace backranq::engine::uci
{
  // A UCI engine running as a child process. A reader thread collects output lines;
  // callers pull them with readLine().
  class UciEngineProcess
  {
  public:
    struct Id
    {
      std::string name, author;
    };

    enum class ReadStatus
    {
      Line,
      Timeout,
      Closed
    };

    UciEngineProcess() = default;
    ~UciEngineProcess(); // out-of-line semantics via custom deleter (safe with incomplete Impl)

    UciEngineProcess(const UciEngineProcess &) = delete;
    UciEngineProcess &operator=(const UciEngineProcess &) = delete;
    UciEngineProcess(UciEngineProcess &&) = delete;
    UciEngineProcess &operator=(UciEngineProcess &&) = delete;

    bool start(const std::string &exePath, const std::vector<std::string> &args = {});
    void stop();

    // False once the process exited or a write to it failed.
    bool alive() const { return m_running.load() && !m_closed.load(); }

    bool uciHandshake(Id &outId, std::chrono::milliseconds timeout);
    bool isReady(std::chrono::milliseconds timeout);

    bool setOption(const std::string &name, const std::string &value);
    bool newGame();
    bool position(const std::string &fen);
    bool goMovetime(int movetimeMs);
    bool goDepth(int depth);
    bool stopSearch();

    ReadStatus readLine(std::string &outLine, std::chrono::milliseconds timeout);

  private:
    bool sendLine(const std::string &line);
    void readerLoop();

    bool platformStart(const std::string &exePath, const std::vector<std::string> &args);
    void platformStop();

    bool platformWrite(const std::string &s);
    // Waits at most 'pollMs' for a full line.
    ReadStatus platformReadLine(std::string &outLine, int pollMs);

  private:
    std::thread m_reader;
    std::atomic_bool m_running{false};
    std::atomic_bool m_closed{false};

    std::mutex m_mtx;
    std::condition_variable m_cvLines;
    std::deque<std::string> m_lines;

    struct Impl;

    struct ImplDeleter
    {
      void operator()(Impl *p) noexcept; // defined in platform .cpp where Impl is complete
    };

    std::unique_ptr<Impl, ImplDeleter> m_impl;
  };

} // namespace backranq::engine::uci
