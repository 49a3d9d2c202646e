#include "backranq/engine/uci/uci_engine_process.hpp"

#include <iostream>
#include <sstream>

namespace backranq::engine::uci
{
  using namespace std::chrono_literals;

  static bool starts_with(const std::string &s, const char *pfx)
  {
    return s.rfind(pfx, 0) == 0;
  }

  UciEngineProcess::~UciEngineProcess()
  {
    stop();
  }

  bool UciEngineProcess::start(const std::string &exePath, const std::vector<std::string> &args)
  {
    stop();
    if (!platformStart(exePath, args))
    {
      std::cerr << "[UciEngineProcess] failed to start " << exePath << "\n";
      return false;
    }

    m_closed.store(false);
    m_running.store(true);
    m_reader = std::thread([this]
                           { readerLoop(); });
    return true;
  }

  void UciEngineProcess::stop()
  {
    if (!m_running.load())
      return;

    // best-effort graceful shutdown
    sendLine("quit");
    m_running.store(false);
    m_cvLines.notify_all();

    if (m_reader.joinable())
      m_reader.join();
    platformStop();

    std::lock_guard lk(m_mtx);
    m_lines.clear();
  }

  bool UciEngineProcess::sendLine(const std::string &line)
  {
    if (m_closed.load())
      return false;
    if (!platformWrite(line + "\n"))
    {
      m_closed.store(true);
      m_cvLines.notify_all();
      return false;
    }
    return true;
  }

  void UciEngineProcess::readerLoop()
  {
    while (m_running.load())
    {
      std::string line;
      const ReadStatus st = platformReadLine(line, 50);
      if (st == ReadStatus::Timeout)
        continue;
      if (st == ReadStatus::Closed)
      {
        m_closed.store(true);
        m_cvLines.notify_all();
        break;
      }

      // Normalize CRLF
      while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();

      {
        std::lock_guard lk(m_mtx);
        m_lines.push_back(std::move(line));
      }
      m_cvLines.notify_all();
    }
  }

  UciEngineProcess::ReadStatus UciEngineProcess::readLine(std::string &outLine,
                                                          std::chrono::milliseconds timeout)
  {
    std::unique_lock lk(m_mtx);
    m_cvLines.wait_for(lk, timeout, [&]
                       { return !m_lines.empty() || m_closed.load() || !m_running.load(); });
    if (!m_lines.empty())
    {
      outLine = std::move(m_lines.front());
      m_lines.pop_front();
      return ReadStatus::Line;
    }
    if (m_closed.load() || !m_running.load())
      return ReadStatus::Closed;
    return ReadStatus::Timeout;
  }

  bool UciEngineProcess::uciHandshake(Id &outId, std::chrono::milliseconds timeout)
  {
    outId = {};
    if (!sendLine("uci"))
      return false;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline)
        return false;

      std::string line;
      auto st = readLine(line, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
      if (st == ReadStatus::Closed)
        return false;
      if (st == ReadStatus::Timeout)
        continue;

      if (starts_with(line, "id name "))
        outId.name = line.substr(std::string("id name ").size());
      else if (starts_with(line, "id author "))
        outId.author = line.substr(std::string("id author ").size());
      else if (line == "uciok")
        return isReady(timeout);
    }
  }

  bool UciEngineProcess::isReady(std::chrono::milliseconds timeout)
  {
    if (!sendLine("isready"))
      return false;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline)
        return false;

      std::string line;
      auto st = readLine(line, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
      if (st == ReadStatus::Closed)
        return false;
      if (st == ReadStatus::Line && line == "readyok")
        return true;
    }
  }

  bool UciEngineProcess::setOption(const std::string &name, const std::string &value)
  {
    std::ostringstream os;
    os << "setoption name " << name << " value " << value;
    return sendLine(os.str());
  }

  bool UciEngineProcess::newGame()
  {
    return sendLine("ucinewgame");
  }

  bool UciEngineProcess::position(const std::string &fen)
  {
    return sendLine("position fen " + fen);
  }

  bool UciEngineProcess::goMovetime(int movetimeMs)
  {
    return sendLine("go movetime " + std::to_string(movetimeMs));
  }

  bool UciEngineProcess::goDepth(int depth)
  {
    return sendLine("go depth " + std::to_string(depth));
  }

  bool UciEngineProcess::stopSearch()
  {
    return sendLine("stop");
  }

} // namespace backranq::engine::uci
