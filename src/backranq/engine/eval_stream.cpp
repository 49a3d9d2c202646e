#include "backranq/engine/eval_stream.hpp"

namespace backranq::engine
{
  EvalStream::EvalStream(std::size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

  void EvalStream::publish(EvalSnapshot snap)
  {
    {
      std::lock_guard lk(m_mtx);
      if (m_status != StreamStatus::Running)
        return;
      if (m_queue.size() >= m_capacity)
        m_queue.pop_front();
      m_latest = snap;
      m_queue.push_back(std::move(snap));
    }
    m_cv.notify_all();
  }

  void EvalStream::finish()
  {
    {
      std::lock_guard lk(m_mtx);
      if (m_status != StreamStatus::Running)
        return;
      m_status = cancelled() ? StreamStatus::Cancelled : StreamStatus::Done;
    }
    m_cv.notify_all();
  }

  void EvalStream::fail(std::string message)
  {
    {
      std::lock_guard lk(m_mtx);
      if (m_status != StreamStatus::Running)
        return;
      m_status = StreamStatus::Failed;
      m_error = std::move(message);
    }
    m_cv.notify_all();
  }

  std::optional<EvalSnapshot> EvalStream::next(std::chrono::milliseconds timeout)
  {
    std::unique_lock lk(m_mtx);
    m_cv.wait_for(lk, timeout, [&]
                  { return !m_queue.empty() || m_status != StreamStatus::Running; });
    if (m_queue.empty())
      return std::nullopt;
    EvalSnapshot s = std::move(m_queue.front());
    m_queue.pop_front();
    return s;
  }

  std::optional<EvalSnapshot> EvalStream::latest() const
  {
    std::lock_guard lk(m_mtx);
    return m_latest;
  }

  std::optional<EvalSnapshot> EvalStream::awaitResult(std::chrono::steady_clock::time_point deadline)
  {
    std::unique_lock lk(m_mtx);
    m_cv.wait_until(lk, deadline, [&]
                    { return m_status != StreamStatus::Running; });
    return m_latest;
  }

  void EvalStream::cancel()
  {
    m_cancelled.store(true, std::memory_order_release);
    m_cv.notify_all();
  }

  StreamStatus EvalStream::status() const
  {
    std::lock_guard lk(m_mtx);
    return m_status;
  }

  std::string EvalStream::error() const
  {
    std::lock_guard lk(m_mtx);
    return m_error;
  }

  bool EvalStream::closed() const
  {
    std::lock_guard lk(m_mtx);
    return m_status != StreamStatus::Running;
  }

} // namespace backranq::engine
