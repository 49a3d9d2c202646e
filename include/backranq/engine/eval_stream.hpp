#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "backranq/engine/evaluation.hpp"

namespace backranq::engine
{
  enum class StreamStatus
  {
    Running,
    Done,
    Cancelled,
    Failed
  };

  // Single-producer channel of snapshots for one evaluation request.
  // The queue is bounded; when full the oldest snapshot is dropped, the latest is always kept.
  // Any thread may cancel; the producer polls cancelled() and ends with finish().
  class EvalStream
  {
  public:
    explicit EvalStream(std::size_t capacity = 8);

    EvalStream(const EvalStream &) = delete;
    EvalStream &operator=(const EvalStream &) = delete;

    // ---- producer side ----
    void publish(EvalSnapshot snap);
    void finish();
    void fail(std::string message);

    // ---- consumer side ----
    // Pops the oldest queued snapshot, waiting up to 'timeout'.
    std::optional<EvalSnapshot> next(std::chrono::milliseconds timeout);
    std::optional<EvalSnapshot> latest() const;

    // Blocks until the stream ends or the deadline passes; returns the best result so far.
    std::optional<EvalSnapshot> awaitResult(std::chrono::steady_clock::time_point deadline);

    void cancel();
    bool cancelled() const noexcept { return m_cancelled.load(std::memory_order_acquire); }

    StreamStatus status() const;
    std::string error() const;
    bool closed() const;

  private:
    const std::size_t m_capacity;
    mutable std::mutex m_mtx;
    std::condition_variable m_cv;
    std::deque<EvalSnapshot> m_queue;
    std::optional<EvalSnapshot> m_latest;
    StreamStatus m_status{StreamStatus::Running};
    std::string m_error;
    std::atomic_bool m_cancelled{false};
  };

  using EvalStreamPtr = std::shared_ptr<EvalStream>;

} // namespace backranq::engine
