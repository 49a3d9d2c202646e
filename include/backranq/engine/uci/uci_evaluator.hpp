#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "backranq/engine/evaluation_adapter.hpp"
#include "backranq/engine/uci/uci_engine_process.hpp"

namespace backranq::engine::uci
{
  struct UciEvaluatorOptions
  {
    std::string exePath;
    std::vector<std::string> args;
    int threads{1};
    int hashMb{0};                                   // 0 = engine default
    std::chrono::milliseconds startupTimeout{5000};  // uci + isready
    std::chrono::milliseconds stopTimeout{2000};     // wait for bestmove after "stop"
    int defaultMovetimeMs{1000};                     // request without time or depth limit
  };

  // EvaluationAdapter over one UCI engine process. Requests are queued and served one at
  // a time by a worker thread; each publishes a snapshot per completed depth.
  class UciEvaluator final : public EvaluationAdapter
  {
  public:
    explicit UciEvaluator(UciEvaluatorOptions opts);
    ~UciEvaluator() override;

    UciEvaluator(const UciEvaluator &) = delete;
    UciEvaluator &operator=(const UciEvaluator &) = delete;

    // Spawns the engine and completes the handshake.
    bool start(std::string *err = nullptr);
    void shutdown();

    EvalStreamPtr evaluate(const EvalRequest &req) override;

    bool available() const { return m_available.load(); }
    const UciEngineProcess::Id &engineId() const { return m_id; }

  private:
    struct Job
    {
      EvalRequest req;
      EvalStreamPtr stream;
    };

    void workerLoop();
    void runJob(Job &job);
    void markUnavailable(const std::string &why);

    UciEvaluatorOptions m_opts;
    UciEngineProcess m_proc;
    UciEngineProcess::Id m_id;
    int m_currentMultiPv{0};

    std::mutex m_mtx;
    std::condition_variable m_cv;
    std::deque<Job> m_jobs;
    bool m_stop{false};
    std::atomic_bool m_available{false};
    std::thread m_worker;
  };

} // namespace backranq::engine::uci
