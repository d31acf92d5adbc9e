#pragma once

#include "analysis/analysis.hpp"
#include "experiment/experiment_data.hpp"
#include "progress_reporter.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace bench_analysis {

class AnalysisProgressReporter final : public ProgressReporter {
  public:
    AnalysisProgressReporter() = default;

    void set_total_steps(std::size_t total_steps) override {
        std::lock_guard<std::mutex> lock(mutex_);
        total_steps_ = total_steps;
    }

    void increment_completed_steps(std::size_t delta = 1) override {
        completed_steps_.fetch_add(delta, std::memory_order_relaxed);
    }

    void record_log(const Diagnostic& log) override {
        std::lock_guard<std::mutex> lock(mutex_);
        logs_.push_back(log);
        if (logs_.size() > kMaxLogs) {
            logs_.erase(logs_.begin());
        }
    }

    void enter_experiment(const std::string& experiment_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        active_experiments_.push_back(experiment_id);
    }

    void exit_experiment(const std::string& experiment_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_experiments_.empty() && active_experiments_.back() == experiment_id) {
            active_experiments_.pop_back();
        }
        last_finished_experiment_ = experiment_id;
    }

    std::size_t total_steps() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_steps_;
    }

    std::size_t completed_steps() const {
        return completed_steps_.load(std::memory_order_relaxed);
    }

    std::vector<Diagnostic> recent_logs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return logs_;
    }

    // Ids of the containers under analysis, outermost first.
    std::vector<std::string> active_experiments() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_experiments_;
    }

    std::string last_finished_experiment() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_finished_experiment_;
    }

  private:
    static constexpr std::size_t kMaxLogs = 8;

    mutable std::mutex mutex_;
    std::vector<Diagnostic> logs_;
    std::vector<std::string> active_experiments_;
    std::string last_finished_experiment_;
    std::size_t total_steps_ = 0;
    std::atomic<std::size_t> completed_steps_{0};
};

namespace service {

enum class AnalysisStatus {
    Pending,
    Running,
    Completed,
    Failed,
};

struct AnalysisJobResult {
    std::string job_id;
    AnalysisStatus status = AnalysisStatus::Pending;
    AnalysisOutput output;
    double elapsed_time = 0.0;
    std::string message;
};

struct AnalysisStatusSnapshot {
    AnalysisStatus status = AnalysisStatus::Pending;
    double percent_complete = 0.0;
    std::string message;
    std::vector<Diagnostic> recent_logs;
    // Path from the root container to the one being analysed; empty once the
    // job has finished.
    std::vector<std::string> active_experiments;
    std::string last_finished_experiment;
};

std::string status_to_string(AnalysisStatus status);

// Runs the analysis attached to the data's experiment and converts any
// failure into a Failed result carrying the error message.
class AnalysisRunner {
  public:
    AnalysisJobResult run(
        ExperimentData& data,
        const AnalysisOptions& options = {},
        ProgressReporter* reporter = nullptr
    );
};

class AnalysisService {
  public:
    AnalysisService();
    ~AnalysisService();

    AnalysisService(const AnalysisService&) = delete;
    AnalysisService& operator=(const AnalysisService&) = delete;

    // Analyse `data` on a worker thread. Returns the generated job ID. The
    // service shares ownership of `data` until the job finishes; callers must
    // not touch the tree before poll_result reports completion.
    std::string submit(std::shared_ptr<ExperimentData> data, AnalysisOptions options = {});

    // Poll for the final result if the job is complete.
    std::optional<AnalysisJobResult> poll_result(const std::string& job_id) const;

    // Query the current status snapshot for the given job.
    AnalysisStatusSnapshot status(const std::string& job_id) const;

    // Worker threads not yet joined. Workers of finished jobs are joined on
    // the next submit.
    std::size_t worker_count() const;

  private:
    struct JobEntry {
        std::shared_ptr<ExperimentData> data;
        AnalysisOptions options;
        AnalysisJobResult result;
        std::shared_ptr<AnalysisProgressReporter> reporter;
        std::atomic<AnalysisStatus> status{AnalysisStatus::Pending};
        mutable std::mutex result_mutex;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<JobEntry> entry;
    };

    void join_finished_workers_locked();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<JobEntry>> jobs_;
    std::vector<Worker> workers_;
    std::atomic<std::uint64_t> id_counter_{0};
    AnalysisRunner runner_;
};

}  // namespace service
}  // namespace bench_analysis
