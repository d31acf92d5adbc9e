#include "service/analysis_service.hpp"

#include "experiment/experiment.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace bench_analysis::service {

std::string status_to_string(AnalysisStatus status) {
    switch (status) {
        case AnalysisStatus::Pending:
            return "pending";
        case AnalysisStatus::Running:
            return "running";
        case AnalysisStatus::Completed:
            return "completed";
        case AnalysisStatus::Failed:
            return "failed";
    }
    return "unknown";
}

AnalysisJobResult AnalysisRunner::run(
    ExperimentData& data,
    const AnalysisOptions& options,
    ProgressReporter* reporter
) {
    const auto start = std::chrono::steady_clock::now();
    AnalysisJobResult result;
    try {
        AnalysisOptions run_options = options;
        if (reporter) {
            reporter->set_total_steps(data.node_count());
            run_options.reporter = reporter;
        }
        result.output = data.experiment()->run_analysis(data, run_options);
        result.status = AnalysisStatus::Completed;
    } catch (const std::exception& ex) {
        result.status = AnalysisStatus::Failed;
        result.message = ex.what();
    }
    const auto end = std::chrono::steady_clock::now();
    result.elapsed_time = std::chrono::duration<double>(end - start).count();
    return result;
}

AnalysisService::AnalysisService()
    : id_counter_(0) {}

AnalysisService::~AnalysisService() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void AnalysisService::join_finished_workers_locked() {
    auto finished = [](const Worker& worker) {
        const AnalysisStatus status = worker.entry->status.load(std::memory_order_acquire);
        return status == AnalysisStatus::Completed || status == AnalysisStatus::Failed;
    };
    for (auto& worker : workers_) {
        if (finished(worker) && worker.thread.joinable()) {
            worker.thread.join();
        }
    }
    workers_.erase(
        std::remove_if(workers_.begin(), workers_.end(),
                       [](const Worker& worker) { return !worker.thread.joinable(); }),
        workers_.end());
}

std::size_t AnalysisService::worker_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

std::string AnalysisService::submit(
    std::shared_ptr<ExperimentData> data,
    AnalysisOptions options
) {
    if (!data) {
        throw std::invalid_argument("cannot submit analysis without experiment data");
    }
    const std::uint64_t seq = id_counter_.fetch_add(1, std::memory_order_relaxed);
    const std::string job_id = "analysis-" + std::to_string(seq);

    auto entry = std::make_shared<JobEntry>();
    entry->data = std::move(data);
    entry->options = std::move(options);
    entry->reporter = std::make_shared<AnalysisProgressReporter>();
    entry->result.job_id = job_id;

    std::lock_guard<std::mutex> lock(mutex_);
    join_finished_workers_locked();
    jobs_.emplace(job_id, entry);
    Worker worker;
    worker.entry = entry;
    worker.thread = std::thread([this, entry, job_id]() {
        entry->status.store(AnalysisStatus::Running, std::memory_order_relaxed);
        AnalysisJobResult result =
            runner_.run(*entry->data, entry->options, entry->reporter.get());
        result.job_id = job_id;
        std::lock_guard<std::mutex> guard(entry->result_mutex);
        entry->result = std::move(result);
        entry->status.store(entry->result.status, std::memory_order_release);
    });
    workers_.push_back(std::move(worker));

    return job_id;
}

std::optional<AnalysisJobResult> AnalysisService::poll_result(const std::string& job_id) const {
    std::shared_ptr<JobEntry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            return std::nullopt;
        }
        entry = it->second;
    }
    const AnalysisStatus status = entry->status.load(std::memory_order_acquire);
    if (status != AnalysisStatus::Completed && status != AnalysisStatus::Failed) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> guard(entry->result_mutex);
    return entry->result;
}

AnalysisStatusSnapshot AnalysisService::status(const std::string& job_id) const {
    AnalysisStatusSnapshot snapshot;
    std::shared_ptr<JobEntry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = jobs_.find(job_id);
        if (it == jobs_.end()) {
            snapshot.status = AnalysisStatus::Failed;
            snapshot.message = std::string("job_id not found");
            return snapshot;
        }
        entry = it->second;
    }
    snapshot.status = entry->status.load(std::memory_order_acquire);
    const std::size_t total = entry->reporter->total_steps();
    const std::size_t completed = entry->reporter->completed_steps();
    snapshot.percent_complete = total == 0 ? 0.0
        : std::min(1.0, static_cast<double>(completed) / static_cast<double>(total));
    snapshot.recent_logs = entry->reporter->recent_logs();
    snapshot.active_experiments = entry->reporter->active_experiments();
    snapshot.last_finished_experiment = entry->reporter->last_finished_experiment();
    {
        std::lock_guard<std::mutex> guard(entry->result_mutex);
        snapshot.message = entry->result.message;
    }
    return snapshot;
}

}  // namespace bench_analysis::service
