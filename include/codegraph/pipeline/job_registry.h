#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <codegraph/core/types.h>
#include <codegraph/pipeline/job.h>

namespace codegraph::pipeline {

/**
 * @brief Job-id keyed map of atomically replaced Job snapshots.
 *
 * Readers load the current snapshot without waiting on the job's writer.
 * Writers serialize per job, copy the snapshot, modify and publish it.
 * Once a job is terminal every update fails with ErrorCode::InvalidState.
 * Unknown ids fail with ErrorCode::NotFound.
 */
class JobRegistry {
public:
    JobRegistry() = default;
    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    /// Register a pending job and return its new id.
    std::string create(std::string kind, std::string repoId,
                       nlohmann::json metadata = nlohmann::json::object());

    Result<Job> get(const std::string& id) const;

    /// All jobs, oldest first.
    std::vector<Job> list() const;

    Result<void> markRunning(const std::string& id);

    /// Clamped to [0, 1]; a lower value than the current one is ignored.
    Result<void> setProgress(const std::string& id, double progress);

    Result<void> complete(const std::string& id, nlohmann::json result);
    Result<void> fail(const std::string& id, std::string message);

    /// Move the job to cancelled. Used by the worker that observed the request.
    Result<void> markCancelled(const std::string& id, nlohmann::json partialResult = {});

    /// Raise the cooperative cancellation flag of a non-terminal job.
    Result<void> requestCancel(const std::string& id);
    [[nodiscard]] bool cancelRequested(const std::string& id) const;

    /// Block until the job is terminal or the timeout expires (ErrorCode::Timeout).
    Result<Job> waitForTerminal(const std::string& id, std::chrono::milliseconds timeout) const;

    [[nodiscard]] size_t size() const;

private:
    struct Slot {
        std::atomic<std::shared_ptr<const Job>> snapshot;
        std::mutex writeMutex;
        std::atomic<bool> cancel{false};
        size_t sequence = 0;
    };

    std::shared_ptr<Slot> findSlot(const std::string& id) const;

    template <typename Mutator> Result<void> update(const std::string& id, Mutator&& mutate);

    void notifyTerminal();

    mutable std::shared_mutex mapMutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
    size_t nextSequence_ = 0;

    mutable std::mutex terminalMutex_;
    mutable std::condition_variable terminalCv_;
};

} // namespace codegraph::pipeline
