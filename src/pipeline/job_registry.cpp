#include <codegraph/pipeline/job_registry.h>

#include <spdlog/spdlog.h>
#include <algorithm>

#include <codegraph/core/ids.h>

namespace codegraph::pipeline {

std::string_view toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Pending:
            return "pending";
        case JobStatus::Running:
            return "running";
        case JobStatus::Completed:
            return "completed";
        case JobStatus::Failed:
            return "failed";
        case JobStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const Job& job) {
    j = nlohmann::json{{"id", job.id},
                       {"kind", job.kind},
                       {"repo_id", job.repoId},
                       {"status", toString(job.status)},
                       {"progress", job.progress},
                       {"created_at", core::formatTimestamp(job.createdAt)},
                       {"result", job.result},
                       {"metadata", job.metadata}};
    j["started_at"] = job.startedAt ? nlohmann::json(core::formatTimestamp(*job.startedAt))
                                    : nlohmann::json(nullptr);
    j["completed_at"] = job.completedAt
                            ? nlohmann::json(core::formatTimestamp(*job.completedAt))
                            : nlohmann::json(nullptr);
    j["error"] = job.error ? nlohmann::json(*job.error) : nlohmann::json(nullptr);
}

std::string JobRegistry::create(std::string kind, std::string repoId, nlohmann::json metadata) {
    auto job = std::make_shared<Job>();
    job->id = core::generateUUID();
    job->kind = std::move(kind);
    job->repoId = std::move(repoId);
    job->createdAt = std::chrono::system_clock::now();
    if (metadata.is_object())
        job->metadata = std::move(metadata);

    auto slot = std::make_shared<Slot>();
    slot->snapshot.store(std::shared_ptr<const Job>(job));
    std::string id = job->id;

    std::unique_lock lock(mapMutex_);
    slot->sequence = nextSequence_++;
    slots_.emplace(id, std::move(slot));
    return id;
}

std::shared_ptr<JobRegistry::Slot> JobRegistry::findSlot(const std::string& id) const {
    std::shared_lock lock(mapMutex_);
    auto it = slots_.find(id);
    return it == slots_.end() ? nullptr : it->second;
}

Result<Job> JobRegistry::get(const std::string& id) const {
    auto slot = findSlot(id);
    if (!slot)
        return Error{ErrorCode::NotFound, "Unknown job: " + id};
    return *slot->snapshot.load();
}

std::vector<Job> JobRegistry::list() const {
    std::vector<std::pair<size_t, std::shared_ptr<const Job>>> snapshots;
    {
        std::shared_lock lock(mapMutex_);
        snapshots.reserve(slots_.size());
        for (const auto& [id, slot] : slots_)
            snapshots.emplace_back(slot->sequence, slot->snapshot.load());
    }
    std::sort(snapshots.begin(), snapshots.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<Job> out;
    out.reserve(snapshots.size());
    for (auto& [seq, job] : snapshots)
        out.push_back(*job);
    return out;
}

size_t JobRegistry::size() const {
    std::shared_lock lock(mapMutex_);
    return slots_.size();
}

template <typename Mutator>
Result<void> JobRegistry::update(const std::string& id, Mutator&& mutate) {
    auto slot = findSlot(id);
    if (!slot)
        return Error{ErrorCode::NotFound, "Unknown job: " + id};

    bool becameTerminal = false;
    {
        std::lock_guard<std::mutex> lock(slot->writeMutex);
        auto current = slot->snapshot.load();
        if (isTerminal(current->status)) {
            return Error{ErrorCode::InvalidState,
                         fmt::format("Job {} is already {}", id, toString(current->status))};
        }
        auto next = std::make_shared<Job>(*current);
        mutate(*next);
        becameTerminal = isTerminal(next->status);
        slot->snapshot.store(std::shared_ptr<const Job>(std::move(next)));
    }
    if (becameTerminal)
        notifyTerminal();
    return {};
}

void JobRegistry::notifyTerminal() {
    // Taking the lock orders the store above before a waiter's predicate check.
    { std::lock_guard<std::mutex> lock(terminalMutex_); }
    terminalCv_.notify_all();
}

Result<void> JobRegistry::markRunning(const std::string& id) {
    return update(id, [](Job& job) {
        job.status = JobStatus::Running;
        job.startedAt = std::chrono::system_clock::now();
    });
}

Result<void> JobRegistry::setProgress(const std::string& id, double progress) {
    const double clamped = std::clamp(progress, 0.0, 1.0);
    return update(id, [clamped](Job& job) { job.progress = std::max(job.progress, clamped); });
}

Result<void> JobRegistry::complete(const std::string& id, nlohmann::json result) {
    return update(id, [&](Job& job) {
        job.status = JobStatus::Completed;
        job.progress = 1.0;
        job.completedAt = std::chrono::system_clock::now();
        job.result = std::move(result);
    });
}

Result<void> JobRegistry::fail(const std::string& id, std::string message) {
    return update(id, [&](Job& job) {
        job.status = JobStatus::Failed;
        job.completedAt = std::chrono::system_clock::now();
        job.error = std::move(message);
    });
}

Result<void> JobRegistry::markCancelled(const std::string& id, nlohmann::json partialResult) {
    return update(id, [&](Job& job) {
        job.status = JobStatus::Cancelled;
        job.completedAt = std::chrono::system_clock::now();
        if (partialResult.is_object())
            job.result = std::move(partialResult);
    });
}

Result<void> JobRegistry::requestCancel(const std::string& id) {
    auto slot = findSlot(id);
    if (!slot)
        return Error{ErrorCode::NotFound, "Unknown job: " + id};
    std::lock_guard<std::mutex> lock(slot->writeMutex);
    auto current = slot->snapshot.load();
    if (isTerminal(current->status)) {
        return Error{ErrorCode::InvalidState,
                     fmt::format("Job {} is already {}", id, toString(current->status))};
    }
    slot->cancel.store(true);
    spdlog::info("Cancellation requested for job {}", id);
    return {};
}

bool JobRegistry::cancelRequested(const std::string& id) const {
    auto slot = findSlot(id);
    return slot && slot->cancel.load();
}

Result<Job> JobRegistry::waitForTerminal(const std::string& id,
                                         std::chrono::milliseconds timeout) const {
    auto slot = findSlot(id);
    if (!slot)
        return Error{ErrorCode::NotFound, "Unknown job: " + id};

    std::unique_lock<std::mutex> lock(terminalMutex_);
    const bool done = terminalCv_.wait_for(
        lock, timeout, [&] { return isTerminal(slot->snapshot.load()->status); });
    if (!done)
        return Error{ErrorCode::Timeout, "Timed out waiting for job " + id};
    return *slot->snapshot.load();
}

} // namespace codegraph::pipeline
