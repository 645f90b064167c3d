#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <codegraph/core/types.h>

namespace codegraph::pipeline {

enum class JobStatus { Pending, Running, Completed, Failed, Cancelled };

std::string_view toString(JobStatus status) noexcept;

[[nodiscard]] constexpr bool isTerminal(JobStatus status) noexcept {
    return status == JobStatus::Completed || status == JobStatus::Failed ||
           status == JobStatus::Cancelled;
}

/// Job kind for a full index-and-analyze run.
inline constexpr std::string_view kIndexJobKind = "index_repository";

/**
 * @brief One pipeline execution. Values of this type are snapshots; the
 * registry replaces them wholesale on every update.
 */
struct Job {
    std::string id;
    std::string kind;
    std::string repoId;
    JobStatus status = JobStatus::Pending;
    double progress = 0.0;
    TimePoint createdAt{};
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;
    std::optional<std::string> error;
    nlohmann::json result = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const Job& job);

} // namespace codegraph::pipeline
