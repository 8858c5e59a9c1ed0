#pragma once

#include "core/types.hpp"
#include "core/utils.hpp"
#include "db/iquery_executor.hpp"
#include <memory>
#include <chrono>

namespace sqlguard {

/**
 * @brief Request context - carries state through pipeline
 *
 * One per request; never shared between threads.
 * Contains input, intermediate results, and final output.
 */
struct RequestContext {
    // Input
    std::string request_id;
    std::string sql;
    ExecutionOptions options;

    // Timestamps
    std::chrono::system_clock::time_point received_at;
    std::chrono::steady_clock::time_point started_at;

    RequestState state = RequestState::RECEIVED;

    // Pipeline stage results
    std::shared_ptr<const CandidateStatement> statement;
    ValidationVerdict verdict;
    std::optional<NormalizedStatement> normalized;
    ExecutionResult execution;

    // Failure (set by whichever stage stopped the request)
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;

    // Timing breakdown
    std::chrono::microseconds parse_time{0};
    std::chrono::microseconds policy_time{0};
    std::chrono::microseconds normalize_time{0};

    // Dry-run mode (validate and normalize but skip execution)
    bool dry_run = false;

    RequestContext()
        : request_id(utils::generate_uuid()),
          received_at(std::chrono::system_clock::now()),
          started_at(std::chrono::steady_clock::now()) {}
};

} // namespace sqlguard
