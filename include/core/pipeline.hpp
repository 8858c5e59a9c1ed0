#pragma once

#include "core/types.hpp"
#include "core/request_context.hpp"
#include "core/pipeline_builder.hpp"
#include "core/pipeline_stage.hpp"
#include "config/config_types.hpp"
#include "db/iquery_executor.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace sqlguard {

/**
 * @brief Guard pipeline - the validate-and-execute entry point
 *
 * Flow (per request):
 * 1. Parse     raw SQL -> CandidateStatement     (PARSE_AMBIGUOUS blocks)
 * 2. Policy    ordered rules -> verdict          (VALIDATION_REJECTED blocks)
 * 3. Normalize row ceiling enforced              (PARSE_AMBIGUOUS blocks)
 * 4. Execute   read-only pooled connection       (EXECUTION_ERROR / TIMEOUT)
 *
 * A blocked request ends in REJECTED and never reaches the executor.
 * Every other request ends in RETURNED. Nothing escapes run(): all failures
 * become a GuardResponse.
 *
 * Thread-safety: run() and evaluate() may be called concurrently.
 */
class GuardPipeline {
public:
    /**
     * @brief Construct pipeline from components struct
     */
    explicit GuardPipeline(PipelineComponents components);

    GuardPipeline(const GuardPipeline&) = delete;
    GuardPipeline& operator=(const GuardPipeline&) = delete;

    /**
     * @brief Validate, normalize and execute one statement
     * @param sql Raw SQL from the agent
     * @param options Caller timeout and stop token
     * @return Response envelope (never throws)
     */
    [[nodiscard]] GuardResponse run(const std::string& sql, const ExecutionOptions& options = {});

    /**
     * @brief Validate and normalize only (dry run)
     */
    [[nodiscard]] GuardResponse evaluate(const std::string& sql);

    /**
     * @brief True when an executor is configured
     */
    [[nodiscard]] bool can_execute() const { return c_.executor != nullptr; }

    const GuardConfig& config() const { return *c_.config; }
    std::shared_ptr<IConnectionPool> get_connection_pool() const { return c_.connection_pool; }

    struct Stats {
        uint64_t total_requests;
        uint64_t requests_rejected;
        uint64_t requests_failed;
        uint64_t requests_executed;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .requests_rejected = requests_rejected_.load(std::memory_order_relaxed),
            .requests_failed = requests_failed_.load(std::memory_order_relaxed),
            .requests_executed = requests_executed_.load(std::memory_order_relaxed),
        };
    }

private:
    [[nodiscard]] GuardResponse process(RequestContext& ctx);
    [[nodiscard]] bool execute_query(RequestContext& ctx);
    [[nodiscard]] GuardResponse build_response(const RequestContext& ctx) const;

    /**
     * @brief Build pre-execute stage chain from components
     */
    void build_stage_chain();

    PipelineComponents c_;

    /**
     * @brief Ordered chain of pre-execute stages (parse, policy, normalize)
     */
    std::vector<std::unique_ptr<IPipelineStage>> pre_execute_stages_;

    mutable std::atomic<uint64_t> total_requests_{0};
    mutable std::atomic<uint64_t> requests_rejected_{0};
    mutable std::atomic<uint64_t> requests_failed_{0};
    mutable std::atomic<uint64_t> requests_executed_{0};
};

} // namespace sqlguard
