#include "core/pipeline.hpp"
#include "core/pipeline_stages.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace sqlguard {

GuardPipeline::GuardPipeline(PipelineComponents components)
    : c_(std::move(components)) {
    if (!c_.config) throw std::invalid_argument("GuardPipeline: config is required");
    if (!c_.validator) throw std::invalid_argument("GuardPipeline: validator is required");
    if (!c_.normalizer) throw std::invalid_argument("GuardPipeline: normalizer is required");
    build_stage_chain();
}

void GuardPipeline::build_stage_chain() {
    pre_execute_stages_.clear();
    pre_execute_stages_.push_back(std::make_unique<ParseStage>(c_));
    pre_execute_stages_.push_back(std::make_unique<PolicyStage>(c_));
    pre_execute_stages_.push_back(std::make_unique<NormalizeStage>(c_));
}

GuardResponse GuardPipeline::run(const std::string& sql, const ExecutionOptions& options) {
    RequestContext ctx;
    ctx.sql = sql;
    ctx.options = options;
    return process(ctx);
}

GuardResponse GuardPipeline::evaluate(const std::string& sql) {
    RequestContext ctx;
    ctx.sql = sql;
    ctx.dry_run = true;
    return process(ctx);
}

GuardResponse GuardPipeline::process(RequestContext& ctx) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    try {
        for (const auto& stage : pre_execute_stages_) {
            if (stage->process(ctx) == IPipelineStage::Result::BLOCK) {
                ctx.state = RequestState::REJECTED;
                requests_rejected_.fetch_add(1, std::memory_order_relaxed);
                utils::log::info(std::format("Request {} rejected at {}: {}",
                    ctx.request_id, stage->name(), ctx.error_message));
                return build_response(ctx);
            }
        }

        utils::log::debug(std::format("Request {} normalized ({}): {}",
            ctx.request_id, limit_action_to_string(ctx.normalized->action), ctx.normalized->sql));

        // Dry-run mode: skip execution
        if (ctx.dry_run) {
            ctx.state = RequestState::RETURNED;
            return build_response(ctx);
        }

        if (execute_query(ctx)) {
            requests_executed_.fetch_add(1, std::memory_order_relaxed);
        } else {
            requests_failed_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Request {} failed ({}): {}",
                ctx.request_id, error_kind_to_string(ctx.error_kind), ctx.error_message));
        }
        ctx.state = RequestState::RETURNED;
    } catch (const std::exception& e) {
        requests_failed_.fetch_add(1, std::memory_order_relaxed);
        ctx.error_kind = ErrorKind::INTERNAL_ERROR;
        ctx.error_message = std::format("internal error: {}", e.what());
        ctx.state = ctx.normalized ? RequestState::RETURNED : RequestState::REJECTED;
        utils::log::error(std::format("Request {}: {}", ctx.request_id, ctx.error_message));
    }

    return build_response(ctx);
}

bool GuardPipeline::execute_query(RequestContext& ctx) {
    if (!c_.executor) {
        ctx.error_kind = ErrorKind::EXECUTION_ERROR;
        ctx.error_message = "no database configured";
        return false;
    }

    ctx.execution = c_.executor->execute(*ctx.normalized, ctx.options);
    ctx.state = RequestState::EXECUTED;

    if (!ctx.execution.success) {
        ctx.error_kind = ctx.execution.error_kind == ErrorKind::NONE
            ? ErrorKind::EXECUTION_ERROR
            : ctx.execution.error_kind;
        ctx.error_message = ctx.execution.error.value_or("query execution failed");
        return false;
    }
    return true;
}

GuardResponse GuardPipeline::build_response(const RequestContext& ctx) const {
    GuardResponse response;
    response.request_id = ctx.request_id;
    response.final_state = ctx.state;
    response.accepted = ctx.verdict.accepted && ctx.normalized.has_value();
    response.reason = ctx.verdict.reason;
    response.matched_rule = ctx.verdict.matched_rule;
    response.reason_text = response.accepted ? ctx.verdict.message : ctx.error_message;
    response.error_kind = ctx.error_kind;
    if (ctx.error_kind != ErrorKind::NONE) {
        response.error = ctx.error_message;
    }

    if (ctx.normalized) {
        response.sql = ctx.normalized->sql;
    }

    if (ctx.execution.success) {
        response.column_names = ctx.execution.column_names;
        response.rows = ctx.execution.rows;
        response.row_count = ctx.execution.row_count;
        response.truncated = ctx.execution.truncated;
    }
    response.execution_time = ctx.execution.execution_time;

    return response;
}

} // namespace sqlguard
