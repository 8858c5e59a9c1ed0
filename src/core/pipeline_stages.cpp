#include "core/pipeline_stages.hpp"
#include "core/query_normalizer.hpp"
#include "core/utils.hpp"
#include "parser/statement_classifier.hpp"
#include "policy/policy_constants.hpp"
#include "policy/policy_validator.hpp"

#include <format>

namespace sqlguard {

// ============================================================================
// ParseStage
// ============================================================================
IPipelineStage::Result ParseStage::process(RequestContext& ctx) {
    utils::Timer timer;
    auto parse_result = StatementClassifier::classify(ctx.sql, c_.dialect);
    ctx.parse_time = timer.elapsed_us();

    if (!parse_result.success) {
        ctx.error_kind = ErrorKind::PARSE_AMBIGUOUS;
        ctx.error_message = std::format("{}ambiguous SQL: {}",
            policy::kRejectPrefix, parse_result.error_message);
        return Result::BLOCK;
    }

    ctx.statement = std::move(parse_result.statement);
    ctx.state = RequestState::PARSED;
    return Result::CONTINUE;
}

// ============================================================================
// PolicyStage
// ============================================================================
IPipelineStage::Result PolicyStage::process(RequestContext& ctx) {
    if (!ctx.statement) return Result::BLOCK;

    utils::Timer timer;
    ctx.verdict = c_.validator->validate(*ctx.statement);
    ctx.policy_time = timer.elapsed_us();

    if (!ctx.verdict.accepted) {
        ctx.error_kind = ErrorKind::VALIDATION_REJECTED;
        ctx.error_message = ctx.verdict.message;
        return Result::BLOCK;
    }

    ctx.state = RequestState::VALIDATED;
    return Result::CONTINUE;
}

// ============================================================================
// NormalizeStage
// ============================================================================
IPipelineStage::Result NormalizeStage::process(RequestContext& ctx) {
    if (!ctx.statement) return Result::BLOCK;

    utils::Timer timer;
    auto result = c_.normalizer->normalize(ctx.statement);
    ctx.normalize_time = timer.elapsed_us();

    if (result.is_error()) {
        ctx.error_kind = result.error_category() == ErrorCategory::PARSE_AMBIGUOUS
            ? ErrorKind::PARSE_AMBIGUOUS
            : ErrorKind::INTERNAL_ERROR;
        ctx.error_message = std::format("{}{}", policy::kRejectPrefix, result.error_message());
        return Result::BLOCK;
    }

    ctx.normalized = std::move(result.value());
    ctx.state = RequestState::NORMALIZED;
    return Result::CONTINUE;
}

} // namespace sqlguard
