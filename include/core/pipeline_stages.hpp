#pragma once

#include "core/pipeline_stage.hpp"
#include "core/pipeline_builder.hpp"
#include "core/types.hpp"

namespace sqlguard {

/**
 * @brief Base class providing access to pipeline components
 */
class ComponentStage : public IPipelineStage {
public:
    explicit ComponentStage(const PipelineComponents& c) : c_(c) {}
protected:
    const PipelineComponents& c_;
};

// ============================================================================
// Pre-Execute Stages (can BLOCK or CONTINUE)
// ============================================================================

/**
 * @brief RECEIVED -> PARSED; unreliable input blocks as PARSE_AMBIGUOUS
 */
class ParseStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    [[nodiscard]] Result process(RequestContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "parse"; }
};

/**
 * @brief PARSED -> VALIDATED, or VALIDATION_REJECTED with the first rule that fired
 */
class PolicyStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    [[nodiscard]] Result process(RequestContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "policy"; }
};

/**
 * @brief VALIDATED -> NORMALIZED; a LIMIT that cannot be rewritten safely blocks
 */
class NormalizeStage final : public ComponentStage {
public:
    using ComponentStage::ComponentStage;
    [[nodiscard]] Result process(RequestContext& ctx) override;
    [[nodiscard]] std::string_view name() const override { return "normalize"; }
};

} // namespace sqlguard
