#pragma once

#include "core/request_context.hpp"
#include <string_view>

namespace sqlguard {

/**
 * @brief Abstract pipeline stage interface
 *
 * Each pre-execute step (parse, policy, normalize) implements this
 * interface. Stages are composed into a chain and executed sequentially.
 *
 * Result semantics:
 * - CONTINUE: Stage passed, proceed to next stage
 * - BLOCK:    Stage rejected request; ctx.error_kind and ctx.error_message are set
 */
class IPipelineStage {
public:
    virtual ~IPipelineStage() = default;

    enum class Result { CONTINUE, BLOCK };

    /**
     * @brief Process request through this stage
     * @param ctx Mutable request context
     * @return Stage result determining pipeline flow
     */
    [[nodiscard]] virtual Result process(RequestContext& ctx) = 0;

    /**
     * @brief Human-readable stage name for logging
     */
    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sqlguard
