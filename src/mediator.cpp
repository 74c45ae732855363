#include "libmedi/mediator.hpp"
#include "libmedi/handler_catalog.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <utility>
#include <vector>

namespace libmedi {

namespace {

// Stage i runs behavior i with a continuation into stage i + 1; the stage
// past the last behavior is the handler.
erased_result invoke_stage(const std::vector<pipeline_behavior*>& stages,
                           std::size_t i,
                           const request_context& ctx,
                           const next_fn& terminal) {
    if (ctx.stop_requested()) {
        throw operation_cancelled(ctx.shape);
    }
    if (i == stages.size()) {
        return terminal();
    }

    bool called = false;
    next_fn next = [&]() -> erased_result {
        if (called) {
            throw pipeline_error("a behavior called next more than once while handling "
                                 + ctx.shape_name());
        }
        called = true;
        return invoke_stage(stages, i + 1, ctx, terminal);
    };
    return stages[i]->handle(ctx, next);
}

} // namespace

mediator::mediator(std::shared_ptr<resolver> container)
    : container_(std::move(container))
{
    if (!container_) {
        throw di_error("mediator requires a container");
    }
    if (!container_->is_root()) {
        throw di_error("mediator must be constructed from the container returned by build()");
    }
}

void mediator::check_scope(const scope& s) const {
    if (s.disposed()) {
        throw resolution_error("Cannot send through a scope that has been disposed");
    }
    if (!container_->shares_container_with(s.get_resolver())) {
        throw resolution_error("Scope belongs to a different container");
    }
}

void mediator::throw_if_cancelled(const request_context& ctx) {
    if (ctx.stop_requested()) {
        throw operation_cancelled(ctx.shape);
    }
}

erased_result mediator::run(resolver& r, const request_context& ctx,
                            const next_fn& terminal) const {
    const auto& chain = container_->pipelines().compose(ctx.shape);

    std::vector<pipeline_behavior*> stages;
    stages.reserve(chain.size());
    for (const auto* b : chain) {
        stages.push_back(b->as_behavior(r.get_by_type(b->behavior_type)));
    }

    const auto& log = container_->get_logger();
    log->debug("dispatching {} through {} behavior(s)", ctx.shape_name(), stages.size());

    auto outcome = invoke_stage(stages, 0, ctx, terminal);
    if (!outcome.ok()) {
        log->debug("{} returned handler_error [{}]", ctx.shape_name(), outcome.error().code);
    }
    return outcome;
}

} // namespace libmedi
