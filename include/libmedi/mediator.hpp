#pragma once

#include "export.hpp"
#include "exceptions.hpp"
#include "handler_catalog.hpp"
#include "pipeline.hpp"
#include "request.hpp"
#include "resolver.hpp"
#include "result.hpp"
#include "scope.hpp"

#include <memory>
#include <stop_token>
#include <typeindex>

namespace libmedi {

// ---------------------------------------------------------------
// mediator: dispatch a request to its handler through the pipeline
// ---------------------------------------------------------------

/// Dispatch facade.  The caller owns the scope: the mediator never creates
/// or disposes one, so every instance resolved for a request is released
/// with the caller's unit of work.
class LIBMEDI_EXPORT mediator {
public:
    explicit mediator(std::shared_ptr<resolver> container);

    /// Send `request` to its handler, running the composed behaviors
    /// around it.  Business failures come back as handler_error inside the
    /// result; handler_not_found, operation_cancelled, pipeline_error and
    /// resolution failures are thrown.
    template <request_shape TRequest>
    result<response_t<TRequest>> send(scope& s, const TRequest& request,
                                      std::stop_token stop = {}) {
        using response_type = response_t<TRequest>;

        resolver& r = s.get_resolver();
        check_scope(s);
        container_->handlers().find(typeid(TRequest));   // throws handler_not_found

        request_context ctx{
            .request = &request,
            .shape = typeid(TRequest),
            .stop_token = stop,
            .logger = container_->get_logger(),
        };
        throw_if_cancelled(ctx);

        auto& handler = r.get<request_handler<TRequest>>();
        next_fn terminal = [&handler, &request, &ctx]() -> erased_result {
            return erase_result(handler.handle(request, ctx.stop_token));
        };
        return unerase_result<response_type>(run(r, ctx, terminal));
    }

    resolver& container() const noexcept { return *container_; }

private:
    void check_scope(const scope& s) const;
    static void throw_if_cancelled(const request_context& ctx);
    erased_result run(resolver& r, const request_context& ctx, const next_fn& terminal) const;

    std::shared_ptr<resolver> container_;
};

} // namespace libmedi
