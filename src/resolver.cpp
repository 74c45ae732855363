#include "libmedi/resolver.hpp"
#include "libmedi/exceptions.hpp"
#include "libmedi/handler_catalog.hpp"
#include "libmedi/pipeline.hpp"
#include "libmedi/scope.hpp"
#include "registration_trace.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace libmedi {

namespace {

// ---------------------------------------------------------------
// Per-capability cache cell: singleton slots on the root, scoped slots
// on each scope.  Reads after the first construction take no lock.
// ---------------------------------------------------------------

struct instance_slot {
    std::atomic<void*> instance{nullptr};
    std::mutex mutex;
};

struct owned_instance {
    erased_ptr instance;
    std::type_index type;
};

// ---------------------------------------------------------------
// Capabilities under construction on this thread, innermost last.
// Keyed by container so that nested resolutions across containers do
// not collide.
// ---------------------------------------------------------------

struct in_progress_entry {
    const void* container;
    std::type_index type;
};

thread_local std::vector<in_progress_entry> in_progress;

void check_not_in_progress(const void* container, std::type_index type) {
    auto it = std::find_if(in_progress.begin(), in_progress.end(),
        [&](const in_progress_entry& e) {
            return e.container == container && e.type == type;
        });
    if (it == in_progress.end()) return;

    std::vector<std::type_index> cycle;
    for (; it != in_progress.end(); ++it) {
        if (it->container == container) cycle.push_back(it->type);
    }
    cycle.push_back(type);
    throw cyclic_dependency(cycle);
}

class construction_guard {
public:
    construction_guard(const void* container, std::type_index type) {
        in_progress.push_back({container, type});
    }
    ~construction_guard() { in_progress.pop_back(); }

    construction_guard(const construction_guard&) = delete;
    construction_guard& operator=(const construction_guard&) = delete;
};

std::string describe(const descriptor& desc) {
    std::string ctx = internal::demangle(desc.component_type);
    if (desc.impl_type.has_value()) {
        ctx += " [impl: " + internal::demangle(desc.impl_type.value()) + "]";
    }
    return ctx;
}

} // namespace

// ---------------------------------------------------------------
// impl: container state shared by the root and every scope
// ---------------------------------------------------------------

struct resolver::impl {
    std::vector<descriptor> descriptors;
    std::unordered_map<std::type_index, std::size_t> index;

    // cycles[i] non-empty: resolving descriptor i reaches this cycle.
    std::vector<std::vector<std::type_index>> cycles;

    handler_catalog catalog;
    pipeline_composer composer;
    std::shared_ptr<spdlog::logger> log;

    impl(std::vector<descriptor> descs, handler_catalog cat,
         std::vector<behavior_descriptor> behaviors,
         std::shared_ptr<spdlog::logger> logger)
        : descriptors(std::move(descs))
        , catalog(std::move(cat))
        , composer(std::move(behaviors))
        , log(std::move(logger))
    {
        for (std::size_t i = 0; i < descriptors.size(); ++i) {
            index.emplace(descriptors[i].component_type, i);
        }
        compute_cycles();
        composer.precompute(catalog.shapes());
    }

    void compute_cycles() {
        const std::size_t n = descriptors.size();
        cycles.assign(n, {});
        std::vector<char> clean(n, 0);
        for (std::size_t i = 0; i < n; ++i) {
            if (clean[i]) continue;
            std::vector<std::size_t> path;
            std::vector<char> on_path(n, 0);
            cycles[i] = find_cycle_from(i, path, on_path, clean);
        }
    }

    // Depth-first over declared dependencies.  Missing dependencies are
    // skipped here; they surface as not_found when resolved.
    std::vector<std::type_index> find_cycle_from(std::size_t idx,
                                                 std::vector<std::size_t>& path,
                                                 std::vector<char>& on_path,
                                                 std::vector<char>& clean) const {
        if (clean[idx]) return {};
        if (on_path[idx]) {
            auto start = std::find(path.begin(), path.end(), idx);
            std::vector<std::type_index> cycle;
            for (auto it = start; it != path.end(); ++it) {
                cycle.push_back(descriptors[*it].component_type);
            }
            cycle.push_back(descriptors[idx].component_type);
            return cycle;
        }

        on_path[idx] = 1;
        path.push_back(idx);
        for (const auto& dep : descriptors[idx].dependencies) {
            auto it = index.find(dep);
            if (it == index.end()) continue;
            auto cycle = find_cycle_from(it->second, path, on_path, clean);
            if (!cycle.empty()) return cycle;
        }
        path.pop_back();
        on_path[idx] = 0;
        clean[idx] = 1;
        return {};
    }
};

// ---------------------------------------------------------------
// context: instances owned by one resolver (root or scope)
// ---------------------------------------------------------------

struct resolver::context {
    explicit context(std::size_t slot_count)
        : slots(std::make_unique<instance_slot[]>(slot_count))
        , slot_count(slot_count)
    {}

    std::unique_ptr<instance_slot[]> slots;
    std::size_t slot_count;

    std::mutex owned_mutex;
    std::vector<owned_instance> owned;    // creation order
    std::atomic<bool> released{false};
};

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

resolver::resolver(std::shared_ptr<impl> shared, std::shared_ptr<resolver> parent)
    : impl_(std::move(shared))
    , parent_(std::move(parent))
    , context_(std::make_unique<context>(impl_->descriptors.size()))
{}

resolver::~resolver() {
    if (context_) {
        release_owned();
    }
}

std::shared_ptr<resolver> resolver::create(std::vector<descriptor> descriptors,
                                           handler_catalog catalog,
                                           std::vector<behavior_descriptor> behaviors,
                                           std::shared_ptr<spdlog::logger> logger) {
    auto shared = std::make_shared<impl>(std::move(descriptors), std::move(catalog),
                                         std::move(behaviors), std::move(logger));
    return std::shared_ptr<resolver>(new resolver(std::move(shared), nullptr));
}

resolver& resolver::root() noexcept {
    return parent_ ? *parent_ : *this;
}

// ---------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------

void* resolver::get_impl(std::type_index type) {
    auto it = impl_->index.find(type);
    if (it == impl_->index.end()) return nullptr;
    return resolve_index(it->second);
}

void* resolver::get_by_type(std::type_index type) {
    void* p = get_impl(type);
    if (!p) throw not_found(type);
    return p;
}

void* resolver::resolve_index(std::size_t idx) {
    const auto& desc = impl_->descriptors[idx];

    if (context_->released.load(std::memory_order_acquire)) {
        throw resolution_error("Cannot resolve " + internal::demangle(desc.component_type)
                               + ": the scope has already been disposed");
    }

    // Cycles are rejected before any factory runs, so nothing is built.
    if (!impl_->cycles[idx].empty()) {
        auto ex = cyclic_dependency(impl_->cycles[idx]);
        auto trace = internal::format_registration_trace(desc);
        if (!trace.empty()) ex.set_diagnostic_detail(trace);
        throw ex;
    }
    check_not_in_progress(impl_.get(), desc.component_type);

    impl_->log->trace("resolving {} ({})", internal::demangle(desc.component_type),
                      to_string(desc.lifetime));

    switch (desc.lifetime) {
        case lifetime_kind::singleton:
            return root().resolve_cached(idx);
        case lifetime_kind::scoped:
            if (is_root()) throw no_active_scope(desc.component_type);
            return resolve_cached(idx);
        case lifetime_kind::transient:
            return adopt(construct(idx), desc.component_type);
    }

    throw di_error("Invalid lifetime_kind");
}

void* resolver::resolve_cached(std::size_t idx) {
    auto& slot = context_->slots[idx];
    if (void* p = slot.instance.load(std::memory_order_acquire)) {
        return p;
    }

    std::lock_guard<std::mutex> lock(slot.mutex);
    if (void* p = slot.instance.load(std::memory_order_relaxed)) {
        return p;
    }

    const auto& desc = impl_->descriptors[idx];
    void* raw = adopt(construct(idx), desc.component_type);
    slot.instance.store(raw, std::memory_order_release);
    impl_->log->debug("created {} {}", to_string(desc.lifetime), describe(desc));
    return raw;
}

erased_ptr resolver::construct(std::size_t idx) {
    const auto& desc = impl_->descriptors[idx];
    construction_guard guard(impl_.get(), desc.component_type);

    erased_ptr instance;
    try {
        instance = desc.factory(*this);
    } catch (di_error& e) {
        // Annotate with resolution context so nested failures show the
        // full chain: "... (while resolving B -> A)".  Caught by non-const
        // reference so the exception can be enriched before rethrowing.
        e.append_resolution_context(describe(desc));
        if (e.diagnostic_detail().empty()) {
            auto trace = internal::format_registration_trace(desc);
            if (!trace.empty()) e.set_diagnostic_detail(trace);
        }
        throw;
    } catch (const std::exception& e) {
        auto ex = construction_error(desc.component_type, e, desc.registration_location);
        ex.set_diagnostic_detail(internal::format_registration_trace(desc));
        throw ex;
    }

    if (!instance) {
        throw resolution_error("Factory for " + describe(desc) + " returned null",
                               desc.registration_location);
    }
    return instance;
}

void* resolver::adopt(erased_ptr instance, std::type_index type) {
    void* raw = instance.get();
    std::lock_guard<std::mutex> lock(context_->owned_mutex);
    context_->owned.push_back(owned_instance{std::move(instance), type});
    return raw;
}

// ---------------------------------------------------------------
// Scopes and release
// ---------------------------------------------------------------

std::unique_ptr<scope> resolver::create_scope() {
    auto container = root().shared_from_this();
    auto scoped = std::shared_ptr<resolver>(new resolver(impl_, std::move(container)));
    impl_->log->trace("scope opened");
    return std::unique_ptr<scope>(new scope(std::move(scoped)));
}

bool resolver::shares_container_with(const resolver& other) const noexcept {
    return impl_ == other.impl_;
}

std::vector<std::string> resolver::release_owned() {
    if (context_->released.exchange(true, std::memory_order_acq_rel)) {
        return {};
    }

    std::vector<owned_instance> owned;
    {
        std::lock_guard<std::mutex> lock(context_->owned_mutex);
        owned.swap(context_->owned);
    }
    for (std::size_t i = 0; i < context_->slot_count; ++i) {
        context_->slots[i].instance.store(nullptr, std::memory_order_relaxed);
    }

    // Last constructed, first released.  A failing dispose() does not stop
    // the remaining releases.
    std::vector<std::string> failures;
    for (auto it = owned.rbegin(); it != owned.rend(); ++it) {
        try {
            it->instance.dispose();
        } catch (const std::exception& e) {
            failures.push_back(internal::demangle(it->type) + ": " + e.what());
            impl_->log->error("dispose() failed for {}: {}",
                              internal::demangle(it->type), e.what());
        } catch (...) {
            failures.push_back(internal::demangle(it->type) + ": unknown exception");
            impl_->log->error("dispose() failed for {}: unknown exception",
                              internal::demangle(it->type));
        }
        it->instance.reset();
    }

    impl_->log->debug("released {} instance(s) from {}", owned.size(),
                      is_root() ? "container" : "scope");
    return failures;
}

// ---------------------------------------------------------------
// Container metadata
// ---------------------------------------------------------------

const handler_catalog& resolver::handlers() const noexcept {
    return impl_->catalog;
}

const pipeline_composer& resolver::pipelines() const noexcept {
    return impl_->composer;
}

const std::vector<descriptor>& resolver::descriptors() const noexcept {
    return impl_->descriptors;
}

const std::shared_ptr<spdlog::logger>& resolver::get_logger() const noexcept {
    return impl_->log;
}

} // namespace libmedi
