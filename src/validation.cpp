#include "libmedi/descriptor.hpp"
#include "libmedi/exceptions.hpp"
#include "registration_trace.hpp"

#include <algorithm>
#include <source_location>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace libmedi {

namespace {

using descriptor_index = std::unordered_map<std::type_index, std::size_t>;

descriptor_index build_index(const std::vector<descriptor>& descriptors) {
    descriptor_index idx;
    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        idx.emplace(descriptors[i].component_type, i);
    }
    return idx;
}

// ------------------------------------------------------------------
// Every declared dependency has a registration
// ------------------------------------------------------------------
void check_missing_dependencies(const std::vector<descriptor>& descriptors,
                                const descriptor_index& idx,
                                std::source_location loc) {
    for (const auto& desc : descriptors) {
        for (const auto& dep : desc.dependencies) {
            if (idx.contains(dep)) continue;

            // Tell the user which consumer requires the missing dependency.
            std::string hint = "required by " + internal::demangle(desc.component_type);
            if (desc.impl_type.has_value()) {
                hint += " [impl: " + internal::demangle(desc.impl_type.value()) + "]";
            }
            hint += " (" + std::string(to_string(desc.lifetime)) + ")";
            if (desc.registration_location.file_name()[0]) {
                hint += " registered at " + internal::format_location(desc.registration_location);
            }
            auto ex = not_found(dep, hint, loc);
            ex.set_diagnostic_detail(internal::format_registration_trace(desc));
            throw ex;
        }
    }
}

// ------------------------------------------------------------------
// Captive dependency check: a singleton must not reach a scoped
// component, directly or through transients it builds.
// ------------------------------------------------------------------
void check_singleton_reach(const descriptor& consumer,
                           const descriptor& current,
                           const std::vector<descriptor>& descriptors,
                           const descriptor_index& idx,
                           std::unordered_set<std::type_index>& seen,
                           std::source_location loc) {
    for (const auto& dep : current.dependencies) {
        auto it = idx.find(dep);
        if (it == idx.end() || !seen.insert(dep).second) continue;

        const auto& dep_desc = descriptors[it->second];
        if (dep_desc.lifetime == lifetime_kind::scoped) {
            auto ex = lifetime_mismatch(consumer.component_type, "singleton",
                                        dep, "scoped", consumer.impl_type, loc);
            ex.set_diagnostic_detail(internal::format_registration_trace(consumer));
            throw ex;
        }
        // A transient built for a singleton lives as long as the singleton.
        if (dep_desc.lifetime == lifetime_kind::transient) {
            check_singleton_reach(consumer, dep_desc, descriptors, idx, seen, loc);
        }
    }
}

void check_lifetime_rules(const std::vector<descriptor>& descriptors,
                          const descriptor_index& idx,
                          std::source_location loc) {
    for (const auto& desc : descriptors) {
        if (desc.lifetime != lifetime_kind::singleton) continue;
        std::unordered_set<std::type_index> seen;
        check_singleton_reach(desc, desc, descriptors, idx, seen, loc);
    }
}

// ------------------------------------------------------------------
// Cycle detection (DFS on component dependency graph)
// ------------------------------------------------------------------
enum class visit_state { unvisited, in_progress, done };

void dfs(std::size_t node,
         const std::vector<descriptor>& descriptors,
         const descriptor_index& idx,
         std::vector<visit_state>& states,
         std::vector<std::type_index>& path,
         std::source_location loc) {
    const auto& desc = descriptors[node];
    if (states[node] == visit_state::done) return;
    if (states[node] == visit_state::in_progress) {
        // Build cycle path from where the node first appears
        auto it = std::find(path.begin(), path.end(), desc.component_type);
        std::vector<std::type_index> cycle(it, path.end());
        cycle.push_back(desc.component_type);
        auto ex = cyclic_dependency(cycle, loc);

        std::string detail;
        for (std::size_t i = 0; i + 1 < cycle.size(); ++i) {
            std::string trace = internal::format_registration_trace(
                descriptors[idx.at(cycle[i])]);
            if (trace.empty()) continue;
            if (!detail.empty()) detail += "\n";
            detail += trace;
        }
        if (!detail.empty()) ex.set_diagnostic_detail(detail);
        throw ex;
    }

    states[node] = visit_state::in_progress;
    path.push_back(desc.component_type);

    for (const auto& dep : desc.dependencies) {
        auto it = idx.find(dep);
        if (it == idx.end()) continue;
        dfs(it->second, descriptors, idx, states, path, loc);
    }

    path.pop_back();
    states[node] = visit_state::done;
}

void check_cycles(const std::vector<descriptor>& descriptors,
                  const descriptor_index& idx,
                  std::source_location loc) {
    std::vector<visit_state> states(descriptors.size(), visit_state::unvisited);
    std::vector<std::type_index> path;

    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        if (states[i] == visit_state::unvisited) {
            dfs(i, descriptors, idx, states, path, loc);
        }
    }
}

} // anonymous namespace

// ------------------------------------------------------------------
// Public entry point called by registry::build
// ------------------------------------------------------------------
void validate_descriptors(const std::vector<descriptor>& descriptors,
                          const build_options& options,
                          std::source_location loc) {
    auto idx = build_index(descriptors);

    check_missing_dependencies(descriptors, idx, loc);

    if (options.detect_cycles) {
        check_cycles(descriptors, idx, loc);
    }

    if (options.validate_lifetimes) {
        check_lifetime_rules(descriptors, idx, loc);
    }
}

} // namespace libmedi
