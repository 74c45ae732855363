#include "libmedi/pipeline.hpp"

#include <algorithm>
#include <mutex>

namespace libmedi {

bool behavior_descriptor::applies_to(std::type_index shape) const {
    if (shapes.empty()) return true;
    return std::find(shapes.begin(), shapes.end(), shape) != shapes.end();
}

pipeline_composer::pipeline_composer(std::vector<behavior_descriptor> behaviors)
    : behaviors_(std::move(behaviors))
{}

std::vector<const behavior_descriptor*>
pipeline_composer::build_chain(std::type_index shape) const {
    std::vector<const behavior_descriptor*> chain;
    for (const auto& b : behaviors_) {
        if (b.applies_to(shape)) chain.push_back(&b);
    }
    std::stable_sort(chain.begin(), chain.end(),
        [](const behavior_descriptor* a, const behavior_descriptor* b) {
            if (a->order != b->order) return a->order < b->order;
            return a->sequence < b->sequence;
        });
    return chain;
}

const std::vector<const behavior_descriptor*>&
pipeline_composer::compose(std::type_index shape) const {
    {
        std::shared_lock lock(cache_mutex_);
        auto it = cache_.find(shape);
        if (it != cache_.end()) return it->second;
    }
    auto chain = build_chain(shape);
    std::unique_lock lock(cache_mutex_);
    // Another thread may have won; emplace keeps the first entry.
    return cache_.emplace(shape, std::move(chain)).first->second;
}

void pipeline_composer::precompute(const std::vector<std::type_index>& shapes) {
    for (auto shape : shapes) {
        compose(shape);
    }
}

} // namespace libmedi
