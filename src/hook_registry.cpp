#include "adaptr/hooks/hook_registry.hpp"

namespace adaptr {

std::optional<HookPoint> parse_hook_point(std::string_view name) {
    for (std::size_t i = 0; i < HOOK_POINT_COUNT; ++i) {
        auto point = static_cast<HookPoint>(i);
        if (name == to_string(point)) {
            return point;
        }
    }
    return std::nullopt;
}

void HookRegistry::set_policy(HookPoint point, HookPolicy policy) {
    std::unique_lock lock(write_mutex_);
    auto next = std::make_shared<Tables>(*snapshot());
    next->policies[static_cast<std::size_t>(point)] = policy;
    publish(std::move(next));
}

HookPolicy HookRegistry::policy(HookPoint point) const {
    return snapshot()->policies[static_cast<std::size_t>(point)];
}

} // namespace adaptr
