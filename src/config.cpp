#include "adaptr/config.hpp"

#include <rfl/json.hpp>

namespace adaptr {

AdapterConfig load_config(const std::string& filename) {
    return rfl::json::load<AdapterConfig>(filename).value();
}

AdapterConfig parse_config(const std::string& json) {
    return rfl::json::read<AdapterConfig>(json).value();
}

std::string write_config(const AdapterConfig& config) {
    return rfl::json::write(config);
}

} // namespace adaptr
