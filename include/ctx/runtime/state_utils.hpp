// include/ctx/runtime/state_utils.hpp
#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace ctx::runtime {

// Human-readable rendering of ContextManager::state_snapshot()
std::string generate_state_report(const nlohmann::json& state);

} // namespace ctx::runtime
