// include/ctx/message.hpp
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ctx {

// Author of a conversation turn
enum class Role {
    SYSTEM,
    USER,
    ASSISTANT,
    TOOL
};

// Convert Role to its wire name
inline std::string role_to_string(Role role) {
    switch (role) {
        case Role::SYSTEM: return "system";
        case Role::USER: return "user";
        case Role::ASSISTANT: return "assistant";
        case Role::TOOL: return "tool";
    }
    return "unknown";
}

// Convert a wire name to Role; throws std::invalid_argument for anything else
inline Role string_to_role(const std::string& str) {
    if (str == "system") return Role::SYSTEM;
    if (str == "user") return Role::USER;
    if (str == "assistant") return Role::ASSISTANT;
    if (str == "tool") return Role::TOOL;
    throw std::invalid_argument("Unknown role: " + str);
}

// A recorded conversation turn. token_count is set once, from content.
struct Message {
    Role role;
    std::string content;
    size_t token_count;
};

// A pinned file. token_count covers content only; entry_token_count covers
// the rendered payload entry (label + content).
struct FileContext {
    std::string path;
    std::string content;
    size_t token_count;
    size_t entry_token_count;
};

} // namespace ctx
