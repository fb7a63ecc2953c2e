// src/config/config_manager.cpp
#include "ctx/config_manager.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace ctx {

namespace {

template <typename T>
void read_optional(const nlohmann::json& j, const char* key, T& target) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

// Counts and limits: a negative or fractional value would otherwise wrap
// or truncate on conversion
void read_optional(const nlohmann::json& j, const char* key, size_t& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    if (it->is_number_float() ||
        (it->is_number_integer() && !it->is_number_unsigned() && it->get<std::int64_t>() < 0)) {
        throw std::invalid_argument(std::string(key) + " must be a non-negative integer, got " + it->dump());
    }
    target = it->get<size_t>();
}

} // namespace

void to_json(nlohmann::json& j, const TokenizerConfig& config) {
    j = nlohmann::json{
        {"type", config.type},
        {"vocab_path", config.vocab_path},
        {"chars_per_token", config.chars_per_token}
    };
}

void from_json(const nlohmann::json& j, TokenizerConfig& config) {
    read_optional(j, "type", config.type);
    read_optional(j, "vocab_path", config.vocab_path);
    read_optional(j, "chars_per_token", config.chars_per_token);
}

void to_json(nlohmann::json& j, const ContextConfig& config) {
    j = nlohmann::json{
        {"system_prompt", config.system_prompt},
        {"max_tokens", config.max_tokens},
        {"max_file_contexts", config.max_file_contexts},
        {"per_file_token_cap", config.per_file_token_cap},
        {"file_budget_fraction", config.file_budget_fraction},
        {"warn_threshold", config.warn_threshold},
        {"critical_threshold", config.critical_threshold},
        {"max_history_messages", config.max_history_messages},
        {"keep_tool_sequences", config.keep_tool_sequences},
        {"file_label_format", config.file_label_format},
        {"tokenizer", config.tokenizer},
        {"debug_logging", config.debug_logging}
    };
}

void from_json(const nlohmann::json& j, ContextConfig& config) {
    read_optional(j, "system_prompt", config.system_prompt);
    read_optional(j, "max_tokens", config.max_tokens);
    read_optional(j, "max_file_contexts", config.max_file_contexts);
    read_optional(j, "per_file_token_cap", config.per_file_token_cap);
    read_optional(j, "file_budget_fraction", config.file_budget_fraction);
    read_optional(j, "warn_threshold", config.warn_threshold);
    read_optional(j, "critical_threshold", config.critical_threshold);
    read_optional(j, "max_history_messages", config.max_history_messages);
    read_optional(j, "keep_tool_sequences", config.keep_tool_sequences);
    read_optional(j, "file_label_format", config.file_label_format);
    if (auto it = j.find("tokenizer"); it != j.end() && !it->is_null()) {
        from_json(*it, config.tokenizer);
    }
    read_optional(j, "debug_logging", config.debug_logging);
}

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path) {}

bool ConfigManager::load_config() {
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        return false;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        ContextConfig loaded = config_;
        from_json(j, loaded);
        config_ = std::move(loaded);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + config_path_ + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid config file " + config_path_ + ": " + e.what());
    }
    return true;
}

bool ConfigManager::save_config() const {
    const std::filesystem::path path(config_path_);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    std::ofstream file(config_path_, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << nlohmann::json(config_).dump(2) << "\n";
    return file.good();
}

void ConfigManager::create_default_config() {
    reset_to_defaults();
    if (!save_config()) {
        throw std::runtime_error("Cannot write default config: " + config_path_);
    }
}

void ConfigManager::reset_to_defaults() {
    config_ = ContextConfig{};
}

bool ConfigManager::validate_config() const {
    try {
        validate(config_);
        return true;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Config validation failed: " << e.what() << std::endl;
        return false;
    }
}

void ConfigManager::validate(const ContextConfig& config) {
    if (config.max_tokens == 0) {
        throw std::invalid_argument("max_tokens must be positive");
    }
    if (config.max_file_contexts == 0) {
        throw std::invalid_argument("max_file_contexts must be positive");
    }
    if (config.resolved_per_file_cap() == 0) {
        throw std::invalid_argument("per-file token cap must be positive (max_tokens too small to derive one)");
    }
    if (!(config.file_budget_fraction > 0.0 && config.file_budget_fraction <= 1.0)) {
        throw std::invalid_argument("file_budget_fraction must be in (0, 1]");
    }
    if (!(config.warn_threshold > 0.0 && config.warn_threshold < 1.0)) {
        throw std::invalid_argument("warn_threshold must be in (0, 1)");
    }
    if (!(config.critical_threshold > 0.0 && config.critical_threshold < 1.0)) {
        throw std::invalid_argument("critical_threshold must be in (0, 1)");
    }
    if (!(config.warn_threshold < config.critical_threshold)) {
        throw std::invalid_argument("warn_threshold must be below critical_threshold");
    }
    if (config.tokenizer.type != "heuristic" && config.tokenizer.type != "bpe") {
        throw std::invalid_argument("unknown tokenizer type: " + config.tokenizer.type);
    }
    if (config.tokenizer.type == "heuristic" && config.tokenizer.chars_per_token == 0) {
        throw std::invalid_argument("tokenizer.chars_per_token must be positive");
    }
    if (config.tokenizer.type == "bpe" && config.tokenizer.vocab_path.empty()) {
        throw std::invalid_argument("tokenizer.vocab_path is required for the bpe tokenizer");
    }
}

} // namespace ctx
