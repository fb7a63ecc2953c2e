// include/ctx/config_manager.hpp
#pragma once

#include <string>
#include <iostream>
#include <nlohmann/json.hpp>

namespace ctx {

struct TokenizerConfig {
    std::string type = "heuristic";   // "heuristic" or "bpe"
    std::string vocab_path;           // cereal vocabulary written by BPETokenizer::save
    size_t chars_per_token = 4;
};

struct ContextConfig {
    std::string system_prompt = "You are a helpful software engineering assistant.";

    // Budget
    size_t max_tokens = 8000;
    size_t max_file_contexts = 5;
    size_t per_file_token_cap = 0;        // 0 = max_tokens / 10
    double file_budget_fraction = 0.10;

    // Usage tiers
    double warn_threshold = 0.8;
    double critical_threshold = 0.9;

    // History selection
    size_t max_history_messages = 0;      // 0 = unlimited
    bool keep_tool_sequences = false;

    // "{path}" is replaced with the pinned file's path
    std::string file_label_format = "User added file '{path}'. Content:\n\n";

    TokenizerConfig tokenizer;

    bool debug_logging = false;

    size_t resolved_per_file_cap() const {
        return per_file_token_cap != 0 ? per_file_token_cap : max_tokens / 10;
    }

    size_t file_token_budget() const {
        return static_cast<size_t>(static_cast<double>(max_tokens) * file_budget_fraction);
    }

    // Display all parameters
    void print(std::ostream& os = std::cout) const {
        os << "=== Context Configuration ===" << std::endl;
        os << "Max Tokens: " << max_tokens << std::endl;
        os << "Max File Contexts: " << max_file_contexts << std::endl;
        os << "Per-File Token Cap: " << resolved_per_file_cap() << std::endl;
        os << "File Budget Fraction: " << file_budget_fraction << std::endl;
        os << "Warn Threshold: " << warn_threshold << std::endl;
        os << "Critical Threshold: " << critical_threshold << std::endl;
        os << "Max History Messages: " << max_history_messages << std::endl;
        os << "Keep Tool Sequences: " << (keep_tool_sequences ? "true" : "false") << std::endl;
        os << "Tokenizer: " << tokenizer.type << std::endl;
        os << "Debug Logging: " << (debug_logging ? "true" : "false") << std::endl;
        os << "=============================" << std::endl;
    }
};

// nlohmann::json conversions. Missing keys keep their defaults; a value of
// the wrong type throws nlohmann::json::type_error, and a negative or
// fractional count throws std::invalid_argument.
void to_json(nlohmann::json& j, const TokenizerConfig& config);
void from_json(const nlohmann::json& j, TokenizerConfig& config);
void to_json(nlohmann::json& j, const ContextConfig& config);
void from_json(const nlohmann::json& j, ContextConfig& config);

class ConfigManager {
public:
    explicit ConfigManager(const std::string& config_path = "ctxbudget.json");

    // Returns false and keeps the current values if the file does not exist.
    // Throws std::runtime_error if the file exists but cannot be parsed.
    bool load_config();
    bool save_config() const;
    void create_default_config();

    // Access to configuration
    const ContextConfig& get_config() const { return config_; }
    ContextConfig& get_config() { return config_; }

    // Validation
    bool validate_config() const;
    // Throws std::invalid_argument naming the first offending field
    static void validate(const ContextConfig& config);

    // File operations
    std::string get_config_path() const { return config_path_; }
    void set_config_path(const std::string& path) { config_path_ = path; }

    void reset_to_defaults();

private:
    std::string config_path_;
    ContextConfig config_;
};

} // namespace ctx
