// src/context/context_manager.cpp
#include "ctx/context_manager.hpp"
#include <iostream>
#include <stdexcept>

namespace ctx {

namespace {

ContextConfig validated(ContextConfig config) {
    ConfigManager::validate(config);
    return config;
}

std::shared_ptr<const TokenCounter> counter_for(const ContextConfig& config,
                                                std::shared_ptr<const TokenCounter> counter) {
    return counter ? std::move(counter) : make_token_counter(config.tokenizer);
}

FileStorePolicy file_policy(const ContextConfig& config) {
    FileStorePolicy policy;
    policy.max_file_contexts = config.max_file_contexts;
    policy.per_file_token_cap = config.resolved_per_file_cap();
    policy.label_format = config.file_label_format;
    return policy;
}

PayloadOptions payload_options(const ContextConfig& config) {
    PayloadOptions options;
    options.max_tokens = config.max_tokens;
    options.file_budget_fraction = config.file_budget_fraction;
    options.max_history_messages = config.max_history_messages;
    options.keep_tool_sequences = config.keep_tool_sequences;
    return options;
}

} // namespace

ContextManager::ContextManager(ContextConfig config, std::shared_ptr<const TokenCounter> counter)
    : config_(validated(std::move(config))),
      counter_(counter_for(config_, std::move(counter))),
      message_log_(counter_),
      file_store_(counter_, file_policy(config_)),
      builder_(counter_, payload_options(config_)),
      monitor_(config_.max_tokens, config_.warn_threshold, config_.critical_threshold),
      debug_logging_(config_.debug_logging) {
    const size_t system_tokens = counter_->count(config_.system_prompt);
    if (system_tokens > config_.max_tokens) {
        throw std::invalid_argument("system prompt costs " + std::to_string(system_tokens) +
                                    " tokens, more than max_tokens (" +
                                    std::to_string(config_.max_tokens) + ")");
    }
}

void ContextManager::append_message(Role role, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Message& message = message_log_.append(role, content);
    if (debug_logging_) {
        log("CONTEXT", "Appended " + role_to_string(role) + " message (" +
                       std::to_string(message.token_count) + " tokens)");
    }
}

void ContextManager::add_user_message(const std::string& message) {
    append_message(Role::USER, message);
}

void ContextManager::add_assistant_message(const std::string& message) {
    append_message(Role::ASSISTANT, message);
}

void ContextManager::add_tool_message(const std::string& message) {
    append_message(Role::TOOL, message);
}

bool ContextManager::add_file(const std::string& path, const std::string& content) {
    return add_file_with_outcome(path, content).added;
}

AddFileOutcome ContextManager::add_file_with_outcome(const std::string& path, const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    AddFileOutcome outcome = file_store_.add_with_outcome(path, content);
    if (debug_logging_) {
        if (!outcome.added) {
            log("CONTEXT", "Rejected file '" + path + "': " + std::to_string(outcome.token_count) +
                           " tokens exceeds cap of " + std::to_string(file_store_.policy().per_file_token_cap));
        } else {
            log("CONTEXT", "Pinned file '" + path + "' (" + std::to_string(outcome.token_count) + " tokens)");
            for (const auto& evicted : outcome.evicted) {
                log("CONTEXT", "Evicted file '" + evicted + "'");
            }
        }
    }
    return outcome;
}

bool ContextManager::remove_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool removed = file_store_.remove(path);
    if (debug_logging_ && removed) {
        log("CONTEXT", "Unpinned file '" + path + "'");
    }
    return removed;
}

std::vector<PayloadEntry> ContextManager::build_payload(const std::optional<std::string>& extra_user) const {
    return build(extra_user).entries;
}

BuildResult ContextManager::build(const std::optional<std::string>& extra_user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return build_locked(extra_user);
}

BuildResult ContextManager::build_locked(const std::optional<std::string>& extra_user) const {
    BuildResult result = builder_.build(config_.system_prompt, file_store_, message_log_, extra_user);
    if (debug_logging_) {
        log("PAYLOAD", std::to_string(result.entries.size()) + " entries, " +
                       std::to_string(result.total_tokens) + "/" + std::to_string(config_.max_tokens) + " tokens");
        for (const auto& path : result.omitted_files) {
            log("PAYLOAD", "File '" + path + "' omitted: file budget of " +
                           std::to_string(result.file_budget) + " tokens exhausted");
        }
        if (result.messages_omitted > 0) {
            log("PAYLOAD", std::to_string(result.messages_omitted) + " older messages omitted");
        }
        if (result.extra_user_requested && !result.extra_user_included) {
            log("PAYLOAD", "Pending user message omitted: does not fit remaining budget");
        }
    }
    return result;
}

UsageReport ContextManager::usage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monitor_.usage(file_store_, message_log_);
}

void ContextManager::clear_messages() {
    std::lock_guard<std::mutex> lock(mutex_);
    message_log_.clear();
}

void ContextManager::clear_files() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_store_.clear();
}

size_t ContextManager::message_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return message_log_.size();
}

size_t ContextManager::file_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_store_.size();
}

std::vector<std::string> ContextManager::pinned_paths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> paths;
    paths.reserve(file_store_.size());
    for (const auto& file : file_store_.entries_oldest_first()) {
        paths.push_back(file.path);
    }
    return paths;
}

nlohmann::json ContextManager::state_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const UsageReport report = monitor_.usage(file_store_, message_log_);
    const BuildResult payload = builder_.build(config_.system_prompt, file_store_, message_log_);

    nlohmann::json files = nlohmann::json::array();
    for (const auto& file : file_store_.entries_oldest_first()) {
        files.push_back({{"path", file.path}, {"tokens", file.token_count}});
    }

    return nlohmann::json{
        {"config", {
            {"max_tokens", config_.max_tokens},
            {"max_file_contexts", config_.max_file_contexts},
            {"per_file_token_cap", config_.resolved_per_file_cap()},
            {"warn_threshold", config_.warn_threshold},
            {"critical_threshold", config_.critical_threshold}
        }},
        {"tokenizer", counter_->name()},
        {"usage", {
            {"total_tokens", report.total_tokens},
            {"ratio", report.ratio},
            {"tier", usage_tier_to_string(report.tier)}
        }},
        {"messages", {
            {"count", message_log_.size()},
            {"tokens", message_log_.total_tokens()}
        }},
        {"files", files},
        {"payload", {
            {"entries", payload.entries.size()},
            {"total_tokens", payload.total_tokens},
            {"file_budget", payload.file_budget},
            {"included_files", payload.included_files},
            {"omitted_files", payload.omitted_files},
            {"messages_included", payload.messages_included},
            {"messages_omitted", payload.messages_omitted}
        }}
    };
}

void ContextManager::enable_debug_logging(bool enable) {
    std::lock_guard<std::mutex> lock(mutex_);
    debug_logging_ = enable;
}

void ContextManager::log(const std::string& tag, const std::string& message) const {
    std::cout << "[" << tag << "] " << message << std::endl;
}

} // namespace ctx
