// include/ctx/context_manager.hpp
#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ctx/config_manager.hpp"
#include "ctx/file_context_store.hpp"
#include "ctx/message_log.hpp"
#include "ctx/payload_builder.hpp"
#include "ctx/token_counter.hpp"
#include "ctx/usage_monitor.hpp"

namespace ctx {

// Per-session context state: the conversation log, the pinned files and the
// configuration that budgets them. Created once per session and passed to
// whoever needs it. Every call takes the instance mutex, so a file watcher
// thread may pin files while another thread builds a request.
class ContextManager {
public:
    // Throws std::invalid_argument for an invalid configuration, including a
    // system prompt that alone exceeds max_tokens. With no counter given, one
    // is built from config.tokenizer.
    explicit ContextManager(ContextConfig config,
                            std::shared_ptr<const TokenCounter> counter = nullptr);

    void append_message(Role role, const std::string& content);
    void add_user_message(const std::string& message);
    void add_assistant_message(const std::string& message);
    void add_tool_message(const std::string& message);

    bool add_file(const std::string& path, const std::string& content);
    AddFileOutcome add_file_with_outcome(const std::string& path, const std::string& content);
    bool remove_file(const std::string& path);

    std::vector<PayloadEntry> build_payload(const std::optional<std::string>& extra_user = std::nullopt) const;
    BuildResult build(const std::optional<std::string>& extra_user = std::nullopt) const;

    UsageReport usage() const;

    void clear_messages();
    void clear_files();

    size_t message_count() const;
    size_t file_count() const;
    std::vector<std::string> pinned_paths() const;

    nlohmann::json state_snapshot() const;

    void enable_debug_logging(bool enable);

    const ContextConfig& config() const { return config_; }
    const TokenCounter& token_counter() const { return *counter_; }

private:
    BuildResult build_locked(const std::optional<std::string>& extra_user) const;
    void log(const std::string& tag, const std::string& message) const;

    ContextConfig config_;
    std::shared_ptr<const TokenCounter> counter_;
    MessageLog message_log_;
    FileContextStore file_store_;
    PayloadBuilder builder_;
    UsageMonitor monitor_;
    bool debug_logging_;
    mutable std::mutex mutex_;
};

} // namespace ctx
