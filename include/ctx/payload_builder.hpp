// include/ctx/payload_builder.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ctx/file_context_store.hpp"
#include "ctx/message.hpp"
#include "ctx/message_log.hpp"
#include "ctx/token_counter.hpp"

namespace ctx {

// Where a payload entry came from
enum class EntrySource {
    SYSTEM_PROMPT,
    FILE_CONTEXT,
    HISTORY,
    EXTRA_USER
};

struct PayloadEntry {
    Role role;
    std::string content;
    size_t token_count;
    EntrySource source;
    std::string path;   // set for FILE_CONTEXT entries
};

struct PayloadOptions {
    size_t max_tokens = 8000;
    double file_budget_fraction = 0.10;
    size_t max_history_messages = 0;   // 0 = unlimited
    bool keep_tool_sequences = false;
};

struct BuildResult {
    std::vector<PayloadEntry> entries;
    size_t total_tokens = 0;
    size_t file_budget = 0;
    std::vector<std::string> included_files;
    std::vector<std::string> omitted_files;
    size_t messages_included = 0;
    size_t messages_omitted = 0;
    bool extra_user_requested = false;
    bool extra_user_included = false;

    bool truncated() const {
        return !omitted_files.empty() || messages_omitted > 0 ||
               (extra_user_requested && !extra_user_included);
    }
};

// Assembles the ordered request payload: system prompt, pinned files
// (oldest first, within the file sub-budget), the newest history that fits,
// then the pending user message if it still fits. Reads both stores without
// modifying them. The total never exceeds max_tokens unless the system prompt
// alone does.
class PayloadBuilder {
public:
    PayloadBuilder(std::shared_ptr<const TokenCounter> counter, PayloadOptions options);

    BuildResult build(const std::string& system_prompt,
                      const FileContextStore& file_store,
                      const MessageLog& message_log,
                      const std::optional<std::string>& extra_user = std::nullopt) const;

    const PayloadOptions& options() const { return options_; }
    size_t file_token_budget() const;

private:
    std::shared_ptr<const TokenCounter> counter_;
    PayloadOptions options_;
};

// [{"role": ..., "content": ...}, ...] for a chat-completions request
nlohmann::json payload_to_json(const std::vector<PayloadEntry>& entries);

} // namespace ctx
