// src/context/payload_builder.cpp
#include "ctx/payload_builder.hpp"
#include <iterator>
#include <stdexcept>

namespace ctx {

PayloadBuilder::PayloadBuilder(std::shared_ptr<const TokenCounter> counter, PayloadOptions options)
    : counter_(std::move(counter)), options_(options) {
    if (!counter_) {
        throw std::invalid_argument("PayloadBuilder requires a token counter");
    }
    if (options_.max_tokens == 0) {
        throw std::invalid_argument("max_tokens must be positive");
    }
    if (!(options_.file_budget_fraction > 0.0 && options_.file_budget_fraction <= 1.0)) {
        throw std::invalid_argument("file_budget_fraction must be in (0, 1]");
    }
}

size_t PayloadBuilder::file_token_budget() const {
    return static_cast<size_t>(static_cast<double>(options_.max_tokens) * options_.file_budget_fraction);
}

BuildResult PayloadBuilder::build(const std::string& system_prompt,
                                  const FileContextStore& file_store,
                                  const MessageLog& message_log,
                                  const std::optional<std::string>& extra_user) const {
    BuildResult result;
    result.file_budget = file_token_budget();
    const size_t max_tokens = options_.max_tokens;

    // System prompt is never dropped
    const size_t system_tokens = counter_->count(system_prompt);
    result.entries.push_back({Role::SYSTEM, system_prompt, system_tokens, EntrySource::SYSTEM_PROMPT, {}});
    size_t used = system_tokens;

    // Pinned files, oldest first. The first file that does not fit ends the
    // walk; later, smaller files are not considered. The sub-budget is spent
    // on content, the overall budget on the rendered entry.
    size_t file_used = 0;
    bool files_stopped = false;
    for (const auto& file : file_store.entries_oldest_first()) {
        if (!files_stopped &&
            (file_used + file.token_count > result.file_budget ||
             used + file.entry_token_count > max_tokens)) {
            files_stopped = true;
        }
        if (files_stopped) {
            result.omitted_files.push_back(file.path);
            continue;
        }
        result.entries.push_back({Role::SYSTEM,
                                  render_file_entry(file_store.policy().label_format, file.path, file.content),
                                  file.entry_token_count, EntrySource::FILE_CONTEXT, file.path});
        result.included_files.push_back(file.path);
        file_used += file.token_count;
        used += file.entry_token_count;
    }

    // History, newest first, collected then emitted in insertion order
    std::vector<const Message*> collected;
    const auto history = message_log.iterate_from_most_recent();
    auto it = history.begin();
    while (it != history.end()) {
        auto group_end = std::next(it);
        if (options_.keep_tool_sequences && it->role == Role::TOOL) {
            // Tool results travel with the assistant turn that requested them
            while (group_end != history.end() && group_end->role == Role::TOOL) {
                ++group_end;
            }
            if (group_end != history.end() && group_end->role == Role::ASSISTANT) {
                ++group_end;
            }
        }

        size_t group_tokens = 0;
        size_t group_size = 0;
        for (auto g = it; g != group_end; ++g) {
            group_tokens += g->token_count;
            ++group_size;
        }

        if (used + group_tokens > max_tokens) {
            break;
        }
        if (options_.max_history_messages != 0 &&
            collected.size() + group_size > options_.max_history_messages) {
            break;
        }

        for (auto g = it; g != group_end; ++g) {
            collected.push_back(&*g);
        }
        used += group_tokens;
        it = group_end;
    }

    result.messages_included = collected.size();
    result.messages_omitted = message_log.size() - collected.size();
    for (auto rit = collected.rbegin(); rit != collected.rend(); ++rit) {
        const Message& message = **rit;
        result.entries.push_back({message.role, message.content, message.token_count, EntrySource::HISTORY, {}});
    }

    // Pending user turn goes last, only if it fits
    if (extra_user) {
        result.extra_user_requested = true;
        const size_t extra_tokens = counter_->count(*extra_user);
        if (used + extra_tokens <= max_tokens) {
            result.entries.push_back({Role::USER, *extra_user, extra_tokens, EntrySource::EXTRA_USER, {}});
            used += extra_tokens;
            result.extra_user_included = true;
        }
    }

    result.total_tokens = used;
    return result;
}

nlohmann::json payload_to_json(const std::vector<PayloadEntry>& entries) {
    nlohmann::json messages = nlohmann::json::array();
    for (const auto& entry : entries) {
        messages.push_back({
            {"role", role_to_string(entry.role)},
            {"content", entry.content}
        });
    }
    return messages;
}

} // namespace ctx
