// include/ctx/message_log.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ctx/message.hpp"
#include "ctx/token_counter.hpp"

namespace ctx {

// Append-only record of conversation turns. Nothing is evicted here;
// PayloadBuilder decides what part of the history a request carries.
class MessageLog {
public:
    using const_iterator = std::vector<Message>::const_iterator;
    using const_reverse_iterator = std::vector<Message>::const_reverse_iterator;

    // Newest-first view over the log; each begin() starts a fresh walk
    class ReverseView {
    public:
        explicit ReverseView(const std::vector<Message>& messages) : messages_(&messages) {}

        const_reverse_iterator begin() const { return messages_->crbegin(); }
        const_reverse_iterator end() const { return messages_->crend(); }
        size_t size() const { return messages_->size(); }

    private:
        const std::vector<Message>* messages_;
    };

    explicit MessageLog(std::shared_ptr<const TokenCounter> counter);

    const Message& append(Role role, const std::string& content);

    size_t total_tokens() const { return total_tokens_; }
    ReverseView iterate_from_most_recent() const { return ReverseView(messages_); }

    // Insertion-order access
    const_iterator begin() const { return messages_.cbegin(); }
    const_iterator end() const { return messages_.cend(); }
    const Message& at(size_t index) const { return messages_.at(index); }

    size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }
    void clear();

private:
    std::vector<Message> messages_;
    std::shared_ptr<const TokenCounter> counter_;
    size_t total_tokens_ = 0;
};

} // namespace ctx
