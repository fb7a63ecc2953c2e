// src/context/message_log.cpp
#include "ctx/message_log.hpp"
#include <stdexcept>

namespace ctx {

MessageLog::MessageLog(std::shared_ptr<const TokenCounter> counter)
    : counter_(std::move(counter)) {
    if (!counter_) {
        throw std::invalid_argument("MessageLog requires a token counter");
    }
}

const Message& MessageLog::append(Role role, const std::string& content) {
    const size_t token_count = counter_->count(content);
    messages_.push_back({role, content, token_count});
    total_tokens_ += token_count;
    return messages_.back();
}

void MessageLog::clear() {
    messages_.clear();
    total_tokens_ = 0;
}

} // namespace ctx
