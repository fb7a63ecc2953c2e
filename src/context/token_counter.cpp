// src/context/token_counter.cpp
#include "ctx/token_counter.hpp"
#include "ctx/config_manager.hpp"
#include <stdexcept>

namespace ctx {

BpeTokenCounter::BpeTokenCounter(std::shared_ptr<const BPETokenizer> tokenizer)
    : tokenizer_(std::move(tokenizer)) {
    if (!tokenizer_) {
        throw std::invalid_argument("BpeTokenCounter requires a tokenizer");
    }
}

size_t BpeTokenCounter::count(const std::string& text) const {
    if (text.empty()) {
        return 0;
    }
    return tokenizer_->encode(text).size();
}

HeuristicTokenCounter::HeuristicTokenCounter(size_t chars_per_token)
    : chars_per_token_(chars_per_token) {
    if (chars_per_token_ == 0) {
        throw std::invalid_argument("chars_per_token must be positive");
    }
}

size_t HeuristicTokenCounter::count(const std::string& text) const {
    return (text.size() + chars_per_token_ - 1) / chars_per_token_;
}

std::shared_ptr<const TokenCounter> make_token_counter(const TokenizerConfig& config) {
    if (config.type == "heuristic") {
        return std::make_shared<HeuristicTokenCounter>(config.chars_per_token);
    }
    if (config.type == "bpe") {
        auto tokenizer = std::make_shared<BPETokenizer>();
        if (!tokenizer->load(config.vocab_path)) {
            throw std::runtime_error("Cannot load tokenizer vocabulary: " + config.vocab_path);
        }
        return std::make_shared<BpeTokenCounter>(std::move(tokenizer));
    }
    throw std::invalid_argument("Unknown tokenizer type: " + config.type);
}

} // namespace ctx
