// include/ctx/token_counter.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include "ctx/tokenizer/bpe_tokenizer.hpp"

namespace ctx {

struct TokenizerConfig;

// Text -> token cost. Implementations must be pure: the same text always
// yields the same count, and empty text yields 0. Every cached count in a
// session comes from one counter instance.
class TokenCounter {
public:
    virtual ~TokenCounter() = default;

    virtual size_t count(const std::string& text) const = 0;
    virtual std::string name() const = 0;
};

// Counts with a trained or loaded BPE vocabulary
class BpeTokenCounter : public TokenCounter {
public:
    explicit BpeTokenCounter(std::shared_ptr<const BPETokenizer> tokenizer);

    size_t count(const std::string& text) const override;
    std::string name() const override { return "bpe"; }

private:
    std::shared_ptr<const BPETokenizer> tokenizer_;
};

// ceil(bytes / chars_per_token); no vocabulary needed
class HeuristicTokenCounter : public TokenCounter {
public:
    explicit HeuristicTokenCounter(size_t chars_per_token = 4);

    size_t count(const std::string& text) const override;
    std::string name() const override { return "heuristic"; }

    size_t chars_per_token() const { return chars_per_token_; }

private:
    size_t chars_per_token_;
};

// Builds the counter named by config.type ("heuristic" or "bpe").
// Throws std::invalid_argument for an unknown type and std::runtime_error
// when a BPE vocabulary cannot be loaded.
std::shared_ptr<const TokenCounter> make_token_counter(const TokenizerConfig& config);

} // namespace ctx
