// include/ctx/tokenizer/bpe_tokenizer.hpp
#pragma once

#include <string>
#include <vector>
#include <memory>
#include "ctx/tokenizer/token_types.hpp"

namespace ctx {

// Byte-level BPE tokenizer. Every byte has a token, so any input encodes;
// learned merges shrink the sequence for text resembling the training corpus.
class BPETokenizer {
public:
    BPETokenizer();
    ~BPETokenizer();

    BPETokenizer(const BPETokenizer&) = delete;
    BPETokenizer& operator=(const BPETokenizer&) = delete;

    // Training methods
    void train(const std::vector<std::string>& corpus, size_t vocab_size);

    // Encoding/decoding methods
    std::vector<TokenID> encode(const std::string& text) const;
    std::string decode(const std::vector<TokenID>& tokens) const;

    // Vocabulary methods
    size_t vocab_size() const;
    size_t merge_count() const;

    // Serialization methods (cereal binary archive)
    bool save(const std::string& filename) const;
    bool load(const std::string& filename);

    // Special token methods
    TokenID eos_token_id() const;
    TokenID pad_token_id() const;
    TokenID unk_token_id() const;

    // Debug methods
    void enable_debug_logging(bool enable);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace ctx
