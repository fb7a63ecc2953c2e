// src/tokenizer/bpe_tokenizer.cpp
#include "ctx/tokenizer/bpe_tokenizer.hpp"
#include "ctx/tokenizer/unicode_utils.hpp"
#include <cereal/archives/binary.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <fstream>
#include <algorithm>
#include <stdexcept>
#include <iostream>
#include <limits>
#include <unordered_map>
#include <vector>

namespace ctx {

namespace {

struct VectorHash {
    size_t operator()(const std::vector<TokenID>& vec) const {
        size_t seed = vec.size();
        for (const auto& token : vec) {
            seed ^= token + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

struct PairHash {
    size_t operator()(const std::pair<TokenID, TokenID>& p) const {
        return (static_cast<size_t>(p.first) << 32) ^ static_cast<size_t>(p.second);
    }
};

using TokenPair = std::pair<TokenID, TokenID>;

// One learned merge; its position in the merge list is its priority
struct MergeRule {
    TokenID first = 0;
    TokenID second = 0;
    TokenID result = 0;

    template <class Archive>
    void serialize(Archive& archive) {
        archive(first, second, result);
    }
};

struct VocabularyArchive {
    std::vector<std::string> tokens;
    std::vector<MergeRule> merges;
    TokenID unk_token_id = 0;
    TokenID pad_token_id = 0;
    TokenID eos_token_id = 0;

    template <class Archive>
    void serialize(Archive& archive) {
        archive(tokens, merges, unk_token_id, pad_token_id, eos_token_id);
    }
};

enum class CharClass { WHITESPACE, PUNCTUATION, WORD };

CharClass classify(uint32_t codepoint) {
    if (unicode::is_whitespace(codepoint)) return CharClass::WHITESPACE;
    if (unicode::is_punctuation(codepoint)) return CharClass::PUNCTUATION;
    return CharClass::WORD;
}

constexpr size_t kMinMergeFrequency = 2;

} // namespace

class BPETokenizer::Impl {
public:
    std::unordered_map<std::string, TokenID> vocab;
    std::vector<std::string> inv_vocab;
    // pair -> (rank, merged token)
    std::unordered_map<TokenPair, std::pair<size_t, TokenID>, PairHash> merges;
    std::vector<MergeRule> merge_list;
    std::string unknown_token = "<unk>";
    bool debug_logging = false;

    // Special token IDs
    TokenID eos_token_id = 0;
    TokenID pad_token_id = 0;
    TokenID unk_token_id = 0;

    void initialize_vocab();
    TokenID add_token(const std::string& token);
    void add_merge(const TokenPair& pair, TokenID result);

    std::vector<std::string> split_text(const std::string& text) const;
    std::vector<TokenID> word_to_token_ids(const std::string& word) const;
    std::vector<TokenID> byte_tokens(const std::string& text) const;
    void apply_merges(std::vector<TokenID>& tokens) const;

    void get_pair_counts_from_sequences(const std::vector<std::pair<std::vector<TokenID>, size_t>>& tokenized_corpus,
                                        std::unordered_map<TokenPair, size_t, PairHash>& pair_counts) const;
    void perform_merge_on_sequences(const TokenPair& pair, TokenID new_token_id,
                                    std::vector<std::pair<std::vector<TokenID>, size_t>>& tokenized_corpus) const;

    // Debug logging methods
    void log_word_split(const std::vector<std::string>& words) const;
    void log_final_tokens(const std::vector<TokenID>& tokens) const;
};

void BPETokenizer::Impl::initialize_vocab() {
    vocab.clear();
    inv_vocab.clear();
    merges.clear();
    merge_list.clear();

    // Add bytes
    for (int i = 0; i < 256; i++) {
        add_token(std::string(1, static_cast<char>(i)));
    }

    // Typographic punctuation that would otherwise cost three byte tokens
    for (const char* punct : {"—", "–", "“", "”", "‘", "’", "…"}) {
        add_token(punct);
    }

    unk_token_id = add_token(unknown_token);
    pad_token_id = add_token("<pad>");
    eos_token_id = add_token("<eos>");
}

TokenID BPETokenizer::Impl::add_token(const std::string& token) {
    if (auto it = vocab.find(token); it != vocab.end()) {
        return it->second;
    }
    const auto id = static_cast<TokenID>(inv_vocab.size());
    vocab.emplace(token, id);
    inv_vocab.push_back(token);
    return id;
}

void BPETokenizer::Impl::add_merge(const TokenPair& pair, TokenID result) {
    merges.emplace(pair, std::make_pair(merge_list.size(), result));
    merge_list.push_back({pair.first, pair.second, result});
}

// Pre-tokenization: whitespace runs, single punctuation marks and runs of
// everything else become separate pieces. Merges never cross piece borders.
std::vector<std::string> BPETokenizer::Impl::split_text(const std::string& text) const {
    std::vector<std::string> words;
    std::string current;
    CharClass current_class = CharClass::WORD;

    for (const auto& cp : unicode::to_code_points(text)) {
        const CharClass cls = classify(cp.value);
        if (!current.empty() && (cls != current_class || cls == CharClass::PUNCTUATION)) {
            words.push_back(std::move(current));
            current.clear();
        }
        current += cp.utf8;
        current_class = cls;
    }

    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

std::vector<TokenID> BPETokenizer::Impl::word_to_token_ids(const std::string& word) const {
    std::vector<TokenID> tokens;
    tokens.reserve(word.size());

    for (const auto& cp : unicode::to_code_points(word)) {
        if (auto it = vocab.find(cp.utf8); it != vocab.end()) {
            tokens.push_back(it->second);
            continue;
        }
        // Byte fallback: the first 256 ids are the raw bytes
        for (unsigned char c : cp.utf8) {
            tokens.push_back(static_cast<TokenID>(c));
        }
    }
    return tokens;
}

std::vector<TokenID> BPETokenizer::Impl::byte_tokens(const std::string& text) const {
    std::vector<TokenID> tokens;
    tokens.reserve(text.size());
    for (unsigned char c : text) {
        tokens.push_back(static_cast<TokenID>(c));
    }
    return tokens;
}

// Repeatedly merge the adjacent pair with the lowest rank, like training did.
void BPETokenizer::Impl::apply_merges(std::vector<TokenID>& tokens) const {
    while (tokens.size() > 1) {
        size_t best_rank = std::numeric_limits<size_t>::max();
        TokenPair best_pair;
        TokenID best_result = 0;

        for (size_t i = 0; i + 1 < tokens.size(); i++) {
            auto it = merges.find({tokens[i], tokens[i + 1]});
            if (it != merges.end() && it->second.first < best_rank) {
                best_rank = it->second.first;
                best_pair = it->first;
                best_result = it->second.second;
            }
        }

        if (best_rank == std::numeric_limits<size_t>::max()) {
            break;
        }

        std::vector<TokenID> merged;
        merged.reserve(tokens.size());
        for (size_t i = 0; i < tokens.size(); i++) {
            if (i + 1 < tokens.size() && tokens[i] == best_pair.first && tokens[i + 1] == best_pair.second) {
                merged.push_back(best_result);
                i++;
            } else {
                merged.push_back(tokens[i]);
            }
        }
        tokens = std::move(merged);
    }
}

void BPETokenizer::Impl::get_pair_counts_from_sequences(
    const std::vector<std::pair<std::vector<TokenID>, size_t>>& tokenized_corpus,
    std::unordered_map<TokenPair, size_t, PairHash>& pair_counts) const {

    pair_counts.clear();

    for (const auto& [sequence, count] : tokenized_corpus) {
        for (size_t i = 0; i + 1 < sequence.size(); i++) {
            pair_counts[{sequence[i], sequence[i + 1]}] += count;
        }
    }
}

void BPETokenizer::Impl::perform_merge_on_sequences(
    const TokenPair& pair,
    TokenID new_token_id,
    std::vector<std::pair<std::vector<TokenID>, size_t>>& tokenized_corpus) const {

    for (auto& [sequence, count] : tokenized_corpus) {
        std::vector<TokenID> new_sequence;
        new_sequence.reserve(sequence.size());

        for (size_t i = 0; i < sequence.size(); i++) {
            if (i + 1 < sequence.size() &&
                sequence[i] == pair.first &&
                sequence[i + 1] == pair.second) {
                new_sequence.push_back(new_token_id);
                i++; // Skip the next token
            } else {
                new_sequence.push_back(sequence[i]);
            }
        }

        sequence = std::move(new_sequence);
    }
}

void BPETokenizer::Impl::log_word_split(const std::vector<std::string>& words) const {
    if (!debug_logging) return;
    std::cout << "[ENCODE] Split into " << words.size() << " words: ";
    for (size_t i = 0; i < std::min(words.size(), size_t(10)); i++) {
        std::cout << "[" << i << "]='" << words[i] << "' ";
    }
    if (words.size() > 10) {
        std::cout << "... and " << (words.size() - 10) << " more";
    }
    std::cout << std::endl;
}

void BPETokenizer::Impl::log_final_tokens(const std::vector<TokenID>& tokens) const {
    if (!debug_logging) return;
    std::cout << "[ENCODE] Final tokens (" << tokens.size() << "): ";
    for (size_t i = 0; i < std::min(tokens.size(), size_t(20)); i++) {
        std::cout << tokens[i] << " ";
    }
    if (tokens.size() > 20) {
        std::cout << "...";
    }
    std::cout << std::endl;
}

BPETokenizer::BPETokenizer() : pimpl_(new Impl) {
    pimpl_->initialize_vocab();
}

BPETokenizer::~BPETokenizer() = default;

void BPETokenizer::enable_debug_logging(bool enable) {
    pimpl_->debug_logging = enable;
}

void BPETokenizer::train(const std::vector<std::string>& corpus, size_t vocab_size) {
    if (corpus.empty()) {
        throw std::invalid_argument("Corpus cannot be empty");
    }

    // Count identical pre-tokenized words once
    std::unordered_map<std::vector<TokenID>, size_t, VectorHash> sequence_counts;
    size_t total_words = 0;

    for (const auto& text : corpus) {
        for (const auto& word : pimpl_->split_text(unicode::normalize(text))) {
            auto tokens = pimpl_->word_to_token_ids(word);
            if (tokens.size() > 1) {
                sequence_counts[tokens]++;
            }
            total_words++;
        }
    }

    std::vector<std::pair<std::vector<TokenID>, size_t>> tokenized_corpus(
        sequence_counts.begin(), sequence_counts.end());
    sequence_counts.clear();

    if (pimpl_->debug_logging) {
        std::cout << "[TRAIN] Words: " << total_words
                  << ", unique mergeable sequences: " << tokenized_corpus.size()
                  << ", target vocabulary: " << vocab_size << std::endl;
    }

    std::unordered_map<TokenPair, size_t, PairHash> pair_counts;
    size_t iteration = 0;

    while (pimpl_->inv_vocab.size() < vocab_size) {
        pimpl_->get_pair_counts_from_sequences(tokenized_corpus, pair_counts);

        // Most frequent pair; ties go to the smallest pair so training is reproducible
        auto best = pair_counts.end();
        for (auto it = pair_counts.begin(); it != pair_counts.end(); ++it) {
            if (best == pair_counts.end() ||
                it->second > best->second ||
                (it->second == best->second && it->first < best->first)) {
                best = it;
            }
        }

        if (best == pair_counts.end() || best->second < kMinMergeFrequency) {
            if (pimpl_->debug_logging) {
                std::cout << "[TRAIN] No pairs above frequency threshold. Stopping early." << std::endl;
            }
            break;
        }

        const TokenPair pair = best->first;
        const TokenID new_id = pimpl_->add_token(pimpl_->inv_vocab[pair.first] + pimpl_->inv_vocab[pair.second]);
        pimpl_->add_merge(pair, new_id);
        pimpl_->perform_merge_on_sequences(pair, new_id, tokenized_corpus);
        iteration++;

        if (pimpl_->debug_logging) {
            std::cout << "[TRAIN] Iteration " << iteration
                      << ": merged '" << pimpl_->inv_vocab[pair.first] << "' + '"
                      << pimpl_->inv_vocab[pair.second] << "' (count " << best->second << ")" << std::endl;
        }
    }

    if (pimpl_->debug_logging) {
        std::cout << "[TRAIN] Completed in " << iteration << " iterations, vocabulary size "
                  << pimpl_->inv_vocab.size() << std::endl;
    }
}

size_t BPETokenizer::vocab_size() const {
    return pimpl_->inv_vocab.size();
}

size_t BPETokenizer::merge_count() const {
    return pimpl_->merge_list.size();
}

std::vector<TokenID> BPETokenizer::encode(const std::string& text) const {
    if (text.empty()) {
        return {};
    }

    if (!unicode::is_valid_utf8(text)) {
        std::cerr << "Warning: Invalid UTF-8 in input text, using byte encoding\n";
        return pimpl_->byte_tokens(text);
    }

    auto words = pimpl_->split_text(unicode::normalize(text));
    pimpl_->log_word_split(words);

    std::vector<TokenID> tokens;
    tokens.reserve(text.size());

    for (const auto& word : words) {
        auto word_tokens = pimpl_->word_to_token_ids(word);
        pimpl_->apply_merges(word_tokens);
        tokens.insert(tokens.end(), word_tokens.begin(), word_tokens.end());
    }

    pimpl_->log_final_tokens(tokens);
    return tokens;
}

std::string BPETokenizer::decode(const std::vector<TokenID>& tokens) const {
    std::string text;
    text.reserve(tokens.size() * 3);

    for (TokenID token_id : tokens) {
        if (token_id < pimpl_->inv_vocab.size()) {
            text += pimpl_->inv_vocab[token_id];
        } else {
            text += pimpl_->unknown_token;
        }
    }
    return text;
}

bool BPETokenizer::save(const std::string& filename) const {
    std::ofstream ofs(filename, std::ios::binary);
    if (!ofs.is_open()) {
        return false;
    }

    VocabularyArchive data;
    data.tokens = pimpl_->inv_vocab;
    data.merges = pimpl_->merge_list;
    data.unk_token_id = pimpl_->unk_token_id;
    data.pad_token_id = pimpl_->pad_token_id;
    data.eos_token_id = pimpl_->eos_token_id;

    {
        cereal::BinaryOutputArchive archive(ofs);
        archive(data);
    }
    return ofs.good();
}

bool BPETokenizer::load(const std::string& filename) {
    std::ifstream ifs(filename, std::ios::binary);
    if (!ifs.is_open()) {
        return false;
    }

    VocabularyArchive data;
    try {
        cereal::BinaryInputArchive archive(ifs);
        archive(data);
    } catch (const std::exception& e) {
        std::cerr << "Warning: Cannot read tokenizer vocabulary '" << filename << "': " << e.what() << "\n";
        return false;
    }

    // The byte tokens must sit at ids 0..255 for byte fallback to work
    if (data.tokens.size() < 256) {
        return false;
    }
    for (int i = 0; i < 256; i++) {
        if (data.tokens[i] != std::string(1, static_cast<char>(i))) {
            return false;
        }
    }
    const auto size = data.tokens.size();
    for (const auto& rule : data.merges) {
        if (rule.first >= size || rule.second >= size || rule.result >= size) {
            return false;
        }
    }
    if (data.unk_token_id >= size || data.pad_token_id >= size || data.eos_token_id >= size) {
        return false;
    }

    pimpl_->vocab.clear();
    pimpl_->inv_vocab.clear();
    pimpl_->merges.clear();
    pimpl_->merge_list.clear();

    for (const auto& token : data.tokens) {
        pimpl_->vocab.emplace(token, static_cast<TokenID>(pimpl_->inv_vocab.size()));
        pimpl_->inv_vocab.push_back(token);
    }
    for (const auto& rule : data.merges) {
        pimpl_->add_merge({rule.first, rule.second}, rule.result);
    }
    pimpl_->unk_token_id = data.unk_token_id;
    pimpl_->pad_token_id = data.pad_token_id;
    pimpl_->eos_token_id = data.eos_token_id;
    pimpl_->unknown_token = data.tokens[data.unk_token_id];

    return true;
}

TokenID BPETokenizer::eos_token_id() const {
    return pimpl_->eos_token_id;
}

TokenID BPETokenizer::pad_token_id() const {
    return pimpl_->pad_token_id;
}

TokenID BPETokenizer::unk_token_id() const {
    return pimpl_->unk_token_id;
}

} // namespace ctx
