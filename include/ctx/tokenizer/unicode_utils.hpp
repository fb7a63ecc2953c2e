// include/ctx/tokenizer/unicode_utils.hpp
#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace ctx::unicode {

// Unicode character representation
struct CodePoint {
    uint32_t value;
    std::string utf8;  // UTF-8 representation
};

// Character classes used by pre-tokenization
bool is_whitespace(uint32_t codepoint);
bool is_punctuation(uint32_t codepoint);
bool is_control(uint32_t codepoint);

// Largest slice handed to ICU at once; its UTF-8 macros index with int32_t
constexpr size_t kMaxScanChunk = 1u << 30;

// True if every byte sequence in text is well-formed UTF-8
bool is_valid_utf8(const std::string& text, size_t max_chunk = kMaxScanChunk);

// Normalize Unicode text (NFC normalization)
std::string normalize(const std::string& text);

// Split text into Unicode code points.
// Invalid sequences become U+FFFD, one per offending byte.
std::vector<CodePoint> to_code_points(const std::string& text, size_t max_chunk = kMaxScanChunk);

// Convert code points back to UTF-8 string
std::string from_code_points(const std::vector<CodePoint>& code_points);

} // namespace ctx::unicode
