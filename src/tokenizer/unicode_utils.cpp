// src/tokenizer/unicode_utils.cpp
#include "ctx/tokenizer/unicode_utils.hpp"
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/normalizer2.h>
#include <unicode/utf8.h>
#include <limits>
#include <stdexcept>

namespace ctx::unicode {

namespace {

// Walks text with U8_NEXT, which indexes with int32_t, so longer inputs are
// taken in chunks. A chunk stops early enough that no sequence straddles two
// chunks. An ill-formed sequence is reported as c < 0 covering its first byte
// only, and the walk resumes at the next byte. visit returns false to stop.
template <typename Visit>
bool scan_utf8(const std::string& text, size_t max_chunk, Visit visit) {
    if (max_chunk < U8_MAX_LENGTH ||
        max_chunk > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw std::invalid_argument("UTF-8 chunk size out of range: " + std::to_string(max_chunk));
    }

    const auto* base = reinterpret_cast<const uint8_t*>(text.data());
    size_t offset = 0;
    while (offset < text.size()) {
        const size_t remaining = text.size() - offset;
        const bool last = remaining <= max_chunk;
        const auto length = static_cast<int32_t>(last ? remaining : max_chunk);
        const int32_t stop = last ? length : length - (U8_MAX_LENGTH - 1);
        const uint8_t* data = base + offset;

        int32_t i = 0;
        while (i < stop) {
            const int32_t start = i;
            UChar32 c;
            U8_NEXT(data, i, length, c);
            if (c < 0) {
                i = start + 1;
            }
            if (!visit(offset + static_cast<size_t>(start), offset + static_cast<size_t>(i), c)) {
                return false;
            }
        }
        offset += static_cast<size_t>(i);
    }
    return true;
}

} // namespace

bool is_whitespace(uint32_t codepoint) {
    return u_isUWhiteSpace(static_cast<UChar32>(codepoint));
}

bool is_punctuation(uint32_t codepoint) {
    return u_ispunct(static_cast<UChar32>(codepoint));
}

bool is_control(uint32_t codepoint) {
    return u_iscntrl(static_cast<UChar32>(codepoint));
}

bool is_valid_utf8(const std::string& text, size_t max_chunk) {
    return scan_utf8(text, max_chunk, [](size_t, size_t, UChar32 c) { return c >= 0; });
}

std::string normalize(const std::string& text) {
    if (text.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw std::length_error("Text too long to normalize: " + std::to_string(text.size()) + " bytes");
    }

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status)) {
        throw std::runtime_error("Unicode normalization unavailable: " + std::string(u_errorName(status)));
    }

    icu::UnicodeString unicode_str = icu::UnicodeString::fromUTF8(text);
    icu::UnicodeString normalized = nfc->normalize(unicode_str, status);
    if (U_FAILURE(status)) {
        throw std::runtime_error("Unicode normalization failed: " + std::string(u_errorName(status)));
    }

    std::string result;
    normalized.toUTF8String(result);
    return result;
}

std::vector<CodePoint> to_code_points(const std::string& text, size_t max_chunk) {
    std::vector<CodePoint> code_points;
    code_points.reserve(text.size());

    scan_utf8(text, max_chunk, [&](size_t start, size_t end, UChar32 c) {
        if (c < 0) {
            code_points.push_back({0xFFFD, "\xEF\xBF\xBD"});
        } else {
            code_points.push_back({static_cast<uint32_t>(c), text.substr(start, end - start)});
        }
        return true;
    });

    return code_points;
}

std::string from_code_points(const std::vector<CodePoint>& code_points) {
    std::string result;
    for (const auto& cp : code_points) {
        result += cp.utf8;
    }
    return result;
}

} // namespace ctx::unicode
