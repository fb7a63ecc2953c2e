// include/ctx/usage_monitor.hpp
#pragma once

#include <cstddef>
#include <string>
#include "ctx/file_context_store.hpp"
#include "ctx/message_log.hpp"

namespace ctx {

enum class UsageTier {
    OK,
    WARN,
    CRITICAL
};

inline std::string usage_tier_to_string(UsageTier tier) {
    switch (tier) {
        case UsageTier::OK: return "ok";
        case UsageTier::WARN: return "warn";
        case UsageTier::CRITICAL: return "critical";
    }
    return "unknown";
}

struct UsageReport {
    size_t total_tokens = 0;
    double ratio = 0.0;
    UsageTier tier = UsageTier::OK;
};

// Early-warning signal over everything held, not over what a payload
// would carry: the total is the sum of both stores without truncation.
class UsageMonitor {
public:
    // Throws std::invalid_argument unless max_tokens > 0 and
    // 0 < warn_threshold < critical_threshold < 1
    UsageMonitor(size_t max_tokens, double warn_threshold, double critical_threshold);

    UsageReport usage(const FileContextStore& file_store, const MessageLog& message_log) const;
    UsageReport usage_for(size_t total_tokens) const;
    UsageTier classify(double ratio) const;

    size_t max_tokens() const { return max_tokens_; }
    double warn_threshold() const { return warn_threshold_; }
    double critical_threshold() const { return critical_threshold_; }

private:
    size_t max_tokens_;
    double warn_threshold_;
    double critical_threshold_;
};

} // namespace ctx
