// src/context/usage_monitor.cpp
#include "ctx/usage_monitor.hpp"
#include <stdexcept>

namespace ctx {

UsageMonitor::UsageMonitor(size_t max_tokens, double warn_threshold, double critical_threshold)
    : max_tokens_(max_tokens), warn_threshold_(warn_threshold), critical_threshold_(critical_threshold) {
    if (max_tokens_ == 0) {
        throw std::invalid_argument("max_tokens must be positive");
    }
    if (!(warn_threshold_ > 0.0 && critical_threshold_ < 1.0 && warn_threshold_ < critical_threshold_)) {
        throw std::invalid_argument("thresholds must satisfy 0 < warn < critical < 1");
    }
}

UsageReport UsageMonitor::usage(const FileContextStore& file_store, const MessageLog& message_log) const {
    return usage_for(file_store.total_tokens() + message_log.total_tokens());
}

UsageReport UsageMonitor::usage_for(size_t total_tokens) const {
    UsageReport report;
    report.total_tokens = total_tokens;
    report.ratio = static_cast<double>(total_tokens) / static_cast<double>(max_tokens_);
    report.tier = classify(report.ratio);
    return report;
}

UsageTier UsageMonitor::classify(double ratio) const {
    if (ratio > critical_threshold_) return UsageTier::CRITICAL;
    if (ratio > warn_threshold_) return UsageTier::WARN;
    return UsageTier::OK;
}

} // namespace ctx
