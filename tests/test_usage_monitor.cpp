// tests/test_usage_monitor.cpp
#include "ctx/usage_monitor.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace ctx;

void test_critical_usage() {
    std::cout << "=== Critical usage ===" << std::endl;

    auto counter = std::make_shared<HeuristicTokenCounter>(1);
    FileStorePolicy policy;
    policy.per_file_token_cap = 10;
    FileContextStore files(counter, policy);
    MessageLog log(counter);
    UsageMonitor monitor(100, 0.8, 0.9);

    log.append(Role::USER, std::string(50, 'u'));
    log.append(Role::ASSISTANT, std::string(45, 'a'));

    UsageReport report = monitor.usage(files, log);
    std::cout << "Total: " << report.total_tokens << ", ratio: " << report.ratio
              << ", tier: " << usage_tier_to_string(report.tier) << std::endl;
    assert(report.total_tokens == 95);
    assert(std::fabs(report.ratio - 0.95) < 1e-9);
    assert(report.tier == UsageTier::CRITICAL);
    assert(usage_tier_to_string(report.tier) == "critical");

    std::cout << "Critical usage passed" << std::endl;
}

void test_usage_counts_everything_held() {
    std::cout << "\n=== Usage over both stores ===" << std::endl;

    auto counter = std::make_shared<HeuristicTokenCounter>(1);
    FileStorePolicy policy;
    policy.per_file_token_cap = 50;
    FileContextStore files(counter, policy);
    MessageLog log(counter);
    UsageMonitor monitor(100, 0.8, 0.9);

    files.add("a", std::string(30, 'f'));
    files.add("b", std::string(30, 'f'));
    log.append(Role::USER, std::string(25, 'u'));

    // Content only; labels and the payload budget do not apply here
    UsageReport report = monitor.usage(files, log);
    assert(report.total_tokens == 85);
    assert(report.tier == UsageTier::WARN);

    // Over max_tokens is reported, not clamped
    log.append(Role::ASSISTANT, std::string(40, 'a'));
    report = monitor.usage(files, log);
    assert(report.total_tokens == 125);
    assert(report.ratio > 1.0);
    assert(report.tier == UsageTier::CRITICAL);

    std::cout << "Usage over both stores passed" << std::endl;
}

void test_tier_boundaries() {
    std::cout << "\n=== Tier boundaries ===" << std::endl;

    UsageMonitor monitor(100, 0.8, 0.9);
    assert(monitor.usage_for(0).tier == UsageTier::OK);
    assert(monitor.usage_for(80).tier == UsageTier::OK);
    assert(monitor.usage_for(81).tier == UsageTier::WARN);
    assert(monitor.usage_for(90).tier == UsageTier::WARN);
    assert(monitor.usage_for(91).tier == UsageTier::CRITICAL);

    assert(monitor.classify(0.5) == UsageTier::OK);
    assert(monitor.classify(0.85) == UsageTier::WARN);
    assert(monitor.classify(0.95) == UsageTier::CRITICAL);

    std::cout << "Tier boundaries passed" << std::endl;
}

void test_invalid_thresholds() {
    std::cout << "\n=== Invalid thresholds ===" << std::endl;

    auto rejects = [](size_t max_tokens, double warn, double critical) {
        try {
            UsageMonitor monitor(max_tokens, warn, critical);
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    };

    assert(rejects(0, 0.8, 0.9));
    assert(rejects(100, 0.9, 0.8));
    assert(rejects(100, 0.8, 0.8));
    assert(rejects(100, 0.0, 0.9));
    assert(rejects(100, 0.8, 1.0));
    assert(!rejects(100, 0.5, 0.75));

    std::cout << "Invalid thresholds passed" << std::endl;
}

int main() {
    std::cout << "Testing usage monitor..." << std::endl;

    test_critical_usage();
    test_usage_counts_everything_held();
    test_tier_boundaries();
    test_invalid_thresholds();

    std::cout << "\n=== All usage monitor tests passed! ===" << std::endl;
    return 0;
}
