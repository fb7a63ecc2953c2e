// tests/test_context_manager.cpp
#include "ctx/context_manager.hpp"
#include "ctx/runtime/state_utils.hpp"
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace ctx;

namespace {

ContextConfig small_config() {
    ContextConfig config;
    config.system_prompt = "sys";
    config.max_tokens = 100;
    config.file_label_format = "";
    config.tokenizer.chars_per_token = 1;
    return config;
}

bool rejects(const ContextConfig& config) {
    try {
        ContextManager context(config);
    } catch (const std::invalid_argument& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

} // namespace

void test_session_flow() {
    std::cout << "=== Session flow ===" << std::endl;

    ContextManager context(small_config());
    assert(context.token_counter().name() == "heuristic");
    assert(context.config().resolved_per_file_cap() == 10);

    context.add_user_message("hello");
    context.add_assistant_message("hi!");
    context.add_tool_message("ok");
    context.append_message(Role::SYSTEM, "note");
    assert(context.message_count() == 4);

    assert(context.add_file("a.py", "print(1)"));
    assert(!context.add_file("big.py", std::string(11, 'x')));
    assert(context.file_count() == 1);

    std::vector<PayloadEntry> payload = context.build_payload(std::string("next"));
    assert(payload.size() == 7);
    assert(payload.front().content == "sys");
    assert(payload[1].path == "a.py");
    assert(payload.back().content == "next");
    assert(payload.back().role == Role::USER);

    // Usage counts what is held: 8 + 5 + 3 + 2 + 4
    UsageReport report = context.usage();
    assert(report.total_tokens == 22);
    assert(report.tier == UsageTier::OK);

    assert(context.remove_file("a.py"));
    assert(!context.remove_file("a.py"));
    context.clear_messages();
    assert(context.message_count() == 0);
    assert(context.usage().total_tokens == 0);

    std::cout << "Session flow passed" << std::endl;
}

void test_eviction_through_facade() {
    std::cout << "\n=== Eviction through facade ===" << std::endl;

    ContextManager context(small_config());
    for (int i = 1; i <= 6; i++) {
        context.add_file("f" + std::to_string(i), "x");
    }
    assert((context.pinned_paths() == std::vector<std::string>{"f2", "f3", "f4", "f5", "f6"}));

    AddFileOutcome outcome = context.add_file_with_outcome("f7", "y");
    assert((outcome.evicted == std::vector<std::string>{"f2"}));

    context.clear_files();
    assert(context.file_count() == 0);

    std::cout << "Eviction through facade passed" << std::endl;
}

void test_critical_tier() {
    std::cout << "\n=== Critical tier ===" << std::endl;

    ContextManager context(small_config());
    context.add_user_message(std::string(60, 'u'));
    context.add_assistant_message(std::string(35, 'a'));

    UsageReport report = context.usage();
    assert(report.total_tokens == 95);
    assert(report.tier == UsageTier::CRITICAL);

    // Holding more than max_tokens is allowed; the payload still fits
    context.add_user_message(std::string(10, 'n'));
    assert(context.usage().total_tokens == 105);

    BuildResult result = context.build();
    assert(result.total_tokens == 48);
    assert(result.messages_included == 2);
    assert(result.messages_omitted == 1);

    std::cout << "Critical tier passed" << std::endl;
}

void test_default_label_file_budget() {
    std::cout << "\n=== File budget with default label ===" << std::endl;

    ContextConfig config;
    config.max_tokens = 100;
    config.system_prompt = std::string(40, 's');   // 10 tokens at 4 chars each
    ContextManager context(config);
    assert(context.token_counter().count(config.system_prompt) == 10);

    assert(context.add_file("fileA", std::string(24, 'a')));   // 6 tokens
    assert(context.add_file("fileB", std::string(24, 'b')));   // 6 tokens

    BuildResult result = context.build();
    assert((result.included_files == std::vector<std::string>{"fileA"}));
    assert((result.omitted_files == std::vector<std::string>{"fileB"}));
    assert(result.entries[1].content.rfind("User added file 'fileA'. Content:\n\n", 0) == 0);
    assert(result.total_tokens <= 100);

    // A file exactly at the per-file cap fills the file budget and is sent
    context.clear_files();
    assert(context.add_file("full", std::string(40, 'f')));   // 10 tokens
    result = context.build();
    assert((result.included_files == std::vector<std::string>{"full"}));

    std::cout << "File budget with default label passed" << std::endl;
}

void test_invalid_configs() {
    std::cout << "\n=== Invalid configs ===" << std::endl;

    ContextConfig config = small_config();
    config.max_tokens = 0;
    assert(rejects(config));

    config = small_config();
    config.warn_threshold = 0.95;
    assert(rejects(config));

    config = small_config();
    config.max_file_contexts = 0;
    assert(rejects(config));

    config = small_config();
    config.file_budget_fraction = 0.0;
    assert(rejects(config));

    config = small_config();
    config.tokenizer.type = "words";
    assert(rejects(config));

    config = small_config();
    config.tokenizer.type = "bpe";
    assert(rejects(config));

    config = small_config();
    config.system_prompt = std::string(101, 's');
    assert(rejects(config));

    // A system prompt exactly at max_tokens is allowed
    config.system_prompt = std::string(100, 's');
    assert(!rejects(config));

    std::cout << "Invalid configs passed" << std::endl;
}

void test_injected_counter() {
    std::cout << "\n=== Injected counter ===" << std::endl;

    ContextConfig config = small_config();
    config.tokenizer.chars_per_token = 4;
    ContextManager context(config, std::make_shared<HeuristicTokenCounter>(2));
    assert(context.token_counter().name() == "heuristic");

    context.add_user_message("abcd");
    assert(context.usage().total_tokens == 2);

    std::cout << "Injected counter passed" << std::endl;
}

void test_concurrent_access() {
    std::cout << "\n=== Concurrent access ===" << std::endl;

    ContextConfig config = small_config();
    config.max_tokens = 200;
    ContextManager context(config);

    const int iterations = 500;
    std::thread messages([&]() {
        for (int i = 0; i < iterations; i++) {
            context.add_user_message("message " + std::to_string(i));
        }
    });
    std::thread files([&]() {
        for (int i = 0; i < iterations; i++) {
            context.add_file("file" + std::to_string(i % 8), std::string(1 + i % 15, 'f'));
            if (i % 7 == 0) {
                context.remove_file("file" + std::to_string(i % 8));
            }
        }
    });
    std::thread builds([&]() {
        for (int i = 0; i < iterations; i++) {
            BuildResult result = context.build(std::string("pending"));
            assert(result.total_tokens <= 200);
            assert(context.file_count() <= 5);
        }
    });

    messages.join();
    files.join();
    builds.join();

    assert(context.message_count() == static_cast<size_t>(iterations));
    assert(context.file_count() <= 5);
    assert(context.build().total_tokens <= 200);

    std::cout << "Concurrent access passed" << std::endl;
}

void test_state_report() {
    std::cout << "\n=== State report ===" << std::endl;

    ContextManager context(small_config());
    context.add_file("notes.md", "abc");
    context.add_user_message("question");

    nlohmann::json state = context.state_snapshot();
    assert(state["tokenizer"] == "heuristic");
    assert(state["usage"]["total_tokens"] == 11);
    assert(state["usage"]["tier"] == "ok");
    assert(state["messages"]["count"] == 1);
    assert(state["files"].size() == 1);
    assert(state["files"][0]["path"] == "notes.md");
    assert(state["payload"]["entries"] == 3);

    const std::string report = runtime::generate_state_report(state);
    std::cout << report;
    assert(report.find("Tier: ok") != std::string::npos);
    assert(report.find("Pinned Files (1):") != std::string::npos);
    assert(report.find("notes.md (3 tokens)") != std::string::npos);
    assert(report.find("Next Payload:") != std::string::npos);

    std::cout << "State report passed" << std::endl;
}

void test_debug_logging() {
    std::cout << "\n=== Debug logging ===" << std::endl;

    ContextConfig config = small_config();
    config.debug_logging = true;
    ContextManager context(config);
    context.add_user_message("logged");
    context.add_file("big", std::string(20, 'b'));
    context.enable_debug_logging(false);
    context.add_user_message("quiet");
    assert(context.message_count() == 2);

    std::cout << "Debug logging passed" << std::endl;
}

int main() {
    std::cout << "Testing context manager..." << std::endl;

    test_session_flow();
    test_eviction_through_facade();
    test_critical_tier();
    test_default_label_file_budget();
    test_invalid_configs();
    test_injected_counter();
    test_concurrent_access();
    test_state_report();
    test_debug_logging();

    std::cout << "\n=== All context manager tests passed! ===" << std::endl;
    return 0;
}
