// tests/test_file_context_store.cpp
#include "ctx/file_context_store.hpp"
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ctx;

namespace {

std::shared_ptr<const TokenCounter> byte_counter() {
    return std::make_shared<HeuristicTokenCounter>(1);
}

FileStorePolicy policy(size_t max_files, size_t cap) {
    FileStorePolicy p;
    p.max_file_contexts = max_files;
    p.per_file_token_cap = cap;
    return p;
}

std::vector<std::string> paths_of(const FileContextStore& store) {
    std::vector<std::string> paths;
    for (const auto& file : store.entries_oldest_first()) {
        paths.push_back(file.path);
    }
    return paths;
}

} // namespace

void test_oversized_file_rejected() {
    std::cout << "=== Oversized file ===" << std::endl;

    // max_tokens=1000 gives a per-file cap of 100
    FileContextStore store(byte_counter(), policy(5, 100));
    assert(!store.add("a.py", std::string(150, 'a')));
    assert(store.empty());
    assert(store.total_tokens() == 0);

    // Exactly at the cap is accepted
    assert(store.add("b.py", std::string(100, 'b')));
    assert(store.size() == 1);

    std::cout << "Oversized file passed" << std::endl;
}

void test_eviction_keeps_newest() {
    std::cout << "\n=== Eviction ===" << std::endl;

    FileContextStore store(byte_counter(), policy(5, 100));
    for (int i = 1; i <= 5; i++) {
        assert(store.add("f" + std::to_string(i), "content"));
    }
    AddFileOutcome outcome = store.add_with_outcome("f6", "content");
    assert(outcome.added);
    assert((outcome.evicted == std::vector<std::string>{"f1"}));

    assert((paths_of(store) == std::vector<std::string>{"f2", "f3", "f4", "f5", "f6"}));
    assert(!store.contains("f1"));
    assert(store.find("f1") == nullptr);
    assert(store.total_tokens() == 35);

    std::cout << "Eviction passed" << std::endl;
}

void test_readd_moves_to_newest() {
    std::cout << "\n=== Re-pinning ===" << std::endl;

    FileContextStore store(byte_counter(), policy(3, 100));
    store.add("a", "aaaa");
    store.add("b", "bb");
    store.add("c", "c");

    // Re-adding replaces content and refreshes recency
    assert(store.add("a", "AAAAAAAA"));
    assert((paths_of(store) == std::vector<std::string>{"b", "c", "a"}));
    assert(store.size() == 3);
    assert(store.find("a")->content == "AAAAAAAA");
    assert(store.find("a")->token_count == 8);
    assert(store.total_tokens() == 11);

    // "b" is now the oldest and goes first
    AddFileOutcome outcome = store.add_with_outcome("d", "d");
    assert((outcome.evicted == std::vector<std::string>{"b"}));
    assert((paths_of(store) == std::vector<std::string>{"c", "a", "d"}));

    std::cout << "Re-pinning passed" << std::endl;
}

void test_oversized_readd_keeps_previous_entry() {
    std::cout << "\n=== Oversized re-pin ===" << std::endl;

    FileContextStore store(byte_counter(), policy(3, 10));
    store.add("a", "small");
    store.add("b", "tiny");

    AddFileOutcome outcome = store.add_with_outcome("a", std::string(11, 'x'));
    assert(!outcome.added);
    assert(outcome.token_count == 11);
    assert(outcome.evicted.empty());
    assert((paths_of(store) == std::vector<std::string>{"a", "b"}));
    assert(store.find("a")->content == "small");
    assert(store.total_tokens() == 9);

    std::cout << "Oversized re-pin passed" << std::endl;
}

void test_remove_and_clear() {
    std::cout << "\n=== Remove ===" << std::endl;

    FileContextStore store(byte_counter(), policy(5, 100));
    store.add("a", "123");
    store.add("b", "45");
    assert(store.remove("a"));
    assert(!store.remove("a"));
    assert((paths_of(store) == std::vector<std::string>{"b"}));
    assert(store.total_tokens() == 2);

    store.clear();
    assert(store.empty());
    assert(store.total_tokens() == 0);
    assert(!store.contains("b"));

    std::cout << "Remove passed" << std::endl;
}

void test_rendered_entry_cost() {
    std::cout << "\n=== Rendered entry ===" << std::endl;

    FileStorePolicy p = policy(5, 100);
    p.label_format = "[{path}] ";
    FileContextStore store(byte_counter(), p);
    store.add("x.cpp", "int x;");

    const FileContext* file = store.find("x.cpp");
    assert(file != nullptr);
    assert(file->token_count == 6);
    assert(render_file_entry(p.label_format, "x.cpp", "int x;") == "[x.cpp] int x;");
    assert(file->entry_token_count == 14);

    // The cap applies to content, not to the label
    assert(store.add("y.cpp", std::string(100, 'y')));

    assert(render_file_entry("", "p", "body") == "body");
    assert(render_file_entry("{path}/{path}: ", "p", "") == "p/p: ");
    assert(render_file_entry("User added file '{path}'. Content:\n\n", "a.py", "x") ==
           "User added file 'a.py'. Content:\n\nx");

    std::cout << "Rendered entry passed" << std::endl;
}

void test_invalid_policy() {
    std::cout << "\n=== Invalid policy ===" << std::endl;

    bool threw = false;
    try {
        FileContextStore store(byte_counter(), policy(0, 100));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        FileContextStore store(byte_counter(), policy(5, 0));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "Invalid policy passed" << std::endl;
}

int main() {
    std::cout << "Testing file context store..." << std::endl;

    test_oversized_file_rejected();
    test_eviction_keeps_newest();
    test_readd_moves_to_newest();
    test_oversized_readd_keeps_previous_entry();
    test_remove_and_clear();
    test_rendered_entry_cost();
    test_invalid_policy();

    std::cout << "\n=== All file context store tests passed! ===" << std::endl;
    return 0;
}
