// include/ctx/file_context_store.hpp
#pragma once

#include <list>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "ctx/message.hpp"
#include "ctx/token_counter.hpp"

namespace ctx {

struct FileStorePolicy {
    size_t max_file_contexts = 5;
    size_t per_file_token_cap = 800;
    std::string label_format = "User added file '{path}'. Content:\n\n";
};

struct AddFileOutcome {
    bool added = false;
    size_t token_count = 0;
    std::vector<std::string> evicted;   // oldest first
};

// Renders a pinned file the way it appears in a payload
std::string render_file_entry(const std::string& label_format, const std::string& path,
                              const std::string& content);

// Pinned files, oldest first. Paths are unique; re-pinning a path moves it
// to the newest end. When full, the oldest entries are evicted.
class FileContextStore {
public:
    FileContextStore(std::shared_ptr<const TokenCounter> counter, FileStorePolicy policy);

    FileContextStore(const FileContextStore&) = delete;
    FileContextStore& operator=(const FileContextStore&) = delete;

    // False, with no state change, when content exceeds the per-file cap
    bool add(const std::string& path, const std::string& content);
    AddFileOutcome add_with_outcome(const std::string& path, const std::string& content);
    bool remove(const std::string& path);

    const std::list<FileContext>& entries_oldest_first() const { return entries_; }
    const FileContext* find(const std::string& path) const;
    bool contains(const std::string& path) const { return index_.count(path) != 0; }

    size_t total_tokens() const { return total_tokens_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear();

    const FileStorePolicy& policy() const { return policy_; }

private:
    void erase(std::list<FileContext>::iterator it);

    std::shared_ptr<const TokenCounter> counter_;
    FileStorePolicy policy_;
    std::list<FileContext> entries_;
    std::unordered_map<std::string, std::list<FileContext>::iterator> index_;
    size_t total_tokens_ = 0;
};

} // namespace ctx
