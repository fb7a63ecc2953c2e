// src/context/file_context_store.cpp
#include "ctx/file_context_store.hpp"
#include <iterator>
#include <stdexcept>

namespace ctx {

std::string render_file_entry(const std::string& label_format, const std::string& path,
                              const std::string& content) {
    static const std::string placeholder = "{path}";

    std::string label;
    label.reserve(label_format.size() + path.size());
    size_t pos = 0;
    while (true) {
        const size_t found = label_format.find(placeholder, pos);
        if (found == std::string::npos) {
            label.append(label_format, pos, std::string::npos);
            break;
        }
        label.append(label_format, pos, found - pos);
        label += path;
        pos = found + placeholder.size();
    }
    return label + content;
}

FileContextStore::FileContextStore(std::shared_ptr<const TokenCounter> counter, FileStorePolicy policy)
    : counter_(std::move(counter)), policy_(std::move(policy)) {
    if (!counter_) {
        throw std::invalid_argument("FileContextStore requires a token counter");
    }
    if (policy_.max_file_contexts == 0) {
        throw std::invalid_argument("max_file_contexts must be positive");
    }
    if (policy_.per_file_token_cap == 0) {
        throw std::invalid_argument("per_file_token_cap must be positive");
    }
}

bool FileContextStore::add(const std::string& path, const std::string& content) {
    return add_with_outcome(path, content).added;
}

AddFileOutcome FileContextStore::add_with_outcome(const std::string& path, const std::string& content) {
    AddFileOutcome outcome;
    outcome.token_count = counter_->count(content);
    if (outcome.token_count > policy_.per_file_token_cap) {
        return outcome;
    }

    const size_t entry_tokens = counter_->count(render_file_entry(policy_.label_format, path, content));

    if (auto it = index_.find(path); it != index_.end()) {
        erase(it->second);
    }

    entries_.push_back({path, content, outcome.token_count, entry_tokens});
    index_[path] = std::prev(entries_.end());
    total_tokens_ += outcome.token_count;

    while (entries_.size() > policy_.max_file_contexts) {
        outcome.evicted.push_back(entries_.front().path);
        erase(entries_.begin());
    }

    outcome.added = true;
    return outcome;
}

bool FileContextStore::remove(const std::string& path) {
    auto it = index_.find(path);
    if (it == index_.end()) {
        return false;
    }
    erase(it->second);
    return true;
}

const FileContext* FileContextStore::find(const std::string& path) const {
    auto it = index_.find(path);
    return it == index_.end() ? nullptr : &*it->second;
}

void FileContextStore::clear() {
    entries_.clear();
    index_.clear();
    total_tokens_ = 0;
}

void FileContextStore::erase(std::list<FileContext>::iterator it) {
    total_tokens_ -= it->token_count;
    index_.erase(it->path);
    entries_.erase(it);
}

} // namespace ctx
