// src/payload_demo.cpp
#include "ctx/config_manager.hpp"
#include "ctx/context_manager.hpp"
#include "ctx/runtime/state_utils.hpp"
#include "ctx/tokenizer/bpe_tokenizer.hpp"
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " [--config <file.json>] [--debug] [file ...] < transcript\n"
              << "  " << argv0 << " --train-vocab <corpus.txt> <vocab.bin> [vocab_size]\n\n"
              << "Transcript lines are '<role>: <text>' (system, user, assistant, tool).\n"
              << "A final line '> <text>' is sent as the pending user message.\n";
}

bool read_file(const std::string& path, std::string& content) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    content = buffer.str();
    return true;
}

int train_vocabulary(const std::string& corpus_path, const std::string& vocab_path, size_t vocab_size) {
    std::ifstream in(corpus_path);
    if (!in.is_open()) {
        std::cerr << "Cannot open corpus: " << corpus_path << "\n";
        return 1;
    }

    std::vector<std::string> corpus;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            corpus.push_back(line);
        }
    }

    ctx::BPETokenizer tokenizer;
    tokenizer.train(corpus, vocab_size);
    if (!tokenizer.save(vocab_path)) {
        std::cerr << "Cannot write vocabulary: " << vocab_path << "\n";
        return 1;
    }
    std::cout << "Trained " << tokenizer.merge_count() << " merges, vocabulary size "
              << tokenizer.vocab_size() << " -> " << vocab_path << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        if (!args.empty() && args[0] == "--train-vocab") {
            if (args.size() < 3) {
                print_usage(argv[0]);
                return 2;
            }
            const size_t vocab_size = args.size() > 3 ? std::stoul(args[3]) : 1000;
            return train_vocabulary(args[1], args[2], vocab_size);
        }

        ctx::ConfigManager config_manager;
        bool debug = false;
        std::vector<std::string> files;

        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--config" && i + 1 < args.size()) {
                config_manager.set_config_path(args[++i]);
                if (!config_manager.load_config()) {
                    std::cerr << "Config file not found, using defaults: " << config_manager.get_config_path() << "\n";
                }
            } else if (args[i] == "--debug") {
                debug = true;
            } else if (args[i] == "--help" || args[i] == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                files.push_back(args[i]);
            }
        }

        ctx::ContextManager context(config_manager.get_config());
        context.enable_debug_logging(debug);

        for (const auto& path : files) {
            std::string content;
            if (!read_file(path, content)) {
                std::cerr << "Cannot read file: " << path << "\n";
                continue;
            }
            if (!context.add_file(path, content)) {
                std::cerr << "File too large for context: " << path << "\n";
            }
        }

        std::optional<std::string> pending;
        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.empty()) {
                continue;
            }
            if (line.rfind("> ", 0) == 0) {
                pending = line.substr(2);
                continue;
            }
            const auto colon = line.find(':');
            const std::string prefix = colon == std::string::npos ? "" : line.substr(0, colon);
            if (prefix != "system" && prefix != "user" && prefix != "assistant" && prefix != "tool") {
                context.add_user_message(line);
                continue;
            }
            std::string text = line.substr(colon + 1);
            if (!text.empty() && text[0] == ' ') {
                text.erase(0, 1);
            }
            context.append_message(ctx::string_to_role(prefix), text);
        }

        const ctx::BuildResult result = context.build(pending);
        std::cout << ctx::payload_to_json(result.entries).dump(2) << "\n\n";
        if (result.extra_user_requested && !result.extra_user_included) {
            std::cerr << "Warning: pending message does not fit in the remaining budget\n";
        }
        std::cout << ctx::runtime::generate_state_report(context.state_snapshot());

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
