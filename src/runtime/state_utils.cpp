// src/runtime/state_utils.cpp
#include "ctx/runtime/state_utils.hpp"
#include <iomanip>
#include <sstream>

namespace ctx::runtime {

std::string generate_state_report(const nlohmann::json& state) {
    std::ostringstream report;

    report << "=== Context State Report ===\n\n";

    if (state.contains("usage")) {
        const auto& usage = state["usage"];
        report << "Usage:\n";
        report << "  Total Tokens: " << usage.value("total_tokens", size_t(0));
        if (state.contains("config")) {
            report << " / " << state["config"].value("max_tokens", size_t(0));
        }
        report << "\n";
        report << "  Ratio: " << std::fixed << std::setprecision(1)
               << usage.value("ratio", 0.0) * 100.0 << "%\n";
        report << "  Tier: " << usage.value("tier", "unknown") << "\n";
        report << "  Tokenizer: " << state.value("tokenizer", "unknown") << "\n\n";
    }

    if (state.contains("messages")) {
        const auto& messages = state["messages"];
        report << "Conversation:\n";
        report << "  Messages: " << messages.value("count", size_t(0)) << "\n";
        report << "  Tokens: " << messages.value("tokens", size_t(0)) << "\n\n";
    }

    if (state.contains("files")) {
        const auto& files = state["files"];
        report << "Pinned Files (" << files.size() << "):\n";
        for (const auto& file : files) {
            report << "  " << file.value("path", "?") << " (" << file.value("tokens", size_t(0)) << " tokens)\n";
        }
        report << "\n";
    }

    if (state.contains("payload")) {
        const auto& payload = state["payload"];
        report << "Next Payload:\n";
        report << "  Entries: " << payload.value("entries", size_t(0)) << "\n";
        report << "  Tokens: " << payload.value("total_tokens", size_t(0)) << "\n";
        report << "  File Budget: " << payload.value("file_budget", size_t(0)) << "\n";
        report << "  Messages Included: " << payload.value("messages_included", size_t(0))
               << ", omitted: " << payload.value("messages_omitted", size_t(0)) << "\n";
        if (payload.contains("omitted_files") && !payload["omitted_files"].empty()) {
            report << "  Files Omitted:";
            for (const auto& path : payload["omitted_files"]) {
                report << " " << path.get<std::string>();
            }
            report << "\n";
        }
        report << "\n";
    }

    return report.str();
}

} // namespace ctx::runtime
