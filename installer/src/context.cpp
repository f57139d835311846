#include "context.hpp"
#include "signals.hpp"
#include "tui.hpp"
#include <algorithm>
#include <exception>

namespace fortress {

RunContext::RunContext() : cancel_query_(signals::cancel_requested) {}

RunContext::RunContext(CancelQuery cancel_query) : cancel_query_(std::move(cancel_query)) {}

RunContext::~RunContext() {
    if (!armed_ || releases_.empty()) return;
    try {
        tui::print_info("Releasing resources held by this run...");
        release_all();
    } catch (const std::exception& e) {
        tui::print_error(std::string("Release failed: ") + e.what());
    }
}

void RunContext::hold(const std::string& name, Release release, int stage) {
    if (holds(name)) return;
    releases_.push_back({name, std::move(release), stage});
}

bool RunContext::holds(const std::string& name) const {
    return std::any_of(releases_.begin(), releases_.end(),
                       [&](const Entry& entry) { return entry.name == name; });
}

std::vector<std::string> RunContext::held() const {
    std::vector<std::string> names;
    for (const auto& entry : releases_) {
        names.push_back(entry.name);
    }
    return names;
}

int RunContext::release_all() {
    std::stable_sort(releases_.begin(), releases_.end(),
                     [](const Entry& a, const Entry& b) { return a.stage < b.stage; });
    int failures = 0;
    while (!releases_.empty()) {
        Entry entry = std::move(releases_.back());
        releases_.pop_back();
        if (!entry.release()) {
            tui::print_warning("Could not release " + entry.name);
            ++failures;
        }
    }
    return failures;
}

void RunContext::disarm() {
    armed_ = false;
}

bool RunContext::cancelled() const {
    return cancel_query_ && cancel_query_();
}

}  // namespace fortress
