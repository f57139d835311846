#include "teardown.hpp"
#include "layout.hpp"
#include "tui.hpp"
#include <algorithm>

namespace fortress {

int TeardownReport::effective_operations() const {
    return static_cast<int>(std::count_if(steps.begin(), steps.end(),
        [](const Step& step) { return step.result == StepResult::Done; }));
}

bool TeardownReport::ok() const {
    return std::none_of(steps.begin(), steps.end(),
        [](const Step& step) { return step.result == StepResult::Failed; });
}

std::string to_string(StepResult result) {
    switch (result) {
        case StepResult::Done:   return "done";
        case StepResult::NoOp:   return "no-op";
        case StepResult::Failed: return "failed";
    }
    return "unknown";
}

TeardownReconciler::TeardownReconciler(System& sys, const disk::TargetDisk& target,
                                       const std::string& mount_point)
    : sys_(sys), target_(target), mount_point_(mount_point) {}

TeardownReport TeardownReconciler::run() {
    TeardownReport report;

    auto add = [&](const std::string& name, StepResult result, const std::string& detail) {
        report.steps.push_back({name, result, detail});
        switch (result) {
            case StepResult::Done:
                tui::print_success(name + (detail.empty() ? "" : ": " + detail));
                break;
            case StepResult::NoOp:
                tui::print_info(name + ": nothing to do");
                break;
            case StepResult::Failed:
                tui::print_warning(name + " failed" + (detail.empty() ? "" : ": " + detail));
                break;
        }
    };

    std::string detail;
    StepResult result = deactivate_swap(&detail);
    add("Deactivate swap", result, detail);

    detail.clear();
    result = unmount_all(&detail);
    add("Unmount " + mount_point_, result, detail);

    detail.clear();
    result = close_volume(layout::kHomeMapping, &detail);
    add(std::string("Close ") + layout::kHomeMapping, result, detail);

    detail.clear();
    result = close_volume(layout::kRootMapping, &detail);
    add(std::string("Close ") + layout::kRootMapping, result, detail);

    return report;
}

StepResult TeardownReconciler::deactivate_swap(std::string* detail) {
    const std::string swap = target_.partition(layout::kSwapIndex);
    if (!sys_.swap_active(swap)) {
        return StepResult::NoOp;
    }
    if (!sys_.swap_off(swap)) {
        if (detail) *detail = "swapoff " + swap;
        return StepResult::Failed;
    }
    if (detail) *detail = swap;
    return StepResult::Done;
}

StepResult TeardownReconciler::unmount_all(std::string* detail) {
    if (sys_.is_mounted(mount_point_)) {
        // Processes left behind by the chroot keep the tree busy
        sys_.kill_users(mount_point_);
        if (!sys_.unmount_recursive(mount_point_)) {
            if (detail) *detail = "mount point is busy";
            return StepResult::Failed;
        }
        if (detail) *detail = "recursive";
        return StepResult::Done;
    }

    // Root is gone but stray mounts below it may remain
    auto plan = layout::mount_plan(target_);
    bool any = false;
    bool failed = false;
    for (auto it = plan.rbegin(); it != plan.rend(); ++it) {
        const std::string path = layout::under(mount_point_, it->target);
        if (!sys_.is_mounted(path)) continue;
        any = true;
        if (!sys_.unmount(path, false)) {
            failed = true;
            if (detail) *detail = "could not unmount " + path;
        }
    }
    if (failed) return StepResult::Failed;
    return any ? StepResult::Done : StepResult::NoOp;
}

StepResult TeardownReconciler::close_volume(const std::string& mapping, std::string* detail) {
    if (!sys_.mapping_exists(mapping)) {
        return StepResult::NoOp;
    }
    if (!sys_.luks_close(mapping)) {
        if (detail) *detail = "cryptsetup close " + mapping;
        return StepResult::Failed;
    }
    return StepResult::Done;
}

}  // namespace fortress
