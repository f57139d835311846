#pragma once

#include <string>
#include <vector>
#include "disk.hpp"
#include "system.hpp"

namespace fortress {

enum class StepResult {
    Done,
    NoOp,
    Failed
};

struct TeardownReport {
    struct Step {
        std::string name;
        StepResult result;
        std::string detail;
    };

    std::vector<Step> steps;

    int effective_operations() const;
    bool ok() const;
};

// Releases swap, mounts and encrypted mappings in reverse dependency order.
// Every step checks before acting, so it can start from any state and may
// be repeated.
class TeardownReconciler {
public:
    TeardownReconciler(System& sys, const disk::TargetDisk& target,
                       const std::string& mount_point);

    TeardownReport run();

    // Individual steps, shared with the run context's release callbacks
    StepResult deactivate_swap(std::string* detail = nullptr);
    StepResult unmount_all(std::string* detail = nullptr);
    StepResult close_volume(const std::string& mapping, std::string* detail = nullptr);

private:
    System& sys_;
    disk::TargetDisk target_;
    std::string mount_point_;
};

std::string to_string(StepResult result);

}  // namespace fortress
