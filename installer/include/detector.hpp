#pragma once

#include <string>
#include "disk.hpp"
#include "phase.hpp"
#include "system.hpp"

namespace fortress {

struct Detection {
    Phase phase;
    std::string detail;

    bool operator==(const Detection& other) const {
        return phase == other.phase && detail == other.detail;
    }
};

// Classifies live system state into exactly one phase. Read-only: it only
// calls the const queries of System, so it can run any number of times.
class StateDetector {
public:
    StateDetector(const System& sys, const disk::TargetDisk& target,
                  const std::string& mount_point);

    Detection detect() const;

private:
    const System& sys_;
    disk::TargetDisk target_;
    std::string mount_point_;
};

// A populated usr/bin plus an etc directory under the target root
bool base_system_present(const System& sys, const std::string& root);

}  // namespace fortress
