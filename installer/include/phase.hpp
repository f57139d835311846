#pragma once

#include <optional>
#include <string>

namespace fortress {

// Installation progress, ordered from "nothing exists" to "ready to boot".
// Declaration order is the total order used by rank().
enum class Phase {
    NoDisk,
    NoPartitions,
    NotEncrypted,
    PartialEncrypted,
    VolumesClosed,
    RootOpenHomeClosed,
    NoRootFilesystem,
    NoHomeFilesystem,
    NotMounted,
    PartialMount,
    NoSystem,
    NotConfigured,
    Ready,

    // Never produced by the detector; only recorded in checkpoints
    Error
};

std::string to_string(Phase phase);

std::optional<Phase> phase_from_string(const std::string& name);

// Position in the total order (Error ranks below everything)
int rank(Phase phase);

// No action can make progress from this phase
bool is_fatal(Phase phase);

}  // namespace fortress
