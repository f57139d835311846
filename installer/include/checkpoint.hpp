#pragma once

#include <cstdint>
#include <string>
#include <optional>
#include "phase.hpp"

namespace fortress {

struct Checkpoint {
    Phase phase = Phase::NoDisk;
    int64_t timestamp = 0;       // seconds since the epoch
    std::string disk;
    std::string detail;
};

// Advisory record of the last known phase. Written as a small TOML table;
// each save replaces the previous record. Nothing reads it to decide what
// to do next, the detector is always re-run instead.
class CheckpointStore {
public:
    explicit CheckpointStore(std::string path);

    bool save(const Checkpoint& checkpoint);

    // save() with the current time
    bool record(Phase phase, const std::string& disk, const std::string& detail);

    // nullopt when missing or unreadable
    std::optional<Checkpoint> load() const;

    const std::string& path() const { return path_; }

    std::string get_error() const { return error_message_; }

private:
    std::string path_;
    std::string error_message_;
};

}  // namespace fortress
