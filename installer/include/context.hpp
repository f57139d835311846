#pragma once

#include <functional>
#include <string>
#include <vector>

namespace fortress {

// Scoped guard over the resources a run opens or adopts (mappings, mounts,
// swap). Release callbacks run from release_all() or from the destructor
// while the guard is armed: highest stage first, newest first within a stage.
class RunContext {
public:
    using Release = std::function<bool()>;
    using CancelQuery = std::function<bool()>;

    RunContext();
    explicit RunContext(CancelQuery cancel_query);
    ~RunContext();

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    // Register a release for a named resource; a name is held at most once.
    // A resource built on top of another takes a higher stage.
    void hold(const std::string& name, Release release, int stage = 0);
    bool holds(const std::string& name) const;
    std::vector<std::string> held() const;

    // Returns the number of releases that failed
    int release_all();

    // Keep the resources when the context goes away
    void disarm();
    bool armed() const { return armed_; }

    bool cancelled() const;

private:
    struct Entry {
        std::string name;
        Release release;
        int stage;
    };

    std::vector<Entry> releases_;
    CancelQuery cancel_query_;
    bool armed_ = true;
};

}  // namespace fortress
