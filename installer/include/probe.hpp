#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "config.hpp"
#include "system.hpp"

namespace fortress {

enum class CheckStatus {
    Pass,
    Warn,
    Fail
};

struct Check {
    std::string name;
    CheckStatus status;
    std::string detail;
};

// Facts gathered once before anything destructive runs
struct Environment {
    bool root = false;
    bool uefi = false;
    bool musl = false;
    bool live = false;
    std::string arch;
    std::string kernel;
    uint64_t memory_kib = 0;     // 0 when unknown
    std::string repository;      // follows the libc of the host

    std::string libc() const { return musl ? "musl" : "glibc"; }
};

struct CapabilityReport {
    std::vector<Check> checks;
    Environment environment;

    // False when any check failed
    bool ok() const;
    std::vector<Check> failures() const;
};

// Tools every run needs
const std::vector<std::string>& required_tools();

CapabilityReport probe(const System& sys, const Config& config);

// Draw the report as a box and return ok()
bool print_report(const CapabilityReport& report);

std::string to_string(CheckStatus status);

}  // namespace fortress
