#pragma once

#include <string>
#include <vector>
#include <optional>

namespace fortress {
namespace tui {

// ANSI color codes
namespace colors {
    constexpr const char* RESET   = "\033[0m";
    constexpr const char* BOLD    = "\033[1m";
    constexpr const char* RED     = "\033[31m";
    constexpr const char* GREEN   = "\033[32m";
    constexpr const char* YELLOW  = "\033[33m";
    constexpr const char* BLUE    = "\033[34m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN    = "\033[36m";
}

// Mirror every printed message into a log file. Returns false if the file
// cannot be opened; printing keeps working either way.
bool open_log(const std::string& path);
void close_log();

// Display banner
void print_banner();

// Print colored messages
void print_info(const std::string& msg);
void print_success(const std::string& msg);
void print_error(const std::string& msg);
void print_warning(const std::string& msg);
void print_step(int step, int total, const std::string& msg);

// Clear screen
void clear_screen();

// Draw a box around text
void draw_box(const std::string& title, const std::vector<std::string>& lines);

// Yes/No prompt
bool confirm(const std::string& question, bool default_yes = true);

// Destructive confirmation: the operator must type the exact word
bool confirm_typed(const std::string& warning, const std::string& word = "YES");

// Text input
std::string input(const std::string& prompt, const std::string& default_value = "");

struct DiskInfo {
    std::string device;     // /dev/sda
    std::string model;      // Samsung SSD
    std::string size;       // 500G
    std::string type;       // disk
};

std::optional<DiskInfo> select_disk(const std::vector<DiskInfo>& disks);

}  // namespace tui
}  // namespace fortress
