#include "tui.hpp"
#include <cctype>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iomanip>

namespace fortress {
namespace tui {

namespace {

std::ofstream log_stream;

void log_line(const char* level, const std::string& msg) {
    if (!log_stream.is_open()) return;

    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    log_stream << "[" << std::put_time(&local, "%H:%M:%S") << "] [" << level << "] "
               << msg << std::endl;
}

}  // namespace

bool open_log(const std::string& path) {
    close_log();
    log_stream.open(path, std::ios::app);
    return log_stream.is_open();
}

void close_log() {
    if (log_stream.is_open()) {
        log_stream.close();
    }
}

void print_banner() {
    std::cout << colors::CYAN << R"(
    ╔══════════════════════════════════════════════════════════╗
    ║)" << colors::BOLD << "            Fortress Installer v1.0" << colors::RESET << colors::CYAN << R"(                   ║
    ║      Void Linux full-disk-encrypted installation         ║
    ╚══════════════════════════════════════════════════════════╝
)" << colors::RESET << std::endl;
}

void print_info(const std::string& msg) {
    std::cout << colors::BLUE << "[*] " << colors::RESET << msg << std::endl;
    log_line("INFO", msg);
}

void print_success(const std::string& msg) {
    std::cout << colors::GREEN << "[✓] " << colors::RESET << msg << std::endl;
    log_line("SUCCESS", msg);
}

void print_error(const std::string& msg) {
    std::cout << colors::RED << "[✗] " << colors::RESET << msg << std::endl;
    log_line("ERROR", msg);
}

void print_warning(const std::string& msg) {
    std::cout << colors::YELLOW << "[!] " << colors::RESET << msg << std::endl;
    log_line("WARN", msg);
}

void print_step(int step, int total, const std::string& msg) {
    std::cout << colors::MAGENTA << "[" << step << "/" << total << "] "
              << colors::RESET << msg << std::endl;
    log_line("STEP", std::to_string(step) + "/" + std::to_string(total) + " " + msg);
}

void clear_screen() {
    std::cout << "\033[2J\033[H";
}

void draw_box(const std::string& title, const std::vector<std::string>& lines) {
    const int width = 60;

    // Top border
    std::cout << colors::CYAN << "╔";
    for (int i = 0; i < width - 2; ++i) std::cout << "═";
    std::cout << "╗" << colors::RESET << std::endl;

    // Title
    std::cout << colors::CYAN << "║ " << colors::BOLD << std::left
              << std::setw(width - 4) << title << colors::RESET
              << colors::CYAN << " ║" << colors::RESET << std::endl;

    // Separator
    std::cout << colors::CYAN << "╠";
    for (int i = 0; i < width - 2; ++i) std::cout << "═";
    std::cout << "╣" << colors::RESET << std::endl;

    for (const auto& line : lines) {
        std::cout << colors::CYAN << "║ " << colors::RESET
                  << std::left << std::setw(width - 4) << line
                  << colors::CYAN << " ║" << colors::RESET << std::endl;
    }

    // Bottom border
    std::cout << colors::CYAN << "╚";
    for (int i = 0; i < width - 2; ++i) std::cout << "═";
    std::cout << "╝" << colors::RESET << std::endl;
}

bool confirm(const std::string& question, bool default_yes) {
    std::cout << std::endl;
    std::cout << colors::YELLOW << question << colors::RESET;
    if (default_yes) {
        std::cout << " [Y/n]: ";
    } else {
        std::cout << " [y/N]: ";
    }

    std::string input_str;
    if (!std::getline(std::cin, input_str) || input_str.empty()) {
        return default_yes;
    }

    char c = static_cast<char>(std::tolower(static_cast<unsigned char>(input_str[0])));
    return (c == 'y');
}

bool confirm_typed(const std::string& warning, const std::string& word) {
    print_warning(warning);
    std::cout << "Type '" << word << "' to continue: ";

    std::string input_str;
    if (!std::getline(std::cin, input_str)) {
        return false;
    }
    return input_str == word;
}

std::string input(const std::string& prompt, const std::string& default_value) {
    std::cout << prompt;
    if (!default_value.empty()) {
        std::cout << " [" << default_value << "]";
    }
    std::cout << ": ";

    std::string input_str;
    if (!std::getline(std::cin, input_str) || input_str.empty()) {
        return default_value;
    }
    return input_str;
}

std::optional<DiskInfo> select_disk(const std::vector<DiskInfo>& disks) {
    if (disks.empty()) {
        print_error("No disks found!");
        return std::nullopt;
    }

    std::cout << std::endl;
    std::cout << colors::BOLD << "Select installation disk:" << colors::RESET << std::endl;
    std::cout << std::string(60, '-') << std::endl;

    for (size_t i = 0; i < disks.size(); ++i) {
        std::cout << "  " << colors::CYAN << "[" << (i + 1) << "]"
                  << colors::RESET << " " << disks[i].device
                  << " - " << disks[i].size
                  << " (" << disks[i].model << ")" << std::endl;
    }

    std::cout << "  " << colors::RED << "[0]" << colors::RESET << " Cancel" << std::endl;
    std::cout << std::endl;
    std::cout << "Enter selection: ";

    std::string input_str;
    std::getline(std::cin, input_str);

    try {
        int selection = std::stoi(input_str);
        if (selection == 0) {
            return std::nullopt;
        }
        if (selection > 0 && selection <= static_cast<int>(disks.size())) {
            return disks[selection - 1];
        }
    } catch (const std::exception&) {
        // not a number, falls through to the error below
    }

    print_error("Invalid selection");
    return std::nullopt;
}

}  // namespace tui
}  // namespace fortress
