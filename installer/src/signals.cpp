#include "signals.hpp"
#include <atomic>
#include <csignal>

namespace fortress {
namespace signals {

namespace {

volatile std::sig_atomic_t received_signal = 0;
std::atomic<bool> cancelled{false};

struct sigaction old_int {};
struct sigaction old_term {};
struct sigaction old_hup {};
bool installed = false;

void on_signal(int sig) {
    received_signal = sig;
    cancelled.store(true);
}

}  // namespace

void install_handlers() {
    if (installed) return;

    struct sigaction sa {};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &old_int);
    sigaction(SIGTERM, &sa, &old_term);
    sigaction(SIGHUP, &sa, &old_hup);
    installed = true;
}

void restore_handlers() {
    if (!installed) return;

    sigaction(SIGINT, &old_int, nullptr);
    sigaction(SIGTERM, &old_term, nullptr);
    sigaction(SIGHUP, &old_hup, nullptr);
    installed = false;
}

bool cancel_requested() {
    return cancelled.load();
}

void request_cancel() {
    cancelled.store(true);
}

void reset() {
    cancelled.store(false);
    received_signal = 0;
}

int last_signal() {
    return static_cast<int>(received_signal);
}

}  // namespace signals
}  // namespace fortress
