#include "interrupt.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>

namespace {

std::atomic<bool> sig_interrupted(false);

static_assert(std::atomic<bool>::is_always_lock_free);

void signal_handler(int) {
    sig_interrupted.store(true);
}

} // anonymous namespace

void install_interrupt_handler() {
    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);

    for (int signum : {SIGINT, SIGTERM}) {
        if (sigaction(signum, &sa, nullptr) != 0) {
            throw NudlException(string_format("error.signal_handler", std::string(std::strerror(errno))));
        }
    }
}

bool interrupt_requested() {
    return sig_interrupted.load();
}

void reset_interrupt() {
    sig_interrupted.store(false);
}
