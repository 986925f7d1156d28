#include "bench/interrupt.hpp"

#include "log/log.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <signal.h>

namespace compbench::bench {

namespace {

volatile std::sig_atomic_t g_interrupted = 0;
std::atomic<pid_t> g_active_pgid{0};

static_assert(std::atomic<pid_t>::is_always_lock_free,
              "the signal handler reads the active process group");

void on_interrupt_signal(int /*signo*/) {
    g_interrupted = 1;
    pid_t pgid = g_active_pgid.load();
    if (pgid > 0) {
        ::kill(-pgid, SIGKILL);
    }
}

} // namespace

void install_interrupt_handlers() {
    struct sigaction action {};
    action.sa_handler = on_interrupt_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0; // no SA_RESTART: blocking calls return EINTR
    for (int signo : {SIGINT, SIGTERM}) {
        if (sigaction(signo, &action, nullptr) != 0) {
            COMPBENCH_LOG_WARN("bench", "Cannot install handler for signal " << signo << ": "
                                                                           << std::strerror(errno));
        }
    }

    // An ignored SIGCHLD inherited across exec makes waitpid() lose exit statuses
    struct sigaction child_default {};
    child_default.sa_handler = SIG_DFL;
    sigemptyset(&child_default.sa_mask);
    if (sigaction(SIGCHLD, &child_default, nullptr) != 0) {
        COMPBENCH_LOG_WARN("bench", "Cannot reset SIGCHLD: " << std::strerror(errno));
    }
}

bool interrupt_requested() {
    return g_interrupted != 0;
}

void request_interrupt() {
    g_interrupted = 1;
}

void reset_interrupt() {
    g_interrupted = 0;
}

void set_active_process_group(pid_t pgid) {
    g_active_pgid.store(pgid);
}

} // namespace compbench::bench
