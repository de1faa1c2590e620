#include "stop_signals.hpp"
#include "session_loop.hpp"
#include "logger.hpp"

#include <atomic>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <string>

#ifndef _WIN32
    #include <pthread.h>
    #include <signal.h>
#endif

namespace Session {

static std::atomic<SessionLoop*> g_activeSession{nullptr};

static void handleStopSignal(int) {
    if (SessionLoop* session = g_activeSession.load()) {
        session->requestStop();
    }
}

#ifndef _WIN32
static sigset_t stopSignalSet() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
}

static void setDisposition(int sig, void (*handler)(int)) {
    struct sigaction sa {};
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (sigaction(sig, &sa, nullptr) != 0) {
        LOG_WARN("Signals", "sigaction(" + std::to_string(sig) + ") failed: " + std::strerror(errno));
    }
}

static void setStopMask(int how) {
    sigset_t set = stopSignalSet();
    int rc = pthread_sigmask(how, &set, nullptr);
    if (rc != 0) {
        LOG_WARN("Signals", std::string("pthread_sigmask failed: ") + std::strerror(rc));
    }
}

void blockStopSignals() {
    setStopMask(SIG_BLOCK);
}

void installStopHandlers(SessionLoop* session) {
    g_activeSession.store(session);
    setDisposition(SIGINT, handleStopSignal);
    setDisposition(SIGTERM, handleStopSignal);
    // A TTS command that exits early must not kill us mid-write
    setDisposition(SIGPIPE, SIG_IGN);

    setStopMask(SIG_UNBLOCK);
}

void restoreStopHandlers() {
    setDisposition(SIGINT, SIG_DFL);
    setDisposition(SIGTERM, SIG_DFL);
    g_activeSession.store(nullptr);
}
#else
void blockStopSignals() {}

void installStopHandlers(SessionLoop* session) {
    g_activeSession.store(session);
    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);
}

void restoreStopHandlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_activeSession.store(nullptr);
}
#endif

} // namespace Session
