#pragma once

namespace Session {

class SessionLoop;

// SIGINT / SIGTERM routing for a running session.
//
// Call blockStopSignals() on the main thread before any audio library starts
// its threads: they inherit the mask, so stop signals only ever land on the
// thread that owns the session. installStopHandlers() then routes them to
// session->requestStop() and unblocks them on the calling thread. Handlers
// are installed without SA_RESTART, so a read blocked on the terminal
// returns instead of waiting for the next line.
void blockStopSignals();
void installStopHandlers(SessionLoop* session);

// Back to default dispositions. Call before the session is destroyed.
void restoreStopHandlers();

} // namespace Session
