#include "bootstrap.hpp"
#include "launch_options.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "device_setups/audio_devices.hpp"
#include "session/diagnostics.hpp"
#include "session/session_loop.hpp"
#include "session/stop_signals.hpp"

#include <iostream>

// ---------------- Fatal exit ----------------
static int exitWith(const StageResult& r) {
    LogRecord stage = lastPhase();
    std::cerr << "[VoiceATC] " << errorKindName(r.kind) << ": "
              << ErrorManager::describe(r) << std::endl;
    if (!stage.message.empty() && !stage.success) {
        std::cerr << "[VoiceATC] Failed during: " << stage.message << std::endl;
    }
    LOG_PHASE("Exit on " + std::string(errorKindName(r.kind)), false);
    shutdownLogger();
    return exitCodeFor(r.kind);
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    LaunchOptions opts;
    std::string err;
    if (!parseLaunchOptions(argc, argv, opts, &err)) {
        std::cerr << err << "\n\n" << usageText(argv[0]);
        return 2;
    }
    if (opts.showHelp) {
        std::cout << usageText(argv[0]);
        return 0;
    }
    if (opts.listDevices) {
        return printAudioDevices(std::cout);
    }

    // Before PortAudio / SFML start threads, so they inherit the mask
    Session::blockStopSignals();
    LOG_PHASE("Startup begin", true);

    Runtime runtime;
    StageResult r = runBootstrapChecks(opts, runtime);
    if (!r) {
        return exitWith(r);
    }

    if (opts.checkOnly) {
        std::cout << "Configuration OK: " << runtime.config.configPath.string() << "\n"
                  << "Mappings OK: " << runtime.table->size() << " phrases from "
                  << runtime.config.mappingsPath.string() << std::endl;
        shutdownLogger();
        return 0;
    }

    Session::LogDiagnostics diagnostics(runtime.config.auditLogPath.string());
    Session::SessionSummary summary;
    {
        Session::SessionLoop session(runtime.table,
                                     std::move(runtime.recognizer),
                                     std::move(runtime.synthesizer),
                                     diagnostics);

        Session::installStopHandlers(&session);

        LOG_PHASE("Startup complete, entering session", true);
        summary = session.run();

        Session::restoreStopHandlers();
    }

    if (!summary.result) {
        return exitWith(summary.result);
    }

    LOG_PHASE("Shutdown complete", true);
    shutdownLogger();
    return 0;
}
