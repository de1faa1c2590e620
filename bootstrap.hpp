#pragma once
#include <memory>

#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "launch_options.hpp"
#include "phrases/phrase_map.hpp"
#include "voice/recognizer.hpp"
#include "voice/synthesizer.hpp"

// Everything a session needs, acquired by runBootstrapChecks()
struct Runtime {
    AppConfig config;
    Phrases::MappingTablePtr table;
    std::unique_ptr<Voice::Recognizer> recognizer;
    std::unique_ptr<Voice::Synthesizer> synthesizer;
};

// Staged startup: config -> logger -> error catalog -> mappings ->
// resources -> recognizer -> synthesizer. Stops at the first failed stage.
// With --check, stops after the mappings and resources are validated.
StageResult runBootstrapChecks(const LaunchOptions& opts, Runtime& out);
