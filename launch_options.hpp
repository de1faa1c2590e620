#pragma once
#include <string>

// Command line for the voiceatc executable
struct LaunchOptions {
    std::string configPath;       // empty = <resources>/voiceatc_config.json
    std::string mappingsPath;     // overrides mappings_path from the config
    std::string replayPath;       // fragments from a text file, one per line
    bool useStdin = false;        // fragments typed on stdin
    bool dryRun = false;          // print phrases instead of speaking them
    bool checkOnly = false;       // validate config + mappings, then exit
    bool listDevices = false;
    bool showHelp = false;

    // Console and replay input never touch the microphone or the model
    bool needsMicrophone() const { return !useStdin && replayPath.empty(); }
};

// Returns false with a message in 'err' on unknown or incomplete options.
bool parseLaunchOptions(int argc, const char* const* argv,
                        LaunchOptions& out, std::string* err = nullptr);

std::string usageText(const std::string& program);
