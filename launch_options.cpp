#include "launch_options.hpp"

bool parseLaunchOptions(int argc, const char* const* argv,
                        LaunchOptions& out, std::string* err) {
    LaunchOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto takeValue = [&](std::string& dest) {
            if (i + 1 >= argc) {
                if (err) *err = arg + " needs a value";
                return false;
            }
            dest = argv[++i];
            return true;
        };

        if (arg == "--config" || arg == "-c") {
            if (!takeValue(opts.configPath)) return false;
        } else if (arg == "--mappings" || arg == "-m") {
            if (!takeValue(opts.mappingsPath)) return false;
        } else if (arg == "--replay") {
            if (!takeValue(opts.replayPath)) return false;
        } else if (arg == "--stdin") {
            opts.useStdin = true;
        } else if (arg == "--dry-run") {
            opts.dryRun = true;
        } else if (arg == "--check") {
            opts.checkOnly = true;
        } else if (arg == "--list-devices") {
            opts.listDevices = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.showHelp = true;
        } else {
            if (err) *err = "Unknown option: " + arg;
            return false;
        }
    }

    if (opts.useStdin && !opts.replayPath.empty()) {
        if (err) *err = "--stdin and --replay cannot be combined";
        return false;
    }

    out = opts;
    return true;
}

std::string usageText(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "\n"
           "Listens for ATC phrases, maps them onto the configured vocabulary,\n"
           "and speaks the canonical phrase.\n"
           "\n"
           "  -c, --config PATH    configuration file (default: resources/voiceatc_config.json)\n"
           "  -m, --mappings PATH  phrase mappings file (overrides mappings_path)\n"
           "      --stdin          read fragments from standard input, one per line\n"
           "      --replay FILE    read fragments from FILE, one per line\n"
           "      --dry-run        print canonical phrases instead of speaking them\n"
           "      --check          validate configuration and mappings, then exit\n"
           "      --list-devices   list audio devices, then exit\n"
           "  -h, --help           show this help\n";
}
