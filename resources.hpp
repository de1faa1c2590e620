#pragma once
#include <filesystem>
#include <string>
#include <vector>

// ------------------------------------------------------------
// Resource folder lookup
// ------------------------------------------------------------
// Candidates, in order:
//  1. $VOICEATC_RESOURCES
//  2. <exe dir>/resources
//  3. <cwd>/../resources   (running from a build directory)   - not in portable mode
//  4. <cwd>/resources                                         - not in portable mode
// The first candidate holding voiceatc_config.json wins; otherwise the first
// that exists; otherwise the exe dir (portable) or the cwd.
std::vector<std::filesystem::path> resourceCandidates();
std::string getResourcePath();

// <resources>/voiceatc_config.json
std::string defaultConfigPath();

// Text of <resources>/<filename>, or "" if it cannot be read.
std::string loadTextResource(const std::string& filename);
