#pragma once
#include <string>

namespace Voice {

// Quote for a POSIX shell (or cmd.exe on Windows) so the value is one argument.
std::string shellQuote(const std::string& value);

// Replace every {voice} and {out} in 'pattern' with the shell-quoted values.
// Unknown {placeholders} are left alone.
std::string expandTtsCommand(const std::string& pattern,
                             const std::string& voice,
                             const std::string& outFile);

} // namespace Voice
