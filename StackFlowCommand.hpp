// StackFlowCommand.hpp
//
// Turning an assembled argument list into something a person can read or a
// shell can run. Neither form changes the arguments themselves.
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace StackFlow {

class CommandError : public std::runtime_error {
public:
    explicit CommandError(const std::string& what) : std::runtime_error(what) {}
};

// Human-readable command line: flags bare, every other token in double quotes.
std::string displayCommand(const std::vector<std::string>& args,
                           const std::string& tool = "ffmpeg",
                           const std::string& outputFile = "output.mp4");

// Quote one token for a POSIX shell
std::string shellQuote(const std::string& token);

// Command line safe to hand to /bin/sh
std::string shellCommand(const std::vector<std::string>& args,
                         const std::string& tool,
                         const std::string& outputFile,
                         bool overwrite = false);

// Run a shell command line and return the tool's exit status.
// Status 127 is the shell's "not found" and raises CommandError; a tool that
// itself exits with 127 is reported the same way.
int runCommand(const std::string& commandLine);

} // namespace StackFlow
