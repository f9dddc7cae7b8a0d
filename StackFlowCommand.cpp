// StackFlowCommand.cpp
#include "StackFlowCommand.hpp"
#include <cstdlib>
#include <fmt/core.h>
#include <sys/wait.h>

namespace StackFlow {

std::string displayCommand(const std::vector<std::string>& args,
                           const std::string& tool,
                           const std::string& outputFile) {
    std::string line = tool;
    for (const auto& a : args) {
        line += ' ';
        if (!a.empty() && a.front() == '-') line += a;
        else line += '"' + a + '"';
    }
    line += " \"" + outputFile + '"';
    return line;
}

std::string shellQuote(const std::string& token) {
    std::string out = "'";
    for (char c : token) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string shellCommand(const std::vector<std::string>& args,
                         const std::string& tool,
                         const std::string& outputFile,
                         bool overwrite) {
    std::string line = shellQuote(tool);
    for (const auto& a : args) {
        line += ' ';
        line += shellQuote(a);
    }
    if (overwrite) line += " -y";
    line += ' ';
    line += shellQuote(outputFile);
    return line;
}

int runCommand(const std::string& commandLine) {
    int status = std::system(commandLine.c_str());
    if (status == -1) {
        throw CommandError("could not start shell for: " + commandLine);
    }
    if (WIFSIGNALED(status)) {
        throw CommandError(fmt::format("command killed by signal {}", WTERMSIG(status)));
    }
    if (!WIFEXITED(status)) {
        throw CommandError("command terminated abnormally");
    }
    // 127 is the shell's "not found"
    if (WEXITSTATUS(status) == 127) {
        throw CommandError("command not found: " + commandLine);
    }
    return WEXITSTATUS(status);
}

} // namespace StackFlow
