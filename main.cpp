// main.cpp
//
// StackFlow command-line front end. Parses CLI (CLI11), loads a composition
// (JSON scene file or built-in demo), compiles it and either prints the ffmpeg
// command line / arguments / JSON description or runs the tool.
#include "StackFlowCommand.hpp"
#include "StackFlowCore.hpp"
#include "StackFlowDemos.hpp"
#include "StackFlowScene.hpp"
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <cstdio>
#include <exception>
#include <string>

int main(int argc, char** argv) {
    std::string scenePath;
    std::string demoName;
    bool listDemos = false;
    std::string tool = "ffmpeg";
    std::string outputFile = "output.mp4";
    std::string emit = "command";     // command | args | json
    bool dumpScene = false;
    bool run = false;
    bool overwrite = false;
    bool verbose = false;
    CLI::App app{"StackFlow: compile stacked video compositions to ffmpeg filter graphs"};
    try {
        auto sceneOpt = app.add_option("--scene", scenePath, "Path to scene JSON file");
        app.add_option("--demo", demoName, "Built-in demo scene (see --list-demos)")->excludes(sceneOpt);
        app.add_flag("--list-demos", listDemos, "List built-in demo scenes");
        app.add_option("--tool", tool, "Media tool executable");
        app.add_option("-o,--output", outputFile, "Output media file");
        app.add_option("--emit", emit, "What to print: command|args|json")
            ->check(CLI::IsMember({"command", "args", "json"}));
        app.add_flag("--dump-scene", dumpScene, "Print the loaded scene as JSON and exit");
        app.add_flag("--run", run, "Run the tool with the compiled arguments");
        app.add_flag("-y,--overwrite", overwrite, "Let the tool overwrite the output file");
        app.add_flag("-v,--verbose", verbose, "Print [DEBUG] diagnostics to stderr");
        app.allow_extras(false);
        app.set_config("--config", "", "Read options from an INI/TOML file");
        app.set_help_all_flag("--help-all", "Show all help");
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    auto debug = [&](const std::string& msg) {
        if (verbose) fmt::print(stderr, "[DEBUG] {}\n", msg);
    };

    if (listDemos) {
        for (const auto& name : StackFlow::demos::demoSceneNames()) fmt::print("{}\n", name);
        return 0;
    }

    try {
        StackFlow::CompositionNode scene;
        if (!scenePath.empty()) {
            debug(fmt::format("loading scene '{}'", scenePath));
            scene = StackFlow::loadSceneFromFile(scenePath);
        } else {
            if (demoName.empty()) demoName = "main-movie";
            debug(fmt::format("using demo scene '{}'", demoName));
            scene = StackFlow::demos::demoScene(demoName);
        }

        if (dumpScene) {
            fmt::print("{}\n", StackFlow::sceneToJson(scene).dump(2));
            return 0;
        }

        StackFlow::CompiledGraph graph = StackFlow::compile(scene);
        debug(fmt::format("compiled {} inputs, {} filters, output [{}]",
                          graph.inputs.size(), graph.filters.size(), graph.output.str()));
        for (const auto& f : graph.filters) debug("filter " + f);
        const auto args = StackFlow::assemble(graph);

        if (run) {
            const std::string line = StackFlow::shellCommand(args, tool, outputFile, overwrite);
            debug("executing: " + line);
            int status = StackFlow::runCommand(line);
            debug(fmt::format("{} exited with status {}", tool, status));
            return status;
        }

        if (emit == "args") {
            for (const auto& a : args) fmt::print("{}\n", a);
        } else if (emit == "json") {
            nlohmann::json out;
            out["inputs"] = graph.inputs;
            out["filters"] = graph.filters;
            out["output"] = graph.output.str();
            out["args"] = args;
            fmt::print("{}\n", out.dump(2));
        } else {
            fmt::print("{}\n", StackFlow::displayCommand(args, tool, outputFile));
        }
    } catch (const std::exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
    return 0;
}
