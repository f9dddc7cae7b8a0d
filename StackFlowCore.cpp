// StackFlowCore.cpp
//
// Implements the graph compiler (tree -> inputs, filter expressions, output
// stream) and the argument assembler producing the ffmpeg command line.
#include "StackFlowCore.hpp"
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <type_traits>

namespace StackFlow {

std::string formatCoordinate(const Coordinate& c) {
    return std::visit([](auto v) { return fmt::format("{}", v); }, c);
}

std::string StreamRef::str() const {
    if (kind == Kind::Input) return std::to_string(index);
    return "s" + std::to_string(index);
}

CompiledGraph GraphCompiler::compile(const CompositionNode& root) {
    inputs.clear();
    filters.clear();
    streamCounter = 0;

    StreamRef output = visit(root);

    CompiledGraph graph;
    graph.inputs = std::move(inputs);
    graph.filters = std::move(filters);
    graph.output = output;
    inputs.clear();
    filters.clear();
    return graph;
}

StreamRef GraphCompiler::visit(const CompositionNode& node) {
    return std::visit([&](const auto& c) -> StreamRef {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Resource>) {
            return visitResource(c);
        } else if constexpr (std::is_same_v<T, HStack>) {
            return visitLinearStack(c.children, "hstack");
        } else if constexpr (std::is_same_v<T, VStack>) {
            return visitLinearStack(c.children, "vstack");
        } else {
            return visitZStack(c);
        }
    }, node.contents);
}

// Every occurrence gets its own slot, even when the path repeats
StreamRef GraphCompiler::visitResource(const Resource& resource) {
    StreamRef ref = StreamRef::input(inputs.size());
    inputs.push_back(resource.path);
    return ref;
}

StreamRef GraphCompiler::visitLinearStack(const std::vector<CompositionNode>& children, const char* op) {
    if (children.empty()) {
        throw EmptyTreeError(fmt::format("{} has no children", op));
    }
    std::string in;
    for (const auto& child : children) {
        in += visit(child).bracketed();
    }
    StreamRef out = nextStream();
    filters.push_back(fmt::format("{}{}=inputs={}{}", in, op, children.size(), out.bracketed()));
    return out;
}

// First child is the base layer; each later child is overlaid onto the
// accumulated composite at its own offset.
StreamRef GraphCompiler::visitZStack(const ZStack& stack) {
    if (stack.children.empty()) {
        throw EmptyTreeError("zstack has no children");
    }
    StreamRef main = visit(stack.children.front());
    for (size_t i = 1; i < stack.children.size(); ++i) {
        const auto& child = stack.children[i];
        StreamRef overlay = visit(child);
        StreamRef out = nextStream();
        filters.push_back(fmt::format("{}{}overlay={}:{}{}",
                                      main.bracketed(), overlay.bracketed(),
                                      formatCoordinate(child.offset.x), formatCoordinate(child.offset.y),
                                      out.bracketed()));
        main = out;
    }
    return main;
}

CompiledGraph compile(const CompositionNode& root) {
    GraphCompiler compiler;
    return compiler.compile(root);
}

std::string joinFilters(const std::vector<std::string>& filters) {
    return fmt::format("{}", fmt::join(filters, ";"));
}

std::vector<std::string> assemble(const std::vector<std::string>& inputs,
                                  const std::vector<std::string>& filters,
                                  const StreamRef& output) {
    std::vector<std::string> args;
    args.reserve(inputs.size() * 2 + 4);
    for (const auto& path : inputs) {
        args.push_back("-i");
        args.push_back(path);
    }
    // A bare input has no named stream to map; point -map at the input itself
    if (filters.empty()) {
        args.push_back("-map");
        args.push_back(output.str());
        return args;
    }
    args.push_back("-filter_complex");
    args.push_back(joinFilters(filters));
    args.push_back("-map");
    args.push_back(output.bracketed());
    return args;
}

std::vector<std::string> assemble(const CompiledGraph& graph) {
    return assemble(graph.inputs, graph.filters, graph.output);
}

std::vector<std::string> compileArgs(const CompositionNode& root) {
    return assemble(compile(root));
}

} // namespace StackFlow
