// StackFlow core types and compiler
//
// This header defines the composition tree (resources and stacks), the
// stream references produced while walking it, and the graph compiler that
// turns one tree into an ffmpeg filter-graph program plus its argument list.
// The compiler is a single post-order traversal; all of its state lives in a
// per-call object so independent trees can be compiled from any thread.
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace StackFlow {

// Numeric coordinate; keeps integers integral when rendered.
using Coordinate = std::variant<int, double>;

std::string formatCoordinate(const Coordinate& c);

// Overlay placement of a ZStack child relative to the running composite
struct Position {
    Coordinate x = 0;
    Coordinate y = 0;
};

struct CompositionNode;

struct Resource {
    std::string path;
};

struct HStack {
    std::vector<CompositionNode> children;
};

struct VStack {
    std::vector<CompositionNode> children;
};

struct ZStack {
    std::vector<CompositionNode> children;
};

using Component = std::variant<Resource, HStack, VStack, ZStack>;

// One element of the composition tree. Children are owned by value.
// offset is only read when the node is a non-first child of a ZStack.
struct CompositionNode {
    Component contents;
    Position offset;
};

// Thrown when a stack (or a composition body) has nothing to resolve
class EmptyTreeError : public std::runtime_error {
public:
    explicit EmptyTreeError(const std::string& what) : std::runtime_error(what) {}
};

// Either a bare input slot ("0") or a generated stream name ("s3")
struct StreamRef {
    enum class Kind { Input, Stream };
    Kind kind = Kind::Input;
    std::size_t index = 0;

    static StreamRef input(std::size_t slot) { return {Kind::Input, slot}; }
    static StreamRef stream(std::size_t n) { return {Kind::Stream, n}; }

    bool isInput() const { return kind == Kind::Input; }
    std::string str() const;
    std::string bracketed() const { return "[" + str() + "]"; }

    bool operator==(const StreamRef& o) const { return kind == o.kind && index == o.index; }
    bool operator!=(const StreamRef& o) const { return !(*this == o); }
};

// Result of one compile call
struct CompiledGraph {
    std::vector<std::string> inputs;   // index = input slot
    std::vector<std::string> filters;  // in dependency order
    StreamRef output;
};

// GraphCompiler walks one tree depth-first, left-to-right, and emits filter
// expressions post-order so every stream is declared before it is consumed.
class GraphCompiler {
public:
    GraphCompiler() = default;
    // Compile a tree. Throws EmptyTreeError for stacks without children.
    CompiledGraph compile(const CompositionNode& root);

private:
    // Compiler state, reset at the start of every compile call
    std::vector<std::string> inputs;
    std::vector<std::string> filters;
    std::size_t streamCounter = 0;

    StreamRef visit(const CompositionNode& node);
    StreamRef visitResource(const Resource& resource);
    StreamRef visitLinearStack(const std::vector<CompositionNode>& children, const char* op);
    StreamRef visitZStack(const ZStack& stack);
    StreamRef nextStream() { return StreamRef::stream(streamCounter++); }
};

// Convenience wrapper around a fresh GraphCompiler
CompiledGraph compile(const CompositionNode& root);

// Argument assembly: -i inputs, -filter_complex program, -map output
std::string joinFilters(const std::vector<std::string>& filters);
std::vector<std::string> assemble(const std::vector<std::string>& inputs,
                                  const std::vector<std::string>& filters,
                                  const StreamRef& output);
std::vector<std::string> assemble(const CompiledGraph& graph);
std::vector<std::string> compileArgs(const CompositionNode& root);

} // namespace StackFlow
