// StackFlowBuilder.hpp
//
// Authoring helpers for composition trees. Conditionals, alternatives, loops
// and nested videos all collapse into a flat, ordered Components list before a
// stack node is built, so the compiler only ever sees the final tree.
//
//   auto scene = zstack(block(
//       resource("base.mp4"),
//       optional(showLogo, block(resource("logo.png", {100, 800})))));
#pragma once
#include "StackFlowCore.hpp"
#include <string>
#include <utility>
#include <vector>

namespace StackFlow::compose {

using Components = std::vector<CompositionNode>;

// A reusable piece of composition; its body is spliced wherever it is used.
class Video {
public:
    virtual ~Video() = default;
    virtual Components body() const = 0;
};

inline void append(Components& out, const CompositionNode& node) { out.push_back(node); }
inline void append(Components& out, CompositionNode&& node) { out.push_back(std::move(node)); }
inline void append(Components& out, const Components& parts) { out.insert(out.end(), parts.begin(), parts.end()); }
inline void append(Components& out, const Video& video) { append(out, video.body()); }

// Flatten any mix of nodes, component lists and videos, in argument order
template <typename... Parts>
Components block(Parts&&... parts) {
    Components out;
    (append(out, std::forward<Parts>(parts)), ...);
    return out;
}

CompositionNode resource(const std::string& path, Position offset = {});
CompositionNode hstack(Components children, Position offset = {});
CompositionNode vstack(Components children, Position offset = {});
CompositionNode zstack(Components children, Position offset = {});

// Parts when condition holds, nothing otherwise
Components optional(bool condition, Components parts);
Components either(bool condition, Components first, Components second);

// Concatenate fn(element) for every element of range
template <typename Range, typename Fn>
Components forEach(const Range& range, Fn fn) {
    Components out;
    for (const auto& element : range) append(out, fn(element));
    return out;
}

// Single root of a body. Extra top-level components are ignored.
CompositionNode root(const Components& body);
CompositionNode root(const Video& video);

} // namespace StackFlow::compose
