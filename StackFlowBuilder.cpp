// StackFlowBuilder.cpp
#include "StackFlowBuilder.hpp"

namespace StackFlow::compose {

CompositionNode resource(const std::string& path, Position offset) {
    return CompositionNode{Resource{path}, offset};
}

CompositionNode hstack(Components children, Position offset) {
    return CompositionNode{HStack{std::move(children)}, offset};
}

CompositionNode vstack(Components children, Position offset) {
    return CompositionNode{VStack{std::move(children)}, offset};
}

CompositionNode zstack(Components children, Position offset) {
    return CompositionNode{ZStack{std::move(children)}, offset};
}

Components optional(bool condition, Components parts) {
    if (!condition) return {};
    return parts;
}

Components either(bool condition, Components first, Components second) {
    return condition ? std::move(first) : std::move(second);
}

CompositionNode root(const Components& body) {
    if (body.empty()) {
        throw EmptyTreeError("composition body is empty");
    }
    return body.front();
}

CompositionNode root(const Video& video) {
    return root(video.body());
}

} // namespace StackFlow::compose
