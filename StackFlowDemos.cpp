// StackFlowDemos.cpp
#include "StackFlowDemos.hpp"
#include <stdexcept>

namespace StackFlow::demos {

using namespace compose;

Components SomeVideo::body() const {
    return block(zstack(block(
        resource("wwdc2020.mp4"),
        resource("wwdc1990.mkv", {1200, 100}),
        optional(showLogo, block(resource("cocoaheads.png", {100, 800}))))));
}

Components MainMovie::body() const {
    return block(hstack(block(SomeVideo(false), SomeVideo(true))));
}

std::vector<std::string> demoSceneNames() {
    return {"main-movie", "some-video", "some-video-logo"};
}

CompositionNode demoScene(const std::string& name) {
    if (name == "main-movie") return root(MainMovie());
    if (name == "some-video") return root(SomeVideo(false));
    if (name == "some-video-logo") return root(SomeVideo(true));
    throw std::invalid_argument("unknown demo scene: " + name);
}

} // namespace StackFlow::demos
