// StackFlowDemos.hpp
//
// Built-in scenes: two conference clips side by side, each with an inset and
// an optional logo.
#pragma once
#include "StackFlowBuilder.hpp"
#include <string>
#include <vector>

namespace StackFlow::demos {

// Main clip with an inset at (1200, 100); logo at (100, 800) when enabled
class SomeVideo : public compose::Video {
public:
    explicit SomeVideo(bool showLogo) : showLogo(showLogo) {}
    compose::Components body() const override;

private:
    bool showLogo;
};

// SomeVideo without and with logo, side by side
class MainMovie : public compose::Video {
public:
    compose::Components body() const override;
};

std::vector<std::string> demoSceneNames();
// Throws std::invalid_argument for unknown names
CompositionNode demoScene(const std::string& name);

} // namespace StackFlow::demos
