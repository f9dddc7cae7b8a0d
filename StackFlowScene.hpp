// StackFlowScene.hpp
//
// JSON scene files. A scene is one node object:
//   { "type": "zstack", "offset": {"x": 0, "y": 0},
//     "children": [ { "type": "resource", "file": "a.mp4" }, ... ] }
// optionally wrapped as { "scene": <node> }.
#pragma once
#include "StackFlowCore.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace StackFlow {

class SceneFormatError : public std::runtime_error {
public:
    explicit SceneFormatError(const std::string& what) : std::runtime_error(what) {}
};

// Build a composition tree from a parsed scene document
CompositionNode loadSceneFromJson(const nlohmann::json& json);
// Read and parse a scene file
CompositionNode loadSceneFromFile(const std::string& path);
// Write a tree back in the same format
nlohmann::json sceneToJson(const CompositionNode& node);

} // namespace StackFlow
