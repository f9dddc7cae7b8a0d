// StackFlowScene.cpp
//
// Loads composition trees from JSON scene documents and writes them back.
#include "StackFlowScene.hpp"
#include <fmt/core.h>
#include <cstdint>
#include <fstream>
#include <limits>
#include <type_traits>

namespace StackFlow {

namespace {

// Deeper documents are rejected instead of exhausting the stack
constexpr int kMaxSceneDepth = 1000;

std::string where(const std::string& path) {
    return path.empty() ? std::string("/") : path;
}

Coordinate readCoordinate(const nlohmann::json& offset, const char* key, const std::string& path) {
    if (!offset.contains(key)) return 0;
    const auto& v = offset[key];
    // Keep integral JSON numbers integral so "100" renders as 100, not 100.0
    if (v.is_number_unsigned()) {
        if (v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw SceneFormatError(fmt::format("{}/offset/{}: out of range", path, key));
        }
        return static_cast<int>(v.get<std::uint64_t>());
    }
    if (v.is_number_integer()) {
        const std::int64_t i = v.get<std::int64_t>();
        if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) {
            throw SceneFormatError(fmt::format("{}/offset/{}: out of range", path, key));
        }
        return static_cast<int>(i);
    }
    if (v.is_number()) return v.get<double>();
    throw SceneFormatError(fmt::format("{}/offset/{}: expected a number", path, key));
}

CompositionNode readNode(const nlohmann::json& nodeJson, const std::string& path, int depth) {
    if (depth > kMaxSceneDepth) {
        throw SceneFormatError(fmt::format("{}: nesting deeper than {} levels", where(path), kMaxSceneDepth));
    }
    if (!nodeJson.is_object()) {
        throw SceneFormatError(fmt::format("{}: expected an object", where(path)));
    }
    if (!nodeJson.contains("type") || !nodeJson["type"].is_string()) {
        throw SceneFormatError(fmt::format("{}: missing string 'type'", where(path)));
    }
    const std::string type = nodeJson["type"].get<std::string>();

    CompositionNode node;
    if (nodeJson.contains("offset")) {
        const auto& offset = nodeJson["offset"];
        if (!offset.is_object()) {
            throw SceneFormatError(fmt::format("{}/offset: expected an object", path));
        }
        node.offset.x = readCoordinate(offset, "x", path);
        node.offset.y = readCoordinate(offset, "y", path);
    }

    if (type == "resource") {
        if (!nodeJson.contains("file") || !nodeJson["file"].is_string()) {
            throw SceneFormatError(fmt::format("{}: resource needs a string 'file'", where(path)));
        }
        node.contents = Resource{nodeJson["file"].get<std::string>()};
        return node;
    }

    std::vector<CompositionNode> children;
    if (nodeJson.contains("children")) {
        const auto& list = nodeJson["children"];
        if (!list.is_array()) {
            throw SceneFormatError(fmt::format("{}/children: expected an array", path));
        }
        for (size_t i = 0; i < list.size(); ++i) {
            children.push_back(readNode(list[i], fmt::format("{}/children/{}", path, i), depth + 1));
        }
    }

    if (type == "hstack") node.contents = HStack{std::move(children)};
    else if (type == "vstack") node.contents = VStack{std::move(children)};
    else if (type == "zstack") node.contents = ZStack{std::move(children)};
    else throw SceneFormatError(fmt::format("{}: unknown node type '{}'", where(path), type));
    return node;
}

nlohmann::json coordinateToJson(const Coordinate& c) {
    return std::visit([](auto v) { return nlohmann::json(v); }, c);
}

} // namespace

CompositionNode loadSceneFromJson(const nlohmann::json& json) {
    if (json.is_object() && json.contains("scene")) {
        return readNode(json["scene"], "/scene", 0);
    }
    return readNode(json, "", 0);
}

CompositionNode loadSceneFromFile(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) {
        throw SceneFormatError("Could not open scene file: " + path);
    }
    nlohmann::json json;
    try {
        f >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw SceneFormatError(fmt::format("{}: {}", path, e.what()));
    }
    return loadSceneFromJson(json);
}

nlohmann::json sceneToJson(const CompositionNode& node) {
    nlohmann::json out;
    auto writeChildren = [&](const char* type, const std::vector<CompositionNode>& children) {
        out["type"] = type;
        out["children"] = nlohmann::json::array();
        for (const auto& child : children) out["children"].push_back(sceneToJson(child));
    };
    std::visit([&](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Resource>) {
            out["type"] = "resource";
            out["file"] = c.path;
        } else if constexpr (std::is_same_v<T, HStack>) {
            writeChildren("hstack", c.children);
        } else if constexpr (std::is_same_v<T, VStack>) {
            writeChildren("vstack", c.children);
        } else {
            writeChildren("zstack", c.children);
        }
    }, node.contents);
    out["offset"] = {{"x", coordinateToJson(node.offset.x)}, {"y", coordinateToJson(node.offset.y)}};
    return out;
}

} // namespace StackFlow
