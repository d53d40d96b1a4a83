#include "pagecraft/interaction/DragConfig.h"
#include "pagecraft/common/Errors.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace pagecraft {

std::string DragConfigSerializer::toJson(const DragConfig& config) {
    json j;
    j["snapToGrid"] = config.snapToGrid;
    j["gridSize"] = config.gridSize;
    j["enableDropValidation"] = config.enableDropValidation;
    j["canvas"] = {
        {"x", config.canvasBounds.x},
        {"y", config.canvasBounds.y},
        {"width", config.canvasBounds.width},
        {"height", config.canvasBounds.height}
    };
    j["insideMargin"] = config.insideMargin;
    j["gapWidth"] = config.gapWidth;
    return j.dump(2);
}

DragConfig DragConfigSerializer::fromJson(const std::string& jsonStr) {
    DragConfig config;

    json j;
    try {
        j = json::parse(jsonStr);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Invalid drag config JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("Drag config must be a JSON object");
    }

    try {
        config.snapToGrid = j.value("snapToGrid", config.snapToGrid);
        config.gridSize = j.value("gridSize", config.gridSize);
        config.enableDropValidation = j.value("enableDropValidation", config.enableDropValidation);
        config.insideMargin = j.value("insideMargin", config.insideMargin);
        config.gapWidth = j.value("gapWidth", config.gapWidth);

        if (j.contains("canvas")) {
            const auto& cj = j["canvas"];
            if (!cj.is_object()) {
                throw ConfigError("\"canvas\" must be an object");
            }
            config.canvasBounds.x = cj.value("x", config.canvasBounds.x);
            config.canvasBounds.y = cj.value("y", config.canvasBounds.y);
            config.canvasBounds.width = cj.value("width", config.canvasBounds.width);
            config.canvasBounds.height = cj.value("height", config.canvasBounds.height);
        }
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("Invalid drag config value: ") + e.what());
    }

    if (config.gridSize <= 0.0f) {
        throw ConfigError("gridSize must be positive");
    }
    if (config.canvasBounds.width <= 0.0f || config.canvasBounds.height <= 0.0f) {
        throw ConfigError("canvas width and height must be positive");
    }
    return config;
}

}  // namespace pagecraft
