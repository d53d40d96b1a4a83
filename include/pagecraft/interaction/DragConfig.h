#pragma once

#include "../core/Types.h"

#include <string>

namespace pagecraft {

/// Tunables of the drag-drop coordinator
struct DragConfig {
    bool snapToGrid = true;
    float gridSize = 8.0f;
    bool enableDropValidation = true;       ///< false marks every zone legal
    Rect canvasBounds{0.0f, 0.0f, 1200.0f, 800.0f};
    float insideMargin = 10.0f;             ///< Inset of "inside" zones
    float gapWidth = 10.0f;                 ///< Width of between-siblings zones

    static DragConfig createDefault() { return DragConfig{}; }
};

/// JSON load/save of a DragConfig
///
/// Schema:
/// @code
/// {
///   "snapToGrid": true, "gridSize": 8, "enableDropValidation": true,
///   "canvas": { "x": 0, "y": 0, "width": 1200, "height": 800 },
///   "insideMargin": 10, "gapWidth": 10
/// }
/// @endcode
/// Missing keys keep their defaults.
class DragConfigSerializer {
public:
    static std::string toJson(const DragConfig& config);

    /// @throws ConfigError on malformed JSON or a non-positive grid/canvas size
    static DragConfig fromJson(const std::string& json);
};

}  // namespace pagecraft
