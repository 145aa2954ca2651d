#pragma once

#include "graphlens/view/ViewSettings.h"

#include <string>

namespace graphlens {

/// JSON persistence for ViewSettings
///
/// Missing keys keep their defaults; out-of-range numbers are clamped.
class SettingsSerializer {
public:
    static std::string toJson(const ViewSettings& settings);

    /// @throws std::runtime_error on malformed JSON or mistyped values
    static ViewSettings fromJson(const std::string& json);

    /// @return true if save succeeded
    static bool saveToFile(const ViewSettings& settings, const std::string& path);

    /// @throws std::runtime_error if the file cannot be read or parsed
    static ViewSettings loadFromFile(const std::string& path);
};

}  // namespace graphlens
