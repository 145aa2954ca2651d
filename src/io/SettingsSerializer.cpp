#include "graphlens/io/SettingsSerializer.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>

using json = nlohmann::json;

namespace graphlens {

namespace {

std::string themeToString(Theme theme) {
    return theme == Theme::Light ? "light" : "dark";
}

std::string_view settingsKey(EdgeType type) {
    switch (type) {
        case EdgeType::Derivative: return "derivative";
        case EdgeType::Subgenre: return "subgenre";
        case EdgeType::FusionGenre: return "fusionGenre";
    }
    return "";
}

Theme stringToTheme(const std::string& str) {
    if (str == "light") return Theme::Light;
    if (str == "dark") return Theme::Dark;
    throw std::runtime_error("unknown theme \"" + str + "\"");
}

}  // namespace

std::string SettingsSerializer::toJson(const ViewSettings& settings) {
    json j;
    json types = json::object();
    for (EdgeType type : {EdgeType::Derivative, EdgeType::Subgenre, EdgeType::FusionGenre}) {
        types[std::string(settingsKey(type))] = settings.visibleTypes[edgeTypeIndex(type)];
    }
    j["visibleTypes"] = types;
    j["maxInfluenceDistance"] = settings.maxInfluenceDistance;
    j["zoomOnSelect"] = settings.zoomOnSelect;
    j["showLabels"] = settings.showLabels;
    j["arrowSizeScale"] = settings.arrowSizeScale;
    j["theme"] = themeToString(settings.theme);
    return j.dump(2);
}

ViewSettings SettingsSerializer::fromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        ViewSettings settings;

        if (j.contains("visibleTypes")) {
            const json& types = j["visibleTypes"];
            auto& mask = settings.visibleTypes;
            for (EdgeType type : {EdgeType::Derivative, EdgeType::Subgenre, EdgeType::FusionGenre}) {
                const bool current = mask[edgeTypeIndex(type)];
                mask[edgeTypeIndex(type)] = types.value(std::string(settingsKey(type)), current);
            }
        }

        settings.maxInfluenceDistance = j.value("maxInfluenceDistance", settings.maxInfluenceDistance);
        settings.zoomOnSelect = j.value("zoomOnSelect", settings.zoomOnSelect);
        settings.showLabels = j.value("showLabels", settings.showLabels);
        settings.arrowSizeScale = j.value("arrowSizeScale", settings.arrowSizeScale);
        if (j.contains("theme")) {
            settings.theme = stringToTheme(j["theme"].get<std::string>());
        }

        return settings.clamped();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse settings JSON: ") + e.what());
    }
}

bool SettingsSerializer::saveToFile(const ViewSettings& settings, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << toJson(settings);
    return file.good();
}

ViewSettings SettingsSerializer::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open settings file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

}  // namespace graphlens
