#ifndef APPICON_CONFIG_HPP
#define APPICON_CONFIG_HPP

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace appicon {

struct PngTarget {
    std::string path; // relative to the output root
    int size;
};

struct IconSize {
    int width;
    int height;

    bool operator==(const IconSize& other) const { return width == other.width && height == other.height; }
};

struct IcnsLayer {
    std::string name;
    int size;
    std::string type; // four character element tag, informational only
};

struct IconConfig {
    std::filesystem::path input;
    std::filesystem::path outputRoot;

    std::vector<PngTarget> pngTargets;
    std::vector<IconSize> icoSizes;
    std::map<std::string, IcnsLayer> icnsLayers;

    std::string sharpFilter;
    std::string smoothFilter;
};

IconConfig defaultConfig();

// Overrides fields of |config| with the keys present in the JSON file at
// |path|. Keys that are absent keep their current value.
bool loadConfigJson(const std::filesystem::path& path, IconConfig& config, std::string& err);
bool parseConfigJson(const std::string& text, IconConfig& config, std::string& err);

std::string configToJson(const IconConfig& config);

bool validateConfig(const IconConfig& config, std::string& err);

// Distinct ICNS pixel sizes, ascending.
std::vector<int> icnsDistinctSizes(const IconConfig& config);

// ICO sizes with duplicates removed, first occurrence kept.
std::vector<IconSize> icoDistinctSizes(const IconConfig& config);

} // namespace appicon

#endif
