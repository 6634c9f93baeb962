#include "config.hpp"

#include <algorithm>
#include <fstream>
#include <json/json.h>
#include <memory>
#include <set>
#include <sstream>

namespace appicon {

namespace {

constexpr int kMaxEdge = 16384;

bool readSize(const Json::Value& value, const std::string& what, int& out, std::string& err)
{
    if (!value.isInt()) {
        err = what + " must be an integer";
        return false;
    }
    out = value.asInt();
    return true;
}

bool readString(const Json::Value& value, const std::string& what, std::string& out, std::string& err)
{
    if (!value.isString()) {
        err = what + " must be a string";
        return false;
    }
    out = value.asString();
    return true;
}

bool parsePngTargets(const Json::Value& value, std::vector<PngTarget>& out, std::string& err)
{
    if (!value.isArray()) {
        err = "\"png_targets\" must be an array";
        return false;
    }

    std::vector<PngTarget> targets;
    for (Json::ArrayIndex i = 0; i < value.size(); i++) {
        const auto& entry = value[i];
        auto where = "png_targets[" + std::to_string(i) + "]";
        if (!entry.isObject()) {
            err = where + " must be an object";
            return false;
        }

        PngTarget target;
        if (!readString(entry["path"], where + ".path", target.path, err)
            || !readSize(entry["size"], where + ".size", target.size, err)) {
            return false;
        }
        targets.push_back(target);
    }

    out = std::move(targets);
    return true;
}

// Accepts [w, h] pairs or a bare integer for a square layer.
bool parseIcoSizes(const Json::Value& value, std::vector<IconSize>& out, std::string& err)
{
    if (!value.isArray()) {
        err = "\"ico_sizes\" must be an array";
        return false;
    }

    std::vector<IconSize> sizes;
    for (Json::ArrayIndex i = 0; i < value.size(); i++) {
        const auto& entry = value[i];
        auto where = "ico_sizes[" + std::to_string(i) + "]";

        IconSize size;
        if (entry.isInt()) {
            size.width = size.height = entry.asInt();
        } else if (entry.isArray() && entry.size() == 2) {
            if (!readSize(entry[0], where + "[0]", size.width, err)
                || !readSize(entry[1], where + "[1]", size.height, err)) {
                return false;
            }
        } else {
            err = where + " must be an integer or a [width, height] pair";
            return false;
        }
        sizes.push_back(size);
    }

    out = std::move(sizes);
    return true;
}

bool parseIcnsLayers(const Json::Value& value, std::map<std::string, IcnsLayer>& out, std::string& err)
{
    if (!value.isObject()) {
        err = "\"icns_layers\" must be an object";
        return false;
    }

    std::map<std::string, IcnsLayer> layers;
    for (const auto& key : value.getMemberNames()) {
        const auto& entry = value[key];
        auto where = "icns_layers." + key;
        if (!entry.isObject()) {
            err = where + " must be an object";
            return false;
        }

        IcnsLayer layer;
        if (!readString(entry["name"], where + ".name", layer.name, err)
            || !readSize(entry["size"], where + ".size", layer.size, err)
            || !readString(entry["type"], where + ".type", layer.type, err)) {
            return false;
        }
        layers[key] = layer;
    }

    out = std::move(layers);
    return true;
}

bool isContainedRelativePath(const std::filesystem::path& path)
{
    if (path.empty() || path.is_absolute() || path.has_root_name() || path.has_root_directory()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return path.has_filename();
}

} // namespace

IconConfig defaultConfig()
{
    IconConfig config;
    config.input = "utils/src.png";
    config.outputRoot = "utils/output";

    config.pngTargets = {
        { "128x128.png", 128 },
        { "128x128@2x.png", 256 },
        { "32x32.png", 32 },
        { "icon.png", 512 },
        { "Square107x107Logo.png", 107 },
        { "Square142x142Logo.png", 142 },
        { "Square150x150Logo.png", 150 },
        { "Square284x284Logo.png", 284 },
        { "Square30x30Logo.png", 30 },
        { "Square310x310Logo.png", 310 },
        { "Square44x44Logo.png", 44 },
        { "Square71x71Logo.png", 71 },
        { "Square89x89Logo.png", 89 },
        { "StoreLogo.png", 50 },
        { "mipmap-hdpi/ic_launcher.png", 72 },
        { "mipmap-mdpi/ic_launcher.png", 48 },
        { "mipmap-xhdpi/ic_launcher.png", 96 },
        { "mipmap-xxhdpi/ic_launcher.png", 144 },
        { "mipmap-xxxhdpi/ic_launcher.png", 192 },
        { "mipmap-hdpi/ic_launcher_round.png", 72 },
        { "mipmap-hdpi/ic_launcher_foreground.png", 162 },
        { "mipmap-mdpi/ic_launcher_round.png", 48 },
        { "mipmap-mdpi/ic_launcher_foreground.png", 108 },
        { "mipmap-xhdpi/ic_launcher_round.png", 96 },
        { "mipmap-xhdpi/ic_launcher_foreground.png", 216 },
        { "mipmap-xxhdpi/ic_launcher_round.png", 144 },
        { "mipmap-xxhdpi/ic_launcher_foreground.png", 324 },
        { "mipmap-xxxhdpi/ic_launcher_round.png", 192 },
        { "mipmap-xxxhdpi/ic_launcher_foreground.png", 432 },
    };

    // 32x32 is listed first so it becomes the first directory entry.
    config.icoSizes = { { 32, 32 }, { 16, 16 }, { 24, 24 }, { 48, 48 }, { 64, 64 }, { 256, 256 } };

    config.icnsLayers = {
        { "16x16", { "icon_16x16.png", 16, "is32" } },
        { "16x16@2x", { "icon_16x16@2x.png", 32, "ic11" } },
        { "32x32", { "icon_32x32.png", 32, "il32" } },
        { "32x32@2x", { "icon_32x32@2x.png", 64, "ic12" } },
        { "128x128", { "icon_128x128.png", 128, "ic07" } },
        { "128x128@2x", { "icon_128x128@2x.png", 256, "ic13" } },
        { "256x256", { "icon_256x256.png", 256, "ic08" } },
        { "256x256@2x", { "icon_256x256@2x.png", 512, "ic14" } },
        { "512x512", { "icon_512x512.png", 512, "ic09" } },
        { "512x512@2x", { "icon_512x512@2x.png", 1024, "ic10" } },
    };

    config.sharpFilter = "nearest-exact";
    config.smoothFilter = "auto";
    return config;
}

bool parseConfigJson(const std::string& text, IconConfig& config, std::string& err)
{
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string parseErrors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &parseErrors)) {
        err = "invalid JSON: " + parseErrors;
        return false;
    }
    if (!root.isObject()) {
        err = "top level value must be an object";
        return false;
    }

    // Parse into a copy so a failure leaves |config| untouched.
    auto parsed = config;
    std::string value;

    if (root.isMember("input")) {
        if (!readString(root["input"], "\"input\"", value, err)) {
            return false;
        }
        parsed.input = value;
    }
    if (root.isMember("output")) {
        if (!readString(root["output"], "\"output\"", value, err)) {
            return false;
        }
        parsed.outputRoot = value;
    }
    if (root.isMember("sharp_filter")
        && !readString(root["sharp_filter"], "\"sharp_filter\"", parsed.sharpFilter, err)) {
        return false;
    }
    if (root.isMember("smooth_filter")
        && !readString(root["smooth_filter"], "\"smooth_filter\"", parsed.smoothFilter, err)) {
        return false;
    }
    if (root.isMember("png_targets") && !parsePngTargets(root["png_targets"], parsed.pngTargets, err)) {
        return false;
    }
    if (root.isMember("ico_sizes") && !parseIcoSizes(root["ico_sizes"], parsed.icoSizes, err)) {
        return false;
    }
    if (root.isMember("icns_layers") && !parseIcnsLayers(root["icns_layers"], parsed.icnsLayers, err)) {
        return false;
    }

    config = std::move(parsed);
    return true;
}

bool loadConfigJson(const std::filesystem::path& path, IconConfig& config, std::string& err)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        err = "could not open config " + path.string();
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    if (!parseConfigJson(ss.str(), config, err)) {
        err = path.string() + ": " + err;
        return false;
    }
    return true;
}

std::string configToJson(const IconConfig& config)
{
    Json::Value root(Json::objectValue);
    root["input"] = config.input.generic_string();
    root["output"] = config.outputRoot.generic_string();
    root["sharp_filter"] = config.sharpFilter;
    root["smooth_filter"] = config.smoothFilter;

    Json::Value targets(Json::arrayValue);
    for (const auto& target : config.pngTargets) {
        Json::Value entry(Json::objectValue);
        entry["path"] = target.path;
        entry["size"] = target.size;
        targets.append(entry);
    }
    root["png_targets"] = targets;

    Json::Value sizes(Json::arrayValue);
    for (const auto& size : config.icoSizes) {
        Json::Value pair(Json::arrayValue);
        pair.append(size.width);
        pair.append(size.height);
        sizes.append(pair);
    }
    root["ico_sizes"] = sizes;

    Json::Value layers(Json::objectValue);
    for (const auto& [key, layer] : config.icnsLayers) {
        Json::Value entry(Json::objectValue);
        entry["name"] = layer.name;
        entry["size"] = layer.size;
        entry["type"] = layer.type;
        layers[key] = entry;
    }
    root["icns_layers"] = layers;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";
    return Json::writeString(builder, root);
}

bool validateConfig(const IconConfig& config, std::string& err)
{
    if (config.input.empty()) {
        err = "no input image configured";
        return false;
    }
    if (config.outputRoot.empty()) {
        err = "no output folder configured";
        return false;
    }
    if (config.sharpFilter.empty() || config.smoothFilter.empty()) {
        err = "both a sharp and a smooth filter must be named";
        return false;
    }

    std::set<std::string> seen;
    for (const auto& target : config.pngTargets) {
        std::filesystem::path path(target.path);
        if (!isContainedRelativePath(path)) {
            err = "\"" + target.path + "\" must be a relative file path inside the output folder";
            return false;
        }
        auto normalized = path.lexically_normal().generic_string();
        if (normalized == "icon.ico" || normalized == "icon.icns") {
            err = "\"" + target.path + "\" is reserved for the icon container of the same name";
            return false;
        }
        if (!seen.insert(normalized).second) {
            err = "\"" + target.path + "\" is listed more than once";
            return false;
        }
        if (target.size <= 0 || target.size > kMaxEdge) {
            err = "\"" + target.path + "\" has invalid size " + std::to_string(target.size);
            return false;
        }
    }

    for (const auto& size : config.icoSizes) {
        if (size.width <= 0 || size.height <= 0 || size.width > kMaxEdge || size.height > kMaxEdge) {
            err = "invalid ico size " + std::to_string(size.width) + "x" + std::to_string(size.height);
            return false;
        }
    }

    for (const auto& [key, layer] : config.icnsLayers) {
        if (layer.size <= 0 || layer.size > kMaxEdge) {
            err = "icns layer \"" + key + "\" has invalid size " + std::to_string(layer.size);
            return false;
        }
        if (layer.type.size() != 4) {
            err = "icns layer \"" + key + "\" type \"" + layer.type + "\" is not a four character tag";
            return false;
        }
    }

    return true;
}

std::vector<int> icnsDistinctSizes(const IconConfig& config)
{
    std::set<int> sizes;
    for (const auto& entry : config.icnsLayers) {
        sizes.insert(entry.second.size);
    }
    return std::vector<int>(sizes.begin(), sizes.end());
}

std::vector<IconSize> icoDistinctSizes(const IconConfig& config)
{
    std::vector<IconSize> sizes;
    for (const auto& size : config.icoSizes) {
        if (std::find(sizes.begin(), sizes.end(), size) == sizes.end()) {
            sizes.push_back(size);
        }
    }
    return sizes;
}

} // namespace appicon
