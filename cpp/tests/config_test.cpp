#include <gtest/gtest.h>

#include "appicon/config.hpp"
#include "test_util.hpp"

using namespace appicon;

TEST(ConfigTest, DefaultTables)
{
    auto config = defaultConfig();
    EXPECT_EQ(config.input, std::filesystem::path("utils/src.png"));
    EXPECT_EQ(config.outputRoot, std::filesystem::path("utils/output"));
    EXPECT_EQ(config.pngTargets.size(), 29u);
    EXPECT_EQ(config.icoSizes.size(), 6u);
    EXPECT_EQ(config.icnsLayers.size(), 10u);
    EXPECT_EQ(config.sharpFilter, "nearest-exact");
    EXPECT_EQ(config.smoothFilter, "auto");

    std::string err;
    EXPECT_TRUE(validateConfig(config, err)) << err;
}

TEST(ConfigTest, IcnsSizesAreDistinctAndAscending)
{
    auto sizes = icnsDistinctSizes(defaultConfig());
    EXPECT_EQ(sizes, (std::vector<int> { 16, 32, 64, 128, 256, 512, 1024 }));
}

TEST(ConfigTest, IcoSizesKeepFirstOccurrenceOrder)
{
    auto config = defaultConfig();
    config.icoSizes = { { 32, 32 }, { 16, 16 }, { 32, 32 }, { 48, 48 }, { 16, 16 } };

    auto sizes = icoDistinctSizes(config);
    ASSERT_EQ(sizes.size(), 3u);
    EXPECT_EQ(sizes[0], (IconSize { 32, 32 }));
    EXPECT_EQ(sizes[1], (IconSize { 16, 16 }));
    EXPECT_EQ(sizes[2], (IconSize { 48, 48 }));
}

TEST(ConfigTest, JsonOverridesOnlyPresentKeys)
{
    auto config = defaultConfig();
    std::string err;
    ASSERT_TRUE(parseConfigJson(R"({
        "input": "art/master.png",
        "png_targets": [ { "path": "web/favicon.png", "size": 48 } ],
        "ico_sizes": [ 16, [ 32, 32 ] ]
    })",
        config, err))
        << err;

    EXPECT_EQ(config.input, std::filesystem::path("art/master.png"));
    EXPECT_EQ(config.outputRoot, std::filesystem::path("utils/output"));
    ASSERT_EQ(config.pngTargets.size(), 1u);
    EXPECT_EQ(config.pngTargets[0].path, "web/favicon.png");
    EXPECT_EQ(config.pngTargets[0].size, 48);
    EXPECT_EQ(config.icoSizes, (std::vector<IconSize> { { 16, 16 }, { 32, 32 } }));
    EXPECT_EQ(config.icnsLayers.size(), 10u);
}

TEST(ConfigTest, MalformedJsonLeavesConfigUntouched)
{
    auto config = defaultConfig();
    std::string err;

    EXPECT_FALSE(parseConfigJson("{ \"input\": ", config, err));
    EXPECT_FALSE(err.empty());

    err.clear();
    EXPECT_FALSE(parseConfigJson(R"({ "input": "x.png", "png_targets": [ { "path": "a.png", "size": "big" } ] })", config, err));
    EXPECT_NE(err.find("png_targets[0].size"), std::string::npos) << err;

    EXPECT_EQ(config.input, std::filesystem::path("utils/src.png"));
    EXPECT_EQ(config.pngTargets.size(), 29u);
}

TEST(ConfigTest, IcnsLayersFromJson)
{
    auto config = defaultConfig();
    std::string err;
    ASSERT_TRUE(parseConfigJson(R"({
        "icns_layers": {
            "16x16": { "name": "icon_16x16.png", "size": 16, "type": "is32" },
            "16x16@2x": { "name": "icon_16x16@2x.png", "size": 32, "type": "ic11" },
            "32x32": { "name": "icon_32x32.png", "size": 32, "type": "il32" }
        }
    })",
        config, err))
        << err;

    ASSERT_EQ(config.icnsLayers.size(), 3u);
    EXPECT_EQ(config.icnsLayers.at("16x16@2x").size, 32);
    EXPECT_EQ(icnsDistinctSizes(config), (std::vector<int> { 16, 32 }));
}

TEST(ConfigTest, LoadFromFile)
{
    appicon_test::TempDir dir;
    auto path = dir.path() / "icons.json";
    {
        std::ofstream out(path);
        out << R"({ "output": "dist/icons", "smooth_filter": "lanczos" })";
    }

    auto config = defaultConfig();
    std::string err;
    ASSERT_TRUE(loadConfigJson(path, config, err)) << err;
    EXPECT_EQ(config.outputRoot, std::filesystem::path("dist/icons"));
    EXPECT_EQ(config.smoothFilter, "lanczos");

    EXPECT_FALSE(loadConfigJson(dir.path() / "missing.json", config, err));
}

TEST(ConfigTest, DumpedJsonParsesBack)
{
    auto defaults = defaultConfig();
    auto config = IconConfig {};
    std::string err;
    ASSERT_TRUE(parseConfigJson(configToJson(defaults), config, err)) << err;

    EXPECT_EQ(config.input, defaults.input);
    EXPECT_EQ(config.outputRoot, defaults.outputRoot);
    ASSERT_EQ(config.pngTargets.size(), defaults.pngTargets.size());
    EXPECT_EQ(config.pngTargets[14].path, "mipmap-hdpi/ic_launcher.png");
    EXPECT_EQ(config.icoSizes, defaults.icoSizes);
    EXPECT_EQ(config.icnsLayers.size(), defaults.icnsLayers.size());
    EXPECT_EQ(config.icnsLayers.at("512x512@2x").type, "ic10");
}

TEST(ConfigTest, ValidationRejectsEscapingPaths)
{
    std::string err;

    auto config = defaultConfig();
    config.pngTargets = { { "../outside.png", 32 } };
    EXPECT_FALSE(validateConfig(config, err));

    config.pngTargets = { { "/abs/icon.png", 32 } };
    EXPECT_FALSE(validateConfig(config, err));

    config.pngTargets = { { "mipmap-mdpi/", 32 } };
    EXPECT_FALSE(validateConfig(config, err));

    config.pngTargets = { { "a/icon.png", 32 }, { "a/./icon.png", 64 } };
    EXPECT_FALSE(validateConfig(config, err));
    EXPECT_NE(err.find("more than once"), std::string::npos) << err;

    config.pngTargets = { { "icon.ico", 32 } };
    EXPECT_FALSE(validateConfig(config, err));
    EXPECT_NE(err.find("reserved"), std::string::npos) << err;

    config.pngTargets = { { "./icon.icns", 32 } };
    EXPECT_FALSE(validateConfig(config, err));
    EXPECT_NE(err.find("reserved"), std::string::npos) << err;

    config.pngTargets = { { "sub/icon.ico", 32 } };
    EXPECT_TRUE(validateConfig(config, err)) << err;
}

TEST(ConfigTest, ValidationRejectsBadSizesAndTags)
{
    std::string err;

    auto config = defaultConfig();
    config.pngTargets[0].size = 0;
    EXPECT_FALSE(validateConfig(config, err));

    config = defaultConfig();
    config.icoSizes.push_back({ -1, 16 });
    EXPECT_FALSE(validateConfig(config, err));

    config = defaultConfig();
    config.icnsLayers["64x64"] = { "icon_64x64.png", 64, "icp" };
    EXPECT_FALSE(validateConfig(config, err));
    EXPECT_NE(err.find("four character"), std::string::npos) << err;
}
