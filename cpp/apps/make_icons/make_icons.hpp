#ifndef APPICON_MAKE_ICONS_HPP
#define APPICON_MAKE_ICONS_HPP

#include <filesystem>
#include <string>

#include "appicon/console.hpp"

struct Options {
    std::filesystem::path config;
    std::filesystem::path input;
    std::filesystem::path output;
    std::string sharpFilter;
    std::string smoothFilter;
    appicon::Verbosity verbosity = appicon::Verbosity::Normal;
    bool dumpConfig = false;
};

#endif
