#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "appicon/config.hpp"
#include "appicon/console.hpp"
#include "appicon/pipeline.hpp"
#include "appicon/resampler.hpp"
#include "make_icons.hpp"

#define NEXTARG()                                                     \
    if (((argIndex + 1) == argc) || (argv[argIndex + 1][0] == '-')) { \
        std::cerr << arg << " requires an argument." << std::endl;    \
        return EXIT_FAILURE;                                          \
    }                                                                 \
    arg = std::string(argv[++argIndex])

void syntax()
{
    std::cerr << "Syntax: make_icons [options] -i source.png -o output"
              << std::endl
              << "Options:" << std::endl
              << "  -h,--help                   : Shows syntax help" << std::endl
              << "  -c,--config FILENAME        : JSON file overriding the input, output, "
                 "filters and size tables."
              << std::endl
              << "  -i,--input FILENAME         : Source image (default utils/src.png)." << std::endl
              << "  -o,--output FOLDER          : Output folder (default utils/output)." << std::endl
              << "  -s,--sharp FILTER           : Filter for the png set (default nearest-exact)." << std::endl
              << "  -m,--smooth FILTER          : Filter for icon.ico and icon.icns (default auto)." << std::endl
              << "  -v,--verbose                : Print every written file and layer." << std::endl
              << "  -q,--quiet                  : Only print errors." << std::endl
              << "  --dump-config               : Print the effective configuration as JSON and exit."
              << std::endl
              << std::endl
              << "Filters: auto, nearest-exact, nearest, linear, cubic, area, lanczos" << std::endl
              << std::endl;
}

int main(int argc, char* argv[])
{
    Options options;

    int argIndex = 1;
    while (argIndex < argc) {
        std::string arg = argv[argIndex];

        if (arg == "--help" || arg == "-h") {
            syntax();
            return EXIT_FAILURE;
        } else if (arg == "--config" || arg == "-c") {
            NEXTARG();
            options.config = arg;
        } else if (arg == "--input" || arg == "-i") {
            NEXTARG();
            options.input = arg;
        } else if (arg == "--output" || arg == "-o") {
            NEXTARG();
            options.output = arg;
        } else if (arg == "--sharp" || arg == "-s") {
            NEXTARG();
            options.sharpFilter = arg;
        } else if (arg == "--smooth" || arg == "-m") {
            NEXTARG();
            options.smoothFilter = arg;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbosity = appicon::Verbosity::Verbose;
        } else if (arg == "--quiet" || arg == "-q") {
            options.verbosity = appicon::Verbosity::Quiet;
        } else if (arg == "--dump-config") {
            options.dumpConfig = true;
        } else {
            std::cerr << "\"" << arg << "\" is an unknown argument." << std::endl;
            syntax();
            return EXIT_FAILURE;
        }

        argIndex++;
    }

    auto config = appicon::defaultConfig();
    std::string err;

    if (!options.config.empty() && !appicon::loadConfigJson(options.config, config, err)) {
        std::cerr << "ConfigError: " << err << std::endl;
        return EXIT_FAILURE;
    }
    if (!options.input.empty()) {
        config.input = options.input;
    }
    if (!options.output.empty()) {
        config.outputRoot = options.output;
    }
    if (!options.sharpFilter.empty()) {
        config.sharpFilter = options.sharpFilter;
    }
    if (!options.smoothFilter.empty()) {
        config.smoothFilter = options.smoothFilter;
    }

    if (!appicon::validateConfig(config, err)) {
        std::cerr << "ConfigError: " << err << std::endl;
        return EXIT_FAILURE;
    }

    appicon::Resampler resampler;
    if (!appicon::Resampler::create(config.sharpFilter, config.smoothFilter, resampler, err)) {
        std::cerr << "ConfigError: " << err << std::endl;
        return EXIT_FAILURE;
    }

    if (options.dumpConfig) {
        std::cout << appicon::configToJson(config) << std::endl;
        return EXIT_SUCCESS;
    }

    const appicon::Console console(std::cout, std::cerr, options.verbosity);
    auto report = appicon::runPipeline(config, resampler, console);

    if (!report.ok()) {
        std::cerr << "Finished with errors." << std::endl;
        return EXIT_FAILURE;
    }

    console.progress("Done.");
    return EXIT_SUCCESS;
}
