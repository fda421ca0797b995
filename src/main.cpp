#include "Controller.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

static void usage(const char *prog){
    std::cout << "Usage: " << prog << " --dataset <manifest.yml> [--config <options.yml>] [--output <results.txt>]"
              << " [--cache-dir <dir>] [--lambda <v>] [--no-global] [--no-snap] [--remove-duplicates]"
              << " [--reduce-map] [--no-cache]" << std::endl;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    std::string manifest, configFile, output, cacheDir, lambdaArg;
    bool noGlobal = false, noSnap = false, dedup = false, reduce = false, noCache = false;
    for (int i=1;i<argc;i++) {
        std::string a = argv[i];
        if (a == "--dataset" && i+1<argc) manifest = argv[++i];
        else if (a == "--config" && i+1<argc) configFile = argv[++i];
        else if (a == "--output" && i+1<argc) output = argv[++i];
        else if (a == "--cache-dir" && i+1<argc) cacheDir = argv[++i];
        else if (a == "--lambda" && i+1<argc) lambdaArg = argv[++i];
        else if (a == "--no-global") noGlobal = true;
        else if (a == "--no-snap") noSnap = true;
        else if (a == "--remove-duplicates") dedup = true;
        else if (a == "--reduce-map") reduce = true;
        else if (a == "--no-cache") noCache = true;
        else {
            std::cerr << "Unknown argument: " << a << std::endl;
            usage(argv[0]);
            return 1;
        }
    }
    if (manifest.empty()) {
        std::cerr << "Missing required argument --dataset." << std::endl;
        return 1;
    }
    if (!std::filesystem::exists(manifest)) {
        std::cerr << "Dataset manifest not found: " << manifest << std::endl;
        return 1;
    }

    try {
        ddloc::ControllerOptions options;
        if (!configFile.empty()) options = ddloc::ControllerOptions::load(configFile);
        if (!output.empty()) options.output_path = output;
        if (!cacheDir.empty()) options.cache_dir = cacheDir;
        if (!lambdaArg.empty()) options.lambda = std::stod(lambdaArg);
        if (noGlobal) options.use_global = false;
        if (noSnap) options.snap_query_global = false;
        if (dedup) options.remove_duplicates = true;
        if (reduce) options.reduce_map = true;
        if (noCache) options.use_cache = false;

        ddloc::Controller controller;
        return controller.run(manifest, options);
    } catch (const std::exception &e) {
        std::cerr << "ddloc_localize: " << e.what() << std::endl;
        return 1;
    }
}
