#include "featson/featson.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

// Reads a GeoJSON file and prints it in canonical form.
//
//   featson_cat <file> [--insertion-order] [--indent N]
int main(int argc, char **argv) {
    spdlog::cfg::load_env_levels();

    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <file.geojson> [--insertion-order] [--indent N]\n";
        return 2;
    }

    featson::SerializeOptions options;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--insertion-order") {
            options.key_order = featson::KeyOrder::Insertion;
        } else if (arg == "--indent" && i + 1 < argc) {
            try {
                options.indent = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                spdlog::error("--indent expects a number, got \"{}\"", argv[i]);
                return 2;
            }
        } else {
            spdlog::error("unknown argument \"{}\"", arg);
            return 2;
        }
    }

    try {
        auto geojson = featson::read(argv[1]);
        std::cout << featson::to_string(geojson, options) << "\n";
    } catch (const featson::Error &e) {
        spdlog::error("{}: {} ({})", argv[1], e.what(), featson::to_string(e.kind()));
        return 1;
    } catch (const std::exception &e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
