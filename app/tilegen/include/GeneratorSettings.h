#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tessella {

struct GeneratorSettings {
    uint32_t rows = 100;
    uint32_t cols = 100;
    bool reverseWinding = false;
    std::string outputDirectory = ".";
    // Tiling identifiers as typed by the user; "all" selects every tiling
    std::vector<std::string> tilings{ "all" };
    bool validate = true;
    std::string logLevel = "info";

    static GeneratorSettings Load(const std::string& path = "tessella_tilegen.ini");
    bool Save(const std::string& path = "tessella_tilegen.ini") const;
};

} // namespace tessella
