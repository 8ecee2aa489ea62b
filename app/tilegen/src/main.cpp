#include "GeneratorSettings.h"
#include "TileGenerator.h"
#include "tessella/core/Log.h"

#include <string>
#include <vector>

// Usage: tessella_tilegen [settings.ini] [tiling ...]
// A first argument ending in .ini selects the settings file; any remaining
// arguments replace the Tilings setting.
int main(int argc, char* argv[]) {
    tessella::Log::Init();
    
    std::string settingsPath = "tessella_tilegen.ini";
    int firstTiling = 1;
    if (argc > 1) {
        const std::string first = argv[1];
        if (first.size() > 4 && first.compare(first.size() - 4, 4, ".ini") == 0) {
            settingsPath = first;
            firstTiling = 2;
        }
    }
    
    tessella::GeneratorSettings settings = tessella::GeneratorSettings::Load(settingsPath);
    
    if (!tessella::Log::SetLevel(settings.logLevel)) {
        TESSELLA_WARN("Unknown LogLevel '{}', keeping info", settings.logLevel);
    }
    
    if (argc > firstTiling) {
        settings.tilings.assign(argv + firstTiling, argv + argc);
    }
    
    tessella::TileGenerator generator;
    if (!generator.Init(settings)) {
        TESSELLA_CRITICAL("Failed to initialize tiling generator");
        tessella::Log::Shutdown();
        return 1;
    }
    
    const int failures = generator.Run();
    if (failures > 0) {
        TESSELLA_ERROR("{} of {} tilings failed", failures, generator.GetTilings().size());
    } else {
        TESSELLA_INFO("Wrote {} tilings", generator.GetWrittenFiles().size());
    }
    
    tessella::Log::Shutdown();
    return failures > 0 ? 1 : 0;
}
