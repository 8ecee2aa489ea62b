#pragma once

#include "GeneratorSettings.h"
#include "tessella/core/Core.h"
#include "tessella/tiling/TilingCatalog.h"
#include <string>
#include <vector>

namespace tessella {

// Generates every configured tiling and writes <OutputDirectory>/<NAME>.obj
class TileGenerator : public NonCopyable {
public:
    TileGenerator() = default;
    virtual ~TileGenerator() = default;
    
    // Resolves tiling names and prepares the output directory.
    // Returns false (and logs why) if a name is unknown or the directory cannot be created.
    bool Init(const GeneratorSettings& settings);
    
    // Returns the number of tilings that failed to generate, validate or save.
    // Allocation and other generation errors are logged and counted, never rethrown.
    int Run();
    
    const std::vector<tiling::TilingKind>& GetTilings() const { return m_Tilings; }
    const std::vector<std::string>& GetWrittenFiles() const { return m_WrittenFiles; }
    
protected:
    // Builds the mesh for kind at the configured size
    virtual tiling::TilingMesh GenerateMesh(tiling::TilingKind kind) const;
    
private:
    bool GenerateOne(tiling::TilingKind kind);
    
    GeneratorSettings m_Settings;
    std::vector<tiling::TilingKind> m_Tilings;
    std::vector<std::string> m_WrittenFiles;
};

} // namespace tessella
