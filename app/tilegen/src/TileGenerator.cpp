#include "TileGenerator.h"
#include "tessella/core/Log.h"
#include "tessella/io/ObjWriter.h"
#include "tessella/tiling/MeshValidation.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <new>
#include <stdexcept>
#include <system_error>

namespace tessella {

static bool IsAllTilings(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return lower == "all";
}

bool TileGenerator::Init(const GeneratorSettings& settings) {
    m_Settings = settings;
    m_Tilings.clear();
    m_WrittenFiles.clear();
    
    bool allKnown = true;
    for (const std::string& name : settings.tilings) {
        if (IsAllTilings(name)) {
            for (tiling::TilingKind kind : tiling::AllTilingKinds()) {
                if (std::find(m_Tilings.begin(), m_Tilings.end(), kind) == m_Tilings.end()) {
                    m_Tilings.push_back(kind);
                }
            }
            continue;
        }
        
        auto kind = tiling::FindTilingKind(name);
        if (!kind) {
            TESSELLA_ERROR("Unknown tiling '{}'", name);
            allKnown = false;
            continue;
        }
        if (std::find(m_Tilings.begin(), m_Tilings.end(), *kind) == m_Tilings.end()) {
            m_Tilings.push_back(*kind);
        }
    }
    if (!allKnown) {
        return false;
    }
    
    std::error_code ec;
    std::filesystem::create_directories(m_Settings.outputDirectory, ec);
    if (ec) {
        TESSELLA_ERROR("Cannot create output directory {}: {}", m_Settings.outputDirectory, ec.message());
        return false;
    }
    
    TESSELLA_INFO("Generating {} tiling(s) at {} x {} into {}",
                  m_Tilings.size(), m_Settings.rows, m_Settings.cols, m_Settings.outputDirectory);
    return true;
}

int TileGenerator::Run() {
    int failures = 0;
    for (tiling::TilingKind kind : m_Tilings) {
        if (!GenerateOne(kind)) {
            ++failures;
        }
    }
    return failures;
}

bool TileGenerator::GenerateOne(tiling::TilingKind kind) {
    const char* name = tiling::GetTilingName(kind);
    
    try {
        tiling::TilingMesh mesh = GenerateMesh(kind);
        
        if (m_Settings.validate) {
            tiling::ValidationReport report = tiling::ValidateTilingMesh(mesh);
            if (!report.IsValid()) {
                TESSELLA_ERROR("{} ({}) failed validation: {}", name, tiling::GetVertexConfiguration(kind), report.Summary());
                return false;
            }
            TESSELLA_LOG_DEBUG("{} ({}): {}", name, tiling::GetVertexConfiguration(kind), report.Summary());
        }
        
        if (mesh.GetFaceCount() == 0) {
            TESSELLA_WARN("{} has no faces at {} x {}; the patch is smaller than one tile",
                          name, m_Settings.rows, m_Settings.cols);
        }
        
        const std::string path = (std::filesystem::path(m_Settings.outputDirectory) / (std::string(name) + ".obj")).string();
        
        io::ObjExportOptions options;
        options.reverseFaceWinding = m_Settings.reverseWinding;
        io::ObjWriter writer(options);
        if (!writer.Save(mesh, path)) {
            TESSELLA_ERROR("Failed to write {}: {}", name, writer.GetLastError());
            return false;
        }
        
        m_WrittenFiles.push_back(path);
        return true;
    } catch (const tiling::TilingOverflowError& e) {
        TESSELLA_ERROR("{}: {}", name, e.what());
        return false;
    } catch (const std::bad_alloc&) {
        TESSELLA_ERROR("{}: out of memory for a {} x {} patch", name, m_Settings.rows, m_Settings.cols);
        return false;
    } catch (const std::exception& e) {
        TESSELLA_ERROR("{}: generation failed: {}", name, e.what());
        return false;
    }
}

tiling::TilingMesh TileGenerator::GenerateMesh(tiling::TilingKind kind) const {
    return tiling::Generate(kind, m_Settings.rows, m_Settings.cols);
}

} // namespace tessella
