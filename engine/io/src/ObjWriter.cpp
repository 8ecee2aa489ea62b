#include "tessella/io/ObjWriter.h"
#include "tessella/core/Log.h"

#include <spdlog/fmt/fmt.h>
#include <fstream>
#include <iterator>

namespace tessella::io {

ObjWriter::ObjWriter(ObjExportOptions options)
    : m_Options(options) {
}

bool ObjWriter::Write(const tiling::TilingMesh& mesh, std::ostream& out) {
    m_LastError.clear();
    
    fmt::memory_buffer line;
    auto flush = [&]() {
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
        line.clear();
        return out.good();
    };
    
    fmt::format_to(std::back_inserter(line), "o {}-tiling\n", mesh.GetName());
    if (!flush()) {
        m_LastError = "Failed to write object header for " + mesh.GetName();
        TESSELLA_CORE_ERROR("{}", m_LastError);
        return false;
    }
    
    for (const tiling::Point& p : mesh.GetPoints()) {
        fmt::format_to(std::back_inserter(line), "v {} {} 0\n", p.x, p.y);
        if (!flush()) {
            m_LastError = "Failed to write vertices for " + mesh.GetName();
            TESSELLA_CORE_ERROR("{}", m_LastError);
            return false;
        }
    }
    
    for (const tiling::Face& face : mesh.GetFaces()) {
        line.push_back('f');
        if (m_Options.reverseFaceWinding) {
            for (auto it = face.rbegin(); it != face.rend(); ++it) {
                fmt::format_to(std::back_inserter(line), " {}", *it + 1);
            }
        } else {
            for (tiling::VertexKey key : face) {
                fmt::format_to(std::back_inserter(line), " {}", key + 1);
            }
        }
        line.push_back('\n');
        if (!flush()) {
            m_LastError = "Failed to write faces for " + mesh.GetName();
            TESSELLA_CORE_ERROR("{}", m_LastError);
            return false;
        }
    }
    
    return true;
}

bool ObjWriter::Save(const tiling::TilingMesh& mesh, const std::string& path) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        m_LastError = "Failed to open file for writing: " + path;
        TESSELLA_CORE_ERROR("{}", m_LastError);
        return false;
    }
    
    if (!Write(mesh, file)) {
        m_LastError += " (" + path + ")";
        return false;
    }
    
    file.flush();
    file.close();
    if (file.fail()) {
        m_LastError = "Failed to finish writing: " + path;
        TESSELLA_CORE_ERROR("{}", m_LastError);
        return false;
    }
    
    TESSELLA_CORE_INFO("Saved {} ({} points, {} faces) to {}",
                       mesh.GetName(), mesh.GetVertexCount(), mesh.GetFaceCount(), path);
    return true;
}

} // namespace tessella::io
