#pragma once

#include "tessella/core/Core.h"
#include "tessella/tiling/TilingMesh.h"
#include <ostream>
#include <string>

namespace tessella::io {

struct ObjExportOptions {
    // Emit every face's keys back to front, flipping the normal to -Z
    bool reverseFaceWinding = false;
};

// Wavefront OBJ export of a tiling patch:
//   o <name>-tiling
//   v <x> <y> 0           one per point
//   f <k+1> <k+1> ...     one per face, 1-based keys
class ObjWriter : public NonCopyable {
public:
    explicit ObjWriter(ObjExportOptions options = {});
    
    // Returns false if the stream goes bad; see GetLastError()
    bool Write(const tiling::TilingMesh& mesh, std::ostream& out);
    
    // Creates or truncates path. Returns false if it cannot be opened or written.
    bool Save(const tiling::TilingMesh& mesh, const std::string& path);
    
    const ObjExportOptions& GetOptions() const { return m_Options; }
    const std::string& GetLastError() const { return m_LastError; }
    
private:
    ObjExportOptions m_Options;
    std::string m_LastError;
};

} // namespace tessella::io
