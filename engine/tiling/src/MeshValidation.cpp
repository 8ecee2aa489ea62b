#include "tessella/tiling/MeshValidation.h"

#include <cmath>
#include <sstream>
#include <unordered_set>

namespace tessella::tiling {

std::string ValidationReport::Summary() const {
    std::ostringstream ss;
    ss << pointCount << " points, " << faceCount << " faces [";
    bool first = true;
    for (const auto& [size, count] : faceSizes) {
        if (!first) ss << " ";
        ss << size << ":" << count;
        first = false;
    }
    ss << "]";
    
    if (IsValid()) {
        ss << ", valid";
        return ss.str();
    }
    
    if (pointCount != expectedPointCount) ss << ", expected " << expectedPointCount << " points";
    if (outOfBoundsKeys) ss << ", " << outOfBoundsKeys << " out-of-bounds keys";
    if (repeatedKeyFaces) ss << ", " << repeatedKeyFaces << " faces with repeated keys";
    if (degenerateFaces) ss << ", " << degenerateFaces << " degenerate faces";
    if (clockwiseFaces) ss << ", " << clockwiseFaces << " clockwise faces";
    if (nonUnitEdges) ss << ", " << nonUnitEdges << " non-unit edges";
    return ss.str();
}

ValidationReport ValidateTilingMesh(const TilingMesh& mesh, double edgeTolerance) {
    ValidationReport report;
    report.expectedPointCount = static_cast<size_t>(mesh.GetRows()) * mesh.GetCols();
    report.pointCount = mesh.GetVertexCount();
    report.faceCount = mesh.GetFaceCount();
    
    const Points& points = mesh.GetPoints();
    std::unordered_set<VertexKey> seen;
    
    for (const Face& face : mesh.GetFaces()) {
        report.faceSizes[face.size()]++;
        
        if (face.size() < 3) {
            report.degenerateFaces++;
        }
        
        seen.clear();
        bool inBounds = true;
        for (VertexKey key : face) {
            if (key >= points.size()) {
                report.outOfBoundsKeys++;
                inBounds = false;
            }
            seen.insert(key);
        }
        if (seen.size() != face.size()) {
            report.repeatedKeyFaces++;
        }
        
        // Geometry is meaningless once a key points outside the patch
        if (!inBounds || face.size() < 3) {
            continue;
        }
        
        // Shoelace area and edge lengths in double precision
        double twiceArea = 0.0;
        for (size_t i = 0; i < face.size(); ++i) {
            const Point& a = points[face[i]];
            const Point& b = points[face[(i + 1) % face.size()]];
            const double ax = a.x, ay = a.y, bx = b.x, by = b.y;
            twiceArea += ax * by - bx * ay;
            
            const double length = std::hypot(bx - ax, by - ay);
            if (std::abs(length - 1.0) > edgeTolerance) {
                report.nonUnitEdges++;
            }
        }
        if (twiceArea <= 0.0) {
            report.clockwiseFaces++;
        }
    }
    
    return report;
}

} // namespace tessella::tiling
