// modmul_geometry.h - geometry kernel for the modular multiplication viewer.
//
// Points on a polygon (or a circle once the vertex count hits its maximum)
// joined by the rule  i -> (i * K) mod L.  Everything here is a pure
// function of its arguments; no state, no I/O.

#ifndef MODMUL_GEOMETRY_H
#define MODMUL_GEOMETRY_H

#include <cstddef>
#include <utility>
#include <vector>

namespace modmul {

static constexpr int    MAX_VERTEX_COUNT = 50;     // V >= this is circle mode
static constexpr double SNAP_TOLERANCE   = 1e-10;

struct Point {
  double x = 0.0;
  double y = 0.0;
};

inline bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }

using Connection = std::pair<int, int>;

// Square drawing area: `center` is the pixel offset of the origin on both
// axes, `radius` is half the drawing diameter.
struct Canvas {
  double center = 0.0;
  double radius = 1.0;
};

// The four user-facing inputs.  angle is in radians.
struct Parameters {
  int    vertexCount = 3;
  int    modulus     = 9;
  int    multiplier  = 2;
  double angle       = 0.0;
};

bool isCircle(int vertexCount);

Point rotate(const Point& p, double angle);

// Components with magnitude below tol become exactly 0.  Throws
// std::invalid_argument on NaN or infinity.
Point snapToZero(const Point& p, double tol = SNAP_TOLERANCE);
void  snapToZero(std::vector<Point>& points, double tol = SNAP_TOLERANCE);

std::vector<Point> computeVertices(int vertexCount, double angle, const Canvas& canvas);

std::vector<Point> polygonEdgeSamples(const std::vector<Point>& vertices, int samplesPerSide);

// In polygon mode the samples are taken along `vertices`, which must be the
// result of computeVertices() for the same vertexCount and angle.
std::vector<Point> computeEdgePoints(const std::vector<Point>& vertices,
                                     int vertexCount, int modulus, double angle,
                                     const Canvas& canvas);

std::vector<Connection> computeConnections(std::size_t edgePointCount, int multiplier);

} // namespace modmul

#endif // MODMUL_GEOMETRY_H
