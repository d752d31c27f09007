// modmul_geometry.cpp

#include "modmul_geometry.h"

#include <cmath>
#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace modmul {

namespace {
  const double pi = 3.14159265358979323846;

  // Unit point at `theta`, rotated, cleaned, then placed on the canvas.
  Point placeOnCanvas(double theta, double angle, const Canvas& canvas) {
    Point p = snapToZero(rotate(Point{std::cos(theta), std::sin(theta)}, angle));
    return Point{p.x * canvas.radius + canvas.center,
                 p.y * canvas.radius + canvas.center};
  }
}

bool isCircle(int vertexCount) {
  return vertexCount >= MAX_VERTEX_COUNT;
}

Point rotate(const Point& p, double angle) {
  const double c = std::cos(angle);
  const double s = std::sin(angle);
  return Point{p.x * c - p.y * s, p.x * s + p.y * c};
}

Point snapToZero(const Point& p, double tol) {
  if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
    std::ostringstream msg;
    msg << "snapToZero: point (" << p.x << ", " << p.y << ") is not numeric";
    throw std::invalid_argument(msg.str());
  }
  Point out = p;
  if (std::fabs(out.x) < tol) out.x = 0.0;
  if (std::fabs(out.y) < tol) out.y = 0.0;
  return out;
}

void snapToZero(std::vector<Point>& points, double tol) {
  for (std::size_t i = 0; i < points.size(); ++i) {
    if (!std::isfinite(points[i].x) || !std::isfinite(points[i].y)) {
      std::ostringstream msg;
      msg << "snapToZero: entry " << i << " is not numeric";
      throw std::invalid_argument(msg.str());
    }
    points[i] = snapToZero(points[i], tol);
  }
}

std::vector<Point> computeVertices(int vertexCount, double angle, const Canvas& canvas) {
  std::vector<Point> vertices;
  if (isCircle(vertexCount) || vertexCount <= 0)
    return vertices;

  vertices.reserve(vertexCount);
  for (int j = 0; j < vertexCount; ++j) {
    double theta = (double)(j * 2) * pi / (double)vertexCount;
    vertices.push_back(placeOnCanvas(theta, angle, canvas));
  }
  return vertices;
}

std::vector<Point> polygonEdgeSamples(const std::vector<Point>& vertices, int samplesPerSide) {
  std::vector<Point> points;
  const std::size_t n = vertices.size();
  if (n == 0 || samplesPerSide <= 0)
    return points;

  points.reserve(n * samplesPerSide);
  for (std::size_t i = 0; i < n; ++i) {
    const Point& p1 = vertices[i];
    const Point& p2 = vertices[(i + 1) % n];
    for (int s = 0; s < samplesPerSide; ++s) {
      double t = (double)s / (double)samplesPerSide;   // t = 1 belongs to the next side
      points.push_back(Point{(1.0 - t) * p1.x + t * p2.x,
                             (1.0 - t) * p1.y + t * p2.y});
    }
  }
  return points;
}

std::vector<Point> computeEdgePoints(const std::vector<Point>& vertices,
                                     int vertexCount, int modulus, double angle,
                                     const Canvas& canvas) {
  if (isCircle(vertexCount)) {
    std::vector<Point> points;
    if (modulus <= 0)
      return points;
    points.reserve(modulus);
    for (int i = 0; i < modulus; ++i) {
      double theta = (double)(i * 2) * pi / (double)modulus;
      points.push_back(placeOnCanvas(theta, angle, canvas));
    }
    return points;
  }

  if (vertexCount <= 0)
    return std::vector<Point>();
  // modulus < vertexCount leaves zero samples per side: an empty pattern.
  return polygonEdgeSamples(vertices, modulus / vertexCount);
}

std::vector<Connection> computeConnections(std::size_t edgePointCount, int multiplier) {
  std::vector<Connection> connections;
  if (edgePointCount == 0)
    return connections;

  connections.reserve(edgePointCount);
  const std::int64_t L = (std::int64_t)edgePointCount;
  for (std::int64_t i = 0; i < L; ++i) {
    std::int64_t end = (i * (std::int64_t)multiplier) % L;
    connections.emplace_back((int)i, (int)end);
  }
  return connections;
}

} // namespace modmul
