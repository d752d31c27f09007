// modmul_display.cpp

#include "modmul_display.h"

#include <cstdio>
#include <iostream>

namespace modmul {

DisplayController::DisplayController(const Canvas& canvas, const Parameters& initial)
  : canvas_(canvas), params_(initial) {
  vertices_    = computeVertices(params_.vertexCount, params_.angle, canvas_);
  edgePoints_  = computeEdgePoints(vertices_, params_.vertexCount, params_.modulus,
                                   params_.angle, canvas_);
  connections_ = computeConnections(edgePoints_.size(), params_.multiplier);
}

Staleness DisplayController::changeParameters(int vertexCount, int modulus, int multiplier,
                                              double angle) {
  const bool vertexChanged     = params_.vertexCount != vertexCount;
  const bool modulusChanged    = params_.modulus != modulus;
  const bool multiplierChanged = params_.multiplier != multiplier;
  const bool angleChanged      = params_.angle != angle;
  const std::size_t prevEdgeCount = edgePoints_.size();

  Staleness s;
  s.vertices   = angleChanged || vertexChanged;
  s.edgePoints = s.vertices || modulusChanged;

  // Stage into locals so a throwing kernel call leaves the caches and the
  // stored parameters as they were.
  std::vector<Point> vertices = s.vertices
      ? computeVertices(vertexCount, angle, canvas_) : vertices_;
  std::vector<Point> edgePoints = s.edgePoints
      ? computeEdgePoints(vertices, vertexCount, modulus, angle, canvas_) : edgePoints_;

  // Connections only see the edge-point count, never the positions.
  const bool edgeCountChanged = prevEdgeCount != edgePoints.size();
  s.connections = edgeCountChanged || multiplierChanged;
  std::vector<Connection> connections = s.connections
      ? computeConnections(edgePoints.size(), multiplier) : connections_;

  vertices_.swap(vertices);
  connections_.swap(connections);
  edgePoints_.swap(edgePoints);
  params_.angle       = angle;
  params_.vertexCount = vertexCount;
  params_.modulus     = modulus;
  params_.multiplier  = multiplier;

  if (verbose_ && s.any())
    trace(s);
  return s;
}

std::string DisplayController::caption() const {
  char text[128];
  if (isCircle())
    std::snprintf(text, sizeof(text), "Modular multiplication circle, M=%d, K=%d",
                  params_.modulus, params_.multiplier);
  else
    std::snprintf(text, sizeof(text), "Modular multiplication polygon, V=%d, M=%d, K=%d",
                  params_.vertexCount, params_.modulus, params_.multiplier);
  return text;
}

Scene DisplayController::getScene() const {
  Scene scene;
  scene.circle = isCircle();
  if (scene.circle) {
    const double lo = canvas_.center - canvas_.radius;
    const double hi = canvas_.center + canvas_.radius;
    scene.outline = { Point{lo, lo}, Point{hi, hi} };
  } else {
    scene.outline = vertices_;
  }
  scene.edgePoints  = edgePoints_;
  scene.connections = connections_;
  scene.caption     = caption();
  return scene;
}

void DisplayController::trace(const Staleness& s) const {
  std::cerr << "recompute:"
            << (s.vertices ? " vertices" : "")
            << (s.edgePoints ? " edge-points" : "")
            << (s.connections ? " connections" : "")
            << "  [" << caption() << "]  edges=" << edgePoints_.size()
            << " lines=" << connections_.size() << std::endl;
}

} // namespace modmul
