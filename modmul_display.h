// modmul_display.h - parameter state, staged recompute and scene assembly.

#ifndef MODMUL_DISPLAY_H
#define MODMUL_DISPLAY_H

#include <string>
#include <vector>

#include "modmul_geometry.h"

namespace modmul {

// Which stages a changeParameters() call actually recomputed.
struct Staleness {
  bool vertices    = false;
  bool edgePoints  = false;
  bool connections = false;

  bool any() const { return vertices || edgePoints || connections; }
};

// Everything a renderer needs for one frame.  In circle mode `outline` holds
// the two corners of the circle's bounding box and `circle` is true; otherwise
// it is the closed polygon loop.
struct Scene {
  bool                    circle = false;
  std::vector<Point>      outline;
  std::vector<Point>      edgePoints;
  std::vector<Connection> connections;
  std::string             caption;
};

class DisplayController {
public:
  DisplayController(const Canvas& canvas, const Parameters& initial);

  Staleness changeParameters(int vertexCount, int modulus, int multiplier, double angle);
  Staleness changeParameters(const Parameters& p) {
    return changeParameters(p.vertexCount, p.modulus, p.multiplier, p.angle);
  }

  Scene getScene() const;
  std::string caption() const;

  const Parameters&              parameters() const { return params_; }
  const Canvas&                  canvas() const { return canvas_; }
  bool                           isCircle() const { return modmul::isCircle(params_.vertexCount); }
  const std::vector<Point>&      vertices() const { return vertices_; }
  const std::vector<Point>&      edgePoints() const { return edgePoints_; }
  const std::vector<Connection>& connections() const { return connections_; }

  // Trace every recompute to std::cerr.
  void setVerbose(bool on) { verbose_ = on; }

private:
  void trace(const Staleness& s) const;

  Canvas                  canvas_;
  Parameters              params_;
  std::vector<Point>      vertices_;
  std::vector<Point>      edgePoints_;
  std::vector<Connection> connections_;
  bool                    verbose_ = false;
};

} // namespace modmul

#endif // MODMUL_DISPLAY_H
