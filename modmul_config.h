// modmul_config.h - viewer limits, defaults and command-line parsing.

#ifndef MODMUL_CONFIG_H
#define MODMUL_CONFIG_H

#include "modmul_geometry.h"

namespace modmul {

// ===== limits and defaults =====
static constexpr int    IMAGE_SIZE          = 1200;   // canvas side, pixels
static constexpr double DRAWING_RATIO       = 0.9;    // drawing diameter / canvas side
static constexpr int    CONTROL_BAND_HEIGHT = 130;    // slider strip under the canvas
static constexpr int    MIN_IMAGE_SIZE      = 100;
static constexpr int    MAX_IMAGE_SIZE      = 4000;
static constexpr int    MIN_VERTEX_COUNT    = 3;
static constexpr int    MIN_MODULUS         = 1;
static constexpr int    MAX_MODULUS         = 1000;
static constexpr int    MIN_ANGLE_DEGREES   = -180;
static constexpr int    MAX_ANGLE_DEGREES   = 180;
// ===============================

struct ViewerConfig {
  int  imageSize    = IMAGE_SIZE;
  int  vertexCount  = 3;
  int  modulus      = 100;
  int  multiplier   = 2;
  int  angleDegrees = -150;
  bool verbose      = false;

  Canvas     canvas() const;
  Parameters parameters() const;
};

double degreesToRadians(double degrees);

// parseArgs() result meaning "no early exit, go on and run".
static constexpr int CONTINUE = -1;

// Applies command-line overrides to `config`.  Returns CONTINUE, or the exit
// status main() should return (0 after --help, 1 on a bad option).
int parseArgs(int argc, char* argv[], ViewerConfig& config);

void printUsage(const char* prog);

} // namespace modmul

#endif // MODMUL_CONFIG_H
