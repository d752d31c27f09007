// modmul_config.cpp

#include "modmul_config.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>

namespace modmul {

namespace {
  const double pi = 3.14159265358979323846;

  bool parseInt(const char* text, int lo, int hi, int& out) {
    char* end;
    errno = 0;
    long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || errno == ERANGE || v < lo || v > hi)
      return false;
    out = (int)v;
    return true;
  }

  bool parseDegrees(const char* text, int& out) {
    char* end;
    double v = std::strtod(text, &end);
    if (end == text || *end != '\0' || !std::isfinite(v) ||
        v < MIN_ANGLE_DEGREES || v > MAX_ANGLE_DEGREES)
      return false;
    out = (int)(v < 0 ? v - 0.5 : v + 0.5);
    return true;
  }
}

Canvas ViewerConfig::canvas() const {
  Canvas c;
  c.center = (double)(imageSize / 2);
  c.radius = imageSize * DRAWING_RATIO / 2.0;
  return c;
}

Parameters ViewerConfig::parameters() const {
  Parameters p;
  p.vertexCount = vertexCount;
  p.modulus     = modulus;
  p.multiplier  = multiplier;
  p.angle       = degreesToRadians(angleDegrees);
  return p;
}

double degreesToRadians(double degrees) {
  return degrees * pi / 180.0;
}

void printUsage(const char* prog) {
  std::printf("Usage: %s [options]\n", prog);
  std::printf("\nOptions:\n");
  std::printf("  --size <px>         Canvas side length (%d..%d, default %d)\n",
              MIN_IMAGE_SIZE, MAX_IMAGE_SIZE, IMAGE_SIZE);
  std::printf("  --vertices <V>      Polygon vertex count (%d..%d; %d draws a circle)\n",
              MIN_VERTEX_COUNT, MAX_VERTEX_COUNT, MAX_VERTEX_COUNT);
  std::printf("  --modulus <M>       Number of boundary points (%d..%d)\n",
              MIN_MODULUS, MAX_MODULUS);
  std::printf("  --multiplier <K>    Connect i to i*K mod M (0..M)\n");
  std::printf("  --angle <degrees>   Rotation (%d..%d)\n", MIN_ANGLE_DEGREES, MAX_ANGLE_DEGREES);
  std::printf("  --verbose           Log every recompute to stderr\n");
  std::printf("  --help              Show this help message\n");
  std::printf("\nControls:\n");
  std::printf("  Mouse drag on a slider  - Change its value\n");
  std::printf("  Tab / Shift+Tab         - Move keyboard focus between sliders\n");
  std::printf("  Left/Right, PgUp/PgDn   - Nudge focused slider by 1 / 10\n");
  std::printf("  Digits, Enter           - Type a value for the focused slider\n");
  std::printf("  Esc                     - Cancel typing, or quit\n");
  std::printf("  Q                       - Quit\n");
}

int parseArgs(int argc, char* argv[], ViewerConfig& config) {
  static struct option long_options[] = {
    {"size",       required_argument, 0, 's'},
    {"vertices",   required_argument, 0, 'V'},
    {"modulus",    required_argument, 0, 'M'},
    {"multiplier", required_argument, 0, 'K'},
    {"angle",      required_argument, 0, 'a'},
    {"verbose",    no_argument,       0, 'v'},
    {"help",       no_argument,       0, 'h'},
    {0, 0, 0, 0}
  };

  bool multiplierGiven = false;
  int opt;
  int option_index = 0;
  optind = 0;   // glibc: full rescan, so parseArgs can run more than once
  while ((opt = getopt_long(argc, argv, "s:V:M:K:a:vh", long_options, &option_index)) != -1) {
    switch (opt) {
      case 's':
        if (!parseInt(optarg, MIN_IMAGE_SIZE, MAX_IMAGE_SIZE, config.imageSize)) {
          std::fprintf(stderr, "Error: Invalid size '%s' (expected %d..%d)\n",
                       optarg, MIN_IMAGE_SIZE, MAX_IMAGE_SIZE);
          return 1;
        }
        break;
      case 'V':
        if (!parseInt(optarg, MIN_VERTEX_COUNT, MAX_VERTEX_COUNT, config.vertexCount)) {
          std::fprintf(stderr, "Error: Invalid vertex count '%s' (expected %d..%d)\n",
                       optarg, MIN_VERTEX_COUNT, MAX_VERTEX_COUNT);
          return 1;
        }
        break;
      case 'M':
        if (!parseInt(optarg, MIN_MODULUS, MAX_MODULUS, config.modulus)) {
          std::fprintf(stderr, "Error: Invalid modulus '%s' (expected %d..%d)\n",
                       optarg, MIN_MODULUS, MAX_MODULUS);
          return 1;
        }
        break;
      case 'K':
        if (!parseInt(optarg, 0, MAX_MODULUS, config.multiplier)) {
          std::fprintf(stderr, "Error: Invalid multiplier '%s' (expected 0..%d)\n",
                       optarg, MAX_MODULUS);
          return 1;
        }
        multiplierGiven = true;
        break;
      case 'a':
        if (!parseDegrees(optarg, config.angleDegrees)) {
          std::fprintf(stderr, "Error: Invalid angle '%s' (expected %d..%d degrees)\n",
                       optarg, MIN_ANGLE_DEGREES, MAX_ANGLE_DEGREES);
          return 1;
        }
        break;
      case 'v':
        config.verbose = true;
        break;
      case 'h':
        printUsage(argv[0]);
        return 0;
      default:
        printUsage(argv[0]);
        return 1;
    }
  }

  if (optind < argc) {
    std::fprintf(stderr, "Error: Unexpected argument '%s'\n", argv[optind]);
    printUsage(argv[0]);
    return 1;
  }

  // The multiplier slider never goes past the modulus.
  if (config.multiplier > config.modulus) {
    if (multiplierGiven)
      std::fprintf(stderr, "Warning: multiplier %d exceeds modulus %d, using %d\n",
                   config.multiplier, config.modulus, config.modulus);
    config.multiplier = config.modulus;
  }
  return CONTINUE;
}

} // namespace modmul
