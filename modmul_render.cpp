// modmul_render.cpp

#include "modmul_render.h"

#include <cmath>
#include <cstdio>

// Prefer freeglut on Linux; it includes <GL/gl.h> and <GL/glu.h> for you.
#include <GL/freeglut.h>

namespace modmul {

namespace {
  const double pi = 3.14159265358979323846;
  const int CIRCLE_SEGMENTS = 360;

  // Caption font is fixed width, like the original's FreeMono.
  void* const CAPTION_FONT = GLUT_BITMAP_9_BY_15;
  void* const PANEL_FONT   = GLUT_BITMAP_HELVETICA_12;

  void drawText(int x, int baseline, void* font, const char* text) {
    glRasterPos2i(x, baseline);
    for (const char* p = text; *p; ++p)
      glutBitmapCharacter(font, *p);
  }

  void fillRect(const Rect& r) {
    glBegin(GL_QUADS);
      glVertex2i(r.x, r.y);
      glVertex2i(r.x + r.w, r.y);
      glVertex2i(r.x + r.w, r.y + r.h);
      glVertex2i(r.x, r.y + r.h);
    glEnd();
  }

  void strokeRect(const Rect& r) {
    glBegin(GL_LINE_LOOP);
      glVertex2i(r.x, r.y);
      glVertex2i(r.x + r.w, r.y);
      glVertex2i(r.x + r.w, r.y + r.h);
      glVertex2i(r.x, r.y + r.h);
    glEnd();
  }

  // Circle inscribed in the box spanned by two opposite corners.
  void drawEllipse(const Point& a, const Point& b) {
    const double cx = (a.x + b.x) / 2.0, cy = (a.y + b.y) / 2.0;
    const double rx = std::fabs(b.x - a.x) / 2.0, ry = std::fabs(b.y - a.y) / 2.0;
    glBegin(GL_LINE_LOOP);
    for (int i = 0; i < CIRCLE_SEGMENTS; ++i) {
      double theta = (double)(i * 2) * pi / (double)CIRCLE_SEGMENTS;
      glVertex2d(cx + rx * std::cos(theta), cy + ry * std::sin(theta));
    }
    glEnd();
  }
}

void setPixelProjection(int width, int height) {
  glViewport(0, 0, width, height);
  glMatrixMode(GL_PROJECTION);
  glLoadIdentity();
  // y down, matching the image coordinates the kernel produces
  gluOrtho2D(0.0, (double)width, (double)height, 0.0);
  glMatrixMode(GL_MODELVIEW);
  glLoadIdentity();
}

void drawScene(const Scene& scene) {
  // Outline (WHITE)
  glColor3f(1.0f, 1.0f, 1.0f);
  if (scene.circle) {
    if (scene.outline.size() == 2)
      drawEllipse(scene.outline[0], scene.outline[1]);
  } else if (!scene.outline.empty()) {
    glBegin(GL_LINE_LOOP);
    for (const Point& p : scene.outline)
      glVertex2d(p.x, p.y);
    glEnd();
  }

  // Boundary samples (GRAY)
  glColor3f(0.55f, 0.55f, 0.55f);
  glBegin(GL_POINTS);
  for (const Point& p : scene.edgePoints)
    glVertex2d(p.x, p.y);
  glEnd();

  // Multiplication chords (WHITE)
  glColor3f(1.0f, 1.0f, 1.0f);
  const int n = (int)scene.edgePoints.size();
  glBegin(GL_LINES);
  for (const Connection& c : scene.connections) {
    if (c.first < 0 || c.first >= n || c.second < 0 || c.second >= n)
      continue;
    const Point& a = scene.edgePoints[c.first];
    const Point& b = scene.edgePoints[c.second];
    glVertex2d(a.x, a.y);
    glVertex2d(b.x, b.y);
  }
  glEnd();

  drawText(40, 20, CAPTION_FONT, scene.caption.c_str());
}

void drawSliderPanel(const SliderPanel& panel, int bandTop, int width) {
  glColor3f(0.92f, 0.92f, 0.92f);
  fillRect(Rect{0, bandTop, width, CONTROL_BAND_HEIGHT});

  for (int i = 0; i < SLIDER_COUNT; ++i) {
    SliderId id = (SliderId)i;
    const Slider& s = panel.slider(id);
    Rect row   = panel.rowRect(id, bandTop, width);
    Rect track = panel.trackRect(id, bandTop, width);
    bool focused = panel.focus() == id;
    int baseline = row.y + row.h / 2 + 4;

    if (focused) {
      glColor3f(0.82f, 0.87f, 0.95f);
      fillRect(row);
    }

    glColor3f(0.1f, 0.1f, 0.1f);
    drawText(10, baseline, PANEL_FONT, s.label);

    // Track
    glColor3f(0.75f, 0.75f, 0.75f);
    fillRect(track);
    glColor3f(0.45f, 0.45f, 0.45f);
    strokeRect(track);

    // Knob
    double frac = s.max > s.min ? (double)(s.value - s.min) / (double)(s.max - s.min) : 0.0;
    int kx = track.x + (int)(frac * track.w);
    glColor3f(0.2f, 0.35f, 0.7f);
    fillRect(Rect{kx - 4, track.y - 3, 8, track.h + 6});

    // Value, or the pending typed entry
    char text[32];
    if (focused && panel.entryActive())
      std::snprintf(text, sizeof(text), "%s_", panel.entry().c_str());
    else
      std::snprintf(text, sizeof(text), "%d", s.value);
    glColor3f(0.1f, 0.1f, 0.1f);
    drawText(track.x + track.w + 12, baseline, PANEL_FONT, text);
  }
}

} // namespace modmul
