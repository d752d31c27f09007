// modmul_render.h - fixed-function OpenGL drawing of a Scene and the sliders.
//
// All functions assume a current GL context whose projection maps pixels
// with the origin at the top-left (see setPixelProjection).

#ifndef MODMUL_RENDER_H
#define MODMUL_RENDER_H

#include "modmul_display.h"
#include "slider_panel.h"

namespace modmul {

void setPixelProjection(int width, int height);

void drawScene(const Scene& scene);

// Draws the control band spanning [bandTop, bandTop + CONTROL_BAND_HEIGHT).
void drawSliderPanel(const SliderPanel& panel, int bandTop, int width);

} // namespace modmul

#endif // MODMUL_RENDER_H
