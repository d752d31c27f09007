// slider_panel.h - state of the four parameter sliders under the canvas.
//
// Pure bookkeeping: ranges, clamping, keyboard focus, typed entry and the
// pixel geometry of each track.  Drawing lives in modmul_render.

#ifndef MODMUL_SLIDER_PANEL_H
#define MODMUL_SLIDER_PANEL_H

#include <string>

#include "modmul_config.h"
#include "modmul_geometry.h"

namespace modmul {

enum SliderId { SLIDER_VERTEX = 0, SLIDER_MODULUS, SLIDER_MULTIPLIER, SLIDER_ANGLE, SLIDER_COUNT };

struct Slider {
  const char* label = "";
  int min = 0;
  int max = 0;
  int value = 0;
};

struct Rect {
  int x = 0, y = 0, w = 0, h = 0;
  bool contains(int px, int py) const { return px >= x && px < x + w && py >= y && py < y + h; }
};

class SliderPanel {
public:
  explicit SliderPanel(const ViewerConfig& config);

  const Slider& slider(SliderId id) const { return sliders_[id]; }
  int value(SliderId id) const { return sliders_[id].value; }

  // Clamps into the slider's range.  Returns true if the value changed.
  // A modulus change also moves the multiplier's upper bound.
  bool setValue(SliderId id, int v);
  bool step(int delta) { return setValue(focus_, sliders_[focus_].value + delta); }

  SliderId focus() const { return focus_; }
  void setFocus(SliderId id);
  void focusNext();
  void focusPrev();

  // Typed entry for the focused slider.
  const std::string& entry() const { return entry_; }
  bool entryActive() const { return !entry_.empty(); }
  void typeChar(char c);
  void backspace();
  void cancelEntry() { entry_.clear(); }
  bool commitEntry();     // true if a value was applied and it changed

  // Layout inside a band starting at `bandTop` and `width` pixels wide.
  Rect rowRect(SliderId id, int bandTop, int width) const;
  Rect trackRect(SliderId id, int bandTop, int width) const;
  int  valueAt(SliderId id, int px, int bandTop, int width) const;

  // Mouse: press grabs the slider under the cursor, drag moves it.
  bool press(int px, int py, int bandTop, int width);
  bool drag(int px, int bandTop, int width);
  void release() { grabbed_ = SLIDER_COUNT; }
  bool dragging() const { return grabbed_ != SLIDER_COUNT; }

  Parameters parameters() const;

private:
  void updateMultiplierMax();

  Slider      sliders_[SLIDER_COUNT];
  SliderId    focus_   = SLIDER_VERTEX;
  SliderId    grabbed_ = SLIDER_COUNT;
  std::string entry_;
};

} // namespace modmul

#endif // MODMUL_SLIDER_PANEL_H
