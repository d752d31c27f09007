// slider_panel.cpp

#include "slider_panel.h"

#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdlib>

namespace modmul {

namespace {
  const int ROW_HEIGHT   = 28;
  const int BAND_PADDING = 9;
  const int LABEL_WIDTH  = 130;
  const int VALUE_WIDTH  = 90;
  const int TRACK_HEIGHT = 14;
  const std::size_t MAX_ENTRY = 6;   // "-180", "1000" with room to spare

  int clampInt(int v, int lo, int hi) {
    return v < lo ? lo : (v > hi ? hi : v);
  }
}

SliderPanel::SliderPanel(const ViewerConfig& config) {
  sliders_[SLIDER_VERTEX]     = Slider{"Vertex count:", MIN_VERTEX_COUNT, MAX_VERTEX_COUNT, 0};
  sliders_[SLIDER_MODULUS]    = Slider{"Modulus:", MIN_MODULUS, MAX_MODULUS, 0};
  sliders_[SLIDER_MULTIPLIER] = Slider{"Multiplier:", 0, MAX_MODULUS, 0};
  sliders_[SLIDER_ANGLE]      = Slider{"Angle:", MIN_ANGLE_DEGREES, MAX_ANGLE_DEGREES, 0};

  setValue(SLIDER_VERTEX, config.vertexCount);
  setValue(SLIDER_MODULUS, config.modulus);
  setValue(SLIDER_MULTIPLIER, config.multiplier);
  setValue(SLIDER_ANGLE, config.angleDegrees);
}

bool SliderPanel::setValue(SliderId id, int v) {
  Slider& s = sliders_[id];
  int old = s.value;
  s.value = clampInt(v, s.min, s.max);
  if (id == SLIDER_MODULUS)
    updateMultiplierMax();
  return s.value != old;
}

void SliderPanel::updateMultiplierMax() {
  Slider& k = sliders_[SLIDER_MULTIPLIER];
  k.max = sliders_[SLIDER_MODULUS].value;
  if (k.value > k.max)
    k.value = k.max;
}

void SliderPanel::setFocus(SliderId id) {
  if (id == focus_)
    return;
  entry_.clear();
  focus_ = id;
}

void SliderPanel::focusNext() {
  setFocus((SliderId)((focus_ + 1) % SLIDER_COUNT));
}

void SliderPanel::focusPrev() {
  setFocus((SliderId)((focus_ + SLIDER_COUNT - 1) % SLIDER_COUNT));
}

void SliderPanel::typeChar(char c) {
  if (entry_.size() >= MAX_ENTRY)
    return;
  if (c >= '0' && c <= '9')
    entry_ += c;
  else if (c == '-' && entry_.empty() && sliders_[focus_].min < 0)
    entry_ += c;
}

void SliderPanel::backspace() {
  if (!entry_.empty())
    entry_.erase(entry_.size() - 1);
}

bool SliderPanel::commitEntry() {
  if (entry_.empty())
    return false;
  const char* text = entry_.c_str();
  char* end;
  errno = 0;
  long v = std::strtol(text, &end, 10);
  bool ok = end != text && *end == '\0' && errno != ERANGE;
  entry_.clear();
  if (!ok)
    return false;
  return setValue(focus_, (int)v);
}

Rect SliderPanel::rowRect(SliderId id, int bandTop, int width) const {
  Rect r;
  r.x = 0;
  r.y = bandTop + BAND_PADDING + (int)id * ROW_HEIGHT;
  r.w = width;
  r.h = ROW_HEIGHT;
  return r;
}

Rect SliderPanel::trackRect(SliderId id, int bandTop, int width) const {
  Rect row = rowRect(id, bandTop, width);
  Rect r;
  r.x = LABEL_WIDTH;
  r.y = row.y + (ROW_HEIGHT - TRACK_HEIGHT) / 2;
  r.w = width - LABEL_WIDTH - VALUE_WIDTH;
  if (r.w < 1)
    r.w = 1;
  r.h = TRACK_HEIGHT;
  return r;
}

int SliderPanel::valueAt(SliderId id, int px, int bandTop, int width) const {
  const Slider& s = sliders_[id];
  Rect t = trackRect(id, bandTop, width);
  int offset = clampInt(px - t.x, 0, t.w);
  double frac = t.w > 0 ? (double)offset / (double)t.w : 0.0;
  return (int)std::lround(s.min + frac * (s.max - s.min));
}

bool SliderPanel::press(int px, int py, int bandTop, int width) {
  for (int i = 0; i < SLIDER_COUNT; ++i) {
    SliderId id = (SliderId)i;
    if (!rowRect(id, bandTop, width).contains(px, py))
      continue;
    setFocus(id);
    Rect t = trackRect(id, bandTop, width);
    if (px < t.x || px > t.x + t.w)
      return false;
    grabbed_ = id;
    return setValue(id, valueAt(id, px, bandTop, width));
  }
  return false;
}

bool SliderPanel::drag(int px, int bandTop, int width) {
  if (grabbed_ == SLIDER_COUNT)
    return false;
  return setValue(grabbed_, valueAt(grabbed_, px, bandTop, width));
}

Parameters SliderPanel::parameters() const {
  Parameters p;
  p.vertexCount = sliders_[SLIDER_VERTEX].value;
  p.modulus     = sliders_[SLIDER_MODULUS].value;
  p.multiplier  = sliders_[SLIDER_MULTIPLIER].value;
  p.angle       = degreesToRadians(sliders_[SLIDER_ANGLE].value);
  return p;
}

} // namespace modmul
