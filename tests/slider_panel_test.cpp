// slider_panel_test.cpp

#include <gtest/gtest.h>

#include "slider_panel.h"

using namespace modmul;

namespace {
  const int BAND_TOP = 1200;
  const int WIDTH    = 1200;
}

TEST(SliderPanelTest, StartsFromConfig) {
  ViewerConfig config;
  SliderPanel panel(config);
  EXPECT_EQ(panel.value(SLIDER_VERTEX), 3);
  EXPECT_EQ(panel.value(SLIDER_MODULUS), 100);
  EXPECT_EQ(panel.value(SLIDER_MULTIPLIER), 2);
  EXPECT_EQ(panel.value(SLIDER_ANGLE), -150);
  EXPECT_EQ(panel.slider(SLIDER_MULTIPLIER).max, 100);

  Parameters p = panel.parameters();
  EXPECT_EQ(p.vertexCount, 3);
  EXPECT_NEAR(p.angle, -2.6179938779914944, 1e-12);
}

TEST(SliderPanelTest, ValuesClampToRange) {
  SliderPanel panel((ViewerConfig()));
  EXPECT_TRUE(panel.setValue(SLIDER_VERTEX, 99));
  EXPECT_EQ(panel.value(SLIDER_VERTEX), 50);
  panel.setValue(SLIDER_VERTEX, 0);
  EXPECT_EQ(panel.value(SLIDER_VERTEX), 3);
  panel.setValue(SLIDER_ANGLE, -500);
  EXPECT_EQ(panel.value(SLIDER_ANGLE), -180);
  EXPECT_FALSE(panel.setValue(SLIDER_ANGLE, -180));
}

TEST(SliderPanelTest, MultiplierBoundFollowsModulus) {
  SliderPanel panel((ViewerConfig()));
  panel.setValue(SLIDER_MULTIPLIER, 80);
  panel.setValue(SLIDER_MODULUS, 30);
  EXPECT_EQ(panel.slider(SLIDER_MULTIPLIER).max, 30);
  EXPECT_EQ(panel.value(SLIDER_MULTIPLIER), 30);

  panel.setValue(SLIDER_MODULUS, 500);
  EXPECT_EQ(panel.slider(SLIDER_MULTIPLIER).max, 500);
  EXPECT_EQ(panel.value(SLIDER_MULTIPLIER), 30);
  EXPECT_TRUE(panel.setValue(SLIDER_MULTIPLIER, 400));
}

TEST(SliderPanelTest, FocusCyclesAndStepMovesFocused) {
  SliderPanel panel((ViewerConfig()));
  EXPECT_EQ(panel.focus(), SLIDER_VERTEX);
  panel.focusPrev();
  EXPECT_EQ(panel.focus(), SLIDER_ANGLE);
  panel.focusNext();
  panel.focusNext();
  EXPECT_EQ(panel.focus(), SLIDER_MODULUS);
  EXPECT_TRUE(panel.step(10));
  EXPECT_EQ(panel.value(SLIDER_MODULUS), 110);
}

TEST(SliderPanelTest, TypedEntryCommits) {
  SliderPanel panel((ViewerConfig()));
  panel.setFocus(SLIDER_MODULUS);
  panel.typeChar('2');
  panel.typeChar('x');
  panel.typeChar('5');
  panel.typeChar('0');
  panel.backspace();
  panel.typeChar('7');
  EXPECT_EQ(panel.entry(), "257");
  EXPECT_TRUE(panel.commitEntry());
  EXPECT_EQ(panel.value(SLIDER_MODULUS), 257);
  EXPECT_FALSE(panel.entryActive());
}

TEST(SliderPanelTest, TypedEntryClampsAndCancels) {
  SliderPanel panel((ViewerConfig()));
  panel.setFocus(SLIDER_ANGLE);
  panel.typeChar('-');
  panel.typeChar('9');
  panel.typeChar('9');
  panel.typeChar('9');
  EXPECT_TRUE(panel.commitEntry());
  EXPECT_EQ(panel.value(SLIDER_ANGLE), -180);

  panel.typeChar('4');
  panel.cancelEntry();
  EXPECT_FALSE(panel.commitEntry());
  EXPECT_EQ(panel.value(SLIDER_ANGLE), -180);
}

TEST(SliderPanelTest, MinusOnlyForSignedSliders) {
  SliderPanel panel((ViewerConfig()));
  panel.setFocus(SLIDER_MODULUS);
  panel.typeChar('-');
  EXPECT_FALSE(panel.entryActive());

  panel.setFocus(SLIDER_ANGLE);
  panel.typeChar('-');
  EXPECT_FALSE(panel.commitEntry());   // "-" alone is not a number
  EXPECT_EQ(panel.value(SLIDER_ANGLE), -150);
}

TEST(SliderPanelTest, FocusChangeDropsPendingEntry) {
  SliderPanel panel((ViewerConfig()));
  panel.typeChar('9');
  panel.focusNext();
  EXPECT_FALSE(panel.entryActive());
}

TEST(SliderPanelTest, TrackMapsPixelsToValues) {
  SliderPanel panel((ViewerConfig()));
  Rect t = panel.trackRect(SLIDER_ANGLE, BAND_TOP, WIDTH);
  EXPECT_GT(t.w, 0);
  EXPECT_GE(t.y, BAND_TOP);
  EXPECT_LE(t.y + t.h, BAND_TOP + CONTROL_BAND_HEIGHT);
  EXPECT_EQ(panel.valueAt(SLIDER_ANGLE, t.x, BAND_TOP, WIDTH), -180);
  EXPECT_EQ(panel.valueAt(SLIDER_ANGLE, t.x + t.w, BAND_TOP, WIDTH), 180);
  EXPECT_EQ(panel.valueAt(SLIDER_ANGLE, t.x - 50, BAND_TOP, WIDTH), -180);
  EXPECT_EQ(panel.valueAt(SLIDER_ANGLE, t.x + t.w / 2, BAND_TOP, WIDTH), 0);
}

TEST(SliderPanelTest, RowsStayInsideBand) {
  SliderPanel panel((ViewerConfig()));
  Rect last = panel.rowRect(SLIDER_ANGLE, BAND_TOP, WIDTH);
  EXPECT_LE(last.y + last.h, BAND_TOP + CONTROL_BAND_HEIGHT);
}

TEST(SliderPanelTest, PressAndDragMoveSlider) {
  SliderPanel panel((ViewerConfig()));
  Rect t = panel.trackRect(SLIDER_VERTEX, BAND_TOP, WIDTH);
  EXPECT_TRUE(panel.press(t.x + t.w, t.y + 1, BAND_TOP, WIDTH));
  EXPECT_TRUE(panel.dragging());
  EXPECT_EQ(panel.value(SLIDER_VERTEX), 50);
  EXPECT_TRUE(panel.drag(t.x, BAND_TOP, WIDTH));
  EXPECT_EQ(panel.value(SLIDER_VERTEX), 3);
  panel.release();
  EXPECT_FALSE(panel.drag(t.x + t.w, BAND_TOP, WIDTH));

  Rect m = panel.trackRect(SLIDER_MODULUS, BAND_TOP, WIDTH);
  EXPECT_FALSE(panel.press(5, m.y + 1, BAND_TOP, WIDTH));   // on the label
  EXPECT_EQ(panel.focus(), SLIDER_MODULUS);
  EXPECT_FALSE(panel.dragging());
}
