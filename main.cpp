// main.cpp - interactive modular multiplication viewer.
//
// Points on a polygon (or circle) connected by  i -> (i * K) mod M.
// The canvas sits on top, the four parameter sliders underneath.

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>

// Prefer freeglut on Linux; it includes <GL/glut.h> for you.
#include <GL/freeglut.h>

#include "modmul_config.h"
#include "modmul_display.h"
#include "modmul_render.h"
#include "slider_panel.h"

using namespace modmul;

namespace {
  // GLUT callbacks carry no user pointer, so the app state lives here.
  ViewerConfig                       config;
  std::unique_ptr<DisplayController> display_ctl;
  std::unique_ptr<SliderPanel>       panel;
  int winW = IMAGE_SIZE, winH = IMAGE_SIZE + CONTROL_BAND_HEIGHT;
}

void display();
void reshape(int w, int h);
void keyboard(unsigned char key, int x, int y);
void special(int key, int x, int y);
void mouse(int button, int state, int x, int y);
void motion(int x, int y);
void myinit();

int main(int argc, char* argv[]) {
  // GLUT strips its own flags (-display, -geometry, ...) before ours are read.
  glutInit(&argc, argv);

  int status = parseArgs(argc, argv, config);
  if (status != CONTINUE)
    return status;

  try {
    display_ctl = std::make_unique<DisplayController>(config.canvas(), config.parameters());
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  display_ctl->setVerbose(config.verbose);
  panel = std::make_unique<SliderPanel>(config);

  winW = config.imageSize;
  winH = config.imageSize + CONTROL_BAND_HEIGHT;

  glutInitDisplayMode(GLUT_DOUBLE | GLUT_RGB);
  glutInitWindowSize(winW, winH);
  glutInitWindowPosition(100, 100);
  glutCreateWindow("Modular Multiplication Visualization");
  glutDisplayFunc(display);
  glutReshapeFunc(reshape);
  glutKeyboardFunc(keyboard);
  glutSpecialFunc(special);
  glutMouseFunc(mouse);
  glutMotionFunc(motion);

  myinit();
  glutMainLoop();
  return 0;
}

namespace {
  void updateTitle() {
    char title[128];
    std::snprintf(title, sizeof(title), "Modular Multiplication Visualization  %s",
                  display_ctl->caption().c_str());
    glutSetWindowTitle(title);
  }

  // Pushes the panel's values into the controller and schedules a redraw.
  void applyPanel() {
    Staleness s;
    try {
      s = display_ctl->changeParameters(panel->parameters());
    } catch (const std::invalid_argument& e) {
      std::cerr << "Error: " << e.what() << std::endl;
      std::exit(1);
    }
    if (s.any())
      updateTitle();
    glutPostRedisplay();
  }

  int bandTop() {
    return config.imageSize;
  }
}

void display() {
  glClear(GL_COLOR_BUFFER_BIT);
  setPixelProjection(winW, winH);

  drawScene(display_ctl->getScene());
  drawSliderPanel(*panel, bandTop(), winW);

  glutSwapBuffers();
}

void reshape(int w, int h) {
  winW = w;
  winH = h;
  glutPostRedisplay();
}

void keyboard(unsigned char key, int x, int y) {
  (void)x; (void)y;
  switch (key) {
    case '\t':
      if (glutGetModifiers() & GLUT_ACTIVE_SHIFT) panel->focusPrev();
      else panel->focusNext();
      break;
    case '\r': case '\n':
      if (panel->commitEntry()) {
        applyPanel();
        return;
      }
      break;
    case 8: case 127:   // backspace / delete
      panel->backspace();
      break;
    case 27:
      if (!panel->entryActive())
        std::exit(0);
      panel->cancelEntry();
      break;
    case 'q': case 'Q':
      std::exit(0);
    default:
      if ((key >= '0' && key <= '9') || key == '-')
        panel->typeChar((char)key);
      else
        return;
  }
  glutPostRedisplay();
}

void special(int key, int x, int y) {
  (void)x; (void)y;
  bool changed = false;
  switch (key) {
    case GLUT_KEY_LEFT:      changed = panel->step(-1); break;
    case GLUT_KEY_RIGHT:     changed = panel->step(+1); break;
    case GLUT_KEY_PAGE_DOWN: changed = panel->step(-10); break;
    case GLUT_KEY_PAGE_UP:   changed = panel->step(+10); break;
    case GLUT_KEY_UP:        panel->focusPrev(); break;
    case GLUT_KEY_DOWN:      panel->focusNext(); break;
    default: return;
  }
  if (changed) applyPanel();
  else glutPostRedisplay();
}

void mouse(int button, int state, int x, int y) {
  if (button != GLUT_LEFT_BUTTON)
    return;
  if (state == GLUT_DOWN) {
    if (panel->press(x, y, bandTop(), winW)) applyPanel();
    else glutPostRedisplay();
  } else {
    panel->release();
  }
}

void motion(int x, int y) {
  (void)y;
  if (panel->drag(x, bandTop(), winW))
    applyPanel();
}

void myinit() {
  glClearColor(0.0f, 0.0f, 0.0f, 1.0f); // black background
  glPointSize(2.0f);
  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
  glEnable(GL_LINE_SMOOTH);
  glHint(GL_LINE_SMOOTH_HINT, GL_NICEST);

  // The panel starts from the command line but the first frame must reflect
  // any clamping it applied.
  applyPanel();
  updateTitle();
}
