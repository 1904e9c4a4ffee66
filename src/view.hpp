#pragma once
#include "strokes.hpp"

// Uniform fit of the natural image size into the window, centred.
struct ViewTransform {
    float scale = 1.f;
    float offset_x = 0.f, offset_y = 0.f;

    static ViewTransform fit(int img_w, int img_h, int win_w, int win_h);
    Point to_image(float sx, float sy) const;
    Point to_screen(const Point& p) const;
};
