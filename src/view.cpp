#include "view.hpp"
#include <algorithm>

ViewTransform ViewTransform::fit(int img_w, int img_h, int win_w, int win_h){
    ViewTransform v;
    if (img_w <= 0 || img_h <= 0 || win_w <= 0 || win_h <= 0) return v;
    v.scale = std::min((float)win_w/img_w, (float)win_h/img_h);
    v.offset_x = (win_w - img_w*v.scale) * 0.5f;
    v.offset_y = (win_h - img_h*v.scale) * 0.5f;
    return v;
}

Point ViewTransform::to_image(float sx, float sy) const {
    return {(sx-offset_x)/scale, (sy-offset_y)/scale};
}

Point ViewTransform::to_screen(const Point& p) const {
    return {p.x*scale + offset_x, p.y*scale + offset_y};
}
