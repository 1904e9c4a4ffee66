#include "stroke_capture.hpp"
#include "geometry.hpp"

void StrokeCapture::begin(const Point& p){
    active_ = true;
    scratch_.clear();
    scratch_.push_back(p);
    preview_.clear();
    preview_pending_ = true;
}

bool StrokeCapture::add_sample(const Point& p, float min_distance){
    if (!active_) return false;
    if (!scratch_.empty() && distance(scratch_.back(), p) < min_distance) return false;
    scratch_.push_back(p);
    if (preview_pending_) return false;
    preview_pending_ = true;
    return true;
}

bool StrokeCapture::flush_preview(float smoothing){
    if (!preview_pending_) return false;
    preview_pending_ = false;
    preview_ = active_ ? smooth(scratch_, smoothing) : Path{};
    return true;
}

Path StrokeCapture::finish(){
    Path out;
    out.swap(scratch_);
    cancel();
    return out;
}

void StrokeCapture::cancel(){
    active_ = false;
    preview_pending_ = false;
    scratch_.clear();
    preview_.clear();
}
