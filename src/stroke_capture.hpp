#pragma once
#include "strokes.hpp"

// Scratch buffer for one gesture plus the frame-throttled live preview.
class StrokeCapture {
public:
    void begin(const Point& p);
    // Returns true when the sample was kept and a preview recompute has to be
    // scheduled; samples arriving while one is pending coalesce into it.
    bool add_sample(const Point& p, float min_distance);
    bool preview_pending() const { return preview_pending_; }
    // Recomputes the preview from the current scratch if one is pending.
    bool flush_preview(float smoothing);
    // Hands the scratch over and returns to idle.
    Path finish();
    void cancel();

    bool active() const { return active_; }
    const Path& scratch() const { return scratch_; }
    const Path& preview() const { return preview_; }

private:
    bool active_ = false;
    bool preview_pending_ = false;
    Path scratch_;
    Path preview_;
};
