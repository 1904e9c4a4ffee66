#pragma once
#include <vector>
#include <string>

// Image-space position (natural pixel coordinates of the loaded raster).
struct Point { float x; float y; };

using Path = std::vector<Point>;

constexpr int kMaxCorridorPx = 2000;

struct CorridorConfig {
    int corridor_px = 20;
    float smoothing = 0.5f;
    bool edit_mode = false;
    float snap_threshold = 50.f;
    float continue_threshold = 12.f;
    float min_sample_distance = 1.8f;
    std::string color = "#7f00ff";
    float outside_fade = 0.8f;
    float marker_alpha = 0.7f;
    bool show_handles = true;
    float handle_radius = 6.f;
};

// Clamps every field into its documented range; non-finite or non-positive
// thresholds fall back to the defaults.
CorridorConfig clamp_config(CorridorConfig c);

struct ExportPayload {
    std::string image_id;
    Path points;
    int corridor_px;
    double outside_fade;
    double marker_alpha;
};
