#pragma once
#include <string>
#include "strokes.hpp"

struct AppCfg {
    std::string server_base, image;
    std::string svg_output = "corridor.svg";
    std::string merge_output = "corridor_masked.png";
    bool svg_embed_image = false;
    int window_width = 1000;
    int window_height = 700;
    CorridorConfig corridor;
};

// Throws std::runtime_error on malformed JSON or missing required fields.
AppCfg parse_cfg(const std::string& json);
AppCfg load_cfg(const std::string& path);

bool is_hex_color(const std::string& c);
