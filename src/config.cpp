#include "config.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

extern "C" {
#include <json-c/json.h>
}

bool is_hex_color(const std::string& c){
    if (c.size()!=7 || c[0]!='#') return false;
    return std::all_of(c.begin()+1, c.end(), [](char ch){ return std::isxdigit((unsigned char)ch)!=0; });
}

static float clamp01(float v, float def){
    if (!std::isfinite(v)) return def;
    return std::min(1.f, std::max(0.f, v));
}

static float positive_or(float v, float def){
    return (std::isfinite(v) && v > 0.f) ? v : def;
}

CorridorConfig clamp_config(CorridorConfig c){
    const CorridorConfig d{};
    c.corridor_px = std::min(kMaxCorridorPx, std::max(1, c.corridor_px));
    c.smoothing = clamp01(c.smoothing, d.smoothing);
    c.outside_fade = clamp01(c.outside_fade, d.outside_fade);
    c.marker_alpha = clamp01(c.marker_alpha, d.marker_alpha);
    c.snap_threshold = positive_or(c.snap_threshold, d.snap_threshold);
    c.continue_threshold = positive_or(c.continue_threshold, d.continue_threshold);
    c.min_sample_distance = positive_or(c.min_sample_distance, d.min_sample_distance);
    c.handle_radius = positive_or(c.handle_radius, d.handle_radius);
    if (!is_hex_color(c.color)) c.color = d.color;
    return c;
}

AppCfg parse_cfg(const std::string& s){
    json_object* root = json_tokener_parse(s.c_str());
    if (!root) throw std::runtime_error("config.json parse error");

    AppCfg c{};
    auto get=[&](const char* k)->json_object*{
        json_object* v=nullptr;
        return json_object_object_get_ex(root,k,&v) ? v : nullptr;
    };
    auto getS=[&](const char* k, const std::string& def)->std::string{
        json_object* v=get(k);
        if(!v) return def;
        const char* t = json_object_get_string(v);
        return t? std::string(t) : def;
    };
    auto getI=[&](const char* k, int def)->int{
        json_object* v=get(k);
        return v? json_object_get_int(v) : def;
    };
    auto getF=[&](const char* k, float def)->float{
        json_object* v=get(k);
        return v? (float)json_object_get_double(v) : def;
    };
    auto getB=[&](const char* k, bool def)->bool{
        json_object* v=get(k);
        return v? json_object_get_boolean(v)!=0 : def;
    };

    c.server_base = getS("server_base", "");
    c.image = getS("image", "");
    c.svg_output = getS("svg_output", c.svg_output);
    c.merge_output = getS("merge_output", c.merge_output);
    c.svg_embed_image = getB("svg_embed_image", c.svg_embed_image);
    c.window_width = std::max(320, getI("window_width", c.window_width));
    c.window_height = std::max(240, getI("window_height", c.window_height));

    CorridorConfig& k = c.corridor;
    k.corridor_px = getI("corridor_px", k.corridor_px);
    k.smoothing = getF("smoothing", k.smoothing);
    k.edit_mode = getB("edit_mode", k.edit_mode);
    k.snap_threshold = getF("snap_threshold", k.snap_threshold);
    k.continue_threshold = getF("continue_threshold", k.continue_threshold);
    k.color = getS("color", k.color);
    k.outside_fade = getF("outside_fade", k.outside_fade);
    k.marker_alpha = getF("marker_alpha", k.marker_alpha);
    k.show_handles = getB("show_handles", k.show_handles);
    k.handle_radius = getF("handle_radius", k.handle_radius);
    k = clamp_config(k);

    json_object_put(root);
    if (c.server_base.empty()||c.image.empty())
        throw std::runtime_error("config.json missing required fields");
    while (!c.server_base.empty() && c.server_base.back()=='/') c.server_base.pop_back();
    return c;
}

AppCfg load_cfg(const std::string& path){
    return parse_cfg(read_file(path));
}
