#include "export.hpp"
#include "util.hpp"
#include <cmath>
#include <cstdio>
#include <sstream>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/buffer.h>
extern "C" {
#include <json-c/json.h>
}

std::optional<ExportPayload> build_export_payload(const Path& path, const CorridorConfig& cfg,
                                                  const std::string& image_id){
    if (path.size() < 2) return std::nullopt;
    for (const auto& p: path){
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) return std::nullopt;
    }
    CorridorConfig c = clamp_config(cfg);
    // Opacities are stored as float; send them at slider precision.
    auto ratio = [](float v){ return std::round((double)v*10000.0)/10000.0; };
    return ExportPayload{image_id, path, c.corridor_px, ratio(c.outside_fade), ratio(c.marker_alpha)};
}

std::string payload_to_json(const ExportPayload& p){
    json_object* root = json_object_new_object();
    if (!p.image_id.empty())
        json_object_object_add(root, "image_id", json_object_new_string(p.image_id.c_str()));
    json_object* jpoints = json_object_new_array();
    for (const auto& pt: p.points){
        json_object* jp = json_object_new_object();
        json_object_object_add(jp, "x", json_object_new_double(pt.x));
        json_object_object_add(jp, "y", json_object_new_double(pt.y));
        json_object_array_add(jpoints, jp);
    }
    json_object_object_add(root, "points", jpoints);
    json_object_object_add(root, "corridor_px", json_object_new_int(p.corridor_px));
    json_object_object_add(root, "outside_fade", json_object_new_double(p.outside_fade));
    json_object_object_add(root, "marker_alpha", json_object_new_double(p.marker_alpha));
    std::string out = json_object_to_json_string_ext(root, JSON_C_TO_STRING_PLAIN);
    json_object_put(root);
    return out;
}

std::string svg_path_data(const Path& pts){
    std::string d;
    char buf[64];
    for (size_t i=0;i<pts.size();++i){
        snprintf(buf, sizeof(buf), "%s%c %.2f %.2f", i ? " " : "", i ? 'L' : 'M', pts[i].x, pts[i].y);
        d += buf;
    }
    return d;
}

std::string build_svg_document(const Path& pts, const CorridorConfig& cfg, const SvgOptions& opt){
    std::ostringstream o;
    o << "<svg xmlns=\"http://www.w3.org/2000/svg\" xmlns:xlink=\"http://www.w3.org/1999/xlink\""
      << " viewBox=\"0 0 " << opt.width << " " << opt.height << "\""
      << " width=\"" << opt.width << "\" height=\"" << opt.height << "\">\n";
    if (!opt.image_bytes.empty()){
        o << "  <image x=\"0\" y=\"0\" width=\"" << opt.width << "\" height=\"" << opt.height << "\""
          << " xlink:href=\"data:" << escape_xml(opt.image_mime) << ";base64,"
          << base64_encode(opt.image_bytes) << "\"/>\n";
    }
    o << "  <path d=\"" << svg_path_data(pts) << "\" fill=\"none\""
      << " stroke=\"" << escape_xml(cfg.color) << "\""
      << " stroke-width=\"" << cfg.corridor_px*2 << "\""
      << " stroke-linecap=\"round\" stroke-linejoin=\"round\" opacity=\"0.85\"/>\n";
    if (cfg.show_handles && !pts.empty()){
        o << "  <g>\n";
        for (const auto& p: pts){
            char buf[96];
            snprintf(buf, sizeof(buf), "    <circle cx=\"%.2f\" cy=\"%.2f\" r=\"%g\"/>\n",
                     p.x, p.y, cfg.handle_radius);
            o << buf;
        }
        o << "  </g>\n";
    }
    o << "</svg>\n";
    return o.str();
}

std::string base64_encode(const std::string& in){
    if (in.empty()) return {};
    BIO *bio, *b64; BUF_MEM *bufferPtr;
    b64 = BIO_new(BIO_f_base64());
    bio = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, bio);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(b64, in.data(), (int)in.size());
    BIO_flush(b64);
    BIO_get_mem_ptr(b64, &bufferPtr);
    std::string out(bufferPtr->data, bufferPtr->length);
    BIO_free_all(b64);
    return out;
}
