#pragma once
#include <optional>
#include <string>
#include "strokes.hpp"

// Refuses (nullopt) paths shorter than 2 points or carrying non-finite values.
std::optional<ExportPayload> build_export_payload(const Path& path, const CorridorConfig& cfg,
                                                  const std::string& image_id);

// Body of POST /merge.
std::string payload_to_json(const ExportPayload& p);

// "M x y L x y ..." with two decimals; empty for an empty path.
std::string svg_path_data(const Path& pts);

struct SvgOptions {
    int width = 0, height = 0;
    // Raw bytes and MIME type of the base image; embedded as a data URI when set.
    std::string image_bytes;
    std::string image_mime;
};

std::string build_svg_document(const Path& pts, const CorridorConfig& cfg, const SvgOptions& opt);

std::string base64_encode(const std::string& in);
