#include "anchors.hpp"
#include "geometry.hpp"
#include "path_editor.hpp"

std::vector<Point> handle_positions(const Path& path){
    return path;
}

std::optional<size_t> pick_handle(const Path& path, const Point& p, float radius){
    NearestHit hit = nearest_index(path, p);
    if (hit.index < 0 || hit.dist > radius) return std::nullopt;
    return (size_t)hit.index;
}

bool drag_anchor(PathEditor& editor, size_t index, const Point& p){
    return editor.relocate(index, p);
}
