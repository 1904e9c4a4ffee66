#pragma once
#include <cstddef>
#include <optional>
#include "strokes.hpp"

class PathEditor;

// One draggable handle per committed point.
std::vector<Point> handle_positions(const Path& path);

// Nearest handle whose centre lies within radius of p.
std::optional<size_t> pick_handle(const Path& path, const Point& p, float radius);

// Moves a dragged anchor verbatim: no smoothing, simplification or snapping.
bool drag_anchor(PathEditor& editor, size_t index, const Point& p);
