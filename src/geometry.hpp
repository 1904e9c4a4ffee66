#pragma once
#include <vector>
#include "strokes.hpp"

struct NearestHit { int index; float dist; };

float distance(const Point& a, const Point& b);

// Distance from p to the infinite line through a and b. Zero when a == b.
float perpendicular_distance(const Point& p, const Point& a, const Point& b);

// Ramer-Douglas-Peucker. Inputs shorter than 3 points come back unchanged.
Path simplify(const Path& pts, float epsilon);

// RDP with tolerance 2 + s*14, then one weighted averaging pass over the
// interior points when more than 4 survive and s > 0. Endpoints are kept.
Path smooth(const Path& pts, float smoothing);

// Closest vertex by linear scan; {-1, inf} for an empty sequence.
NearestHit nearest_index(const Path& pts, const Point& q);
