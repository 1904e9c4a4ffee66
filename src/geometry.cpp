#include "geometry.hpp"
#include <cmath>
#include <limits>

float distance(const Point& a, const Point& b){
    return std::hypot(a.x-b.x, a.y-b.y);
}

float perpendicular_distance(const Point& p, const Point& a, const Point& b){
    float num = std::fabs((b.y-a.y)*p.x - (b.x-a.x)*p.y + b.x*a.y - b.y*a.x);
    float den = std::hypot(b.y-a.y, b.x-a.x);
    return den==0.f ? 0.f : num/den;
}

static void rdp(const Path& pts, size_t first, size_t last, float epsilon, Path& out){
    float maxD = -1.f; size_t idx = first;
    for (size_t i=first+1;i<last;++i){
        float d = perpendicular_distance(pts[i], pts[first], pts[last]);
        if (d > maxD){ maxD = d; idx = i; }
    }
    if (last-first >= 2 && maxD > epsilon){
        rdp(pts, first, idx, epsilon, out);
        out.pop_back(); // shared split point, re-added by the right half
        rdp(pts, idx, last, epsilon, out);
    } else {
        out.push_back(pts[first]);
        out.push_back(pts[last]);
    }
}

Path simplify(const Path& pts, float epsilon){
    if (pts.size() < 3) return pts;
    Path out;
    out.reserve(pts.size());
    rdp(pts, 0, pts.size()-1, epsilon, out);
    return out;
}

Path smooth(const Path& pts, float smoothing){
    if (pts.size() < 2) return pts;
    Path simplified = simplify(pts, 2.f + smoothing*14.f);
    if (simplified.size() > 4 && smoothing > 0.f){
        const float alpha = 0.15f + smoothing*0.25f;
        Path averaged = simplified;
        for (size_t i=1;i+1<simplified.size();++i){
            const Point& prev = simplified[i-1];
            const Point& p = simplified[i];
            const Point& next = simplified[i+1];
            averaged[i].x = p.x*(1.f-alpha*2.f) + (prev.x+next.x)*alpha;
            averaged[i].y = p.y*(1.f-alpha*2.f) + (prev.y+next.y)*alpha;
        }
        return averaged;
    }
    return simplified;
}

NearestHit nearest_index(const Path& pts, const Point& q){
    NearestHit best{-1, std::numeric_limits<float>::infinity()};
    for (size_t i=0;i<pts.size();++i){
        float d = distance(pts[i], q);
        if (d < best.dist) best = {(int)i, d};
    }
    return best;
}
