#include "render.hpp"
#include <cmath>
#include <cstdlib>
#include <vector>

Rgb parse_color(const std::string& hex){
    if (hex.size()!=7 || hex[0]!='#') return {127,0,255};
    unsigned long v = std::strtoul(hex.c_str()+1, nullptr, 16);
    return {(Uint8)((v>>16)&0xff), (Uint8)((v>>8)&0xff), (Uint8)(v&0xff)};
}

void draw_polyline(SDL_Renderer* r, const Path& pts, const ViewTransform& v, Rgb c, Uint8 alpha){
    SDL_SetRenderDrawColor(r, c.r, c.g, c.b, alpha);
    for (size_t i=1;i<pts.size();++i){
        Point a = v.to_screen(pts[i-1]);
        Point b = v.to_screen(pts[i]);
        SDL_RenderDrawLineF(r, a.x, a.y, b.x, b.y);
    }
}

static void push_disc(std::vector<SDL_Vertex>& vs, Point c, float rad, SDL_Color col){
    const int N = 12;
    const float step = 6.2831853f/N;
    for (int k=0;k<N;++k){
        float a0 = step*k, a1 = step*(k+1);
        vs.push_back({{c.x, c.y}, col, {0,0}});
        vs.push_back({{c.x+rad*std::cos(a0), c.y+rad*std::sin(a0)}, col, {0,0}});
        vs.push_back({{c.x+rad*std::cos(a1), c.y+rad*std::sin(a1)}, col, {0,0}});
    }
}

void draw_corridor(SDL_Renderer* r, const Path& pts, const ViewTransform& v, float radius, Rgb c, Uint8 alpha){
    if (pts.size() < 2) return;
    const float rad = radius*v.scale;
    const SDL_Color col{c.r, c.g, c.b, alpha};
    std::vector<SDL_Vertex> vs;
    vs.reserve(pts.size()*48);
    for (size_t i=1;i<pts.size();++i){
        Point a = v.to_screen(pts[i-1]);
        Point b = v.to_screen(pts[i]);
        float dx = b.x-a.x, dy = b.y-a.y;
        float len = std::hypot(dx, dy);
        if (len == 0.f) continue;
        float nx = -dy/len*rad, ny = dx/len*rad;
        SDL_Vertex q[4] = {
            {{a.x+nx, a.y+ny}, col, {0,0}}, {{b.x+nx, b.y+ny}, col, {0,0}},
            {{b.x-nx, b.y-ny}, col, {0,0}}, {{a.x-nx, a.y-ny}, col, {0,0}},
        };
        vs.push_back(q[0]); vs.push_back(q[1]); vs.push_back(q[2]);
        vs.push_back(q[0]); vs.push_back(q[2]); vs.push_back(q[3]);
    }
    for (const auto& p: pts) push_disc(vs, v.to_screen(p), rad, col);
    SDL_SetRenderDrawBlendMode(r, SDL_BLENDMODE_BLEND);
    SDL_RenderGeometry(r, nullptr, vs.data(), (int)vs.size(), nullptr, 0);
}

void draw_handles(SDL_Renderer* r, const std::vector<Point>& handles, const ViewTransform& v, float radius){
    const float half = radius*v.scale;
    for (const auto& h: handles){
        Point s = v.to_screen(h);
        SDL_FRect box{s.x-half, s.y-half, half*2, half*2};
        SDL_SetRenderDrawColor(r, 255,255,255,230);
        SDL_RenderFillRectF(r, &box);
        SDL_SetRenderDrawColor(r, 20,20,20,255);
        SDL_RenderDrawRectF(r, &box);
    }
}
