#pragma once
#include <SDL2/SDL.h>
#include <string>
#include "strokes.hpp"
#include "view.hpp"

struct Rgb { Uint8 r, g, b; };

Rgb parse_color(const std::string& hex);

void draw_polyline(SDL_Renderer* r, const Path& pts, const ViewTransform& v, Rgb c, Uint8 alpha);
// Band of the given radius (image px) around the polyline, with round joins.
void draw_corridor(SDL_Renderer* r, const Path& pts, const ViewTransform& v, float radius, Rgb c, Uint8 alpha);
void draw_handles(SDL_Renderer* r, const std::vector<Point>& handles, const ViewTransform& v, float radius);
