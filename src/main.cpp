#include <SDL2/SDL.h>
#include <cstdio>
#include <string>
#include <stdexcept>
#include "strokes.hpp"
#include "util.hpp"
#include "config.hpp"
#include "trace_session.hpp"
#include "export.hpp"
#include "merge_client.hpp"
#include "view.hpp"
#include "render.hpp"

static std::string mime_for(const std::string& path){
    std::string e = lower_ext(path);
    if (e==".png") return "image/png";
    if (e==".jpg"||e==".jpeg") return "image/jpeg";
    if (e==".webp") return "image/webp";
    if (e==".tif"||e==".tiff") return "image/tiff";
    if (e==".bmp") return "image/bmp";
    return "application/octet-stream";
}

static void save_svg(const AppCfg& cfg, const TraceSession& session){
    Path pts = session.committed();
    if (pts.size() < 2){ fprintf(stderr, "Draw a corridor first.\n"); return; }
    SvgOptions opt;
    opt.width = session.image_width();
    opt.height = session.image_height();
    if (cfg.svg_embed_image){
        opt.image_bytes = read_file(cfg.image);
        opt.image_mime = mime_for(cfg.image);
    }
    write_file(cfg.svg_output, build_svg_document(pts, session.config(), opt));
    fprintf(stderr, "SVG written: %s\n", cfg.svg_output.c_str());
}

static void merge_png(const AppCfg& cfg, MergeClient& client, const TraceSession& session){
    if (session.image_id().empty()){ fprintf(stderr, "Image not uploaded; cannot merge.\n"); return; }
    auto payload = session.export_payload();
    if (!payload){ fprintf(stderr, "Draw a corridor first.\n"); return; }
    auto r = client.merge(*payload);
    if (!(r.code>=200 && r.code<300)){
        fprintf(stderr, "Merge failed: HTTP %d %s\n", r.code, extract_error(r.body).c_str());
        return;
    }
    write_file(cfg.merge_output, r.body);
    fprintf(stderr, "Merged PNG written: %s\n", cfg.merge_output.c_str());
}

static void print_status(const TraceSession& s){
    const auto& c = s.config();
    fprintf(stderr, "edit=%s handles=%s smoothing=%.2f corridor=%dpx points=%zu\n",
            c.edit_mode?"on":"off", c.show_handles?"on":"off", c.smoothing, c.corridor_px,
            s.committed().size());
}

static int run(const AppCfg& cfg){
    MergeClient client(cfg.server_base);
    TraceSession session(cfg.corridor);

    auto up = client.upload_image(cfg.image);
    UploadInfo info;
    if (up.code==200 && parse_upload_response(up.body, info)){
        session.load_image(info.width, info.height);
        session.set_image_id(info.image_id);
    } else {
        fprintf(stderr, "Upload failed: HTTP %d %s\n", up.code, extract_error(up.body).c_str());
    }

    if (SDL_Init(SDL_INIT_VIDEO|SDL_INIT_TIMER|SDL_INIT_EVENTS)!=0){
        fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }
    SDL_Surface* surf = SDL_LoadBMP(cfg.image.c_str());
    if (!session.image_loaded() && surf) session.load_image(surf->w, surf->h);
    if (!session.image_loaded()) fprintf(stderr, "No base image loaded; drawing is disabled.\n");

    SDL_Window* win = SDL_CreateWindow("corridortrace", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                       cfg.window_width, cfg.window_height, SDL_WINDOW_RESIZABLE);
    SDL_Renderer* ren = win ? SDL_CreateRenderer(win, -1, SDL_RENDERER_ACCELERATED|SDL_RENDERER_TARGETTEXTURE) : nullptr;
    if (!ren){
        fprintf(stderr, "SDL window/renderer failed: %s\n", SDL_GetError());
        if (surf) SDL_FreeSurface(surf);
        if (win) SDL_DestroyWindow(win);
        SDL_Quit();
        return 1;
    }
    SDL_Texture* base = surf ? SDL_CreateTextureFromSurface(ren, surf) : nullptr;
    if (surf) SDL_FreeSurface(surf);
    SDL_Texture* layer = nullptr;
    int layerW = 0, layerH = 0;

    bool quit=false;
    while(!quit){
        int W=0,H=0; SDL_GetRendererOutputSize(ren,&W,&H);
        ViewTransform view = ViewTransform::fit(session.image_width(), session.image_height(), W, H);

        SDL_Event e; while(SDL_PollEvent(&e)){
            if (e.type==SDL_QUIT) quit=true;
            if (e.type==SDL_WINDOWEVENT && e.window.event==SDL_WINDOWEVENT_FOCUS_LOST){
                if (session.cancel()) SDL_CaptureMouse(SDL_FALSE);
            }
            if (e.type==SDL_MOUSEBUTTONDOWN){
                Point p = view.to_image((float)e.button.x, (float)e.button.y);
                if (session.pointer_down(p, e.button.button==SDL_BUTTON_LEFT)) SDL_CaptureMouse(SDL_TRUE);
            }
            if (e.type==SDL_MOUSEMOTION){
                session.pointer_move(view.to_image((float)e.motion.x, (float)e.motion.y));
            }
            if (e.type==SDL_MOUSEBUTTONUP && e.button.button==SDL_BUTTON_LEFT){
                const Release r = session.pointer_up();
                if (r!=Release::Ignored) SDL_CaptureMouse(SDL_FALSE);
                if (r==Release::Rejected){
                    if (session.config().edit_mode && !session.committed().empty())
                        fprintf(stderr, "Edit stroke ignored: not near the path\n");
                    else
                        fprintf(stderr, "Stroke ignored: too short\n");
                }
            }
            if (e.type==SDL_KEYDOWN){
                const auto key = e.key.keysym.sym;
                const bool ctrl = (e.key.keysym.mod & (KMOD_CTRL|KMOD_GUI)) != 0;
                const auto& c = session.config();
                try {
                    if (key==SDLK_ESCAPE){ if (!session.cancel()) quit=true; }
                    else if (ctrl && key==SDLK_z) session.undo();
                    else if (ctrl && key==SDLK_n) session.new_path();
                    else if (key==SDLK_e) session.set_edit_mode(!c.edit_mode);
                    else if (key==SDLK_h) session.set_show_handles(!c.show_handles);
                    else if (key==SDLK_LEFTBRACKET) session.set_smoothing(c.smoothing-0.05f);
                    else if (key==SDLK_RIGHTBRACKET) session.set_smoothing(c.smoothing+0.05f);
                    else if (key==SDLK_MINUS) session.set_corridor_px(c.corridor_px-1);
                    else if (key==SDLK_EQUALS) session.set_corridor_px(c.corridor_px+1);
                    else if (key==SDLK_s) save_svg(cfg, session);
                    else if (key==SDLK_m) merge_png(cfg, client, session);
                    else continue;
                } catch(const std::exception& ex){
                    fprintf(stderr, "Export failed: %s\n", ex.what());
                }
                print_status(session);
            }
        }

        session.frame();

        SDL_SetRenderDrawBlendMode(ren, SDL_BLENDMODE_BLEND);
        SDL_SetRenderDrawColor(ren,40,40,40,255); SDL_RenderClear(ren);
        if (session.image_loaded()){
            SDL_FRect dst{view.offset_x, view.offset_y, session.image_width()*view.scale, session.image_height()*view.scale};
            if (base) SDL_RenderCopyF(ren, base, nullptr, &dst);
            else { SDL_SetRenderDrawColor(ren,245,245,245,255); SDL_RenderFillRectF(ren, &dst); }
        }

        if (!layer || layerW!=W || layerH!=H){
            if (layer) SDL_DestroyTexture(layer);
            layer = SDL_CreateTexture(ren, SDL_PIXELFORMAT_RGBA8888, SDL_TEXTUREACCESS_TARGET, W, H);
            if (layer) SDL_SetTextureBlendMode(layer, SDL_BLENDMODE_BLEND);
            layerW = W; layerH = H;
        }

        const auto& c = session.config();
        const Rgb col = parse_color(c.color);
        Path committed = session.committed();
        Path preview = session.preview();
        // Corridors are drawn opaque into a layer, then blended once so joins don't double up.
        auto blend_corridor = [&](const Path& pts, Uint8 alpha){
            if (pts.size() < 2) return;
            if (!layer){ draw_corridor(ren, pts, view, (float)c.corridor_px, col, alpha); return; }
            SDL_SetRenderTarget(ren, layer);
            SDL_SetRenderDrawColor(ren,0,0,0,0); SDL_RenderClear(ren);
            draw_corridor(ren, pts, view, (float)c.corridor_px, col, 255);
            SDL_SetRenderTarget(ren, nullptr);
            SDL_SetTextureAlphaMod(layer, alpha);
            SDL_RenderCopy(ren, layer, nullptr, nullptr);
        };
        blend_corridor(committed, 217);
        draw_polyline(ren, committed, view, {255,255,255}, 200);
        blend_corridor(preview, 128);
        draw_handles(ren, session.handles(), view, c.handle_radius);
        SDL_RenderPresent(ren);

        SDL_Delay(12);
    }

    if (layer) SDL_DestroyTexture(layer);
    if (base) SDL_DestroyTexture(base);
    SDL_DestroyRenderer(ren); SDL_DestroyWindow(win); SDL_Quit();
    return 0;
}

int main(int argc, char** argv){
    const char* cfgPath = argc>1? argv[1] : "config.json";
    try {
        AppCfg cfg = load_cfg(cfgPath);
        return run(cfg);
    } catch(const std::exception& ex){
        fprintf(stderr, "corridortrace: %s\n", ex.what());
        return 1;
    }
}
