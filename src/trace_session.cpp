#include "trace_session.hpp"
#include "anchors.hpp"
#include "export.hpp"

TraceSession::TraceSession(CorridorConfig cfg): cfg_(clamp_config(std::move(cfg))) {}

bool TraceSession::load_image(int width, int height){
    if (width <= 0 || height <= 0) return false;
    cancel();
    editor_.clear();
    img_w_ = width; img_h_ = height;
    image_id_.clear();
    return true;
}

bool TraceSession::pointer_down(const Point& p, bool primary){
    if (!std::holds_alternative<Idle>(state_)) return false;
    if (!image_loaded() || !primary) return false;

    if (cfg_.show_handles){
        if (auto idx = pick_handle(editor_.path(), p, cfg_.handle_radius)){
            state_ = Dragging{*idx};
            return true;
        }
    }
    capture_.begin(p);
    state_ = Capturing{};
    return true;
}

bool TraceSession::pointer_move(const Point& p){
    if (std::holds_alternative<Capturing>(state_)){
        capture_.add_sample(p, cfg_.min_sample_distance);
        return false; // repaint happens on the next frame()
    }
    if (auto* d = std::get_if<Dragging>(&state_)){
        if (!drag_anchor(editor_, d->index, p)){
            state_ = Idle{};
            return false;
        }
        return true;
    }
    return false;
}

Release TraceSession::pointer_up(){
    if (std::holds_alternative<Capturing>(state_)){
        Path scratch = capture_.finish();
        state_ = Idle{};
        return editor_.commit(scratch, cfg_) ? Release::Committed : Release::Rejected;
    }
    if (std::holds_alternative<Dragging>(state_)){
        state_ = Idle{};
        return Release::DragEnded;
    }
    return Release::Ignored;
}

bool TraceSession::cancel(){
    if (std::holds_alternative<Capturing>(state_)){
        capture_.cancel();
        state_ = Idle{};
        return true;
    }
    if (std::holds_alternative<Dragging>(state_)){
        state_ = Idle{};
        return true;
    }
    return false;
}

bool TraceSession::frame(){
    return capture_.flush_preview(cfg_.smoothing);
}

void TraceSession::end_drag(){
    if (std::holds_alternative<Dragging>(state_)) state_ = Idle{};
}

bool TraceSession::undo(){
    end_drag();
    return editor_.undo_last();
}

bool TraceSession::new_path(){
    end_drag();
    bool had = !editor_.empty();
    editor_.clear();
    return had;
}

bool TraceSession::set_smoothing(float s){
    CorridorConfig c = cfg_;
    c.smoothing = s;
    cfg_ = clamp_config(c);
    end_drag();
    return editor_.set_smoothing(cfg_.smoothing);
}

void TraceSession::set_edit_mode(bool on){
    cfg_.edit_mode = on;
}

void TraceSession::set_corridor_px(int px){
    CorridorConfig c = cfg_;
    c.corridor_px = px;
    cfg_ = clamp_config(c);
}

void TraceSession::set_outside_fade(float f){
    CorridorConfig c = cfg_;
    c.outside_fade = f;
    cfg_ = clamp_config(c);
}

void TraceSession::set_marker_alpha(float a){
    CorridorConfig c = cfg_;
    c.marker_alpha = a;
    cfg_ = clamp_config(c);
}

void TraceSession::set_color(const std::string& color){
    CorridorConfig c = cfg_;
    c.color = color;
    cfg_ = clamp_config(c);
}

void TraceSession::set_show_handles(bool on){
    cfg_.show_handles = on;
    if (!on) end_drag();
}

std::vector<Point> TraceSession::handles() const {
    if (!cfg_.show_handles) return {};
    return handle_positions(editor_.path());
}

std::optional<ExportPayload> TraceSession::export_payload() const {
    if (!image_loaded()) return std::nullopt;
    return build_export_payload(editor_.path(), cfg_, image_id_);
}
