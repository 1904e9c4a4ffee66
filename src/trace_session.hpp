#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include "strokes.hpp"
#include "path_editor.hpp"
#include "stroke_capture.hpp"

struct Idle {};
struct Capturing {};
struct Dragging { size_t index; };

using InteractionState = std::variant<Idle, Capturing, Dragging>;

// Outcome of releasing the pointer.
enum class Release { Ignored, Committed, Rejected, DragEnded };

// Single owner of the committed path, the scratch capture and the anchor drag.
// Only one of capture or drag can be live at a time: both are entered from
// Idle only.
class TraceSession {
public:
    explicit TraceSession(CorridorConfig cfg = {});

    bool load_image(int width, int height);
    bool image_loaded() const { return img_w_ > 0 && img_h_ > 0; }
    int image_width() const { return img_w_; }
    int image_height() const { return img_h_; }
    void set_image_id(std::string id) { image_id_ = std::move(id); }
    const std::string& image_id() const { return image_id_; }

    // Pointer input, already mapped to image space. Each returns whether the
    // view needs a repaint.
    bool pointer_down(const Point& p, bool primary);
    bool pointer_move(const Point& p);
    Release pointer_up();
    bool cancel();
    // Run once per rendered frame; recomputes a pending preview.
    bool frame();

    bool undo();
    bool new_path();
    bool set_smoothing(float s);
    void set_edit_mode(bool on);
    void set_corridor_px(int px);
    void set_outside_fade(float f);
    void set_marker_alpha(float a);
    void set_color(const std::string& c);
    void set_show_handles(bool on);

    const CorridorConfig& config() const { return cfg_; }
    const InteractionState& state() const { return state_; }
    bool capturing() const { return std::holds_alternative<Capturing>(state_); }
    bool dragging() const { return std::holds_alternative<Dragging>(state_); }

    Path committed() const { return editor_.snapshot(); }
    Path preview() const { return capture_.preview(); }
    std::vector<Point> handles() const;

    // Refused when no image is loaded or the path cannot be exported.
    std::optional<ExportPayload> export_payload() const;

private:
    void end_drag();

    CorridorConfig cfg_;
    InteractionState state_ = Idle{};
    PathEditor editor_;
    StrokeCapture capture_;
    int img_w_ = 0, img_h_ = 0;
    std::string image_id_;
};
