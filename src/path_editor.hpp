#pragma once
#include <cstddef>
#include "strokes.hpp"

// Edit-mode replacement of the path range between the vertices nearest to the
// stroke's endpoints. Returns the path unchanged when either endpoint is
// farther than threshold from the path.
Path splice(const Path& path, const Path& stroke, float threshold, float smoothing);
// Same, reporting rejection instead of echoing the input.
bool try_splice(const Path& path, const Path& stroke, float threshold, float smoothing, Path& out);

class PathEditor {
public:
    // Smooths the raw stroke and merges it: initialize, append/replace, or
    // splice in edit mode. False when nothing changed.
    bool commit(const Path& scratch, const CorridorConfig& cfg);
    bool undo_last();
    void clear();
    bool set_smoothing(float factor);
    bool relocate(size_t index, const Point& p);

    const Path& path() const { return path_; }
    Path snapshot() const { return path_; }
    size_t size() const { return path_.size(); }
    bool empty() const { return path_.empty(); }

private:
    Path path_;
};
