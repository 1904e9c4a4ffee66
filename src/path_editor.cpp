#include "path_editor.hpp"
#include "geometry.hpp"
#include <algorithm>
#include <utility>

bool try_splice(const Path& path, const Path& stroke, float threshold, float smoothing, Path& out){
    if (path.size() < 2 || stroke.size() < 2) return false;

    NearestHit n1 = nearest_index(path, stroke.front());
    NearestHit n2 = nearest_index(path, stroke.back());
    if (n1.dist > threshold || n2.dist > threshold) return false;

    size_t i1 = (size_t)n1.index, i2 = (size_t)n2.index;
    if (i1 > i2) std::swap(i1, i2);

    Path merged;
    merged.reserve(i1 + stroke.size() + (path.size()-i2-1));
    merged.insert(merged.end(), path.begin(), path.begin()+i1);
    merged.insert(merged.end(), stroke.begin(), stroke.end());
    merged.insert(merged.end(), path.begin()+i2+1, path.end());
    out = smooth(merged, smoothing);
    return true;
}

Path splice(const Path& path, const Path& stroke, float threshold, float smoothing){
    Path out;
    if (!try_splice(path, stroke, threshold, smoothing, out)) return path;
    return out;
}

bool PathEditor::commit(const Path& scratch, const CorridorConfig& cfg){
    Path stroke = smooth(scratch, cfg.smoothing);
    if (stroke.size() < 2) return false;

    if (path_.empty()){
        path_ = std::move(stroke);
        return true;
    }
    if (cfg.edit_mode){
        Path next;
        if (!try_splice(path_, stroke, cfg.snap_threshold, cfg.smoothing, next) || next.size() < 2)
            return false;
        path_ = std::move(next);
        return true;
    }
    if (distance(path_.back(), stroke.front()) < cfg.continue_threshold){
        path_.insert(path_.end(), stroke.begin()+1, stroke.end());
    } else {
        path_ = std::move(stroke);
    }
    return true;
}

bool PathEditor::undo_last(){
    if (path_.empty()) return false;
    path_.pop_back();
    if (path_.size() < 2) path_.clear();
    return true;
}

void PathEditor::clear(){
    path_.clear();
}

bool PathEditor::set_smoothing(float factor){
    if (path_.size() <= 2) return false;
    path_ = smooth(path_, factor);
    return true;
}

bool PathEditor::relocate(size_t index, const Point& p){
    if (index >= path_.size()) return false;
    path_[index] = p;
    return true;
}
