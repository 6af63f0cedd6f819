#include "selection.hpp"
#include "error.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>

namespace molly {

// ----------------------------------------------------------------------------
// FrameSelection
// ----------------------------------------------------------------------------

FrameSelection FrameSelection::range(std::optional<std::int64_t> start,
                                     std::optional<std::int64_t> stop,
                                     std::int64_t step) {
    FrameSelection sel;
    sel.start_ = start;
    sel.stop_ = stop;
    sel.step_ = step;
    return sel;
}

FrameSelection FrameSelection::list(std::vector<std::size_t> frames) {
    FrameSelection sel;
    sel.is_list_ = true;
    std::sort(frames.begin(), frames.end());
    frames.erase(std::unique(frames.begin(), frames.end()), frames.end());
    sel.frames_ = std::move(frames);
    return sel;
}

// Slice bound resolution for a positive step: negative values count from
// the end, the result is clamped to [0, n].
static std::int64_t clamp_bound(std::optional<std::int64_t> bound, std::int64_t fallback, std::int64_t n) {
    if (!bound) return fallback;
    std::int64_t v = *bound;
    if (v < 0) {
        v += n;
        if (v < 0) v = 0;
    } else if (v > n) {
        v = n;
    }
    return v;
}

std::vector<std::size_t> FrameSelection::resolve(std::size_t frame_count) const {
    std::vector<std::size_t> frames;

    if (is_list_) {
        if (!frames_.empty() && frames_.back() >= frame_count) {
            throw XtcError(ErrorKind::IndexOutOfRange,
                           "frame " + std::to_string(frames_.back()) + " is out of bounds (total frames: " +
                           std::to_string(frame_count) + ")");
        }
        return frames_;
    }

    if (step_ <= 0) {
        throw XtcError(ErrorKind::InvalidSelection,
                       "frame step must be positive, got " + std::to_string(step_));
    }
    const std::int64_t n = static_cast<std::int64_t>(frame_count);
    const std::int64_t start = clamp_bound(start_, 0, n);
    const std::int64_t stop = clamp_bound(stop_, n, n);
    if (start < stop) {
        frames.reserve(static_cast<std::size_t>((stop - start - 1) / step_ + 1));
        for (std::int64_t i = start; ; i += step_) {
            frames.push_back(static_cast<std::size_t>(i));
            if (stop - i <= step_) break;
        }
    }
    return frames;
}

// ----------------------------------------------------------------------------
// AtomSelection
// ----------------------------------------------------------------------------

AtomSelection AtomSelection::indices(std::vector<std::size_t> indices) {
    AtomSelection sel;
    sel.kind_ = Kind::Indices;
    sel.indices_ = std::move(indices);
    return sel;
}

AtomSelection AtomSelection::until(std::size_t n) {
    AtomSelection sel;
    sel.kind_ = Kind::Until;
    sel.until_ = n;
    return sel;
}

AtomSelection AtomSelection::mask(std::vector<bool> mask) {
    AtomSelection sel;
    sel.kind_ = Kind::Mask;
    sel.mask_ = std::move(mask);
    return sel;
}

ResolvedAtoms AtomSelection::resolve(std::size_t natoms) const {
    ResolvedAtoms atoms;
    switch (kind_) {
        case Kind::All:
            atoms.identity = true;
            atoms.reading_limit = natoms;
            atoms.count = natoms;
            break;

        case Kind::Until:
            atoms.identity = true;
            atoms.reading_limit = std::min(until_, natoms);
            atoms.count = atoms.reading_limit;
            break;

        case Kind::Mask:
            atoms.identity = false;
            for (std::size_t i = 0; i < mask_.size(); ++i) {
                if (!mask_[i]) continue;
                if (i >= natoms) {
                    throw XtcError(ErrorKind::IndexOutOfRange,
                                   "atom " + std::to_string(i) + " is out of bounds (total atoms: " +
                                   std::to_string(natoms) + ")");
                }
                atoms.indices.push_back(i);
            }
            break;

        case Kind::Indices: {
            atoms.identity = false;
            std::vector<bool> seen(natoms, false);
            for (std::size_t idx : indices_) {
                if (idx >= natoms) {
                    throw XtcError(ErrorKind::IndexOutOfRange,
                                   "atom " + std::to_string(idx) + " is out of bounds (total atoms: " +
                                   std::to_string(natoms) + ")");
                }
                if (seen[idx]) {
                    throw XtcError(ErrorKind::InvalidSelection,
                                   "atom " + std::to_string(idx) + " is selected more than once");
                }
                seen[idx] = true;
            }
            atoms.indices = indices_;
            break;
        }
    }

    if (!atoms.identity) {
        atoms.count = atoms.indices.size();
        atoms.reading_limit = atoms.indices.empty()
            ? 0
            : *std::max_element(atoms.indices.begin(), atoms.indices.end()) + 1;
    }
    return atoms;
}

void gather_atoms(const float* decoded, const ResolvedAtoms& atoms, float* out) {
    if (atoms.identity) {
        if (atoms.count > 0) {
            std::memcpy(out, decoded, atoms.count * 3 * sizeof(float));
        }
        return;
    }
    for (std::size_t j = 0; j < atoms.indices.size(); ++j) {
        const float* src = decoded + atoms.indices[j] * 3;
        out[j * 3 + 0] = src[0];
        out[j * 3 + 1] = src[1];
        out[j * 3 + 2] = src[2];
    }
}

} // namespace molly
