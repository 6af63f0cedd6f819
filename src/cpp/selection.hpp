#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace molly {

/**
 * @brief Which frames of a trajectory to read.
 *
 * Either a slice (start, stop, step) with the usual slice rules, or an
 * explicit list of frame numbers. Slice bounds are resolved against the
 * frame count at the time of the read: missing bounds default to the whole
 * trajectory, negative bounds count from the end, and bounds past either end
 * are clamped. `stop` is exclusive and `step` must be positive.
 */
class FrameSelection {
public:
    /** @brief Every frame. */
    FrameSelection() = default;

    static FrameSelection all() { return FrameSelection(); }
    static FrameSelection range(std::optional<std::int64_t> start,
                                std::optional<std::int64_t> stop,
                                std::int64_t step = 1);
    /** @brief Explicit frame numbers; read in ascending order, duplicates collapse. */
    static FrameSelection list(std::vector<std::size_t> frames);

    /**
     * @brief Frame numbers to visit, ascending.
     * @throws XtcError(InvalidSelection) for a step below 1,
     * XtcError(IndexOutOfRange) for a listed frame >= frame_count.
     */
    std::vector<std::size_t> resolve(std::size_t frame_count) const;

    bool is_list() const { return is_list_; }
    std::optional<std::int64_t> start() const { return start_; }
    std::optional<std::int64_t> stop() const { return stop_; }
    std::int64_t step() const { return step_; }

private:
    bool is_list_ = false;
    std::optional<std::int64_t> start_;
    std::optional<std::int64_t> stop_;
    std::int64_t step_ = 1;
    std::vector<std::size_t> frames_;
};

/**
 * @brief Atom indices to keep from each frame, in output order, plus the
 * number of leading atoms that must be decoded to produce them.
 */
struct ResolvedAtoms {
    bool identity = true;            // all atoms in file order; `indices` is then empty
    std::vector<std::size_t> indices;
    std::size_t reading_limit = 0;   // highest needed index + 1
    std::size_t count = 0;           // number of positions produced per frame
};

/**
 * @brief Which atoms of each frame to read.
 */
class AtomSelection {
public:
    /** @brief Every atom, in file order. */
    AtomSelection() = default;

    static AtomSelection all() { return AtomSelection(); }
    /** @brief The given atoms, in the given order. Duplicates are rejected on resolve. */
    static AtomSelection indices(std::vector<std::size_t> indices);
    /** @brief The first `n` atoms (clamped to the atom count). */
    static AtomSelection until(std::size_t n);
    /** @brief Atoms whose mask entry is true; entries past the mask are excluded. */
    static AtomSelection mask(std::vector<bool> mask);

    /**
     * @brief Resolve against a frame with `natoms` atoms.
     * @throws XtcError(IndexOutOfRange) for an index >= natoms,
     * XtcError(InvalidSelection) for a repeated index.
     */
    ResolvedAtoms resolve(std::size_t natoms) const;

    bool is_all() const { return kind_ == Kind::All; }

private:
    enum class Kind { All, Indices, Until, Mask };

    Kind kind_ = Kind::All;
    std::vector<std::size_t> indices_;
    std::size_t until_ = 0;
    std::vector<bool> mask_;
};

/**
 * @brief Copy the selected atoms out of `decoded` (positions of the first
 * `atoms.reading_limit` atoms) into `out` (3 * atoms.count floats).
 */
void gather_atoms(const float* decoded, const ResolvedAtoms& atoms, float* out);

} // namespace molly
