#include "reader.hpp"
#include "error.hpp"
#include "frame_decoder.hpp"

#include <atomic>
#include <exception>
#include <string>
#include <utility>

#ifdef _OPENMP
#include <omp.h>        // For OpenMP parallel read
#endif

namespace molly {

// ----------------------------------------------------------------------------
// 辅助函数 (Helpers)
// ----------------------------------------------------------------------------

static std::string shape_string(const std::array<std::size_t, 3>& shape) {
    return "(" + std::to_string(shape[0]) + ", " + std::to_string(shape[1]) + ", " +
           std::to_string(shape[2]) + ")";
}

static void check_shape(const char* name, const ArrayView3& view, const std::array<std::size_t, 3>& expected) {
    if (view.shape != expected) {
        throw XtcError(ErrorKind::ShapeMismatch,
                       std::string(name) + " buffer has shape " + shape_string(view.shape) +
                       ", expected " + shape_string(expected));
    }
    if (view.data == nullptr && expected[0] * expected[1] * expected[2] > 0) {
        throw XtcError(ErrorKind::ShapeMismatch, std::string(name) + " buffer is null");
    }
}

// ----------------------------------------------------------------------------
// FrameCursor
// ----------------------------------------------------------------------------

FrameCursor::FrameCursor(const XTCReader& reader)
    : reader_(&reader) {}

Frame FrameCursor::pop_frame() {
    const std::uint8_t* data = reader_->data();
    const std::size_t size = reader_->file_size();
    if (offset_ >= size) {
        throw XtcError(ErrorKind::EndOfTrajectory,
                       "no frames left after " + std::to_string(frame_) + " read");
    }

    std::uint32_t length = 0;
    Frame frame;
    try {
        length = record_length(data + offset_, size - offset_);
        frame = decode_frame(data + offset_, length);
    } catch (const XtcError& e) {
        throw e.with_frame(frame_);
    }
    offset_ += length;
    ++frame_;
    return frame;
}

void FrameCursor::reset() {
    offset_ = 0;
    frame_ = 0;
}

// ----------------------------------------------------------------------------
// FrameStream
// ----------------------------------------------------------------------------

FrameStream::FrameStream(const XTCReader& reader, std::vector<std::size_t> frames,
                         std::optional<ResolvedAtoms> atoms)
    : reader_(&reader), frames_(std::move(frames)), atoms_(std::move(atoms)) {}

std::optional<Frame> FrameStream::next() {
    if (pos_ >= frames_.size()) {
        return std::nullopt;
    }
    Frame frame = reader_->decode_frame_at(frames_[pos_], atoms_, scratch_);
    ++pos_;
    return frame;
}

std::vector<Frame> FrameStream::collect() {
    std::vector<Frame> frames;
    frames.reserve(remaining());
    while (auto frame = next()) {
        frames.push_back(std::move(*frame));
    }
    return frames;
}

// ----------------------------------------------------------------------------
// XTCReader: 打开、元数据与索引管理
// ----------------------------------------------------------------------------

XTCReader::XTCReader(const std::string& filename)
    : filename_(filename), cursor_(*this) {
    mapped_file_ = std::make_unique<MappedFile>(filename_);
    read_first_header();
}

void XTCReader::require_open() const {
    if (!mapped_file_) {
        throw XtcError(ErrorKind::ReaderClosed, "reader is closed: " + filename_);
    }
}

const std::uint8_t* XTCReader::data() const {
    require_open();
    return mapped_file_->data();
}

std::size_t XTCReader::file_size() const {
    require_open();
    return mapped_file_->size();
}

void XTCReader::read_first_header() {
    if (file_size() == 0) {
        n_atoms_.reset();
        return;
    }
    try {
        n_atoms_ = read_header(data(), file_size()).n_atoms;
    } catch (const XtcError& e) {
        throw e.with_frame(0);
    }
}

const FrameIndex& XTCReader::built_index() const {
    require_open();
    if (!index_) {
        index_ = FrameIndex::build(data(), file_size());
    }
    return *index_;
}

const FrameIndex& XTCReader::index() {
    return built_index();
}

std::size_t XTCReader::frame_count() {
    return built_index().size();
}

std::size_t XTCReader::atom_count() const {
    require_open();
    if (!n_atoms_) {
        throw XtcError(ErrorKind::EmptyTrajectory, "trajectory has no frames: " + filename_);
    }
    return *n_atoms_;
}

void XTCReader::refresh() {
    require_open();
    // 1. 按文件当前状态重新映射；失败时保留旧映射
    auto fresh_file = std::make_unique<MappedFile>(filename_);

    // 2. 基于新映射重新扫描
    std::optional<FrameIndex> fresh;
    try {
        fresh = index_ ? index_->refreshed(fresh_file->data(), fresh_file->size())
                       : FrameIndex::build(fresh_file->data(), fresh_file->size());
    } catch (const XtcError&) {
        // 旧索引可能指向文件末尾之后，下次读取时重新建立
        mapped_file_ = std::move(fresh_file);
        index_.reset();
        throw;
    }

    // 3. 替换；打开之后第一帧可能才出现
    mapped_file_ = std::move(fresh_file);
    index_ = std::move(fresh);
    read_first_header();
}

void XTCReader::save_index(const std::string& cache_filename) {
    built_index().save(cache_filename, file_size());
}

void XTCReader::load_index(const std::string& cache_filename) {
    require_open();
    index_ = FrameIndex::load(cache_filename, data(), file_size());
}

void XTCReader::close() {
    mapped_file_.reset();
    index_.reset();
    cursor_.reset();
}

// ----------------------------------------------------------------------------
// XTCReader: 解码
// ----------------------------------------------------------------------------

FrameHeader XTCReader::decode_selected(std::size_t frame_number, const ResolvedAtoms& atoms, bool exact_count,
                                       float* out, float* precision, std::vector<float>& scratch) const {
    const FrameIndexEntry& entry = built_index().at(frame_number);
    const std::uint8_t* record = data() + entry.offset;

    try {
        FrameHeader header = read_header(record, entry.length);
        if (exact_count && header.n_atoms != atoms.count) {
            throw XtcError(ErrorKind::ShapeMismatch,
                           "frame has " + std::to_string(header.n_atoms) + " atoms, expected " +
                           std::to_string(atoms.count));
        }
        if (header.n_atoms < atoms.reading_limit) {
            throw XtcError(ErrorKind::IndexOutOfRange,
                           "atom " + std::to_string(atoms.reading_limit - 1) +
                           " is out of bounds (frame atoms: " + std::to_string(header.n_atoms) + ")");
        }

        if (atoms.identity) {
            return decode_positions(record, entry.length, atoms.reading_limit, out, precision);
        }
        scratch.resize(atoms.reading_limit * 3);
        header = decode_positions(record, entry.length, atoms.reading_limit, scratch.data(), precision);
        gather_atoms(scratch.data(), atoms, out);
        return header;
    } catch (const XtcError& e) {
        throw e.with_frame(frame_number);
    }
}

Frame XTCReader::decode_frame_at(std::size_t frame_number, const std::optional<ResolvedAtoms>& atoms,
                                 std::vector<float>& scratch) const {
    if (!atoms) {
        const FrameIndexEntry& entry = built_index().at(frame_number);
        try {
            return decode_frame(data() + entry.offset, entry.length);
        } catch (const XtcError& e) {
            throw e.with_frame(frame_number);
        }
    }

    Frame frame;
    frame.positions.resize(atoms->count * 3);
    FrameHeader header = decode_selected(frame_number, *atoms, false, frame.positions.data(),
                                         &frame.precision, scratch);
    frame.box = header.box;
    frame.step = header.step;
    frame.time = header.time;
    frame.n_atoms = atoms->count;
    return frame;
}

Frame XTCReader::read_frame(std::size_t frame_number) {
    std::vector<float> scratch;
    return decode_frame_at(frame_number, std::nullopt, scratch);
}

FrameStream XTCReader::read_frames(const FrameSelection& frame_selection, const AtomSelection& atom_selection) {
    std::vector<std::size_t> frames = frame_selection.resolve(frame_count());
    std::optional<ResolvedAtoms> atoms;
    if (!atom_selection.is_all()) {
        atoms = atom_selection.resolve(n_atoms_.value_or(0));
    }
    return FrameStream(*this, std::move(frames), std::move(atoms));
}

std::size_t XTCReader::read_into_array(ArrayView3 positions, ArrayView3 boxes,
                                       const FrameSelection& frame_selection,
                                       const AtomSelection& atom_selection) {
    // 1. 解析选择并检查调用者缓冲区的形状
    const std::vector<std::size_t> frames = frame_selection.resolve(frame_count());
    const bool all_atoms = atom_selection.is_all();
    const ResolvedAtoms atoms = atom_selection.resolve(n_atoms_.value_or(0));

    check_shape("positions", positions, {{frames.size(), atoms.count, 3}});
    check_shape("boxes", boxes, {{frames.size(), 3, 3}});

    // 2. (并行) 将每一帧直接解码到对应的行
    // MSVC 的 OpenMP 要求循环变量为有符号 int
    const int n_frames_to_read = static_cast<int>(frames.size());
    const std::size_t row_floats = atoms.count * 3;
    std::vector<std::exception_ptr> errors(frames.size());
    std::atomic<int> first_failed{n_frames_to_read};

#ifdef _OPENMP
#pragma omp parallel
#endif
    {
        std::vector<float> scratch;  // 每个线程一份
#ifdef _OPENMP
#pragma omp for schedule(dynamic)
#endif
        for (int i = 0; i < n_frames_to_read; ++i) {
            // 失败行之后的内容本来就不确定
            if (i > first_failed.load()) continue;
            const std::size_t row = static_cast<std::size_t>(i);
            try {
                FrameHeader header = decode_selected(frames[row], atoms, all_atoms,
                                                     positions.data + row * row_floats, nullptr, scratch);
                float* box = boxes.data + row * 9;
                for (int r = 0; r < 3; ++r) {
                    for (int c = 0; c < 3; ++c) {
                        box[r * 3 + c] = header.box[r][c];
                    }
                }
            } catch (const std::exception&) {
                errors[row] = std::current_exception();
                int current = first_failed.load();
                while (i < current && !first_failed.compare_exchange_weak(current, i)) {
                }
            }
        }
    }

    // 3. 报告最早的失败
    const int failed = first_failed.load();
    if (failed < n_frames_to_read) {
        try {
            std::rethrow_exception(errors[static_cast<std::size_t>(failed)]);
        } catch (const XtcError& e) {
            throw e.with_rows_valid(static_cast<std::size_t>(failed));
        }
    }
    return frames.size();
}

} // namespace molly
