// 这个头文件的作用：
// 1. XTCReader：xtc 轨迹的随机访问与流式读取。
//    MappedFile 持有文件字节，FrameIndex 记录每一帧的位置。
// 2. read_frames / read_into_array：解析 FrameSelection 与 AtomSelection，
//    只解码需要的部分。
// 3. FrameCursor：按文件顺序逐帧读取 (pop_frame)。
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "basic.hpp"
#include "frame_index.hpp"
#include "mapped_file.hpp"
#include "selection.hpp"

namespace molly {

class XTCReader;

/**
 * @brief 调用者持有的三维 C 连续 float 数组。
 */
struct ArrayView3 {
    float* data = nullptr;
    std::array<std::size_t, 3> shape{{0, 0, 0}};
};

/**
 * @brief 按文件顺序遍历帧的游标。
 *
 * 游标边走边从帧头计算记录长度，不依赖帧索引，
 * 因此文件仍在追加写入时也能工作。游标引用其 reader，不能比 reader 活得更久。
 */
class FrameCursor {
public:
    explicit FrameCursor(const XTCReader& reader);

    /**
     * @brief 解码下一帧并前进。
     * @throws XtcError(EndOfTrajectory) 所有帧都已读完时抛出。
     * 解码失败时游标保持原位。
     */
    Frame pop_frame();

    /** @brief 回到第一帧。 */
    void reset();

    /** @brief 下一次 pop_frame 返回的帧号 */
    std::size_t frame() const { return frame_; }
    std::uint64_t offset() const { return offset_; }

private:
    const XTCReader* reader_;
    std::uint64_t offset_ = 0;
    std::size_t frame_ = 0;
};

/**
 * @brief XTCReader::read_frames 返回的惰性帧序列，只能遍历一次。
 *
 * 每次调用 next() 解码一帧。流通过其 reader 读取，不能比 reader 活得更久。
 */
class FrameStream {
public:
    /** @brief 下一帧；流结束时返回空 */
    std::optional<Frame> next();

    /** @brief 将要访问的帧号 (按顺序) */
    const std::vector<std::size_t>& frames() const { return frames_; }
    std::size_t size() const { return frames_.size(); }
    std::size_t remaining() const { return frames_.size() - pos_; }

    /** @brief 解码剩余的所有帧 */
    std::vector<Frame> collect();

private:
    friend class XTCReader;
    FrameStream(const XTCReader& reader, std::vector<std::size_t> frames, std::optional<ResolvedAtoms> atoms);

    const XTCReader* reader_;
    std::vector<std::size_t> frames_;
    std::size_t pos_ = 0;
    std::optional<ResolvedAtoms> atoms_;  // 为空表示每帧的全部原子
    std::vector<float> scratch_;
};

/**
 * @brief 读取单个 xtc 轨迹文件。
 *
 * 打开时映射文件并检查第一帧的帧头；帧索引在第一次需要时建立并缓存。
 * 同一个 reader 不能被多个线程同时使用；不同的 reader 互不影响。
 */
class XTCReader {
public:
    /**
     * @brief 打开并映射 `filename`。
     * @throws XtcError(FileNotFound) 文件无法打开；
     * XtcError(BadMagic) 第一条记录不是 xtc 帧。
     */
    explicit XTCReader(const std::string& filename);
    ~XTCReader() = default;

    XTCReader(const XTCReader&) = delete;
    XTCReader& operator=(const XTCReader&) = delete;

    const std::string& filename() const { return filename_; }

    // --- Metadata ---

    /** @brief 总帧数，第一次调用时建立索引 */
    std::size_t frame_count();

    /**
     * @brief 第一帧帧头中的原子数。
     * @throws XtcError(EmptyTrajectory) 文件中没有帧时抛出。
     */
    std::size_t atom_count() const;

    /** @brief 帧索引，不存在时先建立 */
    const FrameIndex& index();

    // --- Index management ---

    /**
     * @brief 重新映射并扫描文件，使追加的帧可见。
     * 文件无法打开时保持原状；重新扫描失败时保留新的映射并丢弃索引，
     * 下次读取时重新建立。
     */
    void refresh();

    /** @brief 将帧索引 (必要时先建立) 写入缓存文件 */
    void save_index(const std::string& cache_filename);

    /**
     * @brief 从缓存文件读取帧索引，确认缓存对应当前文件后替换现有索引。
     */
    void load_index(const std::string& cache_filename);

    // --- Random access ---

    /**
     * @brief 按帧号解码单帧。
     * @throws XtcError(IndexOutOfRange) 帧号越界时抛出。
     */
    Frame read_frame(std::size_t frame_number);

    /**
     * @brief 惰性解码选中的帧，只保留选中的原子。
     * 选择在调用时按当前的帧数和原子数解析。
     */
    FrameStream read_frames(const FrameSelection& frame_selection = FrameSelection(),
                            const AtomSelection& atom_selection = AtomSelection());

    /**
     * @brief 将选中的帧直接解码到调用者的缓冲区 (OpenMP 并行)。
     *
     * @param positions 形状 (n_frames, n_selected_atoms, 3)
     * @param boxes     形状 (n_frames, 3, 3)
     * @return 写入的帧数
     * @throws XtcError(ShapeMismatch) 形状与选择不一致时抛出。
     * 解码失败时异常带有帧号和 rows_valid()：之前的行完整，之后的行内容不确定。
     */
    std::size_t read_into_array(ArrayView3 positions, ArrayView3 boxes,
                                const FrameSelection& frame_selection = FrameSelection(),
                                const AtomSelection& atom_selection = AtomSelection());

    // --- Streaming ---

    /** @brief 从 reader 自带的游标取下一帧 */
    Frame pop_frame() { return cursor_.pop_frame(); }

    /** @brief 将 reader 自带的游标回到开头 */
    void home() { cursor_.reset(); }

    /** @brief 从第一帧开始的独立游标 */
    FrameCursor cursor() const { return FrameCursor(*this); }

    // --- Lifetime ---

    /** @brief 释放映射，之后的读取都会抛出 ReaderClosed */
    void close();
    bool is_open() const { return mapped_file_ != nullptr; }

private:
    friend class FrameCursor;
    friend class FrameStream;

    const std::uint8_t* data() const;
    std::size_t file_size() const;
    void require_open() const;
    void read_first_header();
    const FrameIndex& built_index() const;

    /*
     * 解码第 `frame_number` 帧，将选中的原子写入 `out` (3 * atoms.count 个 float)。
     * `exact_count` 为真时该帧的原子数必须正好等于 atoms.count。异常带有帧号。
     */
    FrameHeader decode_selected(std::size_t frame_number, const ResolvedAtoms& atoms, bool exact_count,
                                float* out, float* precision, std::vector<float>& scratch) const;

    /* 解码一帧为 Frame；`atoms` 为空表示全部原子 */
    Frame decode_frame_at(std::size_t frame_number, const std::optional<ResolvedAtoms>& atoms,
                          std::vector<float>& scratch) const;

    std::string filename_;
    std::unique_ptr<MappedFile> mapped_file_;
    mutable std::optional<FrameIndex> index_;  // 第一次需要时建立
    std::optional<std::size_t> n_atoms_;  // 没有帧时为空
    FrameCursor cursor_;
};

} // namespace molly
