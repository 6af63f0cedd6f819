// MappedFile: 轨迹文件的只读内存映射。
// 所有解码都直接读取映射的字节，析构时自动释放。
#pragma once
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <cstddef>
#include <cstdint>
#include <string>

#ifdef _WIN32
#include <windows.h>
#endif

namespace molly {

/**
 * @brief 使用 RAII 封装内存映射文件 (POSIX mmap / Windows MapViewOfFile)。
 *
 * 允许空文件：此时 data() 为 nullptr，size() 为 0。
 * @throws XtcError(FileNotFound) 文件无法打开或映射时抛出。
 */
class MappedFile {
public:
    explicit MappedFile(const std::string& filename);
    ~MappedFile();

    // --- 禁用拷贝和赋值 ---
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    /** @brief 提前解除映射，可重复调用。 */
    void unmap();

    // --- 访问器 ---
    const std::uint8_t* data() const { return file_ptr_; }
    std::size_t size() const { return file_size_; }
    bool is_mapped() const { return file_ptr_ != nullptr; }
    const std::string& filename() const { return filename_; }

private:
    void map();

    std::string filename_;
    const std::uint8_t* file_ptr_ = nullptr;
    std::size_t file_size_ = 0;

#ifdef _WIN32
    HANDLE hFile_ = INVALID_HANDLE_VALUE;
    HANDLE hMapFile_ = NULL;
#endif
};

} // namespace molly
