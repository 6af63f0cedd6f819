#include "mapped_file.hpp"
#include "error.hpp"

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#include <sys/mman.h>
#include <sys/stat.h>
#endif

namespace molly {

MappedFile::MappedFile(const std::string& filename)
    : filename_(filename) {
    map();
}

MappedFile::~MappedFile() {
    unmap();
}

void MappedFile::map() {
#ifdef _WIN32
    hFile_ = CreateFileA(filename_.c_str(), GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE,
                         NULL, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, NULL);
    if (hFile_ == INVALID_HANDLE_VALUE) {
        throw XtcError(ErrorKind::FileNotFound, "could not open file: " + filename_);
    }

    LARGE_INTEGER size_li;
    if (!GetFileSizeEx(hFile_, &size_li)) {
        CloseHandle(hFile_);
        hFile_ = INVALID_HANDLE_VALUE;
        throw XtcError(ErrorKind::FileNotFound, "could not get file size: " + filename_);
    }
    file_size_ = static_cast<std::size_t>(size_li.QuadPart);

    // 文件大小为0时不创建映射
    if (file_size_ == 0) {
        CloseHandle(hFile_);
        hFile_ = INVALID_HANDLE_VALUE;
        return;
    }

    hMapFile_ = CreateFileMapping(hFile_, NULL, PAGE_READONLY, 0, 0, NULL);
    if (hMapFile_ == NULL) {
        CloseHandle(hFile_);
        hFile_ = INVALID_HANDLE_VALUE;
        throw XtcError(ErrorKind::FileNotFound, "could not create file mapping: " + filename_);
    }

    file_ptr_ = static_cast<const std::uint8_t*>(MapViewOfFile(hMapFile_, FILE_MAP_READ, 0, 0, file_size_));
    if (file_ptr_ == NULL) {
        CloseHandle(hMapFile_);
        CloseHandle(hFile_);
        hMapFile_ = NULL;
        hFile_ = INVALID_HANDLE_VALUE;
        throw XtcError(ErrorKind::FileNotFound, "could not map view of file: " + filename_);
    }
#else // POSIX
    int fd = ::open(filename_.c_str(), O_RDONLY);
    if (fd == -1) {
        throw XtcError(ErrorKind::FileNotFound, "could not open file: " + filename_);
    }

    struct stat sb;
    if (fstat(fd, &sb) == -1) {
        ::close(fd);
        throw XtcError(ErrorKind::FileNotFound, "could not get file size: " + filename_);
    }
    file_size_ = static_cast<std::size_t>(sb.st_size);

    // 文件大小为0时不创建映射
    if (file_size_ == 0) {
        ::close(fd);
        return;
    }

    void* ptr = mmap(NULL, file_size_, PROT_READ, MAP_PRIVATE, fd, 0);
    // mmap 之后可以立即关闭 fd，映射自己持有文件引用
    ::close(fd);
    if (ptr == MAP_FAILED) {
        file_size_ = 0;
        throw XtcError(ErrorKind::FileNotFound, "could not map file to memory: " + filename_);
    }
    file_ptr_ = static_cast<const std::uint8_t*>(ptr);
#endif
}

void MappedFile::unmap() {
#ifdef _WIN32
    if (file_ptr_) UnmapViewOfFile(file_ptr_);
    if (hMapFile_) CloseHandle(hMapFile_);
    if (hFile_ != INVALID_HANDLE_VALUE) CloseHandle(hFile_);
    hMapFile_ = NULL;
    hFile_ = INVALID_HANDLE_VALUE;
#else
    if (file_ptr_) {
        munmap(const_cast<std::uint8_t*>(file_ptr_), file_size_);
    }
#endif
    file_ptr_ = nullptr;
    file_size_ = 0;
}

} // namespace molly
