#pragma once

#include <cstddef>
#include <filesystem>
#include <span>

#ifdef _WIN32
#    include <windows.h>
#else
#    include <fcntl.h>
#    include <sys/mman.h>
#    include <sys/stat.h>
#    include <unistd.h>
#endif

namespace cbers_tiler {

/**
 * @brief 読み取り専用のメモリマップドファイル
 *
 * JP2のボックス構造のように、ファイル内を前後に移動しながら
 * 小さなヘッダを読む用途に使う。
 */
class MemoryMappedFile {
   public:
    explicit MemoryMappedFile(const std::filesystem::path& path) {
#ifdef _WIN32
        file_handle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr,
                                   OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (file_handle_ == INVALID_HANDLE_VALUE) {
            return;
        }

        LARGE_INTEGER file_size;
        if (!GetFileSizeEx(file_handle_, &file_size) || file_size.QuadPart == 0) {
            release();
            return;
        }
        size_ = static_cast<size_t>(file_size.QuadPart);

        map_handle_ = CreateFileMappingW(file_handle_, nullptr, PAGE_READONLY, 0, 0, nullptr);
        if (!map_handle_) {
            release();
            return;
        }

        data_ = MapViewOfFile(map_handle_, FILE_MAP_READ, 0, 0, 0);
        if (!data_) {
            release();
        }
#else
        fd_ = open(path.c_str(), O_RDONLY);
        if (fd_ == -1) {
            return;
        }

        struct stat sb;
        if (fstat(fd_, &sb) == -1 || sb.st_size == 0) {
            release();
            return;
        }
        size_ = static_cast<size_t>(sb.st_size);

        data_ = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
        if (data_ == MAP_FAILED) {
            data_ = nullptr;
            release();
            return;
        }

        // ボックスの走査は飛び飛びに読むため先読みは不要
        madvise(data_, size_, MADV_RANDOM);
#endif
    }

    ~MemoryMappedFile() { release(); }

    // コピー禁止、ムーブも不要
    MemoryMappedFile(const MemoryMappedFile&) = delete;
    MemoryMappedFile& operator=(const MemoryMappedFile&) = delete;

    bool is_open() const { return data_ != nullptr; }

    std::span<const std::byte> bytes() const {
        if (!data_) {
            return {};
        }
        return {static_cast<const std::byte*>(data_), size_};
    }

    size_t size() const { return size_; }

   private:
    void release() noexcept {
#ifdef _WIN32
        if (data_)
            UnmapViewOfFile(data_);
        if (map_handle_)
            CloseHandle(map_handle_);
        if (file_handle_ != INVALID_HANDLE_VALUE)
            CloseHandle(file_handle_);
        map_handle_ = nullptr;
        file_handle_ = INVALID_HANDLE_VALUE;
#else
        if (data_)
            munmap(data_, size_);
        if (fd_ != -1)
            close(fd_);
        fd_ = -1;
#endif
        data_ = nullptr;
        size_ = 0;
    }

    void* data_ = nullptr;
    size_t size_ = 0;

#ifdef _WIN32
    HANDLE file_handle_ = INVALID_HANDLE_VALUE;
    HANDLE map_handle_ = nullptr;
#else
    int fd_ = -1;
#endif
};

}  // namespace cbers_tiler
