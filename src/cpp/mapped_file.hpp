/*
mapped_file.hpp:
    Read-only memory map of a whole file, released on destruction.
    The OUTCAR parser works on the mapped bytes through a std::string_view.
*/
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

class MappedFile {
private:
    const char* data_ = nullptr;
    size_t size_ = 0;
#ifdef _WIN32
    HANDLE file_ = INVALID_HANDLE_VALUE;
    HANDLE mapping_ = NULL;
#endif

public:
    /**
     * @brief Maps filename into memory. An empty file maps to an empty view.
     * @throws std::runtime_error if the file cannot be opened or mapped.
     */
    explicit MappedFile(const std::string& filename) {
#ifdef _WIN32
        file_ = CreateFileA(filename.c_str(), GENERIC_READ, FILE_SHARE_READ, NULL, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, NULL);
        if (file_ == INVALID_HANDLE_VALUE) {
            throw std::runtime_error("Could not open file " + filename);
        }
        LARGE_INTEGER size;
        if (!GetFileSizeEx(file_, &size)) {
            CloseHandle(file_);
            throw std::runtime_error("Could not get the size of " + filename);
        }
        size_ = static_cast<size_t>(size.QuadPart);
        if (size_ == 0) {
            return;
        }
        mapping_ = CreateFileMapping(file_, NULL, PAGE_READONLY, 0, 0, NULL);
        if (mapping_ == NULL) {
            CloseHandle(file_);
            throw std::runtime_error("Could not create a file mapping for " + filename);
        }
        data_ = static_cast<const char*>(MapViewOfFile(mapping_, FILE_MAP_READ, 0, 0, size_));
        if (data_ == NULL) {
            CloseHandle(mapping_);
            CloseHandle(file_);
            throw std::runtime_error("Could not map " + filename);
        }
#else
        int fd = open(filename.c_str(), O_RDONLY);
        if (fd == -1) {
            throw std::runtime_error("Could not open file " + filename);
        }
        struct stat sb;
        if (fstat(fd, &sb) == -1) {
            close(fd);
            throw std::runtime_error("Could not get the size of " + filename);
        }
        size_ = static_cast<size_t>(sb.st_size);
        if (size_ == 0) {
            close(fd);
            return;
        }
        void* p = mmap(NULL, size_, PROT_READ, MAP_PRIVATE, fd, 0);
        // the mapping stays valid after the descriptor is closed
        close(fd);
        if (p == MAP_FAILED) {
            throw std::runtime_error("Could not map " + filename);
        }
        data_ = static_cast<const char*>(p);
#endif
    }

    ~MappedFile() {
#ifdef _WIN32
        if (data_) UnmapViewOfFile(data_);
        if (mapping_) CloseHandle(mapping_);
        if (file_ != INVALID_HANDLE_VALUE) CloseHandle(file_);
#else
        if (data_) munmap(const_cast<char*>(data_), size_);
#endif
    }

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    std::string_view view() const { return data_ ? std::string_view(data_, size_) : std::string_view(); }
};
