#include "../../include/storage/mmap_handler.hpp"
#include "../../include/common/errors.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace knntune {

    namespace {

        std::string os_error(const std::string& what, const std::string& path) {
            std::string msg = what;
            if (!path.empty()) msg += " '" + path + "'";
            return msg + ": " + std::strerror(errno);
        }

    } // namespace

    MMapHandler::MMapHandler()
        : file_size_(0), data_(nullptr), sealed_(false), file_fd_(-1)
    {
    }

    MMapHandler::~MMapHandler() {
        close_file();
    }

    void MMapHandler::open_anonymous(size_t size) {
        close_file();
        if (size == 0) {
            throw StoreError("cannot map an empty shared region");
        }

        // MAP_SHARED | MAP_ANONYMOUS: not backed by a file, but not copy-on-write either.
        // Every process forked after this point reads the very same pages.
        data_ = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_SHARED | MAP_ANONYMOUS, -1, 0);
        if (data_ == MAP_FAILED) {
            data_ = nullptr;
            throw StoreError(os_error("anonymous mmap failed", ""));
        }
        file_size_ = size;
        file_path_.clear();
    }

    void MMapHandler::open_file(const std::string& filepath, size_t min_size) {
        close_file();
        file_path_ = filepath;
        file_size_ = min_size;

        // Create directory if it doesn't exist
        std::filesystem::path p(filepath);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }

        // 1. Open File
        file_fd_ = open(filepath.c_str(), O_RDWR | O_CREAT, 0666);
        if (file_fd_ == -1) {
            throw StoreError(os_error("failed to open", filepath));
        }

        // 2. Resize File
        struct stat st;
        if (fstat(file_fd_, &st) != 0) {
            std::string msg = os_error("fstat failed", filepath);
            close(file_fd_);
            file_fd_ = -1;
            throw StoreError(msg);
        }
        if ((size_t)st.st_size < min_size) {
            if (ftruncate(file_fd_, min_size) != 0) {
                std::string msg = os_error("failed to resize", filepath);
                close(file_fd_);
                file_fd_ = -1;
                throw StoreError(msg);
            }
        } else {
            file_size_ = st.st_size;
        }

        if (file_size_ == 0) {
            close(file_fd_);
            file_fd_ = -1;
            throw StoreError("cannot map empty file '" + filepath + "'");
        }

        // 3. Map Memory
        data_ = mmap(nullptr, file_size_, PROT_READ | PROT_WRITE, MAP_SHARED, file_fd_, 0);
        if (data_ == MAP_FAILED) {
            data_ = nullptr;
            std::string msg = os_error("mmap failed", filepath);
            close(file_fd_);
            file_fd_ = -1;
            throw StoreError(msg);
        }
    }

    void MMapHandler::open_existing(const std::string& filepath) {
        close_file();
        file_path_ = filepath;

        file_fd_ = open(filepath.c_str(), O_RDONLY);
        if (file_fd_ == -1) {
            throw StoreError(os_error("failed to open", filepath));
        }

        struct stat st;
        if (fstat(file_fd_, &st) != 0) {
            std::string msg = os_error("fstat failed", filepath);
            close(file_fd_);
            file_fd_ = -1;
            throw StoreError(msg);
        }
        if (st.st_size == 0) {
            close(file_fd_);
            file_fd_ = -1;
            throw StoreError("store file '" + filepath + "' is empty");
        }
        file_size_ = st.st_size;

        data_ = mmap(nullptr, file_size_, PROT_READ, MAP_SHARED, file_fd_, 0);
        if (data_ == MAP_FAILED) {
            data_ = nullptr;
            std::string msg = os_error("mmap failed", filepath);
            close(file_fd_);
            file_fd_ = -1;
            throw StoreError(msg);
        }
        sealed_ = true;
    }

    void MMapHandler::close_file() {
        if (data_) {
            munmap(data_, file_size_);
            data_ = nullptr;
        }
        if (file_fd_ != -1) {
            close(file_fd_);
            file_fd_ = -1;
        }
        file_size_ = 0;
        sealed_ = false;
    }

    void MMapHandler::seal() {
        if (!data_ || sealed_) return;
        if (mprotect(data_, file_size_, PROT_READ) != 0) {
            throw StoreError(os_error("mprotect failed", file_path_));
        }
        sealed_ = true;
    }

    void MMapHandler::sync() {
        if (!data_ || file_fd_ == -1) return;
        if (msync(data_, file_size_, MS_SYNC) != 0) {
            throw StoreError(os_error("msync failed", file_path_));
        }
    }

    void* MMapHandler::get_data() const {
        return data_;
    }

    size_t MMapHandler::get_size() const {
        return file_size_;
    }

} // namespace knntune
