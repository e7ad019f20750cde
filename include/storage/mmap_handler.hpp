#pragma once

#include <string>
#include <cstddef>

namespace knntune {

    // Owns one memory-mapped region that outlives fork(): either anonymous
    // MAP_SHARED memory or a MAP_SHARED view of a file on disk.
    // Child processes forked after open_*() see the same physical pages.
    class MMapHandler {
    public:
        MMapHandler();
        ~MMapHandler();

        MMapHandler(const MMapHandler&) = delete;
        MMapHandler& operator=(const MMapHandler&) = delete;

        // Maps size bytes of anonymous shared memory (zero filled).
        void open_anonymous(size_t size);

        // Opens (or creates) a file and maps it read/write.
        // min_size: The size the file is grown to if it is smaller.
        void open_file(const std::string& filepath, size_t min_size);

        // Maps an existing file read-only. Throws StoreError if it is missing or empty.
        void open_existing(const std::string& filepath);

        // Unmaps the region and closes the file (if any). Safe to call twice.
        void close_file();

        // Drops write permission on the whole region (mprotect PROT_READ).
        // Any later write through get_data() faults instead of corrupting shared state.
        void seal();

        // Flushes a file-backed mapping to disk. No-op for anonymous memory.
        void sync();

        // Returns the raw pointer to the start of the memory block.
        void* get_data() const;

        // Returns current mapping size.
        size_t get_size() const;

        bool is_open() const { return data_ != nullptr; }
        bool is_sealed() const { return sealed_; }
        bool is_file_backed() const { return file_fd_ != -1; }
        const std::string& path() const { return file_path_; }

    private:
        std::string file_path_;
        size_t file_size_;
        void* data_;
        bool sealed_;
        int file_fd_;        // -1 for anonymous mappings
    };

} // namespace knntune
