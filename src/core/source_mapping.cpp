/**
 * @file source_mapping.cpp
 * @brief mmap-based source access
 */

#include <kcenon/blob_upload/core/source_mapping.h>

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kcenon::blob_upload {

namespace {

auto errno_error(error_code code, const std::string& what, const std::filesystem::path& path)
    -> error {
    int saved = errno;
    return error{code, what + " " + path.string() + ": " + std::strerror(saved)};
}

// Closes the descriptor once the mapping exists; the mapping outlives it.
class scoped_fd {
public:
    explicit scoped_fd(int fd) noexcept : fd_(fd) {}
    ~scoped_fd() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    scoped_fd(const scoped_fd&) = delete;
    auto operator=(const scoped_fd&) -> scoped_fd& = delete;

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }

private:
    int fd_;
};

}  // namespace

auto source_mapping::slice(uint64_t offset, uint64_t length) const
    -> result<std::span<const std::byte>> {
    auto all = bytes();
    if (offset > all.size() || length > all.size() - offset) {
        return unexpected{error{error_code::source_range_error,
            "range [" + std::to_string(offset) + ", " + std::to_string(offset + length) +
                ") outside mapping of " + std::to_string(all.size()) + " bytes"}};
    }
    return all.subspan(static_cast<std::size_t>(offset), static_cast<std::size_t>(length));
}

mapped_file::mapped_file(void* addr, std::size_t length) noexcept
    : addr_(addr), length_(length) {}

mapped_file::~mapped_file() {
    release();
}

auto mapped_file::open(const std::filesystem::path& path, uint64_t expected_size)
    -> result<std::unique_ptr<mapped_file>> {
    if (expected_size == 0) {
        return unexpected{error{error_code::source_map_failed,
            "cannot map empty source " + path.string()}};
    }

    scoped_fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (fd.get() < 0) {
        auto code = errno == ENOENT  ? error_code::source_not_found
                    : errno == EACCES ? error_code::source_access_denied
                                      : error_code::source_open_failed;
        return unexpected{errno_error(code, "cannot open", path)};
    }

    struct stat st {};
    if (::fstat(fd.get(), &st) != 0) {
        return unexpected{errno_error(error_code::source_open_failed, "cannot stat", path)};
    }
    if (static_cast<uint64_t>(st.st_size) != expected_size) {
        return unexpected{error{error_code::source_size_mismatch,
            path.string() + " is " + std::to_string(st.st_size) + " bytes, expected " +
                std::to_string(expected_size)}};
    }

    auto length = static_cast<std::size_t>(expected_size);
    void* addr = ::mmap(nullptr, length, PROT_READ, MAP_SHARED, fd.get(), 0);
    if (addr == MAP_FAILED) {
        return unexpected{errno_error(error_code::source_map_failed, "cannot map", path)};
    }

    // Chunks are read front to back by many workers; a failed hint is harmless.
    (void)::madvise(addr, length, MADV_SEQUENTIAL);

    return std::unique_ptr<mapped_file>(new mapped_file(addr, length));
}

auto mapped_file::bytes() const noexcept -> std::span<const std::byte> {
    if (addr_ == nullptr) {
        return {};
    }
    return {static_cast<const std::byte*>(addr_), length_};
}

void mapped_file::release() noexcept {
    if (addr_ != nullptr) {
        ::munmap(addr_, length_);
        addr_ = nullptr;
        length_ = 0;
    }
}

auto mapped_file::is_released() const noexcept -> bool {
    return addr_ == nullptr;
}

auto open_mapped_file(const std::filesystem::path& path, uint64_t size)
    -> result<std::shared_ptr<source_mapping>> {
    auto mapped = mapped_file::open(path, size);
    if (!mapped) {
        return unexpected{mapped.error()};
    }
    return std::shared_ptr<source_mapping>(std::move(mapped.value()));
}

}  // namespace kcenon::blob_upload
