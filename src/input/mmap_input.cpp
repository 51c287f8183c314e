#include "input/mmap_input.h"
#include "input/slice_ops.h"
#include "utils/Log.h"

#include <cerrno>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

// Closes the descriptor when leaving scope; the mapping outlives it
struct FileDescriptor {
    int fd;
    ~FileDescriptor() {
        if (fd >= 0) ::close(fd);
    }
};

} // namespace

MmapInput::MmapInput(char* base, size_t mappedLen, size_t dataLen, size_t paddedLen)
    : base_(base), mappedLen_(mappedLen), dataLen_(dataLen), paddedLen_(paddedLen) {}

size_t MmapInput::mappedLength(size_t paddedLen, long pageSize) {
    const size_t page = pageSize > 0 ? static_cast<size_t>(pageSize) : DEFAULT_PAGE_SIZE;
    return (paddedLen + page - 1) / page * page;
}

MmapInput MmapInput::mapFile(int fd, AssumeUnmodified) {
    struct stat st;
    if (::fstat(fd, &st) != 0) {
        throw InputError(errno, "fstat failed");
    }
    if (!S_ISREG(st.st_mode)) {
        throw InputError(ENODEV, "input is not a regular file and cannot be memory mapped");
    }

    const size_t dataLen = static_cast<size_t>(st.st_size);
    const size_t paddedLen = paddedLength(dataLen);
    if (paddedLen == 0) {
        return MmapInput(nullptr, 0, 0, 0);
    }

    const size_t mappedLen = mappedLength(paddedLen, ::sysconf(_SC_PAGESIZE));

    // Reserve zeroed pages for the padded length, then lay the file over
    // them. Bytes past the end of the file are zero either way, and no page
    // beyond the file is ever backed by it.
    void* base = ::mmap(nullptr, mappedLen, PROT_READ, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    if (base == MAP_FAILED) {
        throw InputError(errno, "mmap reservation failed");
    }
    if (dataLen > 0) {
        void* file = ::mmap(base, dataLen, PROT_READ, MAP_PRIVATE | MAP_FIXED, fd, 0);
        if (file == MAP_FAILED) {
            const int err = errno;
            ::munmap(base, mappedLen);
            throw InputError(err, "mmap failed");
        }
    }

    Log::debug("mapped ", dataLen, " bytes, padded to ", paddedLen);
    return MmapInput(static_cast<char*>(base), mappedLen, dataLen, paddedLen);
}

MmapInput MmapInput::mapFile(const std::string& path, AssumeUnmodified tag) {
    FileDescriptor file{::open(path.c_str(), O_RDONLY | O_CLOEXEC)};
    if (file.fd < 0) {
        throw InputError(errno, "cannot open '" + path + "'");
    }
    return mapFile(file.fd, tag);
}

MmapInput::~MmapInput() {
    release();
}

MmapInput::MmapInput(MmapInput&& other) noexcept
    : base_(other.base_), mappedLen_(other.mappedLen_), dataLen_(other.dataLen_), paddedLen_(other.paddedLen_) {
    other.base_ = nullptr;
    other.mappedLen_ = 0;
    other.dataLen_ = 0;
    other.paddedLen_ = 0;
}

MmapInput& MmapInput::operator=(MmapInput&& other) noexcept {
    if (this != &other) {
        release();
        base_ = other.base_;
        mappedLen_ = other.mappedLen_;
        dataLen_ = other.dataLen_;
        paddedLen_ = other.paddedLen_;
        other.base_ = nullptr;
        other.mappedLen_ = 0;
        other.dataLen_ = 0;
        other.paddedLen_ = 0;
    }
    return *this;
}

void MmapInput::release() noexcept {
    if (base_ != nullptr) {
        ::munmap(base_, mappedLen_);
        base_ = nullptr;
    }
}

const char* MmapInput::window(size_t offset, size_t size) const {
    if (offset >= paddedLen_ || size > paddedLen_ - offset) return nullptr;
    return base_ + offset;
}

std::optional<size_t> MmapInput::seekBackward(size_t from, char needle) const {
    return slice_ops::seekBackward(bytes(), from, needle);
}

std::optional<std::pair<size_t, char>> MmapInput::seekNonWhitespaceForward(size_t from) const {
    return slice_ops::seekNonWhitespaceForward(bytes(), from);
}

std::optional<std::pair<size_t, char>> MmapInput::seekNonWhitespaceBackward(size_t from) const {
    return slice_ops::seekNonWhitespaceBackward(bytes(), from);
}

bool MmapInput::isMemberMatch(size_t from, size_t to, const Label& label) const {
    return slice_ops::isMemberMatch(bytes(), from, to, label);
}
