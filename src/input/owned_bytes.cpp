#include "input/owned_bytes.h"
#include "input/slice_ops.h"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

OwnedBytes::OwnedBytes(std::string_view contents)
    : buffer_(contents), dataLen_(contents.size()) {
    buffer_.resize(paddedLength(dataLen_), '\0');
}

OwnedBytes OwnedBytes::readFile(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        throw InputError(errno, "cannot stat '" + path + "'");
    }
    if (S_ISDIR(st.st_mode)) {
        throw InputError(EISDIR, "'" + path + "' is a directory");
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw InputError(errno != 0 ? errno : EIO, "cannot open '" + path + "'");
    }

    OwnedBytes input = readStream(file, "'" + path + "'");
    if (S_ISREG(st.st_mode) && st.st_size > 0 && input.dataLen() == 0) {
        throw InputError(EIO, "reading '" + path + "' failed");
    }
    return input;
}

OwnedBytes OwnedBytes::readStream(std::istream& in, const std::string& name) {
    if (!in) {
        throw InputError(EIO, "cannot read " + name);
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw InputError(EIO, "reading " + name + " failed");
    }
    return OwnedBytes(buffer.str());
}

const char* OwnedBytes::window(size_t offset, size_t size) const {
    if (offset >= buffer_.size() || size > buffer_.size() - offset) return nullptr;
    return buffer_.data() + offset;
}

std::optional<size_t> OwnedBytes::seekBackward(size_t from, char needle) const {
    return slice_ops::seekBackward(buffer_, from, needle);
}

std::optional<std::pair<size_t, char>> OwnedBytes::seekNonWhitespaceForward(size_t from) const {
    return slice_ops::seekNonWhitespaceForward(buffer_, from);
}

std::optional<std::pair<size_t, char>> OwnedBytes::seekNonWhitespaceBackward(size_t from) const {
    return slice_ops::seekNonWhitespaceBackward(buffer_, from);
}

bool OwnedBytes::isMemberMatch(size_t from, size_t to, const Label& label) const {
    return slice_ops::isMemberMatch(buffer_, from, to, label);
}
