#include "query/label.h"

Label::Label(std::string_view key) {
    quoted_.reserve(key.size() + 2);
    quoted_.push_back('"');
    quoted_.append(key.data(), key.size());
    quoted_.push_back('"');
}

std::string_view Label::bytes() const {
    return std::string_view(quoted_).substr(1, quoted_.size() - 2);
}

std::string_view Label::bytesWithQuotes() const {
    return quoted_;
}
