// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

#include "lm_cursor.hpp"

#include <stdexcept>

namespace lumen {

bool SourceCursor::has(size_t ahead) const {
    return ahead < remaining();
}

char SourceCursor::peek(size_t ahead) const {
    if (!has(ahead)) return '\0';
    return source_[current_ + ahead];
}

char SourceCursor::next() {
    if (at_end()) {
        throw std::out_of_range("SourceCursor::next() past end of input");
    }
    return source_[current_++];
}

} // namespace lumen
