// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

#include "lm_result.hpp"

namespace lumen {

const char* ScanError::kind_name(ScanErrorKind kind) {
    switch (kind) {
        case ScanErrorKind::UnknownCharacter:   return "UnknownCharacter";
        case ScanErrorKind::UnterminatedString: return "UnterminatedString";
    }
    return "Unknown";
}

std::string ScanError::to_string() const {
    switch (kind) {
        case ScanErrorKind::UnknownCharacter:
            return "unknown character '" + text + "' at line " + position.to_string();
        case ScanErrorKind::UnterminatedString:
            return "unterminated string " + text + " starting at line " + position.to_string();
    }
    return "scan error at line " + position.to_string();
}

std::ostream& operator<<(std::ostream& os, const ScanError& error) {
    return os << error.to_string();
}

} // namespace lumen
