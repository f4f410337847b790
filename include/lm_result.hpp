// SPDX-License-Identifier: MIT
// Copyright (c) 2025 29thnight

/**
 * @file lm_result.hpp
 * @brief Scan errors and the value-or-error result type.
 *
 * Scanning never throws on bad input. Every scanning operation returns a
 * ScanResult holding either the produced value or the first ScanError.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "lm_token.hpp"

namespace lumen {

enum class ScanErrorKind : uint8_t {
    UnknownCharacter,    // character outside the recognized set
    UnterminatedString,  // end of input before the closing quote
};

struct ScanError {
    ScanErrorKind kind;
    Position position;
    std::string text;

    static const char* kind_name(ScanErrorKind kind);

    bool operator==(const ScanError& other) const {
        return kind == other.kind && position == other.position && text == other.text;
    }

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& os, const ScanError& error);

template <typename T>
class ScanResult {
public:
    ScanResult(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    ScanResult(ScanError error) : data_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return data_.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!ok()) throw std::logic_error("ScanResult::value() on error: " + error().to_string());
        return std::get<0>(data_);
    }

    T& value() {
        if (!ok()) throw std::logic_error("ScanResult::value() on error: " + error().to_string());
        return std::get<0>(data_);
    }

    T take_value() { return std::move(value()); }

    const ScanError& error() const {
        if (ok()) throw std::logic_error("ScanResult::error() on success");
        return std::get<1>(data_);
    }

private:
    std::variant<T, ScanError> data_;
};

} // namespace lumen
