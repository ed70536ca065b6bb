// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace dash::core {

enum class StyleErrc {
    success = 0,
    file_not_found,
    parse_error,
    type_mismatch,
    invalid_color,
    out_of_range,
};

namespace detail {

struct StyleErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "dash::style";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<StyleErrc>(ev)) {
            case StyleErrc::success:        return "Success";
            case StyleErrc::file_not_found: return "Style file not found";
            case StyleErrc::parse_error:    return "Malformed style document";
            case StyleErrc::type_mismatch:  return "Style value has the wrong type";
            case StyleErrc::invalid_color:  return "Invalid color string";
            case StyleErrc::out_of_range:   return "Style value out of range";
            default:                        return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::StyleErrcCategory& style_errc_category() noexcept {
    static detail::StyleErrcCategory category;
    return category;
}

inline std::error_code make_error_code(StyleErrc e) noexcept {
    return {static_cast<int>(e), style_errc_category()};
}

} // namespace dash::core

namespace std {

template<>
struct is_error_code_enum<dash::core::StyleErrc> : true_type {};

} // namespace std
