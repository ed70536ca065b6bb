// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dash/core/spinner_style.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <sstream>

namespace dash::core {

namespace {

std::expected<void, std::error_code>
read_color(const nlohmann::json& j, const char* key, Argb& out) noexcept {
    auto it = j.find(key);
    if (it == j.end()) return {};
    if (!it->is_string()) {
        return std::unexpected(make_error_code(StyleErrc::type_mismatch));
    }

    auto color = parse_color(it->get_ref<const std::string&>());
    if (!color) {
        return std::unexpected(make_error_code(StyleErrc::invalid_color));
    }
    out = *color;
    return {};
}

// Angles may be any finite value; sizes must also be non-negative
std::expected<void, std::error_code>
read_number(const nlohmann::json& j, const char* key, float& out, bool non_negative) noexcept {
    auto it = j.find(key);
    if (it == j.end()) return {};
    if (!it->is_number()) {
        return std::unexpected(make_error_code(StyleErrc::type_mismatch));
    }

    auto value = it->get<double>();
    if (!std::isfinite(value) || (non_negative && value < 0.0)) {
        return std::unexpected(make_error_code(StyleErrc::out_of_range));
    }
    out = static_cast<float>(value);
    return {};
}

std::expected<void, std::error_code>
read_flag(const nlohmann::json& j, const char* key, bool& out) noexcept {
    auto it = j.find(key);
    if (it == j.end()) return {};
    if (!it->is_boolean()) {
        return std::unexpected(make_error_code(StyleErrc::type_mismatch));
    }
    out = it->get<bool>();
    return {};
}

} // namespace

Argb SpinnerStyle::inner_circle_color(DashMode mode) const noexcept {
    switch (mode) {
        case DashMode::failure: return inner_circle_failure_color;
        case DashMode::unknown: return inner_circle_unknown_color;
        default:                return inner_circle_success_color;
    }
}

std::expected<SpinnerStyle, std::error_code> SpinnerStyle::from_json(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::unexpected(make_error_code(StyleErrc::type_mismatch));
        }

        SpinnerStyle style;
        std::error_code ec;
        auto check = [&ec](std::expected<void, std::error_code> r) {
            if (!r && !ec) ec = r.error();
        };

        check(read_color(j, "outerRingColor", style.outer_ring_color));
        check(read_color(j, "arcColor", style.arc_color));
        check(read_color(j, "innerCircleSuccessColor", style.inner_circle_success_color));
        check(read_color(j, "innerCircleFailureColor", style.inner_circle_failure_color));
        check(read_color(j, "innerCircleUnknownColor", style.inner_circle_unknown_color));
        check(read_color(j, "textColorFrom", style.text_color_from));
        check(read_color(j, "textColorTo", style.text_color_to));

        check(read_number(j, "arcStartPosition", style.arc_start_position, false));
        check(read_number(j, "arcSweepSpeed", style.arc_sweep_speed, true));
        check(read_number(j, "arcWidth", style.arc_width, true));
        check(read_number(j, "outerRingWidth", style.ring_width, true));
        check(read_number(j, "maxProgressTextSize", style.max_text_size, true));
        check(read_number(j, "arcLength", style.arc_length, true));
        check(read_flag(j, "showProgressText", style.show_progress_text));

        if (ec) {
            return std::unexpected(ec);
        }
        if (style.max_text_size <= 0.0f) {
            return std::unexpected(make_error_code(StyleErrc::out_of_range));
        }
        return style;
    } catch (const nlohmann::json::exception&) {
        return std::unexpected(make_error_code(StyleErrc::parse_error));
    }
}

std::expected<SpinnerStyle, std::error_code> SpinnerStyle::load(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path);
        if (!file) {
            return std::unexpected(make_error_code(StyleErrc::file_not_found));
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_json(buffer.str());
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(StyleErrc::parse_error));
    }
}

std::string SpinnerStyle::to_json() const {
    nlohmann::json j;
    j["outerRingColor"] = format_color(outer_ring_color);
    j["arcColor"] = format_color(arc_color);
    j["innerCircleSuccessColor"] = format_color(inner_circle_success_color);
    j["innerCircleFailureColor"] = format_color(inner_circle_failure_color);
    j["innerCircleUnknownColor"] = format_color(inner_circle_unknown_color);
    j["textColorFrom"] = format_color(text_color_from);
    j["textColorTo"] = format_color(text_color_to);
    j["arcStartPosition"] = arc_start_position;
    j["arcSweepSpeed"] = arc_sweep_speed;
    j["arcWidth"] = arc_width;
    j["outerRingWidth"] = ring_width;
    j["maxProgressTextSize"] = max_text_size;
    j["showProgressText"] = show_progress_text;
    j["arcLength"] = arc_length;
    return j.dump(2);
}

} // namespace dash::core
