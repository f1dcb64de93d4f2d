#include "drone_relay/remote_id.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace drone_relay {

namespace {

constexpr std::array<std::string_view, 16> k_ua_type_names{{
    "No UA type defined",
    "Aeroplane/Airplane (Fixed wing)",
    "Helicopter or Multirotor",
    "Gyroplane",
    "VTOL (Vertical Take-Off and Landing)",
    "Ornithopter",
    "Glider",
    "Kite",
    "Free Balloon",
    "Captive Balloon",
    "Airship (Blimp)",
    "Free Fall/Parachute",
    "Rocket",
    "Tethered powered aircraft",
    "Ground Obstacle",
    "Other type",
}}; /**< Indexed by Remote ID UA type code. */

constexpr std::string_view k_cot_fixed_wing{"a-f-A-f"};
constexpr std::string_view k_cot_rotorcraft{"a-u-A-M-H-R"};
constexpr std::string_view k_cot_surface_marker{"b-m-p-s-m"};
constexpr std::string_view k_cot_generic_air_track{"a-u-A-M-H-R"};

bool equals_ignore_case(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size()
        && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
}

}  // namespace

std::optional<std::string_view> ua_type_name(int code) {
    if (code < 0 || static_cast<std::size_t>(code) >= k_ua_type_names.size()) {
        return std::nullopt;
    }
    return k_ua_type_names[static_cast<std::size_t>(code)];
}

std::optional<int> ua_type_code_from_name(std::string_view name) {
    for (std::size_t index = 0; index < k_ua_type_names.size(); ++index) {
        if (equals_ignore_case(k_ua_type_names[index], name)) {
            return static_cast<int>(index);
        }
    }
    return std::nullopt;
}

std::string_view cot_type_for_ua(std::optional<int> code) {
    if (!code.has_value()) {
        return k_cot_generic_air_track;
    }
    switch (*code) {
        case 1:
        case 5:
        case 6:
            return k_cot_fixed_wing;
        case 2:
        case 3:
        case 4:
            return k_cot_rotorcraft;
        default:
            break;
    }
    if (*code >= 7 && *code <= 15) {
        return k_cot_surface_marker;
    }
    return k_cot_generic_air_track;
}

}  // namespace drone_relay
