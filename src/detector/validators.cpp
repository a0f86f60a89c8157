#include "detector/validators.hpp"
#include "core/utils.hpp"

#include <array>
#include <cctype>
#include <string>

namespace piishield::validators {

namespace {

bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // anonymous namespace

bool luhn_validate(std::string_view number) {
    // Extract digits only
    std::string digits;
    digits.reserve(number.size());
    for (char c : number) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }

    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (int i = static_cast<int>(digits.size()) - 1; i >= 0; --i) {
        int digit = digits[i] - '0';

        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }

        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

bool validate_ssn(std::string_view value) {
    std::array<std::string_view, 3> parts;
    size_t count = 0;
    size_t pos = 0;
    while (pos <= value.size()) {
        const size_t next = value.find_first_of("- ", pos);
        const size_t end = (next == std::string_view::npos) ? value.size() : next;
        if (count == parts.size()) return false;
        parts[count++] = value.substr(pos, end - pos);
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }

    if (count != 3) return false;
    if (parts[0].size() != 3 || parts[1].size() != 2 || parts[2].size() != 4) return false;
    if (!all_digits(parts[0]) || !all_digits(parts[1]) || !all_digits(parts[2])) return false;

    // Area number (first 3) cannot be 000, 666, or 900-999
    const int area = utils::parse_int<int>(parts[0]);
    if (area == 0 || area == 666 || area >= 900) {
        return false;
    }

    // Group number (middle 2) cannot be 00
    if (utils::parse_int<int>(parts[1]) == 0) {
        return false;
    }

    // Serial number (last 4) cannot be 0000
    if (utils::parse_int<int>(parts[2]) == 0) {
        return false;
    }

    return true;
}

bool validate_ipv4(std::string_view ip) {
    size_t octets = 0;
    size_t pos = 0;
    while (true) {
        const size_t dot = ip.find('.', pos);
        const std::string_view part = ip.substr(pos, dot == std::string_view::npos
                                                         ? std::string_view::npos
                                                         : dot - pos);
        if (part.size() > 3 || !all_digits(part)) return false;
        const auto val = utils::try_parse_int<int>(part);
        if (!val || *val > 255) return false;
        ++octets;
        if (dot == std::string_view::npos) break;
        pos = dot + 1;
    }
    return octets == 4;
}

} // namespace piishield::validators
