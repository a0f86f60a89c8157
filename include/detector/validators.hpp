#pragma once

#include <string_view>

namespace piishield::validators {

/**
 * @brief Luhn checksum for credit card numbers
 * Non-digit characters are ignored; 13-19 digits required.
 */
[[nodiscard]] bool luhn_validate(std::string_view number);

/**
 * @brief Structural SSN check: "AAA-GG-SSSS" (dash or space separated)
 * Rejects area 000, 666, 900-999, group 00 and serial 0000.
 */
[[nodiscard]] bool validate_ssn(std::string_view value);

/**
 * @brief Dotted-quad IPv4, each octet 0-255 written with 1-3 digits
 */
[[nodiscard]] bool validate_ipv4(std::string_view ip);

} // namespace piishield::validators
