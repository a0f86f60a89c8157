#include "placeholder/placeholder_generator.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <array>
#include <format>

namespace piishield {

PlaceholderGenerator::PlaceholderGenerator(std::string session_id, PlaceholderFormat format)
    : session_id_(std::move(session_id)), format_(format) {}

uint64_t PlaceholderGenerator::next_counter(EntityKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++counters_[kind];
}

void PlaceholderGenerator::reserve(EntityKind kind, uint64_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& current = counters_[kind];
    if (current < n) {
        current = n;
    }
}

uint64_t PlaceholderGenerator::counter(EntityKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(kind);
    return it == counters_.end() ? 0 : it->second;
}

Result<std::string> PlaceholderGenerator::generate(const EntityMatch& match) {
    const auto prefix = entity_kind_to_prefix(match.kind);

    switch (format_) {
        case PlaceholderFormat::NUMBERED:
            return Result<std::string>::ok(
                std::format("[{}_{}]", prefix, next_counter(match.kind)));

        case PlaceholderFormat::UUID: {
            auto uuid = random_uuid();
            if (!uuid.is_ok()) return uuid;
            return Result<std::string>::ok(std::format("[{}_{}]", prefix, uuid.value()));
        }

        case PlaceholderFormat::HASHED: {
            auto digest = keyed_digest(match.text);
            if (!digest.is_ok()) return digest;
            return Result<std::string>::ok(std::format("[{}_{}]", prefix, digest.value()));
        }
    }

    return Result<std::string>::error(ErrorCategory::PLACEHOLDER_ERROR,
        "Unknown placeholder format");
}

Result<std::vector<std::string>> PlaceholderGenerator::generate_batch(
    const std::vector<EntityMatch>& matches) {

    std::vector<std::string> placeholders;
    placeholders.reserve(matches.size());

    for (const auto& match : matches) {
        auto placeholder = generate(match);
        if (!placeholder.is_ok()) {
            return Result<std::vector<std::string>>::propagate(placeholder);
        }
        placeholders.push_back(std::move(placeholder.value()));
    }

    return Result<std::vector<std::string>>::ok(std::move(placeholders));
}

// ============================================================================
// Token bodies
// ============================================================================

Result<std::string> PlaceholderGenerator::random_uuid() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return Result<std::string>::error(ErrorCategory::PLACEHOLDER_ERROR,
            "RAND_bytes failed while generating placeholder");
    }

    // RFC 4122 version 4, variant 10xx
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    const std::string hex = utils::bytes_to_hex(bytes.data(), bytes.size());
    return Result<std::string>::ok(std::format("{}-{}-{}-{}-{}",
        hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4),
        hex.substr(16, 4), hex.substr(20, 12)));
}

Result<std::string> PlaceholderGenerator::keyed_digest(std::string_view value) const {
    std::array<unsigned char, EVP_MAX_MD_SIZE> mac{};
    unsigned int mac_len = 0;

    if (!HMAC(EVP_sha256(),
              session_id_.data(), static_cast<int>(session_id_.size()),
              reinterpret_cast<const unsigned char*>(value.data()), value.size(),
              mac.data(), &mac_len) || mac_len < 8) {
        return Result<std::string>::error(ErrorCategory::PLACEHOLDER_ERROR,
            "HMAC-SHA256 failed while generating placeholder");
    }

    return Result<std::string>::ok(utils::bytes_to_hex(mac.data(), 8));
}

} // namespace piishield
