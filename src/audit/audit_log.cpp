#include "audit/audit_log.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <format>
#include <stdexcept>

namespace piishield {

AuditLog::AuditLog(const Config& config)
    : config_(config) {}

AuditLog::~AuditLog() {
    shutdown();
}

void AuditLog::add_sink(std::shared_ptr<IAuditSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(mutex_);
    utils::log::info(std::format("Audit sink attached: {}", sink->name()));
    sinks_.push_back(std::move(sink));
}

AuditEvent AuditLog::record(AuditEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);

    event.sequence_num = next_sequence_++;
    event.previous_hash = previous_hash_;
    event.record_hash = compute_record_hash(event, previous_hash_);
    previous_hash_ = event.record_hash;

    history_.push_back(event);
    while (history_.size() > config_.max_history) {
        history_.pop_front();
    }
    total_recorded_.fetch_add(1, std::memory_order_relaxed);

    if (config_.sinks_enabled && !sinks_.empty()) {
        const std::string line = to_json(event);
        for (const auto& sink : sinks_) {
            bool written = false;
            try {
                written = sink->write(line);
            } catch (const std::exception& e) {
                utils::log::error(std::format("Audit sink {} threw: {}", sink->name(), e.what()));
            }
            if (!written) {
                sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
                utils::log::warn(std::format("Audit sink {} failed to write event #{}",
                                             sink->name(), event.sequence_num));
            }
        }
    }

    return event;
}

std::vector<AuditEvent> AuditLog::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {history_.begin(), history_.end()};
}

std::vector<AuditEvent> AuditLog::events_for_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditEvent> out;
    for (const auto& e : history_) {
        if (e.session_id == session_id) {
            out.push_back(e);
        }
    }
    return out;
}

void AuditLog::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

void AuditLog::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->shutdown();
    }
    sinks_.clear();
}

// ============================================================================
// Integrity
// ============================================================================

AuditLog::ChainVerification AuditLog::verify_chain(const std::vector<AuditEvent>& events) {
    ChainVerification result;

    for (size_t i = 0; i < events.size(); ++i) {
        const auto& e = events[i];

        if (i > 0) {
            const auto& prev = events[i - 1];
            if (e.sequence_num != prev.sequence_num + 1) {
                result.valid = false;
                result.first_broken_sequence = e.sequence_num;
                result.message = std::format("Sequence gap: #{} follows #{}",
                                             e.sequence_num, prev.sequence_num);
                return result;
            }
            if (e.previous_hash != prev.record_hash) {
                result.valid = false;
                result.first_broken_sequence = e.sequence_num;
                result.message = std::format("Event #{} does not link to #{}",
                                             e.sequence_num, prev.sequence_num);
                return result;
            }
        }

        if (compute_record_hash(e, e.previous_hash) != e.record_hash) {
            result.valid = false;
            result.first_broken_sequence = e.sequence_num;
            result.message = std::format("Event #{} hash mismatch", e.sequence_num);
            return result;
        }
    }

    return result;
}

std::string AuditLog::compute_record_hash(const AuditEvent& event, const std::string& prev_hash) {
    std::string input;
    input.reserve(192);
    input += std::format("{}", event.sequence_num);
    input += '|';
    input += utils::format_timestamp(event.timestamp);
    input += '|';
    input += event.session_id;
    input += '|';
    input += audit_event_kind_to_string(event.kind);
    input += '|';
    input += event.entity_kind ? entity_kind_to_string(*event.entity_kind) : std::string_view("-");
    input += '|';
    input += audit_outcome_to_string(event.outcome);
    input += '|';
    input += prev_hash;

    // SHA-256 via OpenSSL EVP
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(ctx, input.data(), input.size()) == 1 &&
                    EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) return "";

    return utils::bytes_to_hex(hash, hash_len);
}

std::string AuditLog::to_json(const AuditEvent& event) {
    std::string out;
    out.reserve(320);
    out += std::format("{{\"sequence_num\":{},\"timestamp\":\"{}\",\"session_id\":\"{}\",",
                       event.sequence_num,
                       utils::format_timestamp(event.timestamp),
                       utils::escape_json(event.session_id));
    out += std::format("\"event\":\"{}\",", audit_event_kind_to_string(event.kind));
    if (event.entity_kind) {
        out += std::format("\"entity_kind\":\"{}\",", entity_kind_to_string(*event.entity_kind));
    } else {
        out += "\"entity_kind\":null,";
    }
    out += std::format("\"outcome\":\"{}\",", audit_outcome_to_string(event.outcome));
    out += std::format("\"previous_hash\":\"{}\",\"record_hash\":\"{}\"}}\n",
                       event.previous_hash, event.record_hash);
    return out;
}

} // namespace piishield
