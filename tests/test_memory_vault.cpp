#include <catch2/catch_test_macros.hpp>
#include "vault/memory_vault.hpp"

#include <chrono>
#include <memory>
#include <set>
#include <thread>
#include <vector>

using namespace piishield;
using namespace std::chrono_literals;

namespace {

struct VaultFixture {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<AuditLog> audit = std::make_shared<AuditLog>();
    MemoryVault vault{MemoryVault::Config{}, clock, audit};

    EntityMapping mapping(const std::string& placeholder, const std::string& original,
                          EntityKind kind = EntityKind::EMAIL,
                          std::optional<std::chrono::seconds> ttl = std::nullopt) const {
        EntityMapping m;
        m.kind = kind;
        m.original_value = original;
        m.placeholder = placeholder;
        m.confidence = 0.95;
        m.created_at = clock->now();
        if (ttl) m.expires_at = clock->now() + *ttl;
        return m;
    }

    size_t count_events(AuditEventKind kind, AuditOutcome outcome) const {
        size_t n = 0;
        for (const auto& e : audit->events()) {
            if (e.kind == kind && e.outcome == outcome) ++n;
        }
        return n;
    }
};

} // anonymous namespace

// ============================================================================
// Sessions
// ============================================================================

TEST_CASE("MemoryVault: create_session issues unique ids", "[vault]") {
    VaultFixture f;

    auto a = f.vault.create_session(3600s);
    auto b = f.vault.create_session(std::nullopt);
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    CHECK(a.value() != b.value());
    CHECK(a.value().starts_with("sess_"));
    CHECK(a.value().size() == 17);
    CHECK(f.vault.session_count() == 2);
    CHECK(f.count_events(AuditEventKind::CREATED, AuditOutcome::SUCCESS) == 2);
}

TEST_CASE("MemoryVault: negative TTL rejected", "[vault]") {
    VaultFixture f;
    auto r = f.vault.create_session(std::chrono::seconds{-1});
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::VAULT_ERROR);
}

TEST_CASE("MemoryVault: session cap enforced", "[vault]") {
    MemoryVault::Config config;
    config.max_sessions = 2;
    MemoryVault vault(config, std::make_shared<ManualClock>());

    REQUIRE(vault.create_session(60s).is_ok());
    REQUIRE(vault.create_session(60s).is_ok());
    auto third = vault.create_session(60s);
    REQUIRE(third.is_error());
    CHECK(third.error_category() == ErrorCategory::VAULT_ERROR);
}

TEST_CASE("MemoryVault: delete_session is idempotent", "[vault]") {
    VaultFixture f;
    const auto id = f.vault.create_session(60s).value();

    CHECK(f.vault.delete_session(id).is_ok());
    CHECK(f.vault.delete_session(id).is_ok());
    CHECK(f.vault.session_count() == 0);

    CHECK(f.count_events(AuditEventKind::DELETED, AuditOutcome::SUCCESS) == 1);
    CHECK(f.count_events(AuditEventKind::DELETED, AuditOutcome::NOT_FOUND) == 1);

    auto r = f.vault.get_mapping(id, "[EMAIL_1]");
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::SESSION_NOT_FOUND);
}

// ============================================================================
// Mappings
// ============================================================================

TEST_CASE("MemoryVault: put then get returns the original", "[vault]") {
    VaultFixture f;
    const auto id = f.vault.create_session(60s).value();

    REQUIRE(f.vault.put_mapping(id, f.mapping("[EMAIL_1]", "john@example.com")).is_ok());

    auto r = f.vault.get_mapping(id, "[EMAIL_1]");
    REQUIRE(r.is_ok());
    CHECK(r.value().original_value == "john@example.com");
    CHECK(r.value().kind == EntityKind::EMAIL);

    const auto accessed = f.audit->events().back();
    CHECK(accessed.kind == AuditEventKind::ACCESSED);
    CHECK(accessed.outcome == AuditOutcome::SUCCESS);
    REQUIRE(accessed.entity_kind.has_value());
    CHECK(*accessed.entity_kind == EntityKind::EMAIL);
}

TEST_CASE("MemoryVault: unknown placeholder is NOT_FOUND", "[vault]") {
    VaultFixture f;
    const auto id = f.vault.create_session(60s).value();

    auto r = f.vault.get_mapping(id, "[EMAIL_9]");
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::NOT_FOUND);
    CHECK(f.count_events(AuditEventKind::ACCESSED, AuditOutcome::NOT_FOUND) == 1);
}

TEST_CASE("MemoryVault: unknown session", "[vault]") {
    VaultFixture f;

    auto put = f.vault.put_mapping("sess_missing", f.mapping("[EMAIL_1]", "a@b.io"));
    REQUIRE(put.is_error());
    CHECK(put.error_category() == ErrorCategory::SESSION_NOT_FOUND);

    auto get = f.vault.get_mapping("sess_missing", "[EMAIL_1]");
    REQUIRE(get.is_error());
    CHECK(get.error_category() == ErrorCategory::SESSION_NOT_FOUND);

    CHECK(f.vault.touch_session("sess_missing").error_category() ==
          ErrorCategory::SESSION_NOT_FOUND);
}

TEST_CASE("MemoryVault: placeholder collision with a different value rejected", "[vault]") {
    VaultFixture f;
    const auto id = f.vault.create_session(60s).value();

    REQUIRE(f.vault.put_mapping(id, f.mapping("[EMAIL_1]", "a@b.io")).is_ok());
    CHECK(f.vault.put_mapping(id, f.mapping("[EMAIL_1]", "a@b.io")).is_ok());

    auto clash = f.vault.put_mapping(id, f.mapping("[EMAIL_1]", "c@d.io"));
    REQUIRE(clash.is_error());
    CHECK(clash.error_category() == ErrorCategory::VAULT_ERROR);

    CHECK(f.vault.get_mapping(id, "[EMAIL_1]").value().original_value == "a@b.io");
}

TEST_CASE("MemoryVault: empty placeholder rejected", "[vault]") {
    VaultFixture f;
    const auto id = f.vault.create_session(60s).value();
    auto r = f.vault.put_mapping(id, f.mapping("", "a@b.io"));
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::VAULT_ERROR);
}

TEST_CASE("MemoryVault: sessions are isolated", "[vault]") {
    VaultFixture f;
    const auto a = f.vault.create_session(60s).value();
    const auto b = f.vault.create_session(60s).value();

    REQUIRE(f.vault.put_mapping(a, f.mapping("[EMAIL_1]", "a@b.io")).is_ok());

    auto r = f.vault.get_mapping(b, "[EMAIL_1]");
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::NOT_FOUND);
}

// ============================================================================
// Batches
// ============================================================================

TEST_CASE("MemoryVault: put_mappings stores all or nothing", "[vault][batch]") {
    VaultFixture f;
    const auto id = f.vault.create_session(60s).value();
    REQUIRE(f.vault.put_mapping(id, f.mapping("[EMAIL_1]", "a@b.io")).is_ok());

    SECTION("collision with a stored mapping") {
        auto r = f.vault.put_mappings(id, {f.mapping("[EMAIL_2]", "c@d.io"),
                                           f.mapping("[EMAIL_1]", "x@y.io")}, f.clock->now());
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::VAULT_ERROR);
        CHECK(f.vault.get_mapping(id, "[EMAIL_2]").error_category() == ErrorCategory::NOT_FOUND);
    }

    SECTION("collision inside the batch") {
        auto r = f.vault.put_mappings(id, {f.mapping("[EMAIL_3]", "c@d.io"),
                                           f.mapping("[EMAIL_3]", "e@f.io")}, f.clock->now());
        REQUIRE(r.is_error());
        CHECK(f.vault.get_mapping(id, "[EMAIL_3]").error_category() == ErrorCategory::NOT_FOUND);
    }

    SECTION("repeated value in the batch") {
        auto r = f.vault.put_mappings(id, {f.mapping("[EMAIL_1]", "a@b.io"),
                                           f.mapping("[EMAIL_2]", "c@d.io"),
                                           f.mapping("[EMAIL_2]", "c@d.io")}, f.clock->now());
        REQUIRE(r.is_ok());
        CHECK(f.vault.get_session(id).value().mappings.size() == 2);
    }
}

TEST_CASE("MemoryVault: put_mappings judges liveness at as_of", "[vault][batch][expiry]") {
    VaultFixture f;
    const auto began = f.clock->now();
    const auto id = f.vault.create_session(0s).value();
    f.clock->advance(1ms);

    SECTION("a zero-TTL session accepts the batch of the call that created it") {
        REQUIRE(f.vault.put_mappings(id, {f.mapping("[SSN_1]", "123-45-6789", EntityKind::SSN, 0s)},
                                     began).is_ok());
        CHECK(f.vault.session_count() == 1);
    }

    SECTION("judged at the current time the same session is gone") {
        auto r = f.vault.put_mappings(id, {f.mapping("[SSN_1]", "123-45-6789", EntityKind::SSN)},
                                      f.clock->now());
        REQUIRE(r.is_error());
        CHECK(r.error_category() == ErrorCategory::SESSION_NOT_FOUND);
    }
}

TEST_CASE("MemoryVault: an old as_of never revives an idle session", "[vault][batch][expiry]") {
    VaultFixture f;
    const auto began = f.clock->now();
    const auto id = f.vault.create_session(60s).value();

    f.clock->advance(120s);
    REQUIRE(f.vault.put_mappings(id, {f.mapping("[EMAIL_1]", "a@b.io")}, began).is_ok());

    CHECK(f.vault.touch_session(id).error_category() == ErrorCategory::SESSION_NOT_FOUND);
    CHECK(f.vault.get_mapping(id, "[EMAIL_1]").error_category() ==
          ErrorCategory::SESSION_NOT_FOUND);
    CHECK(f.vault.sweep_expired() == 1);
}

// ============================================================================
// Ownership
// ============================================================================

TEST_CASE("MemoryVault: owned sessions answer only their owner", "[vault][owner]") {
    VaultFixture f;
    const auto id = f.vault.create_session(60s, std::string("alice")).value();
    REQUIRE(f.vault.put_mapping(id, f.mapping("[EMAIL_1]", "a@b.io")).is_ok());

    SECTION("owner reads") {
        auto r = f.vault.get_mapping(id, "[EMAIL_1]", std::string("alice"));
        REQUIRE(r.is_ok());
        CHECK(r.value().original_value == "a@b.io");
        CHECK(f.vault.touch_session(id, std::string("alice")).is_ok());
    }

    SECTION("other or missing owner is denied and audited") {
        auto other = f.vault.get_mapping(id, "[EMAIL_1]", std::string("mallory"));
        REQUIRE(other.is_error());
        CHECK(other.error_category() == ErrorCategory::ACCESS_DENIED);

        const auto denied = f.audit->events().back();
        CHECK(denied.kind == AuditEventKind::ACCESSED);
        CHECK(denied.outcome == AuditOutcome::DENIED);
        CHECK_FALSE(denied.entity_kind.has_value());

        CHECK(f.vault.get_mapping(id, "[EMAIL_1]").error_category() == ErrorCategory::ACCESS_DENIED);
        CHECK(f.vault.touch_session(id).error_category() == ErrorCategory::ACCESS_DENIED);
        CHECK(f.count_events(AuditEventKind::ACCESSED, AuditOutcome::DENIED) == 2);
    }

    SECTION("only the owner deletes") {
        auto denied = f.vault.delete_session(id, std::string("mallory"));
        REQUIRE(denied.is_error());
        CHECK(denied.error_category() == ErrorCategory::ACCESS_DENIED);
        CHECK(f.vault.session_count() == 1);
        CHECK(f.count_events(AuditEventKind::DELETED, AuditOutcome::DENIED) == 1);

        CHECK(f.vault.delete_session(id, std::string("alice")).is_ok());
        CHECK(f.vault.session_count() == 0);
    }

    SECTION("snapshot carries the owner") {
        auto snap = f.vault.get_session(id);
        REQUIRE(snap.is_ok());
        REQUIRE(snap.value().owner.has_value());
        CHECK(*snap.value().owner == "alice");
    }
}

TEST_CASE("MemoryVault: unowned sessions accept any caller", "[vault][owner]") {
    VaultFixture f;
    const auto id = f.vault.create_session(60s).value();
    REQUIRE(f.vault.put_mapping(id, f.mapping("[EMAIL_1]", "a@b.io")).is_ok());

    CHECK(f.vault.get_mapping(id, "[EMAIL_1]", std::string("anyone")).is_ok());
    CHECK(f.vault.get_mapping(id, "[EMAIL_1]").is_ok());
    CHECK_FALSE(f.vault.get_session(id).value().owner.has_value());
}

// ============================================================================
// Expiry
// ============================================================================

TEST_CASE("MemoryVault: zero-TTL mapping is never retrievable", "[vault][expiry]") {
    VaultFixture f;
    const auto id = f.vault.create_session(0s).value();

    REQUIRE(f.vault.put_mapping(id, f.mapping("[SSN_1]", "123-45-6789", EntityKind::SSN, 0s)).is_ok());

    auto r = f.vault.get_mapping(id, "[SSN_1]");
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::MAPPING_EXPIRED);

    const auto denied = f.audit->events().back();
    CHECK(denied.kind == AuditEventKind::ACCESSED);
    CHECK(denied.outcome == AuditOutcome::DENIED);
    REQUIRE(denied.entity_kind.has_value());
    CHECK(*denied.entity_kind == EntityKind::SSN);
}

TEST_CASE("MemoryVault: sweep evicts expired mappings with one event each", "[vault][expiry]") {
    VaultFixture f;
    const auto id = f.vault.create_session(std::nullopt).value();

    REQUIRE(f.vault.put_mapping(id, f.mapping("[EMAIL_1]", "a@b.io", EntityKind::EMAIL, 10s)).is_ok());
    REQUIRE(f.vault.put_mapping(id, f.mapping("[EMAIL_2]", "c@d.io", EntityKind::EMAIL, 100s)).is_ok());

    f.clock->advance(10s);
    CHECK(f.vault.sweep_expired() == 1);
    CHECK(f.count_events(AuditEventKind::EXPIRED, AuditOutcome::SUCCESS) == 1);

    CHECK(f.vault.get_mapping(id, "[EMAIL_1]").error_category() == ErrorCategory::NOT_FOUND);
    CHECK(f.vault.get_mapping(id, "[EMAIL_2]").is_ok());

    // Nothing left to evict
    CHECK(f.vault.sweep_expired() == 0);
}

TEST_CASE("MemoryVault: idle sessions expire and are swept", "[vault][expiry]") {
    VaultFixture f;
    const auto id = f.vault.create_session(60s).value();
    REQUIRE(f.vault.put_mapping(id, f.mapping("[EMAIL_1]", "a@b.io")).is_ok());

    SECTION("activity keeps the session alive") {
        f.clock->advance(50s);
        REQUIRE(f.vault.get_mapping(id, "[EMAIL_1]").is_ok());
        f.clock->advance(50s);
        CHECK(f.vault.touch_session(id).is_ok());
        f.clock->advance(50s);
        CHECK(f.vault.get_mapping(id, "[EMAIL_1]").is_ok());
    }

    SECTION("inactivity past the TTL expires it") {
        f.clock->advance(61s);
        CHECK(f.vault.get_mapping(id, "[EMAIL_1]").error_category() ==
              ErrorCategory::SESSION_NOT_FOUND);
        CHECK(f.vault.list_sessions().empty());
        CHECK(f.vault.session_count() == 1);

        CHECK(f.vault.sweep_expired() == 1);
        CHECK(f.vault.session_count() == 0);

        const auto expired = f.audit->events().back();
        CHECK(expired.kind == AuditEventKind::EXPIRED);
        CHECK(expired.session_id == id);
        CHECK_FALSE(expired.entity_kind.has_value());
    }
}

TEST_CASE("MemoryVault: sessions without TTL never expire", "[vault][expiry]") {
    VaultFixture f;
    const auto id = f.vault.create_session(std::nullopt).value();
    REQUIRE(f.vault.put_mapping(id, f.mapping("[EMAIL_1]", "a@b.io")).is_ok());

    f.clock->advance(24h * 365);
    CHECK(f.vault.sweep_expired() == 0);
    CHECK(f.vault.get_mapping(id, "[EMAIL_1]").is_ok());
}

TEST_CASE("MemoryVault: expired mapping slot can be reused", "[vault][expiry]") {
    VaultFixture f;
    const auto id = f.vault.create_session(std::nullopt).value();
    REQUIRE(f.vault.put_mapping(id, f.mapping("[EMAIL_1]", "old@b.io", EntityKind::EMAIL, 5s)).is_ok());

    f.clock->advance(5s);
    REQUIRE(f.vault.put_mapping(id, f.mapping("[EMAIL_1]", "new@b.io")).is_ok());
    CHECK(f.vault.get_mapping(id, "[EMAIL_1]").value().original_value == "new@b.io");
}

// ============================================================================
// Inspection / integrity / concurrency
// ============================================================================

TEST_CASE("MemoryVault: get_session snapshot", "[vault]") {
    VaultFixture f;
    const auto id = f.vault.create_session(120s).value();
    REQUIRE(f.vault.put_mapping(id, f.mapping("[EMAIL_1]", "a@b.io")).is_ok());
    REQUIRE(f.vault.put_mapping(id, f.mapping("[PHONE_1]", "555-123-4567", EntityKind::PHONE)).is_ok());

    auto snap = f.vault.get_session(id);
    REQUIRE(snap.is_ok());
    CHECK(snap.value().session_id == id);
    CHECK(snap.value().mappings.size() == 2);
    REQUIRE(snap.value().ttl.has_value());
    CHECK(*snap.value().ttl == 120s);

    auto missing = f.vault.get_session("sess_none");
    CHECK(missing.error_category() == ErrorCategory::SESSION_NOT_FOUND);
}

TEST_CASE("MemoryVault: audit trail verifies and never carries values", "[vault][audit]") {
    VaultFixture f;
    const auto id = f.vault.create_session(60s).value();
    REQUIRE(f.vault.put_mapping(id, f.mapping("[EMAIL_1]", "secret@b.io")).is_ok());
    (void)f.vault.get_mapping(id, "[EMAIL_1]");
    (void)f.vault.get_mapping(id, "[EMAIL_2]");
    (void)f.vault.delete_session(id);

    const auto events = f.audit->events();
    CHECK(events.size() == 4);
    CHECK(AuditLog::verify_chain(events).valid);

    for (const auto& e : events) {
        const auto line = AuditLog::to_json(e);
        CHECK(line.find("secret@b.io") == std::string::npos);
        CHECK(line.find("[EMAIL_1]") == std::string::npos);
    }
}

TEST_CASE("MemoryVault: concurrent sessions and lookups", "[vault][concurrency]") {
    auto vault = std::make_shared<MemoryVault>();

    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;
    std::vector<std::vector<std::string>> ids(kThreads);
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&vault, &ids, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                auto id = vault->create_session(60s);
                if (!id.is_ok()) continue;
                EntityMapping m;
                m.kind = EntityKind::EMAIL;
                m.placeholder = "[EMAIL_1]";
                m.original_value = "user" + std::to_string(t) + "_" + std::to_string(i);
                m.created_at = std::chrono::system_clock::now();
                if (vault->put_mapping(id.value(), m).is_ok() &&
                    vault->get_mapping(id.value(), "[EMAIL_1]").is_ok()) {
                    ids[t].push_back(id.value());
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    std::set<std::string> unique;
    for (const auto& batch : ids) unique.insert(batch.begin(), batch.end());
    CHECK(unique.size() == static_cast<size_t>(kThreads * kPerThread));
    CHECK(vault->session_count() == static_cast<size_t>(kThreads * kPerThread));
}
