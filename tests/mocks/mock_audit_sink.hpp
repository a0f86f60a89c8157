#pragma once

#include "audit/audit_sink.hpp"
#include <string>
#include <vector>

namespace piishield::testing {

/**
 * @brief In-memory audit sink recording every line it is given
 */
class MockAuditSink : public IAuditSink {
public:
    explicit MockAuditSink(bool should_succeed = true)
        : should_succeed_(should_succeed) {}

    [[nodiscard]] bool write(std::string_view json_line) override {
        lines.emplace_back(json_line);
        return should_succeed_;
    }

    void flush() override { ++flush_count; }
    void shutdown() override { shut_down = true; }
    [[nodiscard]] std::string name() const override { return "mock"; }

    std::vector<std::string> lines;
    int flush_count = 0;
    bool shut_down = false;

private:
    bool should_succeed_;
};

} // namespace piishield::testing
