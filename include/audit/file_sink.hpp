#pragma once

#include "audit/audit_sink.hpp"
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

namespace piishield {

/**
 * @brief Append-only JSONL audit file, rotated by size
 *
 * A line that would push the active file past max_file_size_bytes first
 * retires it to <file>.1, shifting older generations up to <file>.<max_files>;
 * the generation past that is deleted. max_files = 0 keeps no history.
 *
 * Audit lines name sessions, so every file the sink creates is made
 * owner read/write only when owner_only is set.
 */
class FileSink : public IAuditSink {
public:
    struct Config {
        std::string output_file = "audit.jsonl";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;
        int max_files = 10;
        bool owner_only = true;
    };

    /// @throws std::runtime_error if the file cannot be opened
    explicit FileSink(const Config& config);
    ~FileSink() override;

    [[nodiscard]] bool write(std::string_view json_line) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const { return rotation_count_; }
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }
    [[nodiscard]] uint64_t lines_written() const { return lines_written_; }

private:
    [[nodiscard]] bool open_active(std::ios::openmode mode);
    void retire_active();

    Config config_;
    std::ofstream out_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
    uint64_t lines_written_ = 0;
};

} // namespace piishield
