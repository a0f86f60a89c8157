#include "audit/file_sink.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace piishield {

namespace fs = std::filesystem;

namespace {

std::string generation_path(const std::string& base, int n) {
    return std::format("{}.{}", base, n);
}

} // anonymous namespace

FileSink::FileSink(const Config& config)
    : config_(config) {
    if (!open_active(std::ios::app)) {
        throw std::runtime_error("Failed to open audit file: " + config_.output_file);
    }

    std::error_code ec;
    const auto existing = fs::file_size(config_.output_file, ec);
    current_file_size_ = ec ? 0 : static_cast<size_t>(existing);
}

FileSink::~FileSink() {
    shutdown();
}

bool FileSink::open_active(std::ios::openmode mode) {
    out_.open(config_.output_file, mode);
    if (!out_.is_open()) {
        return false;
    }
    if (config_.owner_only) {
        std::error_code ec;
        fs::permissions(config_.output_file,
                        fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        if (ec) {
            utils::log::warn(std::format("Audit file {}: cannot restrict permissions: {}",
                                         config_.output_file, ec.message()));
        }
    }
    return true;
}

bool FileSink::write(std::string_view json_line) {
    const bool terminated = !json_line.empty() && json_line.back() == '\n';
    const size_t line_size = json_line.size() + (terminated ? 0 : 1);

    if (current_file_size_ > 0 && current_file_size_ + line_size > config_.max_file_size_bytes) {
        retire_active();
    }
    if (!out_.is_open()) {
        return false;
    }

    out_.write(json_line.data(), static_cast<std::streamsize>(json_line.size()));
    if (!terminated) {
        out_.put('\n');
    }
    if (!out_.good()) {
        return false;
    }

    current_file_size_ += line_size;
    ++lines_written_;
    return true;
}

void FileSink::flush() {
    if (out_.is_open()) {
        out_.flush();
    }
}

void FileSink::shutdown() {
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

// ============================================================================
// Rotation
// ============================================================================

void FileSink::retire_active() {
    out_.flush();
    out_.close();

    std::error_code ec;
    const auto& base = config_.output_file;

    if (config_.max_files <= 0) {
        fs::remove(base, ec);
    } else {
        fs::remove(generation_path(base, config_.max_files), ec);
        for (int n = config_.max_files - 1; n >= 1; --n) {
            const auto from = generation_path(base, n);
            if (!fs::exists(from, ec)) continue;
            fs::rename(from, generation_path(base, n + 1), ec);
            if (ec) {
                utils::log::warn(std::format("Audit rotation: cannot shift {}: {}",
                                             from, ec.message()));
            }
        }
        fs::rename(base, generation_path(base, 1), ec);
    }
    if (ec) {
        utils::log::warn(std::format("Audit rotation: cannot retire {}: {}", base, ec.message()));
    }

    if (!open_active(std::ios::trunc)) {
        utils::log::error(std::format("Audit rotation: cannot reopen {}", base));
    }
    current_file_size_ = 0;
    ++rotation_count_;
}

} // namespace piishield
