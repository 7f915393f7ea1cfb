/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/json_sink.hpp"

#include <iostream>
#include <system_error>

namespace fleet_orchestrator {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                           const std::string& prefix,
                           uint32_t max_file_size_mb,
                           uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    open_active();
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

std::filesystem::path JsonFileSink::active_path() const {
    return log_dir_ / (prefix_ + ".ndjson");
}

std::filesystem::path JsonFileSink::generation_path(uint32_t generation) const {
    return log_dir_ / (prefix_ + "." + std::to_string(generation) + ".ndjson");
}

void JsonFileSink::open_active() {
    auto path = active_path();
    std::error_code ec;
    auto existing = std::filesystem::file_size(path, ec);
    current_size_ = ec ? 0 : existing;
    current_file_.open(path, std::ios::app);
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed();
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::rotate_if_needed() {
    if (current_size_ < max_file_size_bytes_) return;

    current_file_.flush();
    current_file_.close();

    // Rename failures are ignored; the active file is always reopened.
    std::error_code ec;
    if (max_files_ == 0) {
        std::filesystem::remove(active_path(), ec);
    } else {
        std::filesystem::remove(generation_path(max_files_), ec);
        for (uint32_t gen = max_files_; gen > 1; --gen) {
            auto from = generation_path(gen - 1);
            if (std::filesystem::exists(from, ec)) {
                std::filesystem::rename(from, generation_path(gen), ec);
            }
        }
        std::filesystem::rename(active_path(), generation_path(1), ec);
    }

    open_active();
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

}  // namespace fleet_orchestrator
