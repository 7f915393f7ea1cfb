/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with size-based rotation, plus stdout and
 *        null sinks.
 */

#pragma once

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace fleet_orchestrator {

/**
 * @brief Writes NDJSON to `<log_dir>/<prefix>.ndjson`.
 *
 * When the active file reaches max_file_size_mb it is renamed to
 * `<prefix>.1.ndjson`, older generations shift up by one, and anything past
 * max_files is deleted. Not internally synchronized: callers (Logger,
 * MetricsCollector) serialize writes.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path active_path() const;
    [[nodiscard]] std::filesystem::path generation_path(uint32_t generation) const;

    /// Byte-granular threshold, for tests that cannot write megabytes.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void open_active();
    void rotate_if_needed();

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout. Default sink for foreground runs.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace fleet_orchestrator
