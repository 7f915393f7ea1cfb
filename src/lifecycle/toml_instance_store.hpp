/**
 * @file toml_instance_store.hpp
 * @brief File-backed instance store using toml++.
 *
 * The whole record set is held in memory and rewritten on every save via
 * a temporary file renamed over the target, so a crash mid-write leaves the
 * previous file intact. Timestamps are stored as Unix epoch milliseconds.
 */

#pragma once

#include "lifecycle/instance_store.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>

namespace fleet_orchestrator {

class TomlInstanceStore : public IInstanceStore {
    struct OpenTag {
        explicit OpenTag() = default;
    };

public:
    /**
     * @brief Open (or create) the store at path.
     *
     * A missing file yields an empty store; an unreadable or malformed one
     * yields PersistenceFailure.
     */
    [[nodiscard]] static Result<std::unique_ptr<TomlInstanceStore>> open(
        const std::filesystem::path& path);

    Result<void> save(const Instance& instance) override;
    [[nodiscard]] Result<Instance> load(const InstanceId& id) const override;
    [[nodiscard]] Result<std::vector<Instance>> list_all() const override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// Reachable only through open(); the tag cannot be named outside the class.
    TomlInstanceStore(OpenTag, std::filesystem::path path);

private:

    Result<void> read_file();
    Result<void> write_file(const std::map<InstanceId, Instance>& records) const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::map<InstanceId, Instance> records_;
};

}  // namespace fleet_orchestrator
