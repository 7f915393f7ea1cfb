/**
 * @file toml_instance_store.cpp
 * @brief TOML (de)serialization of instance records.
 */

#include "lifecycle/toml_instance_store.hpp"

#include <toml++/toml.hpp>

#include <chrono>
#include <fstream>
#include <system_error>

namespace fleet_orchestrator {

namespace {

int64_t to_epoch_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

Timestamp from_epoch_ms(int64_t ms) {
    return Timestamp{std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds{ms})};
}

toml::table encode(const Instance& instance) {
    toml::table tbl;
    tbl.insert_or_assign("id", instance.id);
    tbl.insert_or_assign("owner_id", instance.owner_id);
    tbl.insert_or_assign("name", instance.name);
    tbl.insert_or_assign("image", instance.image);
    tbl.insert_or_assign("node_id", instance.node_id);
    tbl.insert_or_assign("node_address", instance.node_address);
    tbl.insert_or_assign("cpu", static_cast<int64_t>(instance.cpu));
    tbl.insert_or_assign("memory_gb", static_cast<int64_t>(instance.memory_gb));
    tbl.insert_or_assign("port", static_cast<int64_t>(instance.port));
    tbl.insert_or_assign("status", std::string{to_string(instance.status)});
    tbl.insert_or_assign("deployment_handle", instance.deployment_handle);
    tbl.insert_or_assign("created_at_ms", to_epoch_ms(instance.created_at));
    if (instance.started_at) {
        tbl.insert_or_assign("started_at_ms", to_epoch_ms(*instance.started_at));
    }
    if (instance.stopped_at) {
        tbl.insert_or_assign("stopped_at_ms", to_epoch_ms(*instance.stopped_at));
    }
    tbl.insert_or_assign("port_held", instance.port_held);
    tbl.insert_or_assign("quota_held", instance.quota_held);
    return tbl;
}

Result<Instance> decode(const toml::table& tbl, size_t index) {
    Instance instance;
    instance.id = tbl["id"].value_or(std::string{});
    if (instance.id.empty()) {
        return Error{ErrorCode::PersistenceFailure,
                     "instances[" + std::to_string(index) + "]: missing id"};
    }

    auto status_text = tbl["status"].value_or(std::string{});
    auto status = parse_instance_status(status_text);
    if (!status) {
        return Error{ErrorCode::PersistenceFailure,
                     "instance " + instance.id + ": unknown status '" + status_text + "'"};
    }
    instance.status = *status;

    instance.owner_id = tbl["owner_id"].value_or(std::string{});
    instance.name = tbl["name"].value_or(std::string{});
    instance.image = tbl["image"].value_or(std::string{});
    instance.node_id = tbl["node_id"].value_or(std::string{});
    instance.node_address = tbl["node_address"].value_or(std::string{});
    instance.cpu = static_cast<uint32_t>(tbl["cpu"].value_or(int64_t{1}));
    instance.memory_gb = static_cast<uint32_t>(tbl["memory_gb"].value_or(int64_t{1}));
    instance.port = static_cast<uint16_t>(tbl["port"].value_or(int64_t{0}));
    instance.deployment_handle = tbl["deployment_handle"].value_or(std::string{});
    instance.created_at = from_epoch_ms(tbl["created_at_ms"].value_or(int64_t{0}));
    if (auto started = tbl["started_at_ms"].value<int64_t>()) {
        instance.started_at = from_epoch_ms(*started);
    }
    if (auto stopped = tbl["stopped_at_ms"].value<int64_t>()) {
        instance.stopped_at = from_epoch_ms(*stopped);
    }
    instance.port_held = tbl["port_held"].value_or(false);
    instance.quota_held = tbl["quota_held"].value_or(false);
    return instance;
}

}  // anonymous namespace

TomlInstanceStore::TomlInstanceStore(OpenTag, std::filesystem::path path)
    : path_(std::move(path)) {
}

Result<std::unique_ptr<TomlInstanceStore>> TomlInstanceStore::open(
    const std::filesystem::path& path) {
    auto store = std::make_unique<TomlInstanceStore>(OpenTag{}, path);
    if (auto loaded = store->read_file(); !loaded) {
        return loaded.error();
    }
    return Result<std::unique_ptr<TomlInstanceStore>>{std::move(store)};
}

Result<void> TomlInstanceStore::read_file() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        if (ec) {
            return Error{ErrorCode::PersistenceFailure,
                         "Cannot stat " + path_.string() + ": " + ec.message()};
        }
        return Result<void>{};
    }

    try {
        auto root = toml::parse_file(path_.string());
        auto* entries = root["instances"].as_array();
        if (entries == nullptr) return Result<void>{};

        size_t index = 0;
        for (const auto& element : *entries) {
            const auto* tbl = element.as_table();
            if (tbl == nullptr) {
                return Error{ErrorCode::PersistenceFailure,
                             path_.string() + ": instances must be an array of tables"};
            }
            auto instance = decode(*tbl, index++);
            if (!instance) return instance.error();
            auto id = instance->id;
            records_.insert_or_assign(std::move(id), std::move(*instance));
        }
        return Result<void>{};

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::PersistenceFailure,
                     "Corrupt instance store " + path_.string() + ": "
                     + std::string{err.description()}};
    }
}

Result<void> TomlInstanceStore::write_file(const std::map<InstanceId, Instance>& records) const {
    toml::array entries;
    for (const auto& [id, instance] : records) {
        entries.push_back(encode(instance));
    }
    toml::table root;
    root.insert_or_assign("instances", std::move(entries));

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::PersistenceFailure,
                         "Cannot create " + path_.parent_path().string() + ": " + ec.message()};
        }
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::PersistenceFailure, "Cannot open " + tmp.string() + " for writing"};
        }
        out << root << '\n';
        out.flush();
        if (!out) {
            return Error{ErrorCode::PersistenceFailure, "Write to " + tmp.string() + " failed"};
        }
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        return Error{ErrorCode::PersistenceFailure,
                     "Cannot replace " + path_.string() + ": " + ec.message()};
    }
    return Result<void>{};
}

Result<void> TomlInstanceStore::save(const Instance& instance) {
    if (instance.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Instance id is required"};
    }

    std::lock_guard lock(mutex_);
    auto next = records_;
    next.insert_or_assign(instance.id, instance);
    if (auto written = write_file(next); !written) {
        return written.error();
    }
    records_ = std::move(next);
    return Result<void>{};
}

Result<Instance> TomlInstanceStore::load(const InstanceId& id) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Error{ErrorCode::NotFound, "Instance not found: " + id};
    }
    return it->second;
}

Result<std::vector<Instance>> TomlInstanceStore::list_all() const {
    std::lock_guard lock(mutex_);
    std::vector<Instance> all;
    all.reserve(records_.size());
    for (const auto& [id, instance] : records_) {
        all.push_back(instance);
    }
    return all;
}

}  // namespace fleet_orchestrator
