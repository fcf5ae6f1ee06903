#ifndef SYSMCPS_JSON_STORE_HPP
#define SYSMCPS_JSON_STORE_HPP

// Durable key/value store: one pretty-printed <key>.json file per key
// under a data directory.

#include <nlohmann/json.hpp>

#include <shared_mutex>
#include <string>
#include <vector>

namespace storage {

using json = nlohmann::json;

struct StoreResult {
    bool success = false;
    std::string error_detail;
};

struct StoreLoadResult {
    bool success = false;
    json data;
    std::string error_detail;
};

struct StoreKeysResult {
    bool success = false;
    std::vector<std::string> keys;
    std::string error_detail;
};

class JsonStore {
public:
    // Does not touch the filesystem; call open() before use.
    explicit JsonStore(std::string data_directory);

    // Create the data directory if needed.
    StoreResult open();

    StoreResult save(const std::string &key, const json &data);
    StoreLoadResult load(const std::string &key) const;

    // Succeeds when the key does not exist.
    StoreResult remove(const std::string &key);

    bool exists(const std::string &key) const;
    StoreKeysResult list_keys() const;

    const std::string &data_directory() const { return data_directory_; }

private:
    std::string path_for(const std::string &key) const;

    std::string data_directory_;
    mutable std::shared_mutex mutex_;
};

} // namespace storage

#endif // SYSMCPS_JSON_STORE_HPP
