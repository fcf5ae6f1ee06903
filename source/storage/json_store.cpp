#include "storage/json_store.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <system_error>
#include <utility>

namespace storage {

namespace fs = std::filesystem;

static const std::string FILE_EXTENSION = ".json";

JsonStore::JsonStore(std::string data_directory)
    : data_directory_(std::move(data_directory)) {}

std::string JsonStore::path_for(const std::string &key) const {
    return (fs::path(data_directory_) / (key + FILE_EXTENSION)).string();
}

StoreResult JsonStore::open() {
    StoreResult result;
    std::error_code error;
    fs::create_directories(data_directory_, error);
    if (error) {
        result.error_detail = "failed to create data directory " + data_directory_ + ": " + error.message();
        return result;
    }
    result.success = true;
    return result;
}

StoreResult JsonStore::save(const std::string &key, const json &data) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    StoreResult result;

    std::string serialized;
    try {
        serialized = data.dump(2);
    } catch (const json::type_error &error) {
        result.error_detail = "failed to serialize data: " + std::string(error.what());
        return result;
    }

    std::string file_path = path_for(key);
    std::ofstream file_stream(file_path, std::ios::out | std::ios::trunc);
    if (!file_stream.is_open()) {
        result.error_detail = "failed to open file for writing: " + file_path;
        return result;
    }
    file_stream << serialized;
    file_stream.flush();
    if (!file_stream) {
        result.error_detail = "failed to write file: " + file_path;
        return result;
    }

    result.success = true;
    return result;
}

StoreLoadResult JsonStore::load(const std::string &key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    StoreLoadResult result;

    std::string file_path = path_for(key);
    std::error_code error;
    if (!fs::exists(file_path, error)) {
        result.error_detail = "file does not exist: " + file_path;
        return result;
    }

    std::ifstream file_stream(file_path);
    if (!file_stream.is_open()) {
        result.error_detail = "failed to read file: " + file_path;
        return result;
    }

    try {
        result.data = json::parse(file_stream);
    } catch (const json::parse_error &parse_error) {
        result.error_detail = "failed to parse " + file_path + ": " + std::string(parse_error.what());
        return result;
    }

    result.success = true;
    return result;
}

StoreResult JsonStore::remove(const std::string &key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    StoreResult result;

    std::error_code error;
    fs::remove(path_for(key), error);
    if (error) {
        result.error_detail = "failed to delete file: " + error.message();
        return result;
    }
    result.success = true;
    return result;
}

bool JsonStore::exists(const std::string &key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::error_code error;
    return fs::exists(path_for(key), error);
}

StoreKeysResult JsonStore::list_keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    StoreKeysResult result;

    std::error_code error;
    fs::directory_iterator iterator(data_directory_, error);
    if (error) {
        result.error_detail = "failed to read directory: " + error.message();
        return result;
    }

    for (; iterator != fs::directory_iterator(); iterator.increment(error)) {
        std::error_code entry_error;
        if (!iterator->is_regular_file(entry_error)) {
            continue;
        }
        const fs::path &entry_path = iterator->path();
        if (entry_path.extension() == FILE_EXTENSION) {
            result.keys.push_back(entry_path.stem().string());
        }
    }
    if (error) {
        result.error_detail = "failed to read directory: " + error.message();
        return result;
    }

    result.success = true;
    return result;
}

} // namespace storage
