#include "cruxenclave/data_store.hpp"

#include <sodium.h>

#include <fstream>
#include <iterator>
#include <system_error>

#include "cruxenclave/errors.hpp"
#include "cruxenclave/logger.hpp"

namespace CruxEnclave {

// --- MemoryDataStore ---

void MemoryDataStore::put(const byte_vector& key, const byte_vector& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = value;
}

byte_vector MemoryDataStore::get(const byte_vector& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        throw NotFound("No value stored for key " + to_hex(key));
    }
    return it->second;
}

void MemoryDataStore::remove(const byte_vector& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(key) == 0) {
        throw NotFound("No value stored for key " + to_hex(key));
    }
}

bool MemoryDataStore::contains(const byte_vector& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key) != 0;
}

size_t MemoryDataStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}


// --- FileDataStore ---

FileDataStore::FileDataStore(std::filesystem::path base_path) : base_path_(std::move(base_path)) {
    std::error_code ec;
    std::filesystem::create_directories(base_path_, ec);
    if (ec) {
        throw RuntimeError("Unable to create store directory " + base_path_.string() + ": " + ec.message());
    }
    LOG_DEBUG << "File store opened, path=" << base_path_.string();
}

std::filesystem::path FileDataStore::path_for_key(const byte_vector& key) const {
    if (key.empty()) {
        throw InvalidArgument("Store keys must not be empty.");
    }
    std::string hex = to_hex(key);
    if (hex.size() <= 4) {
        return base_path_ / hex;
    }
    return base_path_ / hex.substr(0, 2) / hex.substr(2, 2) / hex.substr(4);
}

void FileDataStore::put(const byte_vector& key, const byte_vector& value) {
    std::filesystem::path target = path_for_key(key);

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw RuntimeError("Unable to create directory " + target.parent_path().string() + ": " + ec.message());
    }

    // Concurrent writers of one key each get their own temp file
    byte_vector suffix(8);
    randombytes_buf(suffix.data(), suffix.size());
    std::filesystem::path tmp = target;
    tmp += "." + to_hex(suffix) + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw RuntimeError("Unable to open " + tmp.string() + " for writing.");
        }
        out.write(reinterpret_cast<const char*>(value.data()), static_cast<std::streamsize>(value.size()));
        if (!out) {
            throw RuntimeError("Unable to write " + tmp.string());
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(tmp, cleanup_ec);
        throw RuntimeError("Unable to move " + tmp.string() + " into place: " + ec.message());
    }
}

byte_vector FileDataStore::get(const byte_vector& key) const {
    std::filesystem::path target = path_for_key(key);
    std::ifstream in(target, std::ios::binary);
    if (!in) {
        throw NotFound("No value stored for key " + to_hex(key));
    }
    return byte_vector(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void FileDataStore::remove(const byte_vector& key) {
    std::filesystem::path target = path_for_key(key);
    std::error_code ec;
    if (!std::filesystem::remove(target, ec)) {
        if (ec) {
            throw RuntimeError("Unable to remove " + target.string() + ": " + ec.message());
        }
        throw NotFound("No value stored for key " + to_hex(key));
    }
}

bool FileDataStore::contains(const byte_vector& key) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_for_key(key), ec);
}

} // namespace CruxEnclave
