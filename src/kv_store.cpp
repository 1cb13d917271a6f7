// ============================================================================
// kv_store.cpp — implementation for kv_store.hpp
// ============================================================================

#include "rovy/kv_store.hpp"
#include "rovy/log.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace rovy {

// --- FileStore --------------------------------------------------------------

FileStore::FileStore(fs::path dir) : dir_(std::move(dir)) {}

fs::path FileStore::path_for(const std::string& key) const {
    return dir_ / (key + ".json");
}

std::optional<std::string> FileStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    const fs::path p = path_for(key);

    std::error_code ec;
    if (!fs::exists(p, ec)) return std::nullopt;

    std::ifstream in(p, std::ios::binary);
    if (!in) {
        log_warn("store", "cannot read " + p.string());
        return std::nullopt;
    }
    std::string value((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return value;
}

bool FileStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lk(mu_);
    const fs::path p = path_for(key);

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        log_error("store", "cannot create " + dir_.string() + ": " + ec.message());
        return false;
    }

    fs::path tmp = p;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            log_error("store", "cannot write " + tmp.string());
            return false;
        }
        out << value;
        out.flush();
        if (!out) {
            log_error("store", "short write " + tmp.string());
            return false;
        }
    }

    fs::rename(tmp, p, ec);      // atomic replace on POSIX
    if (ec) {
        log_error("store", "rename failed for " + p.string() + ": " + ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

bool FileStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    std::error_code ec;
    fs::remove(path_for(key), ec);   // false + no error when already absent
    if (ec) {
        log_warn("store", "cannot remove " + key + ": " + ec.message());
        return false;
    }
    return true;
}

// --- MemoryStore ------------------------------------------------------------

std::optional<std::string> MemoryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

bool MemoryStore::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lk(mu_);
    if (read_only_) return false;
    values_[key] = value;
    return true;
}

bool MemoryStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    if (read_only_) return false;
    values_.erase(key);
    return true;
}

} // namespace rovy
