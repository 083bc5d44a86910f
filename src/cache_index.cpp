#include "voicecache/cache_index.hpp"
#include "voicecache/log.hpp"

#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <unordered_set>

namespace voicecache {

namespace {

bool is_safe_name_char(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.';
}

}  // namespace

std::string sha256_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return {};

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return {};
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        return {};
    }

    char buf[64 * 1024];
    while (ifs) {
        ifs.read(buf, sizeof(buf));
        auto n = ifs.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx, buf, static_cast<size_t>(n)) != 1) {
            EVP_MD_CTX_free(ctx);
            return {};
        }
    }
    if (ifs.bad()) {
        EVP_MD_CTX_free(ctx);
        return {};
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    int ok = EVP_DigestFinal_ex(ctx, digest, &digest_len);
    EVP_MD_CTX_free(ctx);
    if (ok != 1) return {};

    std::string hex;
    hex.reserve(digest_len * 2);
    char byte[3];
    for (unsigned int i = 0; i < digest_len; ++i) {
        std::snprintf(byte, sizeof(byte), "%02x", digest[i]);
        hex += byte;
    }
    return hex;
}

CacheIndex::CacheIndex(KeyValueStore& store, std::filesystem::path cache_dir, std::string file_extension)
    : store_(store)
    , cache_dir_(std::move(cache_dir))
    , file_extension_(std::move(file_extension)) {}

// --- Serialization ---

std::string CacheIndex::encode_file_name(const std::string& id) {
    std::string out;
    out.reserve(id.size());
    for (size_t i = 0; i < id.size(); ++i) {
        auto c = static_cast<unsigned char>(id[i]);
        // A leading dot would hide the file and "." / ".." are not names
        if (is_safe_name_char(c) && !(i == 0 && c == '.')) {
            out += static_cast<char>(c);
        } else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            out += hex;
        }
    }
    return out;
}

std::string CacheIndex::serialize(const std::unordered_map<std::string, CacheEntry>& entries) {
    nlohmann::json doc = nlohmann::json::object();
    for (auto& [id, e] : entries) {
        doc[id] = {
            {"source_url", e.source_url},
            {"local_path", e.local_path.string()},
            {"size_bytes", e.size_bytes},
            {"created_at", e.created_at},
            {"last_accessed_at", e.last_accessed_at},
            {"sha256", e.sha256},
        };
    }
    return doc.dump();
}

std::optional<std::unordered_map<std::string, CacheEntry>> CacheIndex::parse(const std::string& blob) {
    nlohmann::json doc = nlohmann::json::parse(blob, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

    std::unordered_map<std::string, CacheEntry> entries;
    for (auto& [id, value] : doc.items()) {
        try {
            CacheEntry e;
            e.id = id;
            e.source_url = value.at("source_url").get<std::string>();
            e.local_path = value.at("local_path").get<std::string>();
            e.size_bytes = value.at("size_bytes").get<uint64_t>();
            e.created_at = value.value("created_at", int64_t{0});
            e.last_accessed_at = value.value("last_accessed_at", e.created_at);
            e.sha256 = value.value("sha256", std::string{});
            entries.emplace(id, std::move(e));
        } catch (const std::exception& ex) {
            log_warn("Skipping malformed cache entry %s: %s", id.c_str(), ex.what());
        }
    }
    return entries;
}

bool CacheIndex::persist() {
    return store_.write(METADATA_KEY, serialize(entries_));
}

// --- Load & reconcile ---

CacheIndex::LoadReport CacheIndex::load(bool verify_checksums) {
    LoadReport report;
    entries_.clear();
    total_bytes_ = 0;

    std::error_code ec;
    std::filesystem::create_directories(cache_dir_, ec);
    if (ec) log_error("Cannot create cache dir %s: %s", cache_dir_.c_str(), ec.message().c_str());

    // Leftover partial files from an interrupted run are never valid
    std::filesystem::remove_all(incoming_dir(), ec);
    std::filesystem::create_directories(incoming_dir(), ec);
    if (ec) log_error("Cannot create %s: %s", incoming_dir().c_str(), ec.message().c_str());

    std::unordered_map<std::string, CacheEntry> persisted;
    auto blob = store_.read(METADATA_KEY);
    if (blob && !blob->empty()) {
        auto parsed = parse(*blob);
        if (parsed) {
            persisted = std::move(*parsed);
        } else {
            log_warn("Cache metadata is corrupt, starting with an empty index");
        }
    }

    bool changed = false;
    for (auto& [id, e] : persisted) {
        std::error_code fec;
        bool present = std::filesystem::is_regular_file(e.local_path, fec);
        if (!present) {
            ++report.dropped_missing;
            changed = true;
            log_debug("Dropping entry with missing file: %s", id.c_str());
            continue;
        }

        auto actual = std::filesystem::file_size(e.local_path, fec);
        bool corrupt = fec || actual != e.size_bytes;
        if (!corrupt && verify_checksums && !e.sha256.empty()) {
            corrupt = sha256_file(e.local_path) != e.sha256;
        }
        if (corrupt) {
            std::filesystem::remove(e.local_path, fec);
            ++report.dropped_corrupt;
            changed = true;
            log_warn("Dropping corrupt cache entry: %s", id.c_str());
            continue;
        }

        total_bytes_ += e.size_bytes;
        entries_.emplace(id, std::move(e));
    }

    report.orphans_deleted = delete_orphans();
    report.loaded = entries_.size();

    if (changed && !persist()) {
        log_error("Failed to persist reconciled cache metadata");
    }

    log_info("Cache index loaded: %zu entries, %lu bytes (dropped %zu missing, %zu corrupt, "
             "deleted %zu orphans)",
             report.loaded, static_cast<unsigned long>(total_bytes_), report.dropped_missing,
             report.dropped_corrupt, report.orphans_deleted);
    return report;
}

size_t CacheIndex::delete_orphans() {
    std::unordered_set<std::string> referenced;
    for (auto& [id, e] : entries_) {
        referenced.insert(e.local_path.lexically_normal().string());
    }

    size_t deleted = 0;
    std::error_code ec;
    for (auto& f : std::filesystem::directory_iterator(cache_dir_, ec)) {
        std::error_code fec;
        if (!f.is_regular_file(fec)) continue;
        if (referenced.count(f.path().lexically_normal().string())) continue;
        if (std::filesystem::remove(f.path(), fec)) {
            ++deleted;
            log_debug("Deleted orphan file: %s", f.path().c_str());
        }
    }
    if (ec) log_error("Cannot scan cache dir %s: %s", cache_dir_.c_str(), ec.message().c_str());
    return deleted;
}

// --- Lookups ---

bool CacheIndex::is_cached(const std::string& id) const {
    return entries_.count(id) != 0;
}

std::optional<std::filesystem::path> CacheIndex::get_path(const std::string& id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.local_path;
}

const CacheEntry* CacheIndex::find(const std::string& id) const {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

bool CacheIndex::verify(const std::string& id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    std::error_code ec;
    auto size = std::filesystem::file_size(it->second.local_path, ec);
    return !ec && size == it->second.size_bytes;
}

std::vector<CacheEntry> CacheIndex::entries() const {
    std::vector<CacheEntry> out;
    out.reserve(entries_.size());
    for (auto& [id, e] : entries_) out.push_back(e);
    return out;
}

std::filesystem::path CacheIndex::path_for(const std::string& id) const {
    return cache_dir_ / (encode_file_name(id) + file_extension_);
}

// --- Mutations ---

bool CacheIndex::touch(const std::string& id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;
    it->second.last_accessed_at = now_epoch_ms();
    return persist();
}

bool CacheIndex::commit(CacheEntry entry) {
    auto it = entries_.find(entry.id);
    if (it != entries_.end()) {
        total_bytes_ -= it->second.size_bytes;
        entries_.erase(it);
    }
    total_bytes_ += entry.size_bytes;
    auto id = entry.id;
    entries_.emplace(std::move(id), std::move(entry));
    return persist();
}

bool CacheIndex::remove(const std::string& id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) return false;

    std::error_code ec;
    std::filesystem::remove(it->second.local_path, ec);
    if (ec) {
        log_warn("Failed to delete %s: %s", it->second.local_path.c_str(), ec.message().c_str());
    }

    total_bytes_ -= it->second.size_bytes;
    entries_.erase(it);
    if (!persist()) {
        log_error("Failed to persist cache metadata after removing %s", id.c_str());
    }
    return true;
}

size_t CacheIndex::clear() {
    size_t removed = 0;
    std::error_code ec;
    for (auto& [id, e] : entries_) {
        if (std::filesystem::remove(e.local_path, ec)) ++removed;
    }
    entries_.clear();
    total_bytes_ = 0;

    // Anything else at the top level is unreferenced now
    removed += delete_orphans();

    if (!store_.erase()) {
        log_error("Failed to erase cache metadata store");
    }
    return removed;
}

}  // namespace voicecache
