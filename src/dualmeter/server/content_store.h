#pragma once

#include "../core/result.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace dualmeter {
namespace server {

/**
 * One servable file.
 */
struct ContentEntry {
    std::string path;                          // Request path, e.g. "/css/site.css"
    std::shared_ptr<const std::string> body;
    std::string content_type;
    std::string etag;                          // Quoted, e.g. "\"9f86d081884c7d65\""
    size_t size{0};
};

/**
 * Content type for a file name, by extension (case-insensitive).
 * Unknown extensions map to application/octet-stream.
 */
const char* mime_type_for(const std::string& file_name) noexcept;

/**
 * Quoted lowercase hex of the first 8 bytes of SHA-256(data).
 *
 * @return Empty string if the digest could not be computed
 */
std::string compute_etag(const std::string& data);

/**
 * Immutable in-memory index of a content directory.
 *
 * Built once by load(), then only read. Directory paths ("/", "/docs/",
 * "/docs") resolve to their index.html when one exists. Lookups are
 * exact; callers strip the query string.
 */
class ContentStore {
public:
    /**
     * Walk root recursively and read every regular file.
     *
     * Symlinks are followed only when their target stays inside root.
     *
     * @param error Filled with a description on failure
     * @return Store, or content_load_error
     */
    static core::result<std::shared_ptr<const ContentStore>> load(const std::string& root,
                                                                   std::string* error = nullptr);

    /**
     * Empty store.
     */
    ContentStore() = default;

    const ContentEntry* find(const std::string& path) const noexcept;

    size_t file_count() const noexcept { return file_count_; }
    uint64_t total_bytes() const noexcept { return total_bytes_; }
    const std::string& root() const noexcept { return root_; }

private:
    std::unordered_map<std::string, std::shared_ptr<const ContentEntry>> entries_;
    std::string root_;
    size_t file_count_{0};
    uint64_t total_bytes_{0};
};

/**
 * Shared handle to the current store snapshot.
 *
 * Readers take a reference-counted snapshot; a reload swaps in a new
 * store while requests in flight keep using the old one.
 */
class ContentStoreHandle {
public:
    explicit ContentStoreHandle(std::shared_ptr<const ContentStore> store)
        : store_(std::move(store)) {}

    std::shared_ptr<const ContentStore> get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return store_;
    }

    void swap(std::shared_ptr<const ContentStore> store) {
        std::lock_guard<std::mutex> lock(mutex_);
        store_.swap(store);
    }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const ContentStore> store_;
};

} // namespace server
} // namespace dualmeter
