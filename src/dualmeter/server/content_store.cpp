#include "content_store.h"
#include "../core/logger.h"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace dualmeter {
namespace server {

namespace {

struct MimeMapping {
    const char* extension;
    const char* type;
};

constexpr MimeMapping kMimeTypes[] = {
    {"html", "text/html; charset=utf-8"},
    {"htm", "text/html; charset=utf-8"},
    {"css", "text/css; charset=utf-8"},
    {"js", "application/javascript; charset=utf-8"},
    {"mjs", "application/javascript; charset=utf-8"},
    {"json", "application/json"},
    {"txt", "text/plain; charset=utf-8"},
    {"svg", "image/svg+xml"},
    {"png", "image/png"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"gif", "image/gif"},
    {"webp", "image/webp"},
    {"ico", "image/x-icon"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"wasm", "application/wasm"},
    {"xml", "application/xml"},
    {"pdf", "application/pdf"},
};

constexpr const char* kDefaultMimeType = "application/octet-stream";

bool read_file(const fs::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return false;
    }
    out = buf.str();
    return true;
}

/**
 * True if path lies inside root (both canonical).
 */
bool is_within(const fs::path& root, const fs::path& path) {
    auto r = root.begin();
    auto p = path.begin();
    for (; r != root.end(); ++r, ++p) {
        if (p == path.end() || *r != *p) {
            return false;
        }
    }
    return true;
}

} // namespace

const char* mime_type_for(const std::string& file_name) noexcept {
    size_t dot = file_name.rfind('.');
    size_t slash = file_name.rfind('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return kDefaultMimeType;
    }
    std::string ext = file_name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& m : kMimeTypes) {
        if (ext == m.extension) {
            return m.type;
        }
    }
    return kDefaultMimeType;
}

std::string compute_etag(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        return std::string();
    }

    static const char hex[] = "0123456789abcdef";
    std::string etag = "\"";
    for (unsigned int i = 0; i < 8 && i < digest_len; i++) {
        etag.push_back(hex[digest[i] >> 4]);
        etag.push_back(hex[digest[i] & 0x0F]);
    }
    etag.push_back('"');
    return etag;
}

core::result<std::shared_ptr<const ContentStore>> ContentStore::load(const std::string& root,
                                                                      std::string* error) {
    auto fail = [&](const std::string& msg) {
        if (error) *error = msg;
        LOG_ERROR("Content", "%s", msg.c_str());
        return core::error_code::content_load_error;
    };

    std::error_code ec;
    fs::path canonical_root = fs::canonical(root, ec);
    if (ec) {
        return fail("content root " + root + ": " + ec.message());
    }
    if (!fs::is_directory(canonical_root, ec)) {
        return fail("content root " + root + " is not a directory");
    }

    auto store = std::make_shared<ContentStore>();
    store->root_ = canonical_root.string();

    fs::recursive_directory_iterator it(canonical_root, fs::directory_options::none, ec);
    if (ec) {
        return fail("cannot walk " + root + ": " + ec.message());
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return fail("cannot walk " + root + ": " + ec.message());
        }

        const fs::path& path = it->path();
        std::error_code entry_ec;
        if (it->is_symlink(entry_ec)) {
            fs::path target = fs::canonical(path, entry_ec);
            if (entry_ec || !is_within(canonical_root, target)) {
                LOG_WARN("Content", "Skipping symlink leaving the content root: %s",
                         path.string().c_str());
                continue;
            }
        }
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }

        std::string data;
        if (!read_file(path, data)) {
            return fail("cannot read " + path.string());
        }

        std::string rel = path.lexically_relative(canonical_root).generic_string();
        auto entry = std::make_shared<ContentEntry>();
        entry->path = "/" + rel;
        entry->content_type = mime_type_for(rel);
        entry->etag = compute_etag(data);
        if (entry->etag.empty()) {
            return fail("SHA-256 failed for " + path.string());
        }
        entry->size = data.size();
        entry->body = std::make_shared<const std::string>(std::move(data));

        store->file_count_++;
        store->total_bytes_ += entry->size;

        std::shared_ptr<const ContentEntry> shared = entry;
        store->entries_[shared->path] = shared;

        // Directory aliases for index.html
        if (path.filename() == "index.html") {
            std::string dir = shared->path.substr(0, shared->path.size() - std::string("index.html").size());
            store->entries_.emplace(dir, shared);
            if (dir.size() > 1) {
                store->entries_.emplace(dir.substr(0, dir.size() - 1), shared);
            }
        }
    }

    LOG_INFO("Content", "Loaded %zu files (%llu bytes) from %s", store->file_count_,
             (unsigned long long)store->total_bytes_, store->root_.c_str());
    return std::shared_ptr<const ContentStore>(std::move(store));
}

const ContentEntry* ContentStore::find(const std::string& path) const noexcept {
    auto it = entries_.find(path);
    return it == entries_.end() ? nullptr : it->second.get();
}

} // namespace server
} // namespace dualmeter
