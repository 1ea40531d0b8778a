#include "cache/source_fingerprint.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <format>

namespace ccdash {

std::string compute_source_fingerprint(const LocateResult& located) {
    std::vector<const LogFileInfo*> files;
    files.reserve(located.files.size());
    for (const auto& f : located.files) {
        files.push_back(&f);
    }
    std::sort(files.begin(), files.end(),
              [](const LogFileInfo* a, const LogFileInfo* b) { return a->path < b->path; });

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1;

    const std::string_view root_tag = located.root_exists ? "root:1\n" : "root:0\n";
    ok = ok && EVP_DigestUpdate(ctx, root_tag.data(), root_tag.size()) == 1;

    // '\0' cannot appear in a path, so tuples cannot run into each other
    std::string tuple;
    for (const auto* f : files) {
        if (!ok) break;
        tuple = std::format("{}{}{}{}{}\n", f->path, '\0', f->size, '\0', f->mtime_ns);
        ok = EVP_DigestUpdate(ctx, tuple.data(), tuple.size()) == 1;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    ok = ok && EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) return "";

    // Convert to hex string
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += hex_chars[(hash[i] >> 4) & 0x0F];
        hex += hex_chars[hash[i] & 0x0F];
    }
    return hex;
}

} // namespace ccdash
