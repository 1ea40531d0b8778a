#pragma once

#include "usage/log_locator.hpp"

#include <string>

namespace ccdash {

/**
 * @brief SHA-256 (hex) over the located files' (path, size, mtime) tuples
 *
 * Metadata only: no file content is read. Whether the root exists is part
 * of the digest, so "root missing" and "root empty" differ. Input order
 * does not matter; tuples are hashed in path order.
 *
 * @return Lowercase hex digest, or empty string if OpenSSL fails
 */
[[nodiscard]] std::string compute_source_fingerprint(const LocateResult& located);

} // namespace ccdash
