#pragma once

#include <cstdint>
#include <filesystem>

namespace mosaic {

enum class archive_encoding {
  tar_gzip,  // gzip-compressed tar only
  tar,       // uncompressed tar only
};

// Extract archive_path into destination. Returns the number of regular files written.
// Throws std::runtime_error on any libarchive failure, or when no regular file was
// extracted.
std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination,
                      archive_encoding encoding);

// Extract a pack artifact: gzip-compressed tar first, then plain tar. Throws when both
// attempts fail, carrying both messages.
std::uint64_t extract_tar(std::filesystem::path const &archive_path,
                          std::filesystem::path const &destination);

}  // namespace mosaic
