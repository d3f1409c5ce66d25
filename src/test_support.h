#pragma once

// Fixture helpers shared by the unit tests. Linked into mosaic_unit_tests only.

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace mosaic::test {

using archive_file = std::pair<std::string, std::string>;  // relative path, contents

// Writes a ustar archive with libarchive, optionally gzip-compressed.
void write_tar(std::filesystem::path const &archive_path,
               std::vector<archive_file> const &files,
               bool gzip);

// Writes <pack_dir>/gui/manifest.json.
void write_manifest(std::filesystem::path const &pack_dir, std::string const &json);

// Writes <pack_dir>/gui/assets/<relative>.
void write_asset(std::filesystem::path const &pack_dir,
                 std::filesystem::path const &relative,
                 std::string const &contents);

// <pack_root>/acme with a layout (entry index.html, spa) and an "invoices" feature whose
// authenticated route "/invoices" serves invoices.html with a "summary" fragment bound to
// "#summary". with_auth adds an auth pack whose first route is "/signin".
void write_acme_tenant(std::filesystem::path const &pack_root, bool with_auth);

// Sorted relative paths of all regular files below root, '/'-separated.
std::vector<std::string> collect_files_recursive(std::filesystem::path const &root);

}  // namespace mosaic::test
