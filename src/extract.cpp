#include "extract.h"
#include "log.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace mosaic {
namespace {

struct archive_reader : unmovable {
  explicit archive_reader(archive_encoding encoding) : handle(archive_read_new()) {
    if (!handle) { throw std::runtime_error("archive_read_new failed"); }

    switch (encoding) {
      case archive_encoding::tar_gzip:
        archive_read_support_filter_gzip(handle);
        archive_read_support_format_tar(handle);
        archive_read_support_format_gnutar(handle);
        break;
      case archive_encoding::tar:
        archive_read_support_filter_none(handle);
        archive_read_support_format_tar(handle);
        archive_read_support_format_gnutar(handle);
        break;
    }
  }

  ~archive_reader() {
    if (handle) {
      archive_read_close(handle);
      archive_read_free(handle);
    }
  }

  archive *handle{ nullptr };
};

struct archive_writer : unmovable {
  archive_writer() : handle(archive_write_disk_new()) {
    if (!handle) { throw std::runtime_error("archive_write_disk_new failed"); }
    archive_write_disk_set_options(handle,
                                   ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                       ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                       ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(handle);
  }

  ~archive_writer() {
    if (handle) {
      archive_write_close(handle);
      archive_write_free(handle);
    }
  }

  archive *handle{ nullptr };
};

void ensure_directory(std::filesystem::path const &path) {
  auto const dir{ path.parent_path() };
  if (dir.empty()) { return; }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error(std::string("Failed to create directory ") + dir.string() +
                             ": " + ec.message());
  }
}

}  // namespace

std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination,
                      archive_encoding encoding) {
  archive_reader reader{ encoding };
  archive_writer writer;

  if (archive_read_open_filename(reader.handle, archive_path.string().c_str(), 10240) !=
      ARCHIVE_OK) {
    throw std::runtime_error(std::string("Failed to open archive: ") +
                             archive_error_string(reader.handle));
  }

  archive_entry *entry{ nullptr };
  std::uint64_t files_extracted{ 0 };

  while (true) {
    int const r{ archive_read_next_header(reader.handle, &entry) };
    if (r == ARCHIVE_EOF) { break; }

    if (r != ARCHIVE_OK) {
      throw std::runtime_error(std::string("Failed to read archive header: ") +
                               archive_error_string(reader.handle));
    }

    char const *entry_path{ archive_entry_pathname(entry) };
    if (!entry_path) { throw std::runtime_error("Archive entry has null pathname"); }

    bool const is_regular_file{ archive_entry_filetype(entry) == AE_IFREG };

    std::filesystem::path const full_path{ destination / entry_path };
    ensure_directory(full_path);

    {
      std::string const full_path_str{ full_path.string() };
      archive_entry_copy_pathname(entry, full_path_str.c_str());
    }

    if (char const *hardlink{ archive_entry_hardlink(entry) }) {
      std::string const hardlink_full{ (destination / hardlink).string() };
      archive_entry_copy_hardlink(entry, hardlink_full.c_str());
    }

    if (int const write_header_result{ archive_write_header(writer.handle, entry) };
        write_header_result != ARCHIVE_OK && write_header_result != ARCHIVE_WARN) {
      throw std::runtime_error(std::string("Failed to write entry header: ") +
                               archive_error_string(writer.handle));
    }

    if (archive_entry_size(entry) > 0) {
      std::vector<char> buffer(256 * 1024);

      la_ssize_t bytes_read{ 0 };
      while ((bytes_read =
                  archive_read_data(reader.handle, buffer.data(), buffer.size())) > 0) {
        if (la_ssize_t const bytes_written{
                archive_write_data(writer.handle,
                                   buffer.data(),
                                   static_cast<size_t>(bytes_read)) };
            bytes_written < 0) {
          throw std::runtime_error(std::string("Failed to write entry data: ") +
                                   archive_error_string(writer.handle));
        }
      }

      if (bytes_read < 0) {
        throw std::runtime_error(std::string("Failed to read entry data: ") +
                                 archive_error_string(reader.handle));
      }
    }

    if (archive_write_finish_entry(writer.handle) != ARCHIVE_OK) {
      throw std::runtime_error(std::string("Failed to finish entry: ") +
                               archive_error_string(writer.handle));
    }

    if (is_regular_file) { ++files_extracted; }
  }

  if (files_extracted == 0) {
    throw std::runtime_error("Archive extraction failed: 0 files extracted from " +
                             archive_path.filename().string() +
                             " (archive may be empty, corrupt, or unsupported format)");
  }

  return files_extracted;
}

std::uint64_t extract_tar(std::filesystem::path const &archive_path,
                          std::filesystem::path const &destination) {
  std::string gzip_error;
  try {
    return extract(archive_path, destination, archive_encoding::tar_gzip);
  } catch (std::runtime_error const &e) {
    gzip_error = e.what();
  }

  log::warn("tar.gz extraction of %s failed (%s); trying plain tar",
            archive_path.string().c_str(),
            gzip_error.c_str());

  try {
    return extract(archive_path, destination, archive_encoding::tar);
  } catch (std::runtime_error const &e) {
    throw std::runtime_error("extract_tar: " + archive_path.string() +
                             " is neither tar.gz (" + gzip_error + ") nor tar (" +
                             e.what() + ")");
  }
}

}  // namespace mosaic
