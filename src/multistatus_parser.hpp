#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct DirectoryEntry {
  std::string name;
  bool is_directory = false;
  uint64_t size_bytes = 0;     // 0 for directories
  std::string modified_at;
  std::string media_type;
  std::string remote_path;     // normalized, relative to the share root
};

// Parses a WebDAV 207 multistatus body. The entry describing `requested_path`
// itself is dropped. Throws ListingError when the XML is malformed.
std::vector<DirectoryEntry> parse_multistatus(const std::string& xml,
                                              const std::string& requested_path);

// "http://host:8080/a%20b/c/" -> "a b/c"
std::string remote_path_from_href(const std::string& href);
