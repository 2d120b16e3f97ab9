#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);
std::string random_hex(std::size_t byte_count);

// Salted SHA-256 in the form "salt:hexdigest".
std::string hash_password(const std::string& password);
bool verify_password(const std::string& password, const std::string& stored_hash);

std::string base64_encode(const std::string& data);
std::optional<std::string> base64_decode(const std::string& encoded);

// Percent-encodes each path segment, keeping '/' separators.
std::string url_encode_path(const std::string& path);
std::string url_decode(const std::string& text);
std::string xml_escape(const std::string& text);

// Strips surrounding whitespace, leading "./" and leading/trailing slashes.
std::string normalize_remote_path(const std::string& path);
std::string join_remote_path(const std::string& parent, const std::string& child);
std::string remote_basename(const std::string& path);

std::string format_bytes(uint64_t bytes);
std::string format_rate(double bytes_per_second);
std::string format_duration(double seconds);

std::string to_lower(std::string value);
std::string trim_copy(std::string value);
std::string local_host_name();
