#include "utils.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string random_hex(std::size_t byte_count){
    std::vector<unsigned char> bytes(byte_count);
    if(byte_count > 0 && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return hex_from_bytes(bytes);
}

std::string hash_password(const std::string& password){
    auto salt = random_hex(32);
    return salt + ":" + sha256_hex(password + salt);
}

bool verify_password(const std::string& password, const std::string& stored_hash){
    auto pos = stored_hash.find(':');
    if(pos == std::string::npos) return false;
    auto salt = stored_hash.substr(0, pos);
    auto expected = stored_hash.substr(pos + 1);
    auto computed = sha256_hex(password + salt);
    if(computed.size() != expected.size()) return false;
    return CRYPTO_memcmp(computed.data(), expected.data(), computed.size()) == 0;
}

std::string base64_encode(const std::string& data){
    if(data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    out.resize(written < 0 ? 0 : static_cast<std::size_t>(written));
    return out;
}

std::optional<std::string> base64_decode(const std::string& encoded){
    std::string clean = trim_copy(encoded);
    if(clean.empty()) return std::string();
    if(clean.size() % 4 != 0) return std::nullopt;
    std::string out(3 * clean.size() / 4, '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(clean.data()),
                                  static_cast<int>(clean.size()));
    if(written < 0) return std::nullopt;
    // EVP_DecodeBlock counts the padding as decoded zero bytes
    std::size_t padding = 0;
    if(clean.back() == '=') ++padding;
    if(clean.size() > 1 && clean[clean.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

std::string url_encode_path(const std::string& path){
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for(unsigned char ch : path) {
        if(std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~' || ch == '/') {
            oss << static_cast<char>(ch);
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(ch);
        }
    }
    return oss.str();
}

std::string url_decode(const std::string& text){
    std::string out;
    out.reserve(text.size());
    for(std::size_t i = 0; i < text.size(); ++i) {
        char ch = text[i];
        if(ch == '%' && i + 2 < text.size() &&
           std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
           std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

std::string xml_escape(const std::string& text){
    std::string out;
    out.reserve(text.size());
    for(char ch : text) {
        switch(ch) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out.push_back(ch);
        }
    }
    return out;
}

std::string normalize_remote_path(const std::string& path){
    std::string out = trim_copy(path);
    while(out.rfind("./", 0) == 0) out.erase(0, 2);
    if(out == ".") return "";
    while(!out.empty() && out.front() == '/') out.erase(out.begin());
    while(!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

std::string join_remote_path(const std::string& parent, const std::string& child){
    auto base = normalize_remote_path(parent);
    auto leaf = normalize_remote_path(child);
    if(base.empty()) return leaf;
    if(leaf.empty()) return base;
    return base + "/" + leaf;
}

std::string remote_basename(const std::string& path){
    auto normalized = normalize_remote_path(path);
    auto pos = normalized.find_last_of('/');
    if(pos == std::string::npos) return normalized;
    return normalized.substr(pos + 1);
}

std::string format_bytes(uint64_t bytes){
    if(bytes == 0) return "0 B";
    static const std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    std::size_t unit = 0;
    while(size >= 1024.0 && unit + 1 < units.size()) {
        size /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit];
    return oss.str();
}

std::string format_rate(double bytes_per_second){
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if(bytes_per_second < 1024.0 * 1024.0) {
        oss << bytes_per_second / 1024.0 << " KB/s";
    } else {
        oss << bytes_per_second / (1024.0 * 1024.0) << " MB/s";
    }
    return oss.str();
}

std::string format_duration(double seconds){
    if(!std::isfinite(seconds) || seconds < 0) return "--";
    auto total = static_cast<uint64_t>(std::llround(seconds));
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto secs = total % 60;
    std::ostringstream oss;
    if(hours > 0) oss << hours << "h ";
    if(hours > 0 || minutes > 0) oss << minutes << "m ";
    oss << secs << "s";
    return oss.str();
}

std::string to_lower(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
      [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
      [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

std::string local_host_name(){
    char hostname[256] = {0};
    if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0') {
        return "UnknownHost";
    }
    std::string name(hostname);
    // "box.example.org" -> "box"; a DNS label cannot carry dots
    auto dot = name.find('.');
    if(dot != std::string::npos && dot > 0) name.resize(dot);
    return name;
}
