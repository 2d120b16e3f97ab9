#include "webdav_handler.hpp"
#include "utils.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <map>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr const char* kAllow = "OPTIONS, GET, HEAD, PROPFIND, PUT, MKCOL, DELETE";

bool is_within(const fs::path& root, const fs::path& candidate) {
  auto c = candidate.begin();
  for(const auto& part : root) {
    if(part.empty()) continue;
    if(c == candidate.end() || *c != part) return false;
    ++c;
  }
  return true;
}

uint64_t size_of(const fs::path& path) {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  return ec ? 0 : static_cast<uint64_t>(size);
}

std::string modified_of(const fs::path& path) {
  std::error_code ec;
  auto when = fs::last_write_time(path, ec);
  if(ec) return http_date(std::time(nullptr));
  return http_date(when);
}

bool parse_u64(const std::string& text, uint64_t& out) {
  if(text.empty()) return false;
  uint64_t value = 0;
  for(char ch : text) {
    if(ch < '0' || ch > '9') return false;
    auto digit = static_cast<uint64_t>(ch - '0');
    if(value > (UINT64_MAX - digit) / 10) return false;
    value = value * 10 + digit;
  }
  out = value;
  return true;
}

std::string header_value(const DavRequestHeader& request, http::field field) {
  auto it = request.find(field);
  return it == request.end() ? std::string() : std::string(it->value());
}

std::string header_value(const DavRequestHeader& request, const char* name) {
  auto it = request.find(name);
  return it == request.end() ? std::string() : std::string(it->value());
}

DavResponse not_allowed() {
  auto res = make_text_response(http::status::method_not_allowed, "Method not allowed");
  res.message.set(http::field::allow, kAllow);
  return res;
}

} // namespace

ByteRange parse_range(const std::string& header_value, uint64_t resource_size) {
  ByteRange range;
  auto value = trim_copy(header_value);
  if(value.rfind("bytes=", 0) != 0) return range;
  auto range_text = trim_copy(value.substr(6));
  if(range_text.find(',') != std::string::npos) return range; // multiple ranges: serve whole
  auto dash = range_text.find('-');
  if(dash == std::string::npos) return range;
  auto first_text = trim_copy(range_text.substr(0, dash));
  auto last_text = trim_copy(range_text.substr(dash + 1));

  uint64_t first = 0;
  uint64_t last = 0;
  if(first_text.empty()) {
    // suffix form "-N": last N bytes
    uint64_t suffix = 0;
    if(!parse_u64(last_text, suffix)) return range;
    range.present = true;
    if(suffix == 0 || resource_size == 0) return range;
    first = suffix >= resource_size ? 0 : resource_size - suffix;
    last = resource_size - 1;
  } else {
    if(!parse_u64(first_text, first)) return range;
    if(last_text.empty()) {
      last = resource_size == 0 ? 0 : resource_size - 1;
    } else if(!parse_u64(last_text, last) || last < first) {
      return range;
    }
    range.present = true;
    if(first >= resource_size) return range;
    if(last >= resource_size) last = resource_size - 1;
  }
  range.satisfiable = true;
  range.first = first;
  range.last = last;
  return range;
}

std::string http_date(std::time_t when) {
  std::tm tm{};
  gmtime_r(&when, &tm);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm);
  return buf;
}

std::string http_date(fs::file_time_type when) {
  // file_clock has no portable to_sys in C++17; shift by the current offset
  auto sys = std::chrono::system_clock::now() +
             std::chrono::duration_cast<std::chrono::system_clock::duration>(
               when - fs::file_time_type::clock::now());
  return http_date(std::chrono::system_clock::to_time_t(sys));
}

std::optional<std::string> check_basic_auth(const DavRequestHeader& request, const AuthSettings& auth) {
  auto header = trim_copy(header_value(request, http::field::authorization));
  if(header.size() < 6 || to_lower(header.substr(0, 6)) != "basic ") return std::nullopt;
  auto decoded = base64_decode(header.substr(6));
  if(!decoded) return std::nullopt;
  auto colon = decoded->find(':');
  if(colon == std::string::npos) return std::nullopt;
  auto user = decoded->substr(0, colon);
  auto password = decoded->substr(colon + 1);
  if(!auth.username.empty() && user != auth.username) return std::nullopt;
  if(!auth.verifier || !auth.verifier(user, password)) return std::nullopt;
  return user;
}

DavResponse make_text_response(http::status status, const std::string& text) {
  DavResponse res;
  res.message.result(status);
  res.message.set(http::field::content_type, "text/plain; charset=utf-8");
  res.message.body() = text + "\n";
  return res;
}

DavResponse make_unauthorized(const std::string& realm) {
  auto res = make_text_response(http::status::unauthorized, "Authentication required");
  res.message.set(http::field::www_authenticate, "Basic realm=\"" + realm + "\"");
  return res;
}

std::string media_type_for(const fs::path& path) {
  static const std::map<std::string, std::string> types = {
    {".txt", "text/plain"}, {".md", "text/markdown"}, {".html", "text/html"},
    {".htm", "text/html"}, {".css", "text/css"}, {".js", "application/javascript"},
    {".json", "application/json"}, {".xml", "application/xml"}, {".csv", "text/csv"},
    {".pdf", "application/pdf"}, {".zip", "application/zip"}, {".gz", "application/gzip"},
    {".tar", "application/x-tar"}, {".7z", "application/x-7z-compressed"},
    {".png", "image/png"}, {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"},
    {".gif", "image/gif"}, {".svg", "image/svg+xml"}, {".webp", "image/webp"},
    {".mp3", "audio/mpeg"}, {".wav", "audio/wav"}, {".ogg", "audio/ogg"},
    {".mp4", "video/mp4"}, {".mkv", "video/x-matroska"}, {".webm", "video/webm"},
    {".doc", "application/msword"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"}
  };
  auto it = types.find(to_lower(path.extension().string()));
  return it == types.end() ? "application/octet-stream" : it->second;
}

WebDavHandler::WebDavHandler(fs::path root, std::shared_ptr<Logger> logger)
  : logger_(std::move(logger))
{
  std::error_code ec;
  auto absolute = fs::absolute(root, ec);
  if(ec) absolute = root;
  auto canonical = fs::weakly_canonical(absolute, ec);
  root_ = ec ? absolute.lexically_normal() : canonical;
  // "/srv/share/" -> "/srv/share"
  if(!root_.has_filename() && root_.has_relative_path()) {
    root_ = root_.parent_path();
  }
}

std::string WebDavHandler::request_path(const DavRequestHeader& request) {
  std::string target(request.target());
  auto query = target.find('?');
  if(query != std::string::npos) target.erase(query);
  return url_decode(target);
}

std::optional<fs::path> WebDavHandler::resolve(const std::string& url_path) const {
  fs::path relative;
  std::size_t start = 0;
  while(start <= url_path.size()) {
    auto end = url_path.find('/', start);
    if(end == std::string::npos) end = url_path.size();
    auto segment = url_path.substr(start, end - start);
    start = end + 1;
    if(segment.empty() || segment == ".") continue;
    if(segment == ".." || segment.find('\\') != std::string::npos ||
       segment.find('\0') != std::string::npos) {
      return std::nullopt;
    }
    relative /= segment;
  }

  if(relative.empty()) return root_;
  auto full = root_ / relative;
  std::error_code ec;
  auto canonical = fs::weakly_canonical(full, ec);
  if(ec) return std::nullopt;
  // symlinks pointing outside the share are treated like ".."
  if(!is_within(root_, canonical)) return std::nullopt;
  return full;
}

DavResponse WebDavHandler::handle(const DavRequestHeader& request) const {
  const auto method = request.method();
  if(method == http::verb::options) return handle_options();
  if(method != http::verb::propfind && method != http::verb::get && method != http::verb::head &&
     method != http::verb::mkcol && method != http::verb::delete_) {
    return not_allowed();
  }

  auto url_path = request_path(request);
  auto target = resolve(url_path);
  if(!target) {
    log_warn(logger_.get(), "Rejected path outside share: {}", url_path);
    return make_text_response(http::status::forbidden, "Forbidden");
  }
  if(method == http::verb::mkcol) return handle_mkcol(*target);

  std::error_code ec;
  if(!fs::exists(*target, ec)) {
    return make_text_response(http::status::not_found, "Not found");
  }

  if(method == http::verb::delete_) return handle_delete(*target);
  if(method == http::verb::propfind) return handle_propfind(request, *target);
  if(fs::is_directory(*target, ec)) return directory_index(url_path, *target, method == http::verb::head);
  return handle_get(request, *target, method == http::verb::head);
}

DavResponse WebDavHandler::handle_options() const {
  DavResponse res;
  res.message.result(http::status::ok);
  res.message.set("DAV", "1");
  res.message.set(http::field::allow, kAllow);
  res.message.set("MS-Author-Via", "DAV");
  return res;
}

std::string WebDavHandler::href_for(const fs::path& target, bool is_directory) const {
  auto relative = target.lexically_relative(root_).generic_string();
  if(relative == ".") relative.clear();
  std::string href = "/" + relative;
  if(is_directory && href.back() != '/') href.push_back('/');
  return url_encode_path(href);
}

std::string WebDavHandler::propfind_response(const fs::path& target) const {
  std::error_code ec;
  bool is_dir = fs::is_directory(target, ec);
  auto name = target == root_ ? root_.filename().string() : target.filename().string();

  std::ostringstream oss;
  oss << "<D:response>"
      << "<D:href>" << xml_escape(href_for(target, is_dir)) << "</D:href>"
      << "<D:propstat><D:prop>"
      << "<D:displayname>" << xml_escape(name) << "</D:displayname>"
      << "<D:getlastmodified>" << modified_of(target) << "</D:getlastmodified>";
  if(is_dir) {
    oss << "<D:resourcetype><D:collection/></D:resourcetype>";
  } else {
    oss << "<D:resourcetype/>"
        << "<D:getcontentlength>" << size_of(target) << "</D:getcontentlength>"
        << "<D:getcontenttype>" << xml_escape(media_type_for(target)) << "</D:getcontenttype>";
  }
  oss << "</D:prop><D:status>HTTP/1.1 200 OK</D:status></D:propstat>"
      << "</D:response>\n";
  return oss.str();
}

DavResponse WebDavHandler::handle_propfind(const DavRequestHeader& request, const fs::path& target) const {
  // Depth 0 lists the resource itself; "1" and "infinity" are both served as 1.
  const bool depth_zero = trim_copy(header_value(request, "Depth")) == "0";

  std::ostringstream body;
  body << "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
       << "<D:multistatus xmlns:D=\"DAV:\">\n"
       << propfind_response(target);

  std::error_code ec;
  if(!depth_zero && fs::is_directory(target, ec)) {
    std::vector<fs::path> children;
    for(fs::directory_iterator it(target, fs::directory_options::skip_permission_denied, ec), end;
        !ec && it != end; it.increment(ec)) {
      children.push_back(it->path());
    }
    if(ec) {
      log_warn(logger_.get(), "Listing {} failed: {}", target.string(), ec.message());
    }
    std::sort(children.begin(), children.end());
    for(const auto& child : children) {
      if(!resolve("/" + child.lexically_relative(root_).generic_string())) continue;
      body << propfind_response(child);
    }
  }
  body << "</D:multistatus>\n";

  DavResponse res;
  res.message.result(http::status::multi_status);
  res.message.set(http::field::content_type, "application/xml; charset=utf-8");
  res.message.body() = body.str();
  return res;
}

DavResponse WebDavHandler::handle_get(const DavRequestHeader& request, const fs::path& target, bool head) const {
  {
    std::ifstream readable(target, std::ios::binary);
    if(!readable) return make_text_response(http::status::forbidden, "Permission denied");
  }

  auto size = size_of(target);
  DavResponse res;
  res.message.result(http::status::ok);
  res.message.set(http::field::content_type, media_type_for(target));
  res.message.set(http::field::last_modified, modified_of(target));
  res.message.set(http::field::accept_ranges, "bytes");
  res.file = target;
  res.file_offset = 0;
  res.file_length = size;
  res.file_size = size;
  res.omit_body = head;

  auto range_header = header_value(request, http::field::range);
  if(!range_header.empty()) {
    auto range = parse_range(range_header, size);
    if(range.present && !range.satisfiable) {
      auto err = make_text_response(http::status::range_not_satisfiable, "Requested range not satisfiable");
      err.message.set(http::field::content_range, "bytes */" + std::to_string(size));
      return err;
    }
    if(range.present) {
      res.message.result(http::status::partial_content);
      res.file_offset = range.first;
      res.file_length = range.last - range.first + 1;
      res.message.set(http::field::content_range, "bytes " + std::to_string(range.first) + "-" +
                      std::to_string(range.last) + "/" + std::to_string(size));
    }
  }
  return res;
}

DavResponse WebDavHandler::handle_mkcol(const fs::path& target) const {
  std::error_code ec;
  if(fs::exists(target, ec)) return not_allowed();
  if(!fs::is_directory(target.parent_path(), ec)) {
    return make_text_response(http::status::conflict, "Parent collection does not exist");
  }
  if(!fs::create_directory(target, ec) || ec) {
    log_warn(logger_.get(), "Creating {} failed: {}", target.string(), ec.message());
    return make_text_response(http::status::forbidden, "Unable to create collection");
  }
  log_info(logger_.get(), "Created folder {}", target.lexically_relative(root_).generic_string());
  return make_text_response(http::status::created, "Created");
}

DavResponse WebDavHandler::handle_delete(const fs::path& target) const {
  if(target == root_) return make_text_response(http::status::forbidden, "The share root cannot be deleted");
  std::error_code ec;
  fs::remove_all(target, ec);
  if(ec) {
    log_warn(logger_.get(), "Deleting {} failed: {}", target.string(), ec.message());
    return make_text_response(http::status::forbidden, "Unable to delete");
  }
  log_info(logger_.get(), "Deleted {}", target.lexically_relative(root_).generic_string());
  DavResponse res;
  res.message.result(http::status::no_content);
  return res;
}

std::optional<DavResponse> WebDavHandler::prepare_upload(const DavRequestHeader& request,
                                                         UploadTarget& upload) const {
  auto url_path = request_path(request);
  auto target = resolve(url_path);
  if(!target) {
    log_warn(logger_.get(), "Rejected upload outside share: {}", url_path);
    return make_text_response(http::status::forbidden, "Forbidden");
  }
  std::error_code ec;
  if(fs::is_directory(*target, ec)) return not_allowed();
  if(!fs::is_directory(target->parent_path(), ec)) {
    return make_text_response(http::status::conflict, "Parent collection does not exist");
  }
  upload.destination = *target;
  upload.temp = target->parent_path() / ("." + target->filename().string() + ".upload-" + random_hex(4));
  upload.existed = fs::exists(*target, ec);
  return std::nullopt;
}

DavResponse WebDavHandler::complete_upload(const UploadTarget& upload) const {
  std::error_code ec;
  fs::rename(upload.temp, upload.destination, ec);
  if(ec) {
    log_warn(logger_.get(), "Storing {} failed: {}", upload.destination.string(), ec.message());
    abort_upload(upload);
    return make_text_response(http::status::internal_server_error, "Unable to store file");
  }
  log_info(logger_.get(), "Received {} ({})",
           upload.destination.lexically_relative(root_).generic_string(),
           format_bytes(size_of(upload.destination)));
  if(upload.existed) {
    DavResponse res;
    res.message.result(http::status::no_content);
    return res;
  }
  return make_text_response(http::status::created, "Created");
}

void WebDavHandler::abort_upload(const UploadTarget& upload) const {
  std::error_code ec;
  fs::remove(upload.temp, ec);
  if(ec) log_warn(logger_.get(), "Removing {} failed: {}", upload.temp.string(), ec.message());
}

DavResponse WebDavHandler::directory_index(const std::string& url_path, const fs::path& dir, bool head) const {
  std::vector<std::pair<std::string, bool>> entries;
  std::error_code ec;
  for(fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
      !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    entries.emplace_back(it->path().filename().string(), it->is_directory(type_ec));
  }
  std::sort(entries.begin(), entries.end());

  auto base = url_path;
  if(base.empty() || base.back() != '/') base.push_back('/');

  std::ostringstream html;
  html << "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"><title>Index of "
       << xml_escape(base) << "</title></head><body>\n<h1>Index of " << xml_escape(base) << "</h1>\n<ul>\n";
  if(base != "/") html << "<li><a href=\"../\">../</a></li>\n";
  for(const auto& entry : entries) {
    auto label = entry.first + (entry.second ? "/" : "");
    html << "<li><a href=\"" << xml_escape(url_encode_path(base + label)) << "\">"
         << xml_escape(label) << "</a></li>\n";
  }
  html << "</ul>\n</body></html>\n";

  DavResponse res;
  res.message.result(http::status::ok);
  res.message.set(http::field::content_type, "text/html; charset=utf-8");
  res.message.body() = html.str();
  res.omit_body = head;
  return res;
}
