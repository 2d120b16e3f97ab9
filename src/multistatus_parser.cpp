#include "multistatus_parser.hpp"
#include "share_errors.hpp"
#include "utils.hpp"

#include <expat.h>

#include <memory>
#include <type_traits>

namespace {

struct PropValues {
  std::string displayname;
  std::string content_length;
  std::string last_modified;
  std::string content_type;
  bool collection = false;
  std::string status;
};

struct ParseState {
  std::vector<std::string> stack;   // local element names
  std::string text;

  bool in_response = false;
  std::string href;
  PropValues current;               // propstat being read
  PropValues accepted;              // merged propstats with a 2xx status

  std::vector<std::pair<std::string, PropValues>> responses;
};

// expat reports "DAV: href" when a namespace separator of ' ' is set.
std::string local_name(const XML_Char* name) {
  std::string full(name);
  auto sep = full.rfind(' ');
  return sep == std::string::npos ? full : full.substr(sep + 1);
}

bool status_ok(const std::string& status) {
  // "HTTP/1.1 200 OK"
  auto sp = status.find(' ');
  if(sp == std::string::npos) return true;
  return status.compare(sp + 1, 1, "2") == 0;
}

void merge(PropValues& into, const PropValues& from) {
  if(!from.displayname.empty()) into.displayname = from.displayname;
  if(!from.content_length.empty()) into.content_length = from.content_length;
  if(!from.last_modified.empty()) into.last_modified = from.last_modified;
  if(!from.content_type.empty()) into.content_type = from.content_type;
  if(from.collection) into.collection = true;
}

void XMLCALL on_start(void* user, const XML_Char* name, const XML_Char**) {
  auto* st = static_cast<ParseState*>(user);
  auto local = local_name(name);
  st->stack.push_back(local);
  st->text.clear();
  if(local == "response") {
    st->in_response = true;
    st->href.clear();
    st->accepted = PropValues{};
  } else if(local == "propstat") {
    st->current = PropValues{};
  } else if(local == "collection" && st->stack.size() >= 2 &&
            st->stack[st->stack.size() - 2] == "resourcetype") {
    st->current.collection = true;
  }
}

void XMLCALL on_end(void* user, const XML_Char* name) {
  auto* st = static_cast<ParseState*>(user);
  auto local = local_name(name);
  auto text = trim_copy(st->text);
  st->text.clear();
  if(!st->stack.empty()) st->stack.pop_back();
  if(!st->in_response) return;

  if(local == "href" && st->href.empty()) {
    st->href = text;
  } else if(local == "displayname") {
    st->current.displayname = text;
  } else if(local == "getcontentlength") {
    st->current.content_length = text;
  } else if(local == "getlastmodified") {
    st->current.last_modified = text;
  } else if(local == "getcontenttype") {
    st->current.content_type = text;
  } else if(local == "status") {
    st->current.status = text;
  } else if(local == "propstat") {
    if(status_ok(st->current.status)) merge(st->accepted, st->current);
  } else if(local == "response") {
    st->in_response = false;
    if(!st->href.empty()) st->responses.emplace_back(st->href, st->accepted);
  }
}

void XMLCALL on_text(void* user, const XML_Char* s, int len) {
  auto* st = static_cast<ParseState*>(user);
  st->text.append(s, static_cast<std::size_t>(len));
}

struct ParserDeleter {
  void operator()(XML_Parser p) const { XML_ParserFree(p); }
};

} // namespace

std::string remote_path_from_href(const std::string& href) {
  std::string path = trim_copy(href);
  auto scheme = path.find("://");
  if(scheme != std::string::npos) {
    auto slash = path.find('/', scheme + 3);
    path = slash == std::string::npos ? std::string() : path.substr(slash);
  }
  auto query = path.find_first_of("?#");
  if(query != std::string::npos) path.erase(query);
  return normalize_remote_path(url_decode(path));
}

std::vector<DirectoryEntry> parse_multistatus(const std::string& xml,
                                              const std::string& requested_path) {
  std::unique_ptr<std::remove_pointer_t<XML_Parser>, ParserDeleter> parser(XML_ParserCreateNS(nullptr, ' '));
  if(!parser) {
    throw ListingError(requested_path, "unable to allocate XML parser");
  }
  ParseState state;
  XML_SetUserData(parser.get(), &state);
  XML_SetElementHandler(parser.get(), on_start, on_end);
  XML_SetCharacterDataHandler(parser.get(), on_text);

  if(XML_Parse(parser.get(), xml.data(), static_cast<int>(xml.size()), 1) == XML_STATUS_ERROR) {
    throw ListingError(requested_path,
                       std::string("malformed listing: ") +
                       XML_ErrorString(XML_GetErrorCode(parser.get())) +
                       " at line " + std::to_string(XML_GetCurrentLineNumber(parser.get())));
  }

  const auto self = normalize_remote_path(requested_path);
  std::vector<DirectoryEntry> entries;
  for(const auto& [href, props] : state.responses) {
    auto path = remote_path_from_href(href);
    if(path == self) continue;

    DirectoryEntry entry;
    entry.remote_path = path;
    entry.name = props.displayname.empty() ? remote_basename(path) : props.displayname;
    entry.is_directory = props.collection;
    if(!entry.is_directory && !props.content_length.empty()) {
      try {
        entry.size_bytes = std::stoull(props.content_length);
      } catch(const std::exception&) {
        entry.size_bytes = 0;
      }
    }
    entry.modified_at = props.last_modified;
    entry.media_type = entry.is_directory ? std::string() : props.content_type;
    entries.push_back(std::move(entry));
  }
  return entries;
}
