#include "serving_session.hpp"
#include "share_errors.hpp"
#include "test_runner_utils.hpp"
#include "transfer_engine.hpp"
#include "utils.hpp"
#include "webdav_client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <thread>
#include <vector>

namespace {

using share::test::TempDir;
using share::test::TestCase;
using share::test::TestContext;
using share::test::read_file;
namespace fs = std::filesystem;

ServiceConfig loopback_config(const fs::path& folder) {
  ServiceConfig config;
  config.shared_folder = folder;
  config.port = 0;
  config.bind_ip = "127.0.0.1";
  config.worker_threads = 2;
  config.chunk_size = 1024;
  return config;
}

CredentialVerifier password_is(std::string expected) {
  return [expected](const std::string&, const std::string& password){ return password == expected; };
}

std::shared_ptr<WebDavClient> client_for(const ServingSession& session) {
  auto client = std::make_shared<WebDavClient>("127.0.0.1", session.bound_port());
  client->set_timeouts(std::chrono::seconds(5), std::chrono::seconds(5));
  return client;
}

struct RawReply {
  int status = 0;
  std::string body;
  std::string content_range;
  std::string allow;
  std::string content_length;
};

// One blocking request on a fresh connection.
RawReply send_request(uint16_t port, http::verb method, const std::string& target,
                      const std::string& body = "",
                      const std::optional<Credentials>& creds = std::nullopt,
                      const std::string& range = "") {
  net::io_context io;
  beast::tcp_stream stream(io);
  stream.connect(net::ip::tcp::endpoint(net::ip::make_address("127.0.0.1"), port));

  http::request<http::string_body> request{method, target, 11};
  request.set(http::field::host, "127.0.0.1:" + std::to_string(port));
  if(creds) {
    request.set(http::field::authorization,
                "Basic " + base64_encode(creds->username + ":" + creds->password));
  }
  if(!range.empty()) request.set(http::field::range, range);
  request.body() = body;
  request.prepare_payload();
  http::write(stream, request);

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.skip(method == http::verb::head);
  http::read(stream, buffer, parser);
  const auto& response = parser.get();

  RawReply reply;
  reply.status = static_cast<int>(response.result_int());
  reply.body = response.body();
  reply.content_range = std::string(response[http::field::content_range]);
  reply.allow = std::string(response[http::field::allow]);
  reply.content_length = std::string(response[http::field::content_length]);
  beast::error_code ignored;
  stream.socket().shutdown(net::ip::tcp::socket::shutdown_both, ignored);
  return reply;
}

std::size_t entry_count(const fs::path& dir) {
  std::size_t count = 0;
  for(auto it = fs::directory_iterator(dir); it != fs::directory_iterator(); ++it) ++count;
  return count;
}

const DirectoryEntry* find_entry(const ListingResult& listing, const std::string& name) {
  for(const auto& entry : listing.entries) {
    if(entry.name == name) return &entry;
  }
  return nullptr;
}

std::string fetch_all(WebDavClient& client, const std::string& path,
                      const std::optional<Credentials>& creds, FetchResult& result,
                      std::size_t chunk_size = 7) {
  std::string body;
  FetchCallbacks callbacks;
  callbacks.on_chunk = [&](const char* data, std::size_t size){
    body.append(data, size);
    return true;
  };
  result = client.fetch_file(path, creds, callbacks, chunk_size);
  return body;
}

bool test_list_and_fetch(TestContext& ctx) {
  TempDir share("serve_list");
  share.write("notes.txt", "remember the milk");
  share.write("Holiday Photos/beach.jpg", std::string(5000, 'b'));

  auto logger = std::make_shared<Logger>("serving");
  ctx.logs.attach(logger);
  ServingSession session(loopback_config(share.path()), logger);
  session.start();
  if(!session.running() || session.bound_port() == 0) return false;

  auto client = client_for(session);
  auto root = client->list_directory("", std::nullopt);
  auto notes = find_entry(root, "notes.txt");
  auto photos = find_entry(root, "Holiday Photos");

  auto nested = client->list_directory("Holiday Photos", std::nullopt);
  auto beach = find_entry(nested, "beach.jpg");

  FetchResult fetched;
  auto body = fetch_all(*client, "notes.txt", std::nullopt, fetched);
  FetchResult big;
  auto big_body = fetch_all(*client, "Holiday Photos/beach.jpg", std::nullopt, big, 512);

  session.stop();
  return root.status == 207 && root.entries.size() == 2 &&
         notes && !notes->is_directory && notes->size_bytes == 17 &&
         photos && photos->is_directory && photos->remote_path == "Holiday Photos" &&
         nested.status == 207 && beach && beach->remote_path == "Holiday Photos/beach.jpg" &&
         fetched.status == 200 && body == "remember the milk" && fetched.bytes == 17 &&
         big.status == 200 && big_body.size() == 5000;
}

bool test_missing_path(TestContext&) {
  TempDir share("serve_missing");
  ServingSession session(loopback_config(share.path()));
  session.start();
  auto client = client_for(session);
  auto listing = client->list_directory("nope", std::nullopt);
  FetchResult fetched;
  fetch_all(*client, "nope.txt", std::nullopt, fetched);
  session.stop();
  return listing.status == 404 && listing.entries.empty() && !listing.error.empty() &&
         fetched.status == 404 && fetched.error.find("404") != std::string::npos;
}

bool test_auth_challenge(TestContext&) {
  TempDir share("serve_auth");
  share.write("secret.txt", "top secret");
  auto config = loopback_config(share.path());
  config.auth_enabled = true;
  config.username = "alice";
  config.credential_verifier = password_is("pw");
  ServingSession session(config);
  session.start();

  auto client = client_for(session);
  auto anonymous = client->list_directory("", std::nullopt);
  auto wrong = client->list_directory("", Credentials{"alice", "nope"});
  auto right = client->list_directory("", Credentials{"alice", "pw"});
  FetchResult denied;
  fetch_all(*client, "secret.txt", std::nullopt, denied);
  FetchResult allowed;
  auto body = fetch_all(*client, "secret.txt", Credentials{"alice", "pw"}, allowed);
  session.stop();

  return anonymous.status == 401 && wrong.status == 401 && right.status == 207 &&
         denied.status == 401 && allowed.status == 200 && body == "top secret";
}

bool test_auth_toggled_live(TestContext&) {
  TempDir share("serve_toggle");
  share.write("a.txt", "a");
  ServingSession session(loopback_config(share.path()));
  session.start();
  auto client = client_for(session);

  bool ok = client->list_directory("", std::nullopt).status == 207 && !session.auth_enabled();
  session.set_auth(true, "bob", password_is("s3cret"));
  ok = ok && session.auth_enabled() &&
       client->list_directory("", std::nullopt).status == 401 &&
       client->list_directory("", Credentials{"bob", "s3cret"}).status == 207;
  session.set_auth(false, "", nullptr);
  ok = ok && client->list_directory("", std::nullopt).status == 207;
  session.stop();
  return ok;
}

bool test_stop_twice(TestContext&) {
  TempDir share("serve_stop");
  ServingSession idle(loopback_config(share.path()));
  idle.stop();

  ServingSession session(loopback_config(share.path()));
  session.start();
  auto port = session.bound_port();
  session.stop();
  session.stop();

  // the port is released
  auto client = std::make_shared<WebDavClient>("127.0.0.1", port);
  client->set_timeouts(std::chrono::seconds(2), std::chrono::seconds(2));
  auto listing = client->list_directory("", std::nullopt);
  return !session.running() && listing.status == 0 && !listing.error.empty();
}

bool test_port_in_use(TestContext&) {
  TempDir share("serve_port");
  ServingSession first(loopback_config(share.path()));
  first.start();
  auto config = loopback_config(share.path());
  config.port = first.bound_port();
  ServingSession second(config);
  bool threw = false;
  try {
    second.start();
  } catch(const ServeError&) {
    threw = true;
  }
  first.stop();
  return threw && !second.running();
}

bool test_unusable_folder(TestContext&) {
  TempDir scratch("serve_folder");
  auto file = scratch.write("plain.txt", "not a folder");
  for(const auto& folder : {scratch.path() / "missing", file}) {
    ServingSession session(loopback_config(folder));
    try {
      session.start();
      return false;
    } catch(const ServeError&) {
    }
  }
  auto config = loopback_config(scratch.path());
  config.bind_ip = "999.1.1.1";
  ServingSession bad_ip(config);
  try {
    bad_ip.start();
  } catch(const ServeError&) {
    return true;
  }
  return false;
}

bool test_path_escape_rejected(TestContext&) {
  TempDir share("serve_escape");
  WebDavHandler handler(share.path());
  http::request<http::empty_body> get{http::verb::get, "/../../etc/passwd", 11};
  auto response = handler.handle(get);

  http::request<http::empty_body> copy{http::verb::copy, "/a.txt", 11};
  auto refused = handler.handle(copy);

  UploadTarget upload;
  http::request<http::empty_body> put{http::verb::put, "/%2e%2e/outside.txt", 11};
  auto put_refusal = handler.prepare_upload(put, upload);
  return !handler.resolve("/../outside") && handler.resolve("/inside.txt") &&
         response.status() == 403 && refused.status() == 405 &&
         std::string(refused.message[http::field::allow]).find("PROPFIND") != std::string::npos &&
         put_refusal && put_refusal->status() == 403 &&
         !fs::exists(share.path().parent_path() / "outside.txt");
}

bool test_write_methods(TestContext& ctx) {
  TempDir share("serve_write");
  auto logger = std::make_shared<Logger>("serving");
  ctx.logs.attach(logger);
  ServingSession session(loopback_config(share.path()), logger);
  session.start();
  auto port = session.bound_port();

  auto options = send_request(port, http::verb::options, "/");
  auto made = send_request(port, http::verb::mkcol, "/inbox");
  auto made_again = send_request(port, http::verb::mkcol, "/inbox");
  auto orphan_dir = send_request(port, http::verb::mkcol, "/missing/deep");

  auto created = send_request(port, http::verb::put, "/inbox/report.txt", "quarterly");
  bool first_content = read_file(share.path() / "inbox" / "report.txt") == "quarterly";
  auto replaced = send_request(port, http::verb::put, "/inbox/report.txt", "v2");
  bool second_content = read_file(share.path() / "inbox" / "report.txt") == "v2";
  // no temp file left beside the upload
  bool clean = entry_count(share.path() / "inbox") == 1;

  auto orphan_file = send_request(port, http::verb::put, "/nowhere/x.txt", "x");
  auto onto_dir = send_request(port, http::verb::put, "/inbox", "x");
  auto escaped = send_request(port, http::verb::put, "/../escape.txt", "x");

  FetchResult fetched;
  auto client = client_for(session);
  auto body = fetch_all(*client, "inbox/report.txt", std::nullopt, fetched);

  auto removed_file = send_request(port, http::verb::delete_, "/inbox/report.txt");
  bool file_gone = !fs::exists(share.path() / "inbox" / "report.txt");
  auto removed_dir = send_request(port, http::verb::delete_, "/inbox");
  auto missing = send_request(port, http::verb::delete_, "/ghost");
  auto root = send_request(port, http::verb::delete_, "/");
  session.stop();

  return options.allow.find("PUT") != std::string::npos &&
         options.allow.find("MKCOL") != std::string::npos &&
         made.status == 201 && made_again.status == 405 && orphan_dir.status == 409 &&
         created.status == 201 && first_content && replaced.status == 204 && second_content && clean &&
         orphan_file.status == 409 && onto_dir.status == 405 && escaped.status == 403 &&
         fetched.status == 200 && body == "v2" &&
         removed_file.status == 204 && file_gone &&
         removed_dir.status == 204 && !fs::exists(share.path() / "inbox") &&
         missing.status == 404 && root.status == 403 && fs::is_directory(share.path());
}

bool test_write_requires_auth(TestContext&) {
  TempDir share("serve_write_auth");
  auto config = loopback_config(share.path());
  config.auth_enabled = true;
  config.username = "alice";
  config.credential_verifier = password_is("pw");
  ServingSession session(config);
  session.start();
  auto port = session.bound_port();

  auto anonymous = send_request(port, http::verb::put, "/drop.txt", "payload");
  bool absent = !fs::exists(share.path() / "drop.txt");
  auto anonymous_mkcol = send_request(port, http::verb::mkcol, "/dir");
  auto allowed = send_request(port, http::verb::put, "/drop.txt", "payload", Credentials{"alice", "pw"});
  session.stop();

  return anonymous.status == 401 && absent && anonymous_mkcol.status == 401 &&
         !fs::exists(share.path() / "dir") &&
         allowed.status == 201 && read_file(share.path() / "drop.txt") == "payload";
}

bool test_auth_without_verifier(TestContext&) {
  TempDir share("serve_no_verifier");
  ServingSession session(loopback_config(share.path()));
  session.set_auth(true, "alice", nullptr);
  try {
    session.start();
  } catch(const ServeError&) {
    return !session.running();
  }
  session.stop();
  return false;
}

bool test_range_and_head(TestContext&) {
  TempDir share("serve_range");
  share.write("letters.txt", "abcdefghij");
  ServingSession session(loopback_config(share.path()));
  session.start();
  auto port = session.bound_port();

  auto middle = send_request(port, http::verb::get, "/letters.txt", "", std::nullopt, "bytes=2-5");
  auto tail = send_request(port, http::verb::get, "/letters.txt", "", std::nullopt, "bytes=-3");
  auto beyond = send_request(port, http::verb::get, "/letters.txt", "", std::nullopt, "bytes=100-");
  auto head = send_request(port, http::verb::head, "/letters.txt");
  session.stop();

  return middle.status == 206 && middle.body == "cdef" && middle.content_range == "bytes 2-5/10" &&
         tail.status == 206 && tail.body == "hij" &&
         beyond.status == 416 &&
         head.status == 200 && head.body.empty() && head.content_length == "10";
}

bool test_connection_dropped_mid_body(TestContext&) {
  net::io_context io;
  net::ip::tcp::acceptor acceptor(io, net::ip::tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
  auto port = acceptor.local_endpoint().port();

  // promises 100 bytes, sends 10, then hangs up
  std::thread server([&](){
    net::ip::tcp::socket socket(io);
    acceptor.accept(socket);
    std::string request;
    beast::error_code ec;
    net::read_until(socket, net::dynamic_buffer(request), "\r\n\r\n", ec);
    std::string reply = "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\n0123456789";
    net::write(socket, net::buffer(reply), ec);
    socket.shutdown(net::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
  });

  WebDavClient client("127.0.0.1", port);
  client.set_timeouts(std::chrono::seconds(5), std::chrono::seconds(5));
  uint64_t announced = 0;
  std::string body;
  FetchCallbacks callbacks;
  callbacks.on_start = [&](uint64_t total){ announced = total; };
  callbacks.on_chunk = [&](const char* data, std::size_t size){
    body.append(data, size);
    return true;
  };
  auto result = client.fetch_file("partial.bin", std::nullopt, callbacks, 64);
  server.join();

  return result.status == 200 && !result.error.empty() && !result.stopped &&
         announced == 100 && body == "0123456789" && result.bytes == 10;
}

bool test_local_urls(TestContext&) {
  TempDir share("serve_urls");
  ServingSession session(loopback_config(share.path()));
  session.start();
  auto urls = session.local_urls();
  auto expected = "http://127.0.0.1:" + std::to_string(session.bound_port()) + "/";
  session.stop();
  return urls.size() == 1 && urls.front() == expected;
}

bool test_transfer_over_loopback(TestContext& ctx) {
  TempDir share("serve_transfer_src");
  TempDir dest("serve_transfer_dst");
  share.write("album/track 1.flac", std::string(3000, '1'));
  share.write("album/extras/cover.png", std::string(700, 'c'));
  share.write("album/notes.txt", "liner notes");

  auto config = loopback_config(share.path());
  config.auth_enabled = true;
  config.username = "alice";
  config.credential_verifier = password_is("pw");
  ServingSession session(config);
  session.start();

  auto logger = std::make_shared<Logger>("transfer");
  ctx.logs.attach(logger);
  TransferConfig transfer_config;
  transfer_config.chunk_size = 1024;
  transfer_config.peer_name = "loopback";
  TransferEngine engine(client_for(session), transfer_config, logger);

  int prompts = 0;
  TransferCallbacks callbacks;
  callbacks.on_auth_required = [&](const std::string&) -> std::optional<Credentials> {
    ++prompts;
    return Credentials{"alice", "pw"};
  };
  TransferTask task;
  task.remote_path = "album";
  task.local_path = dest.path() / "album";
  task.detect_kind = true;
  auto summary = engine.run_batch({task}, callbacks);
  session.stop();

  return prompts == 1 && summary.files_downloaded == 3 && summary.failures.empty() &&
         summary.bytes_downloaded == 3000 + 700 + 11 &&
         read_file(dest.path() / "album" / "track 1.flac") == std::string(3000, '1') &&
         read_file(dest.path() / "album" / "extras" / "cover.png").size() == 700 &&
         read_file(dest.path() / "album" / "notes.txt") == "liner notes";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"list_and_fetch", test_list_and_fetch},
    {"missing_path", test_missing_path},
    {"auth_challenge", test_auth_challenge},
    {"auth_toggled_live", test_auth_toggled_live},
    {"stop_twice", test_stop_twice},
    {"port_in_use", test_port_in_use},
    {"unusable_folder", test_unusable_folder},
    {"path_escape_rejected", test_path_escape_rejected},
    {"write_methods", test_write_methods},
    {"write_requires_auth", test_write_requires_auth},
    {"auth_without_verifier", test_auth_without_verifier},
    {"range_and_head", test_range_and_head},
    {"connection_dropped_mid_body", test_connection_dropped_mid_body},
    {"local_urls", test_local_urls},
    {"transfer_over_loopback", test_transfer_over_loopback}
  };
  return share::test::run_test_cases("serving session", tests, argc, argv);
}
