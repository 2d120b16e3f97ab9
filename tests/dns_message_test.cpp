#include "dns_message.hpp"
#include "test_runner_utils.hpp"

#include <vector>

namespace {

using share::test::TestCase;
using share::test::TestContext;

DnsMessage decode(const std::vector<uint8_t>& bytes) {
  return decode_dns_message(bytes.data(), bytes.size());
}

bool test_announcement_records(TestContext&) {
  const std::string instance = "LanShare-box._webdav._tcp.local.";
  DnsMessage msg;
  msg.flags = kDnsFlagResponse | kDnsFlagAuthoritative;
  msg.answers.push_back(make_ptr_record("_webdav._tcp.local.", instance, 4500));
  msg.answers.push_back(make_srv_record(instance, "box.local.", 8080, 120));
  msg.answers.push_back(make_txt_record(instance, {{"path", "/"}, {"version", "1.0"}, {"app", "LanShare"}}, 4500));
  msg.additionals.push_back(make_a_record("box.local.", asio::ip::make_address_v4("192.168.1.5"), 120));

  auto parsed = decode(encode_dns_message(msg));
  if(!parsed.is_response() || parsed.answers.size() != 3 || parsed.additionals.size() != 1) return false;

  const auto& ptr = parsed.answers[0];
  const auto& srv = parsed.answers[1];
  const auto& txt = parsed.answers[2];
  const auto& a = parsed.additionals[0];
  return ptr.type == DnsType::PTR && ptr.target == instance && ptr.ttl == 4500 && !ptr.cache_flush &&
         srv.type == DnsType::SRV && srv.port == 8080 && srv.target == "box.local." && srv.cache_flush &&
         txt.type == DnsType::TXT && txt.txt.at("app") == "LanShare" && txt.txt.at("path") == "/" &&
         a.type == DnsType::A && a.address.to_string() == "192.168.1.5";
}

bool test_question_unicast_bit(TestContext&) {
  DnsMessage msg;
  msg.questions.push_back({"_webdav._tcp.local.", DnsType::PTR, true});
  auto parsed = decode(encode_dns_message(msg));
  return !parsed.is_response() && parsed.questions.size() == 1 &&
         parsed.questions[0].unicast_response &&
         parsed.questions[0].type == DnsType::PTR &&
         dns_names_equal(parsed.questions[0].name, "_WebDAV._tcp.local");
}

bool test_compressed_names(TestContext&) {
  // header, question "a.local" at offset 12, answer named by pointer 0xc00c
  std::vector<uint8_t> bytes = {
    0x00, 0x00, 0x84, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00,
    0x01, 'a', 0x05, 'l', 'o', 'c', 'a', 'l', 0x00, 0x00, 0x01, 0x00, 0x01,
    0xc0, 0x0c, 0x00, 0x01, 0x80, 0x01, 0x00, 0x00, 0x00, 0x78, 0x00, 0x04,
    10, 0, 0, 9
  };
  auto parsed = decode(bytes);
  return parsed.answers.size() == 1 &&
         parsed.answers[0].name == "a.local." &&
         parsed.answers[0].cache_flush &&
         parsed.answers[0].ttl == 120 &&
         parsed.answers[0].address.to_string() == "10.0.0.9";
}

bool test_pointer_loop_rejected(TestContext&) {
  std::vector<uint8_t> bytes = {
    0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0xc0, 0x0c, 0x00, 0x0c, 0x00, 0x01
  };
  try {
    decode(bytes);
  } catch(const DnsFormatError&) {
    return true;
  }
  return false;
}

bool test_truncated_rejected(TestContext&) {
  DnsMessage msg;
  msg.answers.push_back(make_a_record("box.local.", asio::ip::make_address_v4("10.0.0.1"), 120));
  auto bytes = encode_dns_message(msg);
  bytes.resize(bytes.size() - 2);
  try {
    decode(bytes);
  } catch(const DnsFormatError&) {
    return true;
  }
  return false;
}

bool test_goodbye_ttl_zero(TestContext&) {
  DnsMessage msg;
  msg.flags = kDnsFlagResponse;
  msg.answers.push_back(make_ptr_record("_webdav._tcp.local.", "LanShare-box._webdav._tcp.local.", 0));
  auto parsed = decode(encode_dns_message(msg));
  return parsed.answers.size() == 1 && parsed.answers[0].ttl == 0;
}

bool test_label_too_long(TestContext&) {
  DnsMessage msg;
  msg.questions.push_back({std::string(64, 'x') + ".local.", DnsType::A, false});
  try {
    encode_dns_message(msg);
  } catch(const DnsFormatError&) {
    return true;
  }
  return false;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"announcement_records", test_announcement_records},
    {"question_unicast_bit", test_question_unicast_bit},
    {"compressed_names", test_compressed_names},
    {"pointer_loop_rejected", test_pointer_loop_rejected},
    {"truncated_rejected", test_truncated_rejected},
    {"goodbye_ttl_zero", test_goodbye_ttl_zero},
    {"label_too_long", test_label_too_long}
  };
  return share::test::run_test_cases("dns message", tests, argc, argv);
}
