#include "nrt_predict/core/errors.hpp"
#include "nrt_predict/core/utils.hpp"
#include "nrt_predict/model/model_resolver.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cctype>
#include <sstream>
#include <string>
#include <vector>

using nrt_predict::IntegrityError;
using nrt_predict::core::sha256_bytes;
using nrt_predict::core::sha256_stream;
using nrt_predict::model::verify_checksum;

namespace {

const std::string kAbcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const std::string kEmptyDigest = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

std::vector<uint8_t> bytes_of(const std::string& s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST_CASE("sha256_known_digests") {
  REQUIRE(sha256_bytes(bytes_of("abc")) == kAbcDigest);
  REQUIRE(sha256_bytes({}) == kEmptyDigest);
}

TEST_CASE("sha256_stream_matches_whole_buffer_for_any_block_size") {
  std::string data;
  for (int i = 0; i < 200000; ++i) {
    data.push_back(static_cast<char>(i % 251));
  }
  const std::string expected = sha256_bytes(bytes_of(data));

  std::istringstream a(data);
  REQUIRE(sha256_stream(a) == expected);

  std::istringstream b(data);
  REQUIRE(sha256_stream(b, 7) == expected);
}

TEST_CASE("verify_checksum_accepts_exact_digest") {
  REQUIRE(verify_checksum(bytes_of("abc"), kAbcDigest) == kAbcDigest);
}

TEST_CASE("verify_checksum_rejects_single_character_change") {
  std::string wrong = kAbcDigest;
  wrong.back() = (wrong.back() == 'd') ? 'e' : 'd';

  try {
    verify_checksum(bytes_of("abc"), wrong);
    FAIL("expected IntegrityError");
  } catch (const IntegrityError& e) {
    REQUIRE(e.expected() == wrong);
    REQUIRE(e.actual() == kAbcDigest);
  }
}

TEST_CASE("verify_checksum_is_case_sensitive") {
  std::string upper = kAbcDigest;
  for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  REQUIRE_THROWS_AS(verify_checksum(bytes_of("abc"), upper), IntegrityError);
}
