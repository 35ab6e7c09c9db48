#include "common.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace {

mpw::bytes FromHex(const std::string& hex) {
  mpw::bytes out;
  for (size_t i = 0; i + 1 < hex.size(); i += 2)
    out.push_back(static_cast<uint8_t>((mpw::hexval(hex[i]) << 4) |
                                       mpw::hexval(hex[i + 1])));
  return out;
}

const std::string kKey = "0123456789abcdef";

TEST(Pkcs7Test, PadsEveryLengthToWholeBlocks) {
  for (size_t n = 0; n <= 64; ++n) {
    mpw::bytes in(n, 'x');
    mpw::bytes padded = mpw::pkcs7_pad(in);
    const size_t p = padded.size() - n;
    EXPECT_GE(p, 1u) << "n=" << n;
    EXPECT_LE(p, 16u) << "n=" << n;
    EXPECT_EQ(0u, padded.size() % 16) << "n=" << n;
    for (size_t i = n; i < padded.size(); ++i)
      EXPECT_EQ(p, padded[i]) << "n=" << n;
    EXPECT_EQ(in, mpw::pkcs7_unpad(padded));
  }
}

TEST(Pkcs7Test, AlignedInputGetsFullBlock) {
  mpw::bytes padded = mpw::pkcs7_pad(mpw::bytes(32, 'a'));
  ASSERT_EQ(48u, padded.size());
  EXPECT_EQ(mpw::bytes(16, 16), mpw::bytes(padded.begin() + 32, padded.end()));

  padded = mpw::pkcs7_pad(mpw::bytes());
  EXPECT_EQ(mpw::bytes(16, 16), padded);
}

TEST(Pkcs7Test, UnpadRejectsMalformedPadding) {
  EXPECT_THROW(mpw::pkcs7_unpad(mpw::bytes()), mpw::EncodingError);
  EXPECT_THROW(mpw::pkcs7_unpad(mpw::bytes(15, 1)), mpw::EncodingError);
  EXPECT_THROW(mpw::pkcs7_unpad(mpw::bytes(16, 0)), mpw::EncodingError);
  EXPECT_THROW(mpw::pkcs7_unpad(mpw::bytes(16, 17)), mpw::EncodingError);

  mpw::bytes inconsistent(16, 4);
  inconsistent[13] = 3;
  EXPECT_THROW(mpw::pkcs7_unpad(inconsistent), mpw::EncodingError);
}

TEST(AesEcbTest, KnownAnswers) {
  // SP800-38A F.1.1, ECB-AES128.Encrypt, first two blocks.
  const std::string key = mpw::to_string(FromHex("2b7e151628aed2a6abf7158809cf4f3c"));
  const mpw::bytes plaintext = FromHex(
      "6bc1bee22e409f96e93d7e117393172a"
      "ae2d8a571e03ac9c9eb76fac45af8e51");
  const mpw::bytes ciphertext = FromHex(
      "3ad77bb40d7a3660a89ecaf32466ef97"
      "f5d3d58503b9699de785895a96fdbaaf");

  EXPECT_EQ(ciphertext, mpw::aes128_ecb_encrypt(key, plaintext));
  EXPECT_EQ(plaintext, mpw::aes128_ecb_decrypt(key, ciphertext));
}

TEST(AesEcbTest, BlocksAreIndependent) {
  mpw::bytes out = mpw::aes128_ecb_encrypt(kKey, mpw::bytes(32, 'A'));
  ASSERT_EQ(32u, out.size());
  EXPECT_EQ(mpw::bytes(out.begin(), out.begin() + 16),
            mpw::bytes(out.begin() + 16, out.end()));
}

TEST(AesEcbTest, RejectsPartialBlocks) {
  EXPECT_THROW(mpw::aes128_ecb_encrypt(kKey, mpw::bytes(15, 0)), mpw::EncodingError);
  EXPECT_THROW(mpw::aes128_ecb_decrypt(kKey, mpw::bytes(17, 0)), mpw::EncodingError);
}

TEST(Base64Test, Rfc4648Vectors) {
  EXPECT_EQ("", mpw::b64(mpw::to_bytes("")));
  EXPECT_EQ("Zg==", mpw::b64(mpw::to_bytes("f")));
  EXPECT_EQ("Zm8=", mpw::b64(mpw::to_bytes("fo")));
  EXPECT_EQ("Zm9v", mpw::b64(mpw::to_bytes("foo")));
  EXPECT_EQ("Zm9vYg==", mpw::b64(mpw::to_bytes("foob")));
  EXPECT_EQ("Zm9vYmE=", mpw::b64(mpw::to_bytes("fooba")));
  EXPECT_EQ("Zm9vYmFy", mpw::b64(mpw::to_bytes("foobar")));

  EXPECT_EQ("foobar", mpw::to_string(mpw::b64d("Zm9vYmFy")));
  EXPECT_EQ("fo", mpw::to_string(mpw::b64d("Zm8=")));
  EXPECT_EQ("f", mpw::to_string(mpw::b64d("Zg==")));
}

TEST(Base64Test, DecodeRejectsMalformedInput) {
  EXPECT_THROW(mpw::b64d("Zg="), mpw::EncodingError);
  EXPECT_THROW(mpw::b64d("Z*=="), mpw::EncodingError);
  EXPECT_THROW(mpw::b64d("Zg==Zg=="), mpw::EncodingError);
  EXPECT_THROW(mpw::b64d("Zm9v\nYmFy"), mpw::EncodingError);
}

TEST(Utf8Test, Validation) {
  EXPECT_TRUE(mpw::is_valid_utf8(""));
  EXPECT_TRUE(mpw::is_valid_utf8("plain ascii"));
  EXPECT_TRUE(mpw::is_valid_utf8("caf\xc3\xa9"));
  EXPECT_TRUE(mpw::is_valid_utf8("\xe2\x82\xac"));
  EXPECT_TRUE(mpw::is_valid_utf8("\xf0\x9f\x92\xb0"));

  EXPECT_FALSE(mpw::is_valid_utf8("\xff"));
  EXPECT_FALSE(mpw::is_valid_utf8("caf\xc3"));
  EXPECT_FALSE(mpw::is_valid_utf8("\xc0\xaf"));
  EXPECT_FALSE(mpw::is_valid_utf8("\xed\xa0\x80"));
}

TEST(PayloadCodecTest, RoundTripsEveryLength) {
  for (size_t n = 0; n <= 1000; ++n) {
    std::string payload;
    for (size_t i = 0; i < n; ++i)
      payload.push_back(static_cast<char>('!' + (i * 7 + n) % 90));
    const std::string token = mpw::encrypt(payload, kKey);
    EXPECT_EQ(n + 16 - n % 16, mpw::b64d(token).size()) << "n=" << n;
    EXPECT_EQ(payload, mpw::decrypt(token, kKey)) << "n=" << n;
  }
}

TEST(PayloadCodecTest, IsDeterministic) {
  const std::string payload = "{\"receiver_user_id\":\"r0210\"}";
  EXPECT_EQ(mpw::encrypt(payload, kKey), mpw::encrypt(payload, kKey));
  EXPECT_NE(mpw::encrypt(payload, kKey),
            mpw::encrypt(payload, "fedcba9876543210"));
}

TEST(PayloadCodecTest, PadsOnByteLength) {
  // Eight two-byte characters: 16 bytes, so a whole padding block follows.
  const std::string payload = "\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9";
  const std::string token = mpw::encrypt(payload, kKey);
  EXPECT_EQ(32u, mpw::b64d(token).size());
  EXPECT_EQ(payload, mpw::decrypt(token, kKey));
}

TEST(PayloadCodecTest, EnforcesKeyLength) {
  EXPECT_THROW(mpw::encrypt("x", ""), mpw::InvalidKeyLength);
  EXPECT_THROW(mpw::encrypt("x", "0123456789abcde"), mpw::InvalidKeyLength);
  EXPECT_THROW(mpw::encrypt("x", "0123456789abcdef0"), mpw::InvalidKeyLength);
  EXPECT_THROW(mpw::encrypt("x", "c533a6e606fb62ccb13e8baf8a95cbdc"), mpw::InvalidKeyLength);
  EXPECT_THROW(mpw::decrypt("AAAAAAAAAAAAAAAAAAAAAA==", "short"), mpw::InvalidKeyLength);
}

TEST(PayloadCodecTest, RejectsInvalidUtf8) {
  EXPECT_THROW(mpw::encrypt("bad \xff byte", kKey), mpw::EncodingError);
}

TEST(PayloadCodecTest, DecryptRejectsTruncatedToken) {
  const std::string token = mpw::encrypt("hello", kKey);
  EXPECT_THROW(mpw::decrypt(token.substr(0, token.size() - 4), kKey),
               mpw::EncodingError);
  EXPECT_THROW(mpw::decrypt("not base64!", kKey), mpw::EncodingError);
}

TEST(FormEncodingTest, EncodesReservedCharacters) {
  EXPECT_EQ("a+b%26c%3Dd%2F%C3%A9", mpw::url_encode("a b&c=d/\xc3\xa9"));
  EXPECT_EQ("AZaz09-_.~", mpw::url_encode("AZaz09-_.~"));
  EXPECT_EQ("%2B%2F%3D", mpw::url_encode("+/="));
  EXPECT_EQ("%7B%22button_text%22%3A%22Tip%22%7D",
            mpw::url_encode("{\"button_text\":\"Tip\"}"));
}

TEST(FormEncodingTest, DecodeReversesEncode) {
  const std::string raw = "a b&c=d/\xc3\xa9+%";
  EXPECT_EQ(raw, mpw::url_decode(mpw::url_encode(raw)));
  EXPECT_EQ("x y", mpw::url_decode("x%20y"));
  EXPECT_THROW(mpw::url_decode("%G1"), mpw::EncodingError);
  EXPECT_THROW(mpw::url_decode("abc%4"), mpw::EncodingError);
}

TEST(FormEncodingTest, ParseQueryKeepsOrder) {
  const mpw::query_pairs q = {{"app_id", "b91014cc28c94841"},
                              {"button_request", "ab+/=="},
                              {"customization", "{\"button_text\": \"Tip\"}"}};
  const std::string url = "http://example.com/pay_button/show?" + mpw::form_encode(q);
  EXPECT_EQ(q, mpw::parse_query(url));
  EXPECT_EQ(q, mpw::parse_query(mpw::form_encode(q) + "#frag"));
  EXPECT_EQ("ab+/==", mpw::query_value(q, "button_request"));
  EXPECT_THROW(mpw::query_value(q, "missing"), mpw::EncodingError);
}

TEST(FormEncodingTest, ExtractWidgetQuery) {
  const std::string query = "?app_id=a1&button_request=ab%2B%2F%3D%3D&customization=%7B%7D";
  EXPECT_EQ(query, mpw::extract_widget_query("http://example.com/show" + query));
  EXPECT_EQ(query, mpw::extract_widget_query("<iframe src=\"http://h/show" + query + "\">\n</iframe>"));
  EXPECT_EQ(query, mpw::extract_widget_query("load('http://h/show" + query + "');"));

  // A bare button_request token carries no query.
  EXPECT_EQ("", mpw::extract_widget_query(mpw::encrypt("{}", kKey)));
  EXPECT_EQ("", mpw::extract_widget_query(""));

  // Query string without a leading URL.
  EXPECT_EQ("button_request=xyz", mpw::extract_widget_query("button_request=xyz"));
}

}  // namespace
