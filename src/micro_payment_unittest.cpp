#include "micro_payment.hpp"

#include <limits>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace {

constexpr char kServiceUrl[] = "http://example.com/pay_button/show";
constexpr char kAppId[] = "b91014cc28c94841";
// The sample 32-character app secret truncated to the 16-byte AES-128 key.
const std::string kAppSecret =
    std::string("c533a6e606fb62ccb13e8baf8a95cbdc").substr(0, mpw::kKeySize);
constexpr int64_t kTimestamp = 1410973639125;

mpw::PaymentRequestConfig TipConfig() {
  mpw::PaymentRequestConfig c([] { return kTimestamp; });
  c.sender_user_email = "sender@example.com";
  c.sender_user_cellphone = "+5491112341234";
  c.receiver_user_id = "r0210";
  c.receiver_user_email = "receiver@example.com";
  c.pay_object_id = "to0210";
  c.amount = 0.01;
  c.pay_type = "Tip";
  return c;
}

size_t CountOccurrences(const std::string& haystack, const std::string& needle) {
  size_t count = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + 1))
    ++count;
  return count;
}

class MicroPaymentTest : public testing::Test {
 protected:
  MicroPaymentTest() : builder_({kServiceUrl, kAppId, kAppSecret}) {}

  // Checks the query carried by |url| and returns the decrypted payload.
  nlohmann::json CheckUrl(const std::string& url, const std::string& pay_type) {
    EXPECT_EQ(0u, url.find(std::string(kServiceUrl) + "?"));
    mpw::query_pairs q = mpw::parse_query(url);
    EXPECT_EQ(3u, q.size());
    EXPECT_EQ(kAppId, mpw::query_value(q, "app_id"));
    const std::string token = mpw::query_value(q, "button_request");
    EXPECT_FALSE(token.empty());
    EXPECT_EQ(nlohmann::json({{"button_text", pay_type}}),
              nlohmann::json::parse(mpw::query_value(q, "customization")));
    return nlohmann::json::parse(mpw::decrypt(token, kAppSecret));
  }

  mpw::MicroPayment builder_;
};

TEST(PaymentRequestConfigTest, ConstructionReadsInjectedClock) {
  int calls = 0;
  mpw::PaymentRequestConfig c([&calls] {
    ++calls;
    return kTimestamp;
  });
  EXPECT_EQ(1, calls);
  EXPECT_EQ(kTimestamp, c.timestamp);
  EXPECT_TRUE(c.receiver_user_id.empty());
  EXPECT_EQ(0, c.amount);

  c.receiver_user_id = "r0210";
  nlohmann::ordered_json j = mpw::to_json(c);
  EXPECT_EQ(kTimestamp, j["timestamp"].get<int64_t>());
}

TEST(PaymentRequestConfigTest, DefaultConstructionUsesSystemClock) {
  const int64_t before = mpw::system_clock_ms();
  mpw::PaymentRequestConfig c;
  const int64_t after = mpw::system_clock_ms();
  EXPECT_LE(before, c.timestamp);
  EXPECT_GE(after, c.timestamp);
  EXPECT_GT(c.timestamp, 0);

  mpw::MicroPayment builder({kServiceUrl, kAppId, kAppSecret});
  nlohmann::json payload =
      nlohmann::json::parse(mpw::decrypt(builder.build_request(c), kAppSecret));
  EXPECT_EQ(c.timestamp, payload["timestamp"].get<int64_t>());
}

TEST(PaymentRequestConfigTest, SampleKeyIsAes128Sized) {
  EXPECT_EQ(mpw::kKeySize, kAppSecret.size());
  EXPECT_EQ(0u, kAppSecret.find("c533a6e606fb62c"));
}

TEST(PaymentRequestConfigTest, KnownPayTypes) {
  EXPECT_TRUE(mpw::is_known_pay_type("Tip"));
  EXPECT_TRUE(mpw::is_known_pay_type("Pay"));
  EXPECT_TRUE(mpw::is_known_pay_type("Deposit"));
  EXPECT_TRUE(mpw::is_known_pay_type("Donate"));
  EXPECT_FALSE(mpw::is_known_pay_type("tip"));
  EXPECT_FALSE(mpw::is_known_pay_type(""));
}

TEST(PaymentRequestConfigTest, SerializesEveryFieldInOrder) {
  mpw::PaymentRequestConfig c;
  c.receiver_user_id = "r1";
  c.pay_type = "Donate";
  nlohmann::ordered_json j = mpw::to_json(c);

  std::vector<std::string> keys;
  for (auto it = j.begin(); it != j.end(); ++it)
    keys.push_back(it.key());
  const std::vector<std::string> expected = {
      "sender_user_id", "sender_user_email", "sender_user_cellphone",
      "receiver_user_id", "receiver_user_email", "pay_object_id",
      "amount", "timestamp", "pay_type"};
  EXPECT_EQ(expected, keys);
  EXPECT_EQ("", j["sender_user_email"]);
  EXPECT_EQ("r1", j["receiver_user_id"]);
  EXPECT_EQ("Donate", j["pay_type"]);
}

TEST(PaymentRequestConfigTest, DetachedVariantLeavesOutPayType) {
  mpw::PaymentRequestConfig c;
  c.pay_type = "Tip";
  nlohmann::ordered_json j =
      mpw::to_json(c, mpw::PayloadVariant::kDetachedPayType);
  EXPECT_FALSE(j.contains("pay_type"));
  EXPECT_EQ(8u, j.size());
}

TEST_F(MicroPaymentTest, IframeWidgetEndToEnd) {
  const mpw::PaymentRequestConfig config = TipConfig();
  const std::string url = builder_.build_url(config);
  const std::string html = builder_.build_iframe_widget(config);

  EXPECT_NE(std::string::npos, html.find("<iframe id=\"tipButtonFrame\""));
  EXPECT_NE(std::string::npos, html.find("src=\"" + url + "\""));
  EXPECT_EQ(1u, CountOccurrences(html, url));
  EXPECT_EQ("\n<iframe id=\"tipButtonFrame\" scrolling=\"no\" frameborder=\"0\"\n"
            "    style=\"border:none; overflow:hidden; height:22px;\"\n"
            "    allowTransparency=\"true\" src=\"" + url + "\">\n"
            "</iframe>\n",
            html);

  nlohmann::json payload = CheckUrl(url, "Tip");
  EXPECT_EQ("r0210", payload["receiver_user_id"]);
  EXPECT_EQ("to0210", payload["pay_object_id"]);
  EXPECT_EQ("sender@example.com", payload["sender_user_email"]);
  EXPECT_EQ("", payload["sender_user_id"]);
  EXPECT_DOUBLE_EQ(0.01, payload["amount"].get<double>());
  EXPECT_EQ(kTimestamp, payload["timestamp"].get<int64_t>());
  EXPECT_EQ("Tip", payload["pay_type"]);
}

TEST_F(MicroPaymentTest, DivWidget) {
  mpw::PaymentRequestConfig config = TipConfig();
  config.pay_type = "Donate";
  const std::string url = builder_.build_url(config);
  const std::string html = builder_.build_div_widget(config);

  EXPECT_EQ("\n<div id=\"tipButtonDiv\" class=\"tipButtonDiv\"></div>\n"
            "<div id=\"tipButtonPopup\" class=\"tipButtonPopup\"></div>\n"
            "<script>\n"
            "    $(document).ready(function() {\n"
            "        $(\"#tipButtonDiv\").load(\"" + url + "\");\n"
            "    });\n"
            "</script>\n",
            html);
  EXPECT_EQ(1u, CountOccurrences(html, url));

  nlohmann::json payload = CheckUrl(url, "Donate");
  EXPECT_EQ("Donate", payload["pay_type"]);
}

TEST_F(MicroPaymentTest, BuildWidgetDispatchesOnKind) {
  const mpw::PaymentRequestConfig config = TipConfig();
  EXPECT_EQ(builder_.build_iframe_widget(config),
            builder_.build_widget(config, mpw::WidgetKind::kIframe));
  EXPECT_EQ(builder_.build_div_widget(config),
            builder_.build_widget(config, mpw::WidgetKind::kDiv));
}

TEST_F(MicroPaymentTest, SameConfigSameOutput) {
  const mpw::PaymentRequestConfig config = TipConfig();
  EXPECT_EQ(builder_.build_iframe_widget(config),
            builder_.build_iframe_widget(config));
  EXPECT_EQ(builder_.build_div_widget(config),
            builder_.build_div_widget(config));

  mpw::PaymentRequestConfig later = config;
  later.timestamp += 1;
  EXPECT_NE(builder_.build_request(config), builder_.build_request(later));
}

TEST_F(MicroPaymentTest, RequestDecryptsToSerializedConfig) {
  const mpw::PaymentRequestConfig config = TipConfig();
  EXPECT_EQ(mpw::to_json(config).dump(),
            mpw::decrypt(builder_.build_request(config), kAppSecret));
}

TEST_F(MicroPaymentTest, DetachedVariantSendsPayTypeOnlyInCustomization) {
  mpw::MicroPayment legacy({kServiceUrl, kAppId, kAppSecret},
                           mpw::PayloadVariant::kDetachedPayType);
  EXPECT_EQ(mpw::PayloadVariant::kDetachedPayType, legacy.variant());

  nlohmann::json payload = CheckUrl(legacy.build_url(TipConfig()), "Tip");
  EXPECT_FALSE(payload.contains("pay_type"));
  EXPECT_EQ("r0210", payload["receiver_user_id"]);
}

TEST_F(MicroPaymentTest, UnknownPayTypeIsPassedThrough) {
  mpw::PaymentRequestConfig config = TipConfig();
  config.pay_type = "Buy me a coffee & cake";
  nlohmann::json payload = CheckUrl(builder_.build_url(config), config.pay_type);
  EXPECT_EQ(config.pay_type, payload["pay_type"]);
}

TEST_F(MicroPaymentTest, WidgetQueryIsRecoveredFromEveryOutput) {
  const mpw::PaymentRequestConfig config = TipConfig();
  const std::string url = builder_.build_url(config);
  const std::string query = url.substr(url.find('?'));

  EXPECT_EQ(query, mpw::extract_widget_query(url));
  EXPECT_EQ(query, mpw::extract_widget_query(builder_.build_iframe_widget(config)));
  EXPECT_EQ(query, mpw::extract_widget_query(builder_.build_div_widget(config)));

  nlohmann::json payload = CheckUrl(
      kServiceUrl + mpw::extract_widget_query(builder_.build_div_widget(config)),
      "Tip");
  EXPECT_EQ("r0210", payload["receiver_user_id"]);

  const std::string token = builder_.build_request(config);
  EXPECT_EQ("", mpw::extract_widget_query(token));
  EXPECT_EQ(mpw::to_json(config).dump(), mpw::decrypt(token, kAppSecret));
}

TEST(MicroPaymentErrorTest, BadSecretFailsEveryBuild) {
  mpw::MicroPayment builder({kServiceUrl, kAppId, "c533a6e606fb62c"});
  const mpw::PaymentRequestConfig config = TipConfig();
  EXPECT_THROW(builder.build_url(config), mpw::InvalidKeyLength);
  EXPECT_THROW(builder.build_iframe_widget(config), mpw::InvalidKeyLength);
  EXPECT_THROW(builder.build_div_widget(config), mpw::InvalidKeyLength);
}

TEST(MicroPaymentErrorTest, UnserializableConfig) {
  mpw::MicroPayment builder({kServiceUrl, kAppId, kAppSecret});
  mpw::PaymentRequestConfig config = TipConfig();
  config.receiver_user_email = "bad \xff byte";
  EXPECT_THROW(builder.build_iframe_widget(config), mpw::SerializationError);

  config = TipConfig();
  config.amount = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(builder.build_div_widget(config), mpw::SerializationError);
}

}  // namespace
