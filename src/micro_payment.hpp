#pragma once
#include <string>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include "common.hpp"
namespace mpw {

// Payment types the provider knows. Not enforced by the builder.
inline constexpr const char* kPayTypes[] = {"Tip","Pay","Deposit","Donate"};
bool is_known_pay_type(const std::string& pay_type);

using Clock = std::function<int64_t()>;
int64_t system_clock_ms();

/*
 * Micro payment button configuration.
 * Every field is serialized, empty strings included: the provider expects all
 * keys to be present. amount == 0 lets the user enter it at payment time.
 */
struct PaymentRequestConfig {
  // Stamps timestamp from clock; assign it afterwards to override.
  explicit PaymentRequestConfig(const Clock& clock = system_clock_ms);

  std::string sender_user_id;
  std::string sender_user_email;
  std::string sender_user_cellphone;
  std::string receiver_user_id;
  std::string receiver_user_email;
  std::string pay_object_id;       // TPA-scoped id of the paid object
  double      amount = 0;
  int64_t     timestamp;           // ms since epoch
  std::string pay_type;            // "Tip", "Pay", "Deposit" or "Donate"
};

struct WidgetIdentity {
  std::string service_url;  // provider endpoint, e.g. http://host/pay_button/show
  std::string app_id;       // sent in clear
  std::string app_secret;   // raw AES-128 key, never sent
};

// Where pay_type travels. Both variants send it as customization.button_text.
enum class PayloadVariant {
  kEmbeddedPayType,   // also inside the encrypted payload (canonical)
  kDetachedPayType,   // legacy: left out of the encrypted payload
};

enum class WidgetKind { kIframe, kDiv };

nlohmann::ordered_json to_json(const PaymentRequestConfig& config,
                               PayloadVariant variant = PayloadVariant::kEmbeddedPayType);

/*
 * Payment button snippet builder.
 *
 * Builds the provider URL (app_id, encrypted button_request, customization)
 * and wraps it in an iframe or in a div + jQuery loader script. The page the
 * div snippet lands in must provide $(document).ready and .load.
 *
 * Holds no mutable state; one instance may be shared between threads.
 */
class MicroPayment {
public:
  explicit MicroPayment(WidgetIdentity identity,
                        PayloadVariant variant = PayloadVariant::kEmbeddedPayType);

  const WidgetIdentity& identity() const { return identity_; }
  PayloadVariant variant() const { return variant_; }

  std::string build_request(const PaymentRequestConfig& config) const;
  std::string build_url(const PaymentRequestConfig& config) const;
  std::string build_iframe_widget(const PaymentRequestConfig& config) const;
  std::string build_div_widget(const PaymentRequestConfig& config) const;
  std::string build_widget(const PaymentRequestConfig& config, WidgetKind kind) const;

private:
  WidgetIdentity identity_;
  PayloadVariant variant_;
};

}
