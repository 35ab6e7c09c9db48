/*
 * MicroPayWidget.cpp – Widget builder
 * Author: MicroPayWidget.cpp contributors
 * License: MIT
 *
 * config -> JSON -> encrypt -> query string -> HTML snippet.
 */

#include "micro_payment.hpp"
#include "config.hpp"

#include <chrono>
#include <cmath>
#include <utility>

namespace mpw {

bool is_known_pay_type(const std::string& pay_type){
  for(const char* t: kPayTypes) if(pay_type==t) return true;
  return false;
}

int64_t system_clock_ms(){
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

PaymentRequestConfig::PaymentRequestConfig(const Clock& clock)
  : timestamp(clock()) {}

// ---------------- Serialization ----------------
nlohmann::ordered_json to_json(const PaymentRequestConfig& c, PayloadVariant variant){
  if(!std::isfinite(c.amount)) throw SerializationError("amount must be a finite number");
  nlohmann::ordered_json j;
  j["sender_user_id"]        = c.sender_user_id;
  j["sender_user_email"]     = c.sender_user_email;
  j["sender_user_cellphone"] = c.sender_user_cellphone;
  j["receiver_user_id"]      = c.receiver_user_id;
  j["receiver_user_email"]   = c.receiver_user_email;
  j["pay_object_id"]         = c.pay_object_id;
  j["amount"]                = c.amount;
  j["timestamp"]             = c.timestamp;
  if(variant==PayloadVariant::kEmbeddedPayType)
    j["pay_type"]            = c.pay_type;
  return j;
}

// nlohmann reports strings that are not UTF-8 as type_error 316 at dump().
static std::string dump(const nlohmann::ordered_json& j){
  try{
    return j.dump();
  }catch(const nlohmann::json::exception& e){
    throw SerializationError(std::string("cannot serialize widget config: ")+e.what());
  }
}

// ---------------- Builder ----------------
MicroPayment::MicroPayment(WidgetIdentity identity, PayloadVariant variant)
  : identity_(std::move(identity)), variant_(variant) {}

std::string MicroPayment::build_request(const PaymentRequestConfig& config) const {
  return encrypt(dump(to_json(config,variant_)),identity_.app_secret);
}

std::string MicroPayment::build_url(const PaymentRequestConfig& config) const {
  nlohmann::ordered_json customization;
  customization["button_text"]=config.pay_type;

  query_pairs query{
    {"app_id",         identity_.app_id},
    {"button_request", build_request(config)},
    {"customization",  dump(customization)},
  };
  return identity_.service_url+"?"+form_encode(query);
}

std::string MicroPayment::build_iframe_widget(const PaymentRequestConfig& config) const {
  const std::string url=build_url(config);
  return "\n"
         "<iframe id=\"tipButtonFrame\" scrolling=\"no\" frameborder=\"0\"\n"
         "    style=\"border:none; overflow:hidden; height:"+std::to_string(mpw_config::kIframeHeightPx)+"px;\"\n"
         "    allowTransparency=\"true\" src=\""+url+"\">\n"
         "</iframe>\n";
}

std::string MicroPayment::build_div_widget(const PaymentRequestConfig& config) const {
  const std::string url=build_url(config);
  return "\n"
         "<div id=\"tipButtonDiv\" class=\"tipButtonDiv\"></div>\n"
         "<div id=\"tipButtonPopup\" class=\"tipButtonPopup\"></div>\n"
         "<script>\n"
         "    $(document).ready(function() {\n"
         "        $(\"#tipButtonDiv\").load(\""+url+"\");\n"
         "    });\n"
         "</script>\n";
}

std::string MicroPayment::build_widget(const PaymentRequestConfig& config, WidgetKind kind) const {
  switch(kind){
    case WidgetKind::kIframe: return build_iframe_widget(config);
    case WidgetKind::kDiv:    return build_div_widget(config);
  }
  throw Error("unknown widget kind");
}

}
