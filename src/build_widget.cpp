/*
 * MicroPayWidget.cpp – Widget builder tool
 * Author: MicroPayWidget.cpp contributors
 * License: MIT
 *
 * Builds a payment button snippet (iframe or div) or the bare provider URL
 * from field=value arguments and prints it on stdout.
 *
 * Credentials come from MPW_APP_ID / MPW_APP_SECRET, the endpoint from
 * MPW_SERVICE_URL (falls back to the compiled default).
 */

#include "common.hpp"
#include "config.hpp"
#include "micro_payment.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

using namespace mpw;

// ---------------- Arguments ----------------
static double parse_amount(const std::string& v){
  size_t used=0; double d=std::stod(v,&used);
  if(used!=v.size()) throw std::runtime_error("amount is not a number: "+v);
  return d;
}

static void apply_field(PaymentRequestConfig& c, PayloadVariant& variant, const std::string& arg){
  const size_t eq=arg.find('=');
  if(eq==std::string::npos) throw std::runtime_error("expected field=value, got: "+arg);
  const std::string k=arg.substr(0,eq), v=arg.substr(eq+1);
  if(k=="sender_user_id") c.sender_user_id=v;
  else if(k=="sender_user_email") c.sender_user_email=v;
  else if(k=="sender_user_cellphone") c.sender_user_cellphone=v;
  else if(k=="receiver_user_id") c.receiver_user_id=v;
  else if(k=="receiver_user_email") c.receiver_user_email=v;
  else if(k=="pay_object_id") c.pay_object_id=v;
  else if(k=="amount") c.amount=parse_amount(v);
  else if(k=="timestamp") c.timestamp=std::stoll(v);
  else if(k=="pay_type") c.pay_type=v;
  else if(k=="variant"){
    if(v=="embedded") variant=PayloadVariant::kEmbeddedPayType;
    else if(v=="detached") variant=PayloadVariant::kDetachedPayType;
    else throw std::runtime_error("variant must be embedded or detached");
  }
  else throw std::runtime_error("unknown field: "+k);
}

// ---------------- Main ----------------
int main(int argc,char** argv){
  if(argc<2){
    std::fprintf(stderr,"Usage: MakeWidget <iframe|div|url> [field=value ...]\n"
                        "  fields: sender_user_id sender_user_email sender_user_cellphone\n"
                        "          receiver_user_id receiver_user_email pay_object_id\n"
                        "          amount timestamp pay_type variant=<embedded|detached>\n");
    return 2;
  }
  try{
    const std::string mode=argv[1];
    if(mode!="iframe" && mode!="div" && mode!="url") throw std::runtime_error("unknown widget kind: "+mode);

    // 1) Identity
    if(mpw_config::kPrintProgressCounters) std::fprintf(stderr,"STEP #1 identity ... ");
    WidgetIdentity id{ mpw_config::env_or(mpw_config::kEnvServiceUrl,mpw_config::kDefaultServiceUrl),
                       mpw_config::env_required(mpw_config::kEnvAppId),
                       mpw_config::env_required(mpw_config::kEnvAppSecret) };
    if(id.app_secret.size()!=kKeySize) throw InvalidKeyLength(id.app_secret.size());
    if(mpw_config::kPrintProgressCounters) std::fprintf(stderr,"[1]\n");

    // 2) Config
    if(mpw_config::kPrintProgressCounters) std::fprintf(stderr,"STEP #2 config ... ");
    PaymentRequestConfig cfg;
    PayloadVariant variant=PayloadVariant::kEmbeddedPayType;
    for(int i=2;i<argc;i++) apply_field(cfg,variant,argv[i]);
    if(mpw_config::kPrintProgressCounters) std::fprintf(stderr,"[1]\n");
    if(cfg.receiver_user_id.empty()) std::fprintf(stderr,"Warning: receiver_user_id is empty\n");
    if(!is_known_pay_type(cfg.pay_type))
      std::fprintf(stderr,"Warning: pay_type '%s' is not one of Tip, Pay, Deposit, Donate\n",cfg.pay_type.c_str());

    // 3) Build
    if(mpw_config::kPrintProgressCounters) std::fprintf(stderr,"STEP #3 encrypt & build ... ");
    MicroPayment builder(id,variant);
    std::string out;
    if(mode=="url") out=builder.build_url(cfg);
    else out=builder.build_widget(cfg, mode=="iframe"?WidgetKind::kIframe:WidgetKind::kDiv);
    if(mpw_config::kPrintProgressCounters) std::fprintf(stderr,"[1]\n");

    std::fputs(out.c_str(),stdout);
    if(mode=="url") std::fputs("\n",stdout);
    return 0;
  }catch(const std::exception& e){
    std::fprintf(stderr,"Error: %s\n",e.what()); return 1;
  }
}
