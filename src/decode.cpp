/*
 * MicroPayWidget.cpp – Decoder
 * Author: MicroPayWidget.cpp contributors
 * License: MIT
 *
 * Takes a widget URL, a whole HTML snippet, or a bare button_request token,
 * decrypts the payload with MPW_APP_SECRET (AES-128-ECB, PKCS#7) and prints
 * what the provider will see.
 */

#include "common.hpp"
#include "config.hpp"

#include <nlohmann/json.hpp>
#include <cstdio>
#include <string>

using namespace mpw;

// ---------------- Main ----------------
int main(int argc, char** argv){
  if(argc<2){ std::fprintf(stderr,"Usage: MakeDecode <widget_url|html_snippet|button_request>\n"); return 2; }
  try{
    const std::string input=argv[1];

    if(mpw_config::kPrintProgressCounters) std::fprintf(stderr,"STEP #1 parse input ... ");
    std::string token, app_id, customization;
    const std::string query=extract_widget_query(input);
    if(query.empty()){
      token=input;
    }else{
      auto q=parse_query(query);
      token=query_value(q,"button_request");
      for(auto& kv: q){
        if(kv.first=="app_id") app_id=kv.second;
        else if(kv.first=="customization") customization=kv.second;
      }
    }
    if(mpw_config::kPrintProgressCounters) std::fprintf(stderr,"[1]\n");

    if(mpw_config::kPrintProgressCounters) std::fprintf(stderr,"STEP #2 decrypt ... ");
    const std::string secret=mpw_config::env_required(mpw_config::kEnvAppSecret);
    const std::string payload=decrypt(token,secret);
    if(mpw_config::kPrintProgressCounters) std::fprintf(stderr,"[1]\n");

    if(!app_id.empty()) std::printf("app_id: %s\n",app_id.c_str());
    if(!customization.empty()){
      auto c=nlohmann::json::parse(customization,nullptr,false);
      if(c.is_discarded()) std::fprintf(stderr,"Warning: customization is not JSON\n");
      std::printf("customization: %s\n",c.is_discarded()?customization.c_str():c.dump().c_str());
    }
    auto j=nlohmann::ordered_json::parse(payload,nullptr,false);
    if(j.is_discarded()) throw std::runtime_error("decrypted payload is not JSON");
    std::printf("button_request:\n%s\n",j.dump(2).c_str());
    return 0;
  }catch(const std::exception& e){
    std::fprintf(stderr,"Error: %s\n",e.what()); return 1;
  }
}
