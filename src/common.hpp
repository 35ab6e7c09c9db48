#pragma once
#include <string>
#include <vector>
#include <utility>
#include <memory>
#include <cstdint>
#include <cstddef>
#include <stdexcept>
#include <openssl/evp.h>
namespace mpw {
using bytes = std::vector<uint8_t>;
using query_pairs = std::vector<std::pair<std::string,std::string>>;

inline constexpr size_t kBlockSize = 16; // AES block, also the PKCS#7 block
inline constexpr size_t kKeySize   = 16; // AES-128

// ---------------- Errors ----------------
struct Error : std::runtime_error { using std::runtime_error::runtime_error; };
struct InvalidKeyLength : Error { explicit InvalidKeyLength(size_t got)
  : Error("invalid key length: got "+std::to_string(got)+" bytes, AES-128 needs "+std::to_string(kKeySize)) {} };
struct SerializationError : Error { using Error::Error; };
struct EncodingError : Error { using Error::Error; };

inline bytes to_bytes(const std::string& s){ return bytes(s.begin(),s.end()); }
inline std::string to_string(const bytes& b){ return std::string(b.begin(),b.end()); }

// ---------------- PKCS#7 ----------------
// Always appends 1..k bytes; an aligned input gets a whole block of k.
inline bytes pkcs7_pad(const bytes& in, size_t k=kBlockSize){
  const uint8_t p=(uint8_t)(k-(in.size()%k)); bytes o(in); o.insert(o.end(),p,p); return o; }
inline bytes pkcs7_unpad(const bytes& in, size_t k=kBlockSize){
  if(in.empty()||in.size()%k) throw EncodingError("padded data is not a whole number of blocks");
  const uint8_t p=in.back(); if(p==0||p>k) throw EncodingError("bad PKCS#7 padding value");
  for(size_t i=in.size()-p;i<in.size();++i) if(in[i]!=p) throw EncodingError("bad PKCS#7 padding bytes");
  return bytes(in.begin(),in.end()-p); }

// ---------------- AES-128-ECB ----------------
struct CipherCtxFree { void operator()(EVP_CIPHER_CTX* c) const { EVP_CIPHER_CTX_free(c); } };
using cipher_ctx = std::unique_ptr<EVP_CIPHER_CTX,CipherCtxFree>;

// Raw ECB pass, no padding: every 16-byte block is transformed on its own.
inline bytes aes128_ecb(const std::string& key, const bytes& in, bool encrypt){
  if(key.size()!=kKeySize) throw InvalidKeyLength(key.size());
  if(in.size()%kBlockSize) throw EncodingError("cipher input is not a whole number of blocks");
  cipher_ctx ctx(EVP_CIPHER_CTX_new()); if(!ctx) throw Error("EVP_CIPHER_CTX_new failed");
  if(1!=EVP_CipherInit_ex(ctx.get(),EVP_aes_128_ecb(),nullptr,
                          reinterpret_cast<const unsigned char*>(key.data()),nullptr,encrypt?1:0))
    throw Error("EVP_CipherInit_ex failed");
  if(1!=EVP_CIPHER_CTX_set_padding(ctx.get(),0)) throw Error("EVP_CIPHER_CTX_set_padding failed");
  bytes out(in.size()+kBlockSize); int outl=0, fin=0;
  if(!in.empty() && 1!=EVP_CipherUpdate(ctx.get(),out.data(),&outl,in.data(),(int)in.size()))
    throw Error("EVP_CipherUpdate failed");
  if(1!=EVP_CipherFinal_ex(ctx.get(),out.data()+outl,&fin)) throw Error("EVP_CipherFinal_ex failed");
  out.resize((size_t)outl+fin); return out; }
inline bytes aes128_ecb_encrypt(const std::string& key, const bytes& in){ return aes128_ecb(key,in,true); }
inline bytes aes128_ecb_decrypt(const std::string& key, const bytes& in){ return aes128_ecb(key,in,false); }

// ---------------- Base64 ----------------
inline std::string b64(const bytes& in){ static const char* t="ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string o; o.reserve(((in.size()+2)/3)*4); size_t i=0; while(i+3<=in.size()){ uint32_t v=(in[i]<<16)|(in[i+1]<<8)|in[i+2]; i+=3;
    o.push_back(t[(v>>18)&63]); o.push_back(t[(v>>12)&63]); o.push_back(t[(v>>6)&63]); o.push_back(t[v&63]); }
  if(i+1==in.size()){ uint32_t v=(in[i]<<16); o.push_back(t[(v>>18)&63]); o.push_back(t[(v>>12)&63]); o.push_back('='); o.push_back('='); }
  else if(i+2==in.size()){ uint32_t v=(in[i]<<16)|(in[i+1]<<8); o.push_back(t[(v>>18)&63]); o.push_back(t[(v>>12)&63]); o.push_back(t[(v>>6)&63]); o.push_back('='); }
  return o; }
// Strict: no whitespace, '=' only as trailing padding.
inline bytes b64d(const std::string& s){
  if(s.size()%4) throw EncodingError("base64 length is not a multiple of 4");
  int T[256]; for(int i=0;i<256;i++) T[i]=-1; const std::string tab="ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  for(int i=0;i<64;i++) T[(unsigned char)tab[i]]=i;
  size_t pad=0; if(!s.empty()&&s.back()=='=') ++pad; if(s.size()>=2&&s[s.size()-2]=='=') ++pad;
  bytes o; o.reserve(s.size()/4*3); uint32_t val=0; int valb=-8;
  for(size_t i=0;i<s.size()-pad;++i){ const int d=T[(unsigned char)s[i]]; if(d<0) throw EncodingError("invalid base64 character");
    val=(val<<6)|(uint32_t)d; valb+=6; if(valb>=0){ o.push_back((uint8_t)((val>>valb)&0xFF)); valb-=8; } }
  return o; }

// ---------------- UTF-8 ----------------
inline bool is_valid_utf8(const std::string& s){
  size_t i=0; const size_t n=s.size();
  while(i<n){ const unsigned char c=s[i]; size_t len; uint32_t cp;
    if(c<0x80){ ++i; continue; }
    else if((c&0xE0)==0xC0){ len=2; cp=c&0x1F; }
    else if((c&0xF0)==0xE0){ len=3; cp=c&0x0F; }
    else if((c&0xF8)==0xF0){ len=4; cp=c&0x07; }
    else return false;
    if(i+len>n) return false;
    for(size_t j=1;j<len;++j){ const unsigned char cc=s[i+j]; if((cc&0xC0)!=0x80) return false; cp=(cp<<6)|(cc&0x3F); }
    if((len==2&&cp<0x80)||(len==3&&cp<0x800)||(len==4&&cp<0x10000)) return false; // overlong
    if(cp>0x10FFFF||(cp>=0xD800&&cp<=0xDFFF)) return false;
    i+=len; }
  return true; }

// ---------------- Payload codec ----------------
// pad -> AES-128-ECB -> base64. Same input, same token: there is no IV.
inline std::string encrypt(const std::string& payload, const std::string& secret){
  if(secret.size()!=kKeySize) throw InvalidKeyLength(secret.size());
  if(!is_valid_utf8(payload)) throw EncodingError("payload is not valid UTF-8");
  return b64(aes128_ecb_encrypt(secret,pkcs7_pad(to_bytes(payload)))); }
inline std::string decrypt(const std::string& token, const std::string& secret){
  if(secret.size()!=kKeySize) throw InvalidKeyLength(secret.size());
  return to_string(pkcs7_unpad(aes128_ecb_decrypt(secret,b64d(token)))); }

// ---------------- Form URL encoding ----------------
inline bool is_unreserved(unsigned char c){
  return (c>='A'&&c<='Z')||(c>='a'&&c<='z')||(c>='0'&&c<='9')||c=='-'||c=='_'||c=='.'||c=='~'; }
inline std::string url_encode(const std::string& s){ static const char* X="0123456789ABCDEF";
  std::string o; o.reserve(s.size()*3);
  for(unsigned char c: s){ if(is_unreserved(c)) o.push_back((char)c); else if(c==' ') o.push_back('+');
    else { o.push_back('%'); o.push_back(X[c>>4]); o.push_back(X[c&15]); } }
  return o; }
inline int hexval(char c){ if(c>='0'&&c<='9') return c-'0'; if(c>='a'&&c<='f') return c-'a'+10; if(c>='A'&&c<='F') return c-'A'+10; return -1; }
inline std::string url_decode(const std::string& s){
  std::string o; o.reserve(s.size());
  for(size_t i=0;i<s.size();++i){ if(s[i]=='+'){ o.push_back(' '); continue; } if(s[i]!='%'){ o.push_back(s[i]); continue; }
    if(i+2>=s.size()) throw EncodingError("truncated percent-escape");
    const int hi=hexval(s[i+1]), lo=hexval(s[i+2]); if(hi<0||lo<0) throw EncodingError("invalid percent-escape");
    o.push_back((char)((hi<<4)|lo)); i+=2; }
  return o; }
inline std::string form_encode(const query_pairs& q){ std::string o;
  for(size_t i=0;i<q.size();++i){ if(i) o.push_back('&'); o+=url_encode(q[i].first); o.push_back('='); o+=url_encode(q[i].second); }
  return o; }
// Accepts a full URL or a bare query string; a '#fragment' is ignored.
inline query_pairs parse_query(const std::string& url){
  const size_t q=url.find('?'); std::string qs=(q==std::string::npos)?url:url.substr(q+1);
  const size_t h=qs.find('#'); if(h!=std::string::npos) qs.resize(h);
  query_pairs out; size_t pos=0;
  while(pos<=qs.size()){ size_t amp=qs.find('&',pos); if(amp==std::string::npos) amp=qs.size();
    const std::string part=qs.substr(pos,amp-pos);
    if(!part.empty()){ const size_t eq=part.find('=');
      if(eq==std::string::npos) out.emplace_back(url_decode(part),std::string());
      else out.emplace_back(url_decode(part.substr(0,eq)),url_decode(part.substr(eq+1))); }
    pos=amp+1; }
  return out; }
// Cuts the query of a widget URL out of a URL or an HTML snippet, from the
// '?' before button_request= up to the closing quote. Empty when absent.
inline std::string extract_widget_query(const std::string& in){
  const size_t mark=in.find("button_request=");
  if(mark==std::string::npos) return std::string();
  size_t b=in.rfind('?',mark); if(b==std::string::npos) b=0;
  size_t e=in.find_first_of("\"' \t\r\n<>",mark); if(e==std::string::npos) e=in.size();
  return in.substr(b,e-b); }
inline std::string query_value(const query_pairs& q, const std::string& key){
  for(auto& kv: q) if(kv.first==key) return kv.second;
  throw EncodingError("missing query parameter: "+key); }
}
