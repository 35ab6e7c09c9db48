#pragma once
/*
  ┏━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━┓
  ┃ MicroPayWidget.cpp – Central configuration                         ┃
  ┗━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━┛

  • Compile-time defaults for the widget tools (MakeWidget / MakeDecode).
  • The library itself takes everything through WidgetIdentity and never
    reads this file's environment overrides.
*/

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace mpw_config {

// ── Project / branding ────────────────────────────────────────────────
inline constexpr const char* kProjectName    = "MicroPayWidget.cpp";
inline constexpr const char* kProjectVersion = "1.0-cpp";

// ── Provider endpoint ─────────────────────────────────────────────────
// Overridden by MPW_SERVICE_URL.
inline constexpr const char* kDefaultServiceUrl = "http://localhost:8089/pay_button/show";

// ── Credentials ───────────────────────────────────────────────────────
// No fallback is compiled in: MPW_APP_ID and MPW_APP_SECRET must be set.
// The secret is the raw 16-byte AES-128 key shared with the provider.
inline constexpr const char* kEnvServiceUrl = "MPW_SERVICE_URL";
inline constexpr const char* kEnvAppId      = "MPW_APP_ID";
inline constexpr const char* kEnvAppSecret  = "MPW_APP_SECRET";

// ── Widget layout ─────────────────────────────────────────────────────
inline constexpr int kIframeHeightPx = 22;

// ── Misc console cosmetics ────────────────────────────────────────────
inline constexpr bool kPrintProgressCounters = true; // Show STEP #n lines

inline std::string env_or(const char* name, const std::string& fallback) {
  const char* v = std::getenv(name);
  return (v && *v) ? std::string(v) : fallback;
}

inline std::string env_required(const char* name) {
  const char* v = std::getenv(name);
  if (!v || !*v) throw std::runtime_error(std::string(name) + " is not set");
  return std::string(v);
}

} // namespace mpw_config
