#pragma once

// ── OAuth application ───────────────────────────────────────
constexpr const char* OAUTH_CLIENT_ID    = "178c6fc778ccc68e1d6a";
constexpr const char* DEVICE_GRANT_TYPE  = "urn:ietf:params:oauth:grant-type:device_code";

// Scopes requested by every device flow; callers may add more.
constexpr const char* DEFAULT_SCOPES[]   = {"repo", "read:org", "gist"};

// ── Device flow timing ──────────────────────────────────────
constexpr int DEVICE_POLL_MIN_INTERVAL_SECS = 5;   // floor for server-provided interval
constexpr int DEVICE_SLOW_DOWN_SECS         = 5;   // added to the interval on slow_down

// ── Keychain ────────────────────────────────────────────────
constexpr int KEYRING_TIMEOUT_MS         = 3000;  // hard deadline for every keychain call
constexpr const char* KEYRING_SERVICE_PREFIX = "gh:";

// ── HTTP ────────────────────────────────────────────────────
constexpr long HTTP_TIMEOUT_SECS         = 30;
constexpr long HTTP_CONNECT_TIMEOUT_SECS = 10;
constexpr const char* HTTP_USER_AGENT    = "ghx/0.4.0";

// ── Hosts ───────────────────────────────────────────────────
constexpr const char* GITHUB_COM         = "github.com";
constexpr const char* GITHUB_LOCALHOST   = "github.localhost";
constexpr const char* TENANCY_SUFFIX     = ".ghe.com";

// ── Git credential helper ───────────────────────────────────
constexpr const char* GIT_TOKEN_USER     = "x-access-token";

// ── Token sources ───────────────────────────────────────────
constexpr const char* SOURCE_KEYRING     = "keyring";
constexpr const char* SOURCE_CONFIG      = "config";

constexpr const char* GHX_VERSION        = "0.4.0";
