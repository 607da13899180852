/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file config.hpp
 * @brief Multi-format configuration store and typed gateway/agent settings.
 *
 * Backends are enabled at build time:
 *   NGW_CONFIG_INI_ENABLED  - inih
 *   NGW_CONFIG_JSON_ENABLED - nlohmann/json
 *   NGW_CONFIG_YAML_ENABLED - fkYAML
 *
 * Every format is flattened into "section + key = value" entries:
 * @code
 *   ngw::MultiConfig cfg;
 *   auto r = cfg.LoadFile("gateway.yaml");
 *   auto gw = ngw::GatewayConfig::Load(cfg);
 * @endcode
 */

#ifndef NGW_CONFIG_HPP_
#define NGW_CONFIG_HPP_

#include "ngw/backoff.hpp"
#include "ngw/log.hpp"
#include "ngw/platform.hpp"
#include "ngw/types.hpp"
#include "ngw/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#ifdef NGW_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef NGW_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef NGW_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace ngw {

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
};

inline const char* ToString(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:       return "file_not_found";
    case ConfigError::kParseError:         return "parse_error";
    case ConfigError::kFormatNotSupported: return "format_not_supported";
    case ConfigError::kBufferFull:         return "buffer_full";
    case ConfigError::kInvalidValue:       return "invalid_value";
  }
  return "unknown";
}

enum class ConfigFormat : uint8_t { kAuto = 0, kIni, kJson, kYaml };

// ============================================================================
// Backend Tag Types
// ============================================================================

namespace detail {

inline std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c + 32);
  }
  return s;
}

inline std::string Trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return std::string();
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const std::string& ext) {
    return ext == "ini" || ext == "cfg" || ext == "conf";
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const std::string& ext) { return ext == "json"; }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const std::string& ext) {
    return ext == "yaml" || ext == "yml";
  }
};

// ============================================================================
// ConfigStore - Flat key-value storage
// ============================================================================

#ifndef NGW_CONFIG_MAX_ENTRIES
#define NGW_CONFIG_MAX_ENTRIES 256U
#endif

/**
 * @brief Case-insensitive (section, key) -> string value map with typed getters.
 */
class ConfigStore {
 public:
  const std::string& GetString(const char* section, const char* key,
                               const std::string& default_val) const {
    auto it = entries_.find(MakeKey(section, key));
    return (it != entries_.end()) ? it->second : default_val;
  }

  std::string GetString(const char* section, const char* key) const {
    return GetString(section, key, std::string());
  }

  int64_t GetInt(const char* section, const char* key, int64_t default_val = 0) const {
    auto v = FindInt(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  uint16_t GetPort(const char* section, const char* key, uint16_t default_val = 0) const {
    auto v = FindInt(section, key);
    if (!v.has_value()) return default_val;
    if (v.value() < 0) return 0;
    if (v.value() > 65535) return 65535;
    return static_cast<uint16_t>(v.value());
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const {
    auto v = FindBool(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  /** @brief Comma separated list; blank items are skipped. */
  std::vector<std::string> GetList(const char* section, const char* key) const {
    std::vector<std::string> out;
    auto it = entries_.find(MakeKey(section, key));
    if (it == entries_.end()) return out;
    size_t start = 0;
    const std::string& s = it->second;
    while (start <= s.size()) {
      size_t comma = s.find(',', start);
      if (comma == std::string::npos) comma = s.size();
      std::string item = detail::Trim(s.substr(start, comma - start));
      if (!item.empty()) out.push_back(std::move(item));
      start = comma + 1;
    }
    return out;
  }

  optional<int64_t> FindInt(const char* section, const char* key) const {
    auto it = entries_.find(MakeKey(section, key));
    if (it == entries_.end()) return {};
    const char* begin = it->second.c_str();
    char* end = nullptr;
    long long val = std::strtoll(begin, &end, 10);
    if (end == begin) return {};
    return optional<int64_t>{static_cast<int64_t>(val)};
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    auto it = entries_.find(MakeKey(section, key));
    if (it == entries_.end()) return {};
    const std::string v = detail::ToLower(it->second);
    return optional<bool>{v == "true" || v == "1" || v == "yes" || v == "on"};
  }

  bool HasSection(const char* section) const {
    const std::string prefix = detail::ToLower(section) + '\n';
    for (const auto& kv : entries_) {
      if (kv.first.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return entries_.find(MakeKey(section, key)) != entries_.end();
  }

  /** @brief Insert or overwrite one entry. @return false when the store is full. */
  bool Set(const char* section, const char* key, const std::string& value) {
    std::string k = MakeKey(section, key);
    auto it = entries_.find(k);
    if (it != entries_.end()) {
      it->second = value;
      return true;
    }
    if (entries_.size() >= NGW_CONFIG_MAX_ENTRIES) return false;
    entries_.emplace(std::move(k), value);
    return true;
  }

  uint32_t EntryCount() const noexcept { return static_cast<uint32_t>(entries_.size()); }

 protected:
  static expected<std::string, ConfigError> ReadFile(const char* path) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(ConfigError::kFileNotFound);
    }
    std::string data;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) data.append(buf, n);
    std::fclose(f);
    return expected<std::string, ConfigError>::success(std::move(data));
  }

  static std::string GetExtension(const char* path) {
    std::string p(path);
    auto dot = p.rfind('.');
    auto slash = p.rfind('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
      return std::string();
    }
    return detail::ToLower(p.substr(dot + 1));
  }

  template <typename> friend struct ConfigParser;

 private:
  static std::string MakeKey(const char* section, const char* key) {
    return detail::ToLower(section != nullptr ? section : "") + '\n' +
           detail::ToLower(key != nullptr ? key : "");
  }

  std::map<std::string, std::string> entries_;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Default: format not compiled in. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef NGW_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    int result = ini_parse_string(data.c_str(), Handler, &store);
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->Set(section, name, value != nullptr ? value : "") ? 1 : 0;
  }
};
#endif

#ifdef NGW_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!store.Set(it.key().c_str(), kit.key().c_str(), ToStr(*kit))) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.Set("", it.key().c_str(), ToStr(*it))) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    if (n.is_array()) {
      // Arrays of scalars become comma lists (e.g. capabilities).
      std::string out;
      for (const auto& item : n) {
        if (!out.empty()) out += ',';
        out += ToStr(item);
      }
      return out;
    }
    return n.dump();
  }
};
#endif

#ifdef NGW_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const std::string& data) {
    fkyaml::node root;
    // fkYAML reports syntax errors by throwing; contain them here.
    try {
      root = fkyaml::node::deserialize(data);
    } catch (const fkyaml::exception& e) {
      NGW_LOG_WARN("Config", "yaml parse error: %s", e.what());
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (root.is_null() || !root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          auto key = kit.key().get_value<std::string>();
          if (!store.Set(sec.c_str(), key.c_str(), ToStr(*kit))) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.Set("", sec.c_str(), ToStr(node))) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return std::to_string(n.get_value<double>());
    if (n.is_sequence()) {
      std::string out;
      for (const auto& item : n) {
        if (!out.empty()) out += ',';
        out += ToStr(item);
      }
      return out;
    }
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    NGW_ASSERT(path != nullptr);
    auto data = ReadFile(path);
    if (!data.has_value()) {
      NGW_LOG_ERROR("Config", "cannot open %s", path);
      return expected<void, ConfigError>::error(data.get_error());
    }
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    auto r = Dispatch<Backends...>(data.value(), format);
    if (!r.has_value()) {
      NGW_LOG_ERROR("Config", "failed to load %s: %s", path, ToString(r.get_error()));
    }
    return r;
  }

  expected<void, ConfigError> LoadBuffer(const std::string& data, ConfigFormat format) {
    return Dispatch<Backends...>(data, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> Dispatch(const std::string& data, ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::ParseBuffer(*this, data);
    if constexpr (sizeof...(Rest) > 0) return Dispatch<Rest...>(data, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const {
    const std::string ext = GetExtension(path);
    if (ext.empty()) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const std::string& ext) const {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }
};

#if defined(NGW_CONFIG_INI_ENABLED) || defined(NGW_CONFIG_JSON_ENABLED) || \
    defined(NGW_CONFIG_YAML_ENABLED)
#define NGW_CONFIG_HAS_BACKEND 1

using MultiConfig = Config<
#ifdef NGW_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(NGW_CONFIG_INI_ENABLED) && \
    (defined(NGW_CONFIG_JSON_ENABLED) || defined(NGW_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef NGW_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(NGW_CONFIG_JSON_ENABLED) && defined(NGW_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef NGW_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

#ifdef NGW_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef NGW_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef NGW_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

// ============================================================================
// Typed settings
// ============================================================================

struct PairingSettings {
  uint32_t code_ttl_ms = 300000;
  uint32_t sweep_interval_ms = 30000;
  uint32_t max_issue_retries = 32;
};

struct SessionSettings {
  uint32_t heartbeat_interval_ms = 15000;
  uint32_t heartbeat_miss_limit = 3;
  uint32_t grace_period_ms = 120000;
  uint32_t pending_timeout_ms = 10000;  ///< Pending registry entries older than this are dropped.
};

namespace detail {

/** @brief Read a non-negative 32-bit value; @p ok cleared on out-of-range. */
inline uint32_t ReadU32(const ConfigStore& store, const char* section, const char* key,
                        uint32_t default_val, bool& ok) {
  auto v = store.FindInt(section, key);
  if (!v.has_value()) return default_val;
  if (v.value() < 0 || v.value() > 0xFFFFFFFFLL) {
    NGW_LOG_ERROR("Config", "[%s] %s out of range: %lld", section, key,
                  static_cast<long long>(v.value()));  // NOLINT
    ok = false;
    return default_val;
  }
  return static_cast<uint32_t>(v.value());
}

inline bool RequirePositive(uint32_t value, const char* section, const char* key) {
  if (value != 0U) return true;
  NGW_LOG_ERROR("Config", "[%s] %s must be > 0", section, key);
  return false;
}

}  // namespace detail

/**
 * @brief Gateway-side settings ([gateway], [pairing], [session], [dispatch]).
 */
struct GatewayConfig {
  std::string listen_host = "0.0.0.0";
  uint16_t listen_port = 7878;
  uint32_t max_nodes = 256;
  uint32_t handshake_timeout_ms = 10000;
  uint32_t shutdown_grace_ms = 5000;
  uint32_t default_timeout_ms = 60000;
  PairingSettings pairing;
  SessionSettings session;
  BackoffPolicy readiness_backoff;

  static expected<GatewayConfig, ConfigError> Load(const ConfigStore& store) {
    using R = expected<GatewayConfig, ConfigError>;
    GatewayConfig c;
    bool ok = true;
    c.listen_host = store.GetString("gateway", "listen_host", c.listen_host);
    c.listen_port = store.GetPort("gateway", "listen_port", c.listen_port);
    c.max_nodes = detail::ReadU32(store, "gateway", "max_nodes", c.max_nodes, ok);
    c.handshake_timeout_ms = detail::ReadU32(store, "gateway", "handshake_timeout_ms",
                                             c.handshake_timeout_ms, ok);
    c.shutdown_grace_ms = detail::ReadU32(store, "gateway", "shutdown_grace_ms",
                                          c.shutdown_grace_ms, ok);
    c.pairing.code_ttl_ms = detail::ReadU32(store, "pairing", "code_ttl_ms",
                                            c.pairing.code_ttl_ms, ok);
    c.pairing.sweep_interval_ms = detail::ReadU32(store, "pairing", "sweep_interval_ms",
                                                  c.pairing.sweep_interval_ms, ok);
    c.pairing.max_issue_retries = detail::ReadU32(store, "pairing", "max_issue_retries",
                                                  c.pairing.max_issue_retries, ok);
    c.session.heartbeat_interval_ms = detail::ReadU32(
        store, "session", "heartbeat_interval_ms", c.session.heartbeat_interval_ms, ok);
    c.session.heartbeat_miss_limit = detail::ReadU32(
        store, "session", "heartbeat_miss_limit", c.session.heartbeat_miss_limit, ok);
    c.session.grace_period_ms = detail::ReadU32(store, "session", "grace_period_ms",
                                                c.session.grace_period_ms, ok);
    c.session.pending_timeout_ms = detail::ReadU32(store, "session", "pending_timeout_ms",
                                                   c.session.pending_timeout_ms, ok);
    c.default_timeout_ms = detail::ReadU32(store, "dispatch", "default_timeout_ms",
                                           c.default_timeout_ms, ok);

    ok = ok && detail::RequirePositive(c.max_nodes, "gateway", "max_nodes") &&
         detail::RequirePositive(c.handshake_timeout_ms, "gateway",
                                 "handshake_timeout_ms") &&
         detail::RequirePositive(c.pairing.code_ttl_ms, "pairing", "code_ttl_ms") &&
         detail::RequirePositive(c.pairing.sweep_interval_ms, "pairing",
                                 "sweep_interval_ms") &&
         detail::RequirePositive(c.pairing.max_issue_retries, "pairing",
                                 "max_issue_retries") &&
         detail::RequirePositive(c.session.heartbeat_interval_ms, "session",
                                 "heartbeat_interval_ms") &&
         detail::RequirePositive(c.session.heartbeat_miss_limit, "session",
                                 "heartbeat_miss_limit") &&
         detail::RequirePositive(c.session.pending_timeout_ms, "session",
                                 "pending_timeout_ms") &&
         detail::RequirePositive(c.default_timeout_ms, "dispatch", "default_timeout_ms");
    if (!ok) return R::error(ConfigError::kInvalidValue);
    return R::success(std::move(c));
  }
};

/**
 * @brief Node-side settings ([agent]).
 */
struct AgentConfig {
  std::string gateway_host = "127.0.0.1";
  uint16_t gateway_port = 7878;
  NodeHello hello;
  uint32_t heartbeat_interval_ms = 15000;
  uint32_t connect_timeout_ms = 5000;
  uint32_t reconnect_max_attempts = 0;  ///< 0 = unbounded.
  BackoffPolicy backoff;

  static expected<AgentConfig, ConfigError> Load(const ConfigStore& store) {
    using R = expected<AgentConfig, ConfigError>;
    AgentConfig c;
    bool ok = true;
    c.gateway_host = store.GetString("agent", "gateway_host", c.gateway_host);
    c.gateway_port = store.GetPort("agent", "gateway_port", c.gateway_port);
    c.hello.display_name = store.GetString("agent", "display_name");
    c.hello.hostname = store.GetString("agent", "hostname");
    c.hello.platform = store.GetString("agent", "platform");
    c.hello.capabilities = store.GetList("agent", "capabilities");
    c.heartbeat_interval_ms = detail::ReadU32(store, "agent", "heartbeat_interval_ms",
                                              c.heartbeat_interval_ms, ok);
    c.connect_timeout_ms = detail::ReadU32(store, "agent", "connect_timeout_ms",
                                           c.connect_timeout_ms, ok);
    c.reconnect_max_attempts = detail::ReadU32(store, "agent", "reconnect_max_attempts",
                                               c.reconnect_max_attempts, ok);
    c.backoff.initial_ms = detail::ReadU32(store, "agent", "backoff_initial_ms",
                                           c.backoff.initial_ms, ok);
    c.backoff.cap_ms = detail::ReadU32(store, "agent", "backoff_cap_ms",
                                       c.backoff.cap_ms, ok);

    ok = ok && detail::RequirePositive(c.heartbeat_interval_ms, "agent",
                                       "heartbeat_interval_ms") &&
         detail::RequirePositive(c.backoff.initial_ms, "agent", "backoff_initial_ms");
    if (ok && c.backoff.cap_ms < c.backoff.initial_ms) {
      NGW_LOG_ERROR("Config", "[agent] backoff_cap_ms below backoff_initial_ms");
      ok = false;
    }
    if (c.gateway_port == 0) {
      NGW_LOG_ERROR("Config", "[agent] gateway_port must be set");
      ok = false;
    }
    if (!ok) return R::error(ConfigError::kInvalidValue);
    return R::success(std::move(c));
  }
};

}  // namespace ngw

#endif  // NGW_CONFIG_HPP_
