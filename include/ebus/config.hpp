/**
 * @file config.hpp
 * @brief Multi-format configuration reader and bus option loading.
 *
 * Backends are selected at build time and composed as Config<Backends...>:
 *   - IniBackend  : inih          (EBUS_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (EBUS_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (EBUS_CONFIG_YAML_ENABLED)
 *
 * Every format is flattened to section/key/value strings. Top-level scalars
 * land in the "" section. Nested objects below the second level are kept as
 * their serialized text.
 *
 * Recognized options (see LoadBusOptions):
 * @code
 *   [bus]
 *   address = unix:path=/run/app/bus   ; or "session" / "system"
 *   mode = peer                         ; "bus" (default) or "peer"
 *   call_timeout_ms = 2000              ; -1: libdbus default
 *
 *   [reactor]
 *   idle_poll_ms = 4000
 *
 *   [log]
 *   level = warn                        ; debug|info|warn|error|fatal|off
 * @endcode
 */

#ifndef EBUS_CONFIG_HPP_
#define EBUS_CONFIG_HPP_

#include "ebus/connection.hpp"
#include "ebus/log.hpp"
#include "ebus/platform.hpp"
#include "ebus/poll_reactor.hpp"
#include "ebus/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>
#include <type_traits>
#include <vector>

#include <strings.h>

#ifdef EBUS_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef EBUS_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef EBUS_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef EBUS_CONFIG_MAX_ENTRIES
#define EBUS_CONFIG_MAX_ENTRIES 256U
#endif

namespace ebus {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

// ============================================================================
// Backend tags
// ============================================================================

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  return ::strcasecmp(a, b) == 0;
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key,
                 int32_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    return FindBool(section, key).value_or(default_val);
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    const double val = std::strtod(e->value.c_str(), &end);
    return (end == e->value.c_str()) ? default_val : val;
  }

  /** @brief Integer value; empty when missing or not a whole number. */
  optional<int32_t> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    const char* s = e->value.c_str();
    char* end = nullptr;
    const long val = std::strtol(s, &end, 10);
    if (end == s || *end != '\0') return {};
    return static_cast<int32_t>(val);
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return {};
    return ParseBool(e->value.c_str());
  }

  bool HasSection(const char* section) const {
    EBUS_ASSERT(section != nullptr);
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

  /** @brief Insert or overwrite; false once EBUS_CONFIG_MAX_ENTRIES is hit. */
  bool Set(const char* section, const char* key, const char* value) {
    return AddEntry(section, key, value);
  }

 protected:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  std::vector<Entry> entries_;

  bool AddEntry(const char* section, const char* key, const char* value) {
    for (Entry& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section) &&
          detail::CaseEqual(e.key.c_str(), key)) {
        e.value = (value != nullptr) ? value : "";
        return true;
      }
    }
    if (entries_.size() >= EBUS_CONFIG_MAX_ENTRIES) return false;
    entries_.push_back(Entry{section, key, (value != nullptr) ? value : ""});
    return true;
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    EBUS_ASSERT(section != nullptr && key != nullptr);
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section.c_str(), section) &&
          detail::CaseEqual(e.key.c_str(), key)) {
        return &e;
      }
    }
    return nullptr;
  }

  static expected<std::string, ConfigError> ReadFile(const char* path) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<std::string, ConfigError>::error(
          ConfigError::kFileNotFound);
    }
    std::string out;
    char chunk[4096];
    size_t n = 0;
    while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0) {
      out.append(chunk, n);
    }
    std::fclose(f);
    return expected<std::string, ConfigError>::success(std::move(out));
  }

  static bool ParseBool(const char* str) noexcept {
    return detail::CaseEqual(str, "true") || detail::CaseEqual(str, "1") ||
           detail::CaseEqual(str, "yes") || detail::CaseEqual(str, "on");
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    const char* slash = std::strrchr(path, '/');
    if (dot == nullptr || (slash != nullptr && dot < slash)) return nullptr;
    return dot + 1;
  }

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> Parse(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef EBUS_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store,
                                           const std::string& text) {
    const int result = ini_parse_string(text.c_str(), &Handler, &store);
    if (result != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* store = static_cast<ConfigStore*>(user);
    return store->AddEntry(section != nullptr ? section : "",
                           name != nullptr ? name : "", value)
               ? 1
               : 0;
  }
};
#endif

#ifdef EBUS_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store,
                                           const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!store.AddEntry(it.key().c_str(), kit.key().c_str(),
                              ToString(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.AddEntry("", it.key().c_str(),
                                 ToString(*it).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToString(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    return n.dump();
  }
};
#endif

#ifdef EBUS_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> Parse(ConfigStore& store,
                                           const std::string& text) {
    auto root = fkyaml::node::deserialize(text);
    if (root.is_null() || !root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto it = root.begin(); it != root.end(); ++it) {
      const auto section = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          const auto key = kit.key().get_value<std::string>();
          if (!store.AddEntry(section.c_str(), key.c_str(),
                              ToString(*kit).c_str())) {
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
          }
        }
      } else if (!store.AddEntry("", section.c_str(),
                                 ToString(node).c_str())) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToString(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) return std::to_string(n.get_value<double>());
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
  Config() = default;

  /** @brief Load @p path; kAuto picks the backend by file extension. */
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    EBUS_ASSERT(path != nullptr);
    auto text = ReadFile(path);
    if (!text) return expected<void, ConfigError>::error(text.get_error());
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return Dispatch<Backends...>(text.value(), format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& text,
                                         ConfigFormat format) {
    return Dispatch<Backends...>(text, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> Dispatch(const std::string& text,
                                       ConfigFormat format) {
    if (First::kFormat == format) return ConfigParser<First>::Parse(*this, text);
    if constexpr (sizeof...(Rest) > 0) return Dispatch<Rest...>(text, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }
};

#ifdef EBUS_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef EBUS_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef EBUS_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

// ============================================================================
// BusOptions
// ============================================================================

struct BusOptions {
  std::string address = "session";
  OpenMode mode = OpenMode::kBus;
  int32_t call_timeout_ms = -1;
  int32_t idle_poll_ms = 4000;
  log::Level log_level = log::Level::kInfo;

  PollReactor::Config ReactorConfig() const {
    PollReactor::Config cfg;
    cfg.idle_poll_ms = idle_poll_ms;
    return cfg;
  }
};

inline optional<log::Level> ParseLogLevel(const char* name) noexcept {
  static constexpr struct {
    const char* name;
    log::Level level;
  } kLevels[] = {
      {"debug", log::Level::kDebug}, {"info", log::Level::kInfo},
      {"warn", log::Level::kWarn},   {"warning", log::Level::kWarn},
      {"error", log::Level::kError}, {"fatal", log::Level::kFatal},
      {"off", log::Level::kOff},
  };
  for (const auto& l : kLevels) {
    if (detail::CaseEqual(name, l.name)) return l.level;
  }
  return {};
}

/**
 * @brief Read BusOptions from @p store; absent keys keep their defaults.
 * @return kParseError for an unknown mode or level or a non-numeric interval.
 */
inline expected<BusOptions, ConfigError> LoadBusOptions(
    const ConfigStore& store) {
  BusOptions opts;
  opts.address = store.GetString("bus", "address", opts.address.c_str());

  if (store.HasKey("bus", "mode")) {
    const char* mode = store.GetString("bus", "mode");
    if (detail::CaseEqual(mode, "bus")) {
      opts.mode = OpenMode::kBus;
    } else if (detail::CaseEqual(mode, "peer")) {
      opts.mode = OpenMode::kPeer;
    } else {
      EBUS_LOG_WARN("config", "unknown bus mode '%s'", mode);
      return expected<BusOptions, ConfigError>::error(ConfigError::kParseError);
    }
  }

  struct IntKey {
    const char* section;
    const char* key;
    int32_t* out;
  };
  const IntKey ints[] = {
      {"bus", "call_timeout_ms", &opts.call_timeout_ms},
      {"reactor", "idle_poll_ms", &opts.idle_poll_ms},
  };
  for (const IntKey& k : ints) {
    if (!store.HasKey(k.section, k.key)) continue;
    auto v = store.FindInt(k.section, k.key);
    if (!v.has_value()) {
      EBUS_LOG_WARN("config", "[%s] %s is not an integer", k.section, k.key);
      return expected<BusOptions, ConfigError>::error(ConfigError::kParseError);
    }
    *k.out = v.value();
  }

  if (store.HasKey("log", "level")) {
    auto level = ParseLogLevel(store.GetString("log", "level"));
    if (!level.has_value()) {
      EBUS_LOG_WARN("config", "unknown log level '%s'",
                    store.GetString("log", "level"));
      return expected<BusOptions, ConfigError>::error(ConfigError::kParseError);
    }
    opts.log_level = level.value();
  }
  return expected<BusOptions, ConfigError>::success(std::move(opts));
}

inline void ApplyLogLevel(const BusOptions& opts) noexcept {
  log::SetLevel(opts.log_level);
}

}  // namespace ebus

#endif  // EBUS_CONFIG_HPP_
