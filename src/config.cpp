#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace omb {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

/**
 * Convert a YAML node into a structurally equivalent JSON object.
 *
 * The conversion preserves scalar types where possible and recursively maps
 * sequences and maps to JSON arrays and objects respectively.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    // Quoted scalars stay strings so that names like "123" survive.
    if (node.Tag() == "!")
      return s;
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    if (s == "~" || s == "null" || s == "Null" || s == "NULL")
      return nullptr;
    if (!s.empty() && (std::isdigit(static_cast<unsigned char>(s[0])) ||
                       s[0] == '-' || s[0] == '+')) {
      try {
        size_t idx = 0;
        long long i = std::stoll(s, &idx, 10);
        if (idx == s.size()) {
          // Leading zeros would be lost, so "007" stays a string.
          if (std::to_string(i) == (s[0] == '+' ? s.substr(1) : s))
            return i;
          return s;
        }
      } catch (const std::logic_error &) {
      }
      try {
        size_t idx = 0;
        double d = std::stod(s, &idx);
        if (idx == s.size())
          return d;
      } catch (const std::logic_error &) {
      }
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to a JSON representation.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }

  if (const auto *array = node.as_array()) {
    json arr = json::array();
    arr.get_ref<json::array_t &>().reserve(array->size());
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }

  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  auto stringify_temporal = [](const auto &temporal) {
    std::ostringstream oss;
    oss << temporal;
    return oss.str();
  };

  if (const auto *value = node.as_date())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_time())
    return stringify_temporal(value->get());
  if (const auto *value = node.as_date_time())
    return stringify_temporal(value->get());

  return nullptr;
}

/**
 * Merge the `logging`, `http` and `history` sections into the root object so
 * grouped and flat configuration files expose the same keys.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section : {"logging", "http", "history"}) {
    merge_section(section);
  }

  return normalized;
}

/// Text of a list entry. YAML reads bare names such as `2048` as integers.
std::string list_item(const nlohmann::json &item, const char *key) {
  if (item.is_string())
    return item.get<std::string>();
  if (item.is_number_integer())
    return item.dump();
  throw ConfigurationError(std::string("'") + key +
                           "' must be a list of strings; quote names that "
                           "YAML reads as numbers or booleans");
}

/// List of strings under @p key; null or missing yields an empty list.
std::vector<std::string> string_list(const nlohmann::json &obj,
                                     const char *key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return out;
  }
  if (!it->is_array()) {
    out.push_back(list_item(*it, key));
    return out;
  }
  for (const auto &item : *it) {
    out.push_back(list_item(item, key));
  }
  return out;
}

template <typename T>
bool read_value(const nlohmann::json &obj, const char *key, T &out) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return false;
  }
  out = it->get<T>();
  return true;
}

} // namespace

void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);

  if (auto it = cfg.find("backup"); it != cfg.end() && it->is_object()) {
    const nlohmann::json &backup = *it;
    read_value(backup, "enabled", backup_enabled_);
    read_value(backup, "organization", organization_);
    set_patterns(string_list(backup, "patterns"));
    set_repositories(string_list(backup, "repositories"));
    read_value(backup, "exclude_archived", exclude_archived_);
    set_exclude_patterns(string_list(backup, "exclude_patterns"));
    set_exclude_repositories(string_list(backup, "exclude_repositories"));
    if (auto meta = backup.find("backup_metadata");
        meta != backup.end() && meta->is_object()) {
      read_value(*meta, "issues", backup_issues_);
    }
    if (auto s3 = backup.find("s3"); s3 != backup.end() && s3->is_object()) {
      read_value(*s3, "bucket", s3_bucket_);
      read_value(*s3, "region", s3_region_);
      read_value(*s3, "prefix", s3_prefix_);
      read_value(*s3, "endpoint", s3_endpoint_);
    }
  }

  read_value(cfg, "log_level", log_level_);
  read_value(cfg, "log_pattern", log_pattern_);
  read_value(cfg, "log_file", log_file_);
  int rotate = log_rotate_;
  if (read_value(cfg, "log_rotate", rotate)) {
    set_log_rotate(rotate);
  }
  read_value(cfg, "log_compress", log_compress_);
  if (auto it = cfg.find("log_categories");
      it != cfg.end() && it->is_object()) {
    for (const auto &[category, level] : it->items()) {
      log_categories_[category] = level.get<std::string>();
    }
  }
  read_value(cfg, "api_base", api_base_);
  read_value(cfg, "http_timeout", http_timeout_);
  read_value(cfg, "http_retries", http_retries_);
  read_value(cfg, "work_dir", work_dir_);
  read_value(cfg, "history_db", history_db_);
}

void Config::validate() const {
  if (s3_bucket_.empty()) {
    throw ConfigurationError("backup.s3.bucket is required");
  }
  if (organization_.empty()) {
    throw ConfigurationError(
        "Organization not specified in config or command line");
  }
  if (http_timeout_ <= 0) {
    throw ConfigurationError("http_timeout must be positive");
  }
  if (http_retries_ < 0) {
    throw ConfigurationError("http_retries must not be negative");
  }
  (void)to_rule_set();
}

MatchRuleSet Config::to_rule_set() const {
  return MatchRuleSet(
      patterns_, std::set<std::string>(repositories_.begin(), repositories_.end()),
      exclude_archived_, exclude_patterns_,
      std::set<std::string>(exclude_repositories_.begin(),
                            exclude_repositories_.end()));
}

S3Location Config::s3_location() const {
  return S3Location{s3_bucket_, s3_region_, s3_endpoint_};
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @throws ConfigurationError When value conversions fail.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  try {
    cfg.load_json(j);
  } catch (const nlohmann::json::exception &e) {
    throw ConfigurationError(std::string("Invalid configuration: ") + e.what());
  }
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors during parsing are logged and rethrown as ConfigurationError.
 */
Config Config::from_file(const std::string &path) {
  ensure_default_logger();
  config_log()->info("Loading configuration from: {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw ConfigurationError("Unknown config file extension: " + path);
  }
  std::string ext = path.substr(pos + 1);
  std::string ext_lower = ext;
  std::transform(
      ext_lower.begin(), ext_lower.end(), ext_lower.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  config_log()->debug("Detected config file type: {}", ext_lower);
  nlohmann::json j;
  try {
    if (ext_lower == "yaml" || ext_lower == "yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext_lower == "json") {
      std::ifstream f(path);
      if (!f) {
        throw ConfigurationError("Configuration file not found: " + path);
      }
      f >> j;
    } else if (ext_lower == "toml" || ext_lower == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw ConfigurationError("Unsupported config format: " + ext);
    }
  } catch (const ConfigurationError &e) {
    config_log()->error("{}", e.what());
    throw;
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw ConfigurationError("Failed to load config " + path + ": " +
                             e.what());
  }
  Config cfg = from_json(j);
  config_log()->debug("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace omb
