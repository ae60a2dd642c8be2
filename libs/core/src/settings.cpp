#include "keyward/core/settings.h"

#include <cstdlib>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <yyjson.h>

namespace keyward::core {

namespace {

constexpr kj::StringPtr FIELDS[] = {
    "token_secret"_kj,
    "token_previous_secrets"_kj,
    "token_ttl_access"_kj,
    "token_ttl_refresh"_kj,
    "super_user_login"_kj,
    "super_user_password"_kj,
    "table_prefix"_kj,
    "db_schema"_kj,
    "data_dir"_kj,
    "password_hash_iterations"_kj,
    "permission_cache_size"_kj,
    "revocation_prune_interval"_kj,
    "log_level"_kj,
};

constexpr kj::StringPtr SECRETS_FILE_PREFIX = "keyward_"_kj;

void put(RawSettings& values, kj::StringPtr key, kj::String value) {
  values.upsert(kj::str(key), kj::mv(value),
                [](kj::String& existing, kj::String&& replacement) {
                  existing = kj::mv(replacement);
                });
}

kj::String to_lower(kj::StringPtr s) {
  kj::String out = kj::heapString(s);
  for (char& c : out) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return out;
}

kj::String to_upper(kj::StringPtr s) {
  kj::String out = kj::heapString(s);
  for (char& c : out) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
  }
  return out;
}

kj::String strip_trailing_newline(kj::StringPtr s) {
  size_t end = s.size();
  if (end > 0 && s[end - 1] == '\n') {
    --end;
    if (end > 0 && s[end - 1] == '\r') {
      --end;
    }
  }
  return kj::heapString(s.slice(0, end));
}

kj::String trim(kj::StringPtr s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && (s[begin] == ' ' || s[begin] == '\t')) {
    ++begin;
  }
  while (end > begin && (s[end - 1] == ' ' || s[end - 1] == '\t')) {
    --end;
  }
  return kj::heapString(s.slice(begin, end));
}

kj::Array<kj::String> split_list(kj::StringPtr s) {
  kj::Vector<kj::String> parts;
  size_t start = 0;
  for (size_t i = 0; i <= s.size(); ++i) {
    if (i == s.size() || s[i] == ',') {
      auto part = trim(s.slice(start, i));
      if (part.size() > 0) {
        parts.add(kj::mv(part));
      }
      start = i + 1;
    }
  }
  return parts.releaseAsArray();
}

kj::Maybe<kj::String> scalar_to_string(yyjson_val* val) {
  if (yyjson_is_str(val)) {
    return kj::str(yyjson_get_str(val));
  } else if (yyjson_is_bool(val)) {
    return kj::str(yyjson_get_bool(val) ? "true" : "false");
  } else if (yyjson_is_uint(val)) {
    return kj::str(yyjson_get_uint(val));
  } else if (yyjson_is_sint(val)) {
    return kj::str(yyjson_get_sint(val));
  } else if (yyjson_is_real(val)) {
    return kj::str(yyjson_get_real(val));
  }
  return kj::none;
}

void flatten(yyjson_val* obj, kj::StringPtr prefix, RawSettings& values) {
  size_t idx, max;
  yyjson_val* key;
  yyjson_val* val;
  yyjson_obj_foreach(obj, idx, max, key, val) {
    auto name = prefix.size() == 0 ? to_lower(yyjson_get_str(key))
                                   : kj::str(prefix, "__", to_lower(yyjson_get_str(key)));
    if (yyjson_is_obj(val)) {
      flatten(val, name, values);
    } else if (yyjson_is_arr(val)) {
      kj::Vector<kj::String> items;
      size_t arr_idx, arr_max;
      yyjson_val* item;
      yyjson_arr_foreach(val, arr_idx, arr_max, item) {
        KJ_IF_SOME(text, scalar_to_string(item)) {
          items.add(kj::mv(text));
        } else {
          throw ConfigException(kj::str("Unsupported array element in config key '", name, "'"));
        }
      }
      put(values, name, kj::strArray(items, ","));
    } else if (yyjson_is_null(val)) {
      continue;
    } else {
      KJ_IF_SOME(text, scalar_to_string(val)) {
        put(values, name, kj::mv(text));
      }
    }
  }
}

kj::StringPtr lookup(const RawSettings& values, kj::StringPtr field, kj::StringPtr fallback) {
  KJ_IF_SOME(value, values.find(field)) {
    return value;
  }
  return fallback;
}

int64_t parse_int(const RawSettings& values, kj::StringPtr field, int64_t fallback) {
  KJ_IF_SOME(value, values.find(field)) {
    KJ_IF_SOME(parsed, trim(value).asPtr().tryParseAs<int64_t>()) {
      return parsed;
    }
    throw ConfigException(kj::str("Setting '", field, "' must be an integer, got '", value, "'"));
  }
  return fallback;
}

bool is_identifier(kj::StringPtr s) {
  for (char c : s) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    if (!ok) {
      return false;
    }
  }
  return true;
}

void check_secret(kj::StringPtr field, kj::StringPtr secret) {
  if (secret.size() < MIN_TOKEN_SECRET_LENGTH) {
    throw ConfigException(kj::str("Setting '", field, "' must be at least ",
                                  MIN_TOKEN_SECRET_LENGTH, " bytes"));
  }
}

kj::Maybe<kj::LogSeverity> parse_log_level(kj::StringPtr level) {
  // KJ has no severity below INFO; debug output comes from KJ_DBG regardless.
  if (level == "debug"_kj || level == "info"_kj) {
    return kj::LogSeverity::INFO;
  } else if (level == "warning"_kj) {
    return kj::LogSeverity::WARNING;
  } else if (level == "error"_kj) {
    return kj::LogSeverity::ERROR;
  }
  return kj::none;
}

kj::StringPtr masked(kj::StringPtr secret) {
  return secret.size() == 0 ? "<unset>"_kj : "<redacted>"_kj;
}

} // namespace

kj::ArrayPtr<const kj::StringPtr> settings_fields() {
  return kj::arrayPtr(FIELDS, kj::size(FIELDS));
}

// ---------------------------------------------------------------------------
// Sources
// ---------------------------------------------------------------------------

void DefaultsSource::apply(RawSettings& values) const {
  put(values, "token_ttl_access"_kj, kj::str("900"));
  put(values, "token_ttl_refresh"_kj, kj::str("604800"));
  put(values, "super_user_login"_kj, kj::str("super-user"));
  put(values, "table_prefix"_kj, kj::str("keyward_"));
  put(values, "db_schema"_kj, kj::str(""));
  put(values, "data_dir"_kj, kj::str(""));
  put(values, "password_hash_iterations"_kj, kj::str("120000"));
  put(values, "permission_cache_size"_kj, kj::str("0"));
  put(values, "revocation_prune_interval"_kj, kj::str("300"));
  put(values, "log_level"_kj, kj::str("info"));
}

void JsonFileSource::apply_json(kj::StringPtr json, RawSettings& values) {
  yyjson_doc* doc = yyjson_read(json.cStr(), json.size(), 0);
  if (doc == nullptr) {
    throw ConfigException("Config file is not valid JSON");
  }
  KJ_DEFER(yyjson_doc_free(doc));

  yyjson_val* root = yyjson_doc_get_root(doc);
  if (root == nullptr || !yyjson_is_obj(root)) {
    throw ConfigException("Config file root must be a JSON object");
  }
  flatten(root, ""_kj, values);
}

void JsonFileSource::apply(RawSettings& values) const {
  auto fs = kj::newDiskFilesystem();
  auto path = fs->getCurrentPath().eval(path_);

  KJ_IF_SOME(file, fs->getRoot().tryOpenFile(path)) {
    kj::String content;
    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { content = file->readAllText(); })) {
      throw ConfigException(
          kj::str("Failed to read config file ", path_, ": ", exception.getDescription()));
    }
    apply_json(content, values);
    KJ_LOG(INFO, "Loaded config file", path_);
  }
}

void EnvironmentSource::apply(RawSettings& values) const {
  for (auto field : FIELDS) {
    auto var = kj::str(prefix_, to_upper(field));
    if (const char* env = std::getenv(var.cStr())) {
      put(values, field, kj::heapString(env));
    }
  }
}

void SecretsDirSource::apply(RawSettings& values) const {
  auto fs = kj::newDiskFilesystem();
  auto path = fs->getCurrentPath().eval(directory_);

  KJ_IF_SOME(dir, fs->getRoot().tryOpenSubdir(path)) {
    for (auto field : FIELDS) {
      KJ_IF_SOME(file, dir->tryOpenFile(kj::Path(kj::str(SECRETS_FILE_PREFIX, field)))) {
        put(values, field, strip_trailing_newline(file->readAllText()));
      }
    }
  }
}

OverrideSource& OverrideSource::set(kj::StringPtr field, kj::StringPtr value) {
  put(values_, field, kj::str(value));
  return *this;
}

void OverrideSource::apply(RawSettings& values) const {
  for (auto& entry : values_) {
    put(values, entry.key, kj::str(entry.value));
  }
}

// ---------------------------------------------------------------------------
// Loader
// ---------------------------------------------------------------------------

SettingsLoader& SettingsLoader::add(kj::Own<SettingsSource> source) {
  sources_.add(kj::mv(source));
  return *this;
}

SettingsLoader SettingsLoader::standard() {
  kj::String config_path = kj::str("keyward.json");
  if (const char* env = std::getenv("KEYWARD_CONFIG")) {
    config_path = kj::heapString(env);
  }
  kj::String secrets_location = kj::str("/run/secrets");
  if (const char* env = std::getenv("KEYWARD_SECRETS_LOCATION")) {
    secrets_location = kj::heapString(env);
  }

  SettingsLoader loader;
  loader.add(kj::heap<DefaultsSource>())
      .add(kj::heap<JsonFileSource>(kj::mv(config_path)))
      .add(kj::heap<EnvironmentSource>())
      .add(kj::heap<SecretsDirSource>(kj::mv(secrets_location)));
  return loader;
}

Settings SettingsLoader::load() const {
  RawSettings values;
  for (auto& source : sources_) {
    source->apply(values);
  }

  for (auto& entry : values) {
    bool known = false;
    for (auto field : FIELDS) {
      if (entry.key == field) {
        known = true;
        break;
      }
    }
    if (!known) {
      KJ_LOG(WARNING, "Ignoring unknown setting", entry.key);
    }
  }

  return parse_settings(values);
}

Settings parse_settings(const RawSettings& values) {
  Settings settings;

  settings.token_secret = kj::str(lookup(values, "token_secret"_kj, ""_kj));
  if (settings.token_secret.size() == 0) {
    throw ConfigException("Setting 'token_secret' is required");
  }
  check_secret("token_secret"_kj, settings.token_secret);

  settings.token_previous_secrets =
      split_list(lookup(values, "token_previous_secrets"_kj, ""_kj));
  for (auto& secret : settings.token_previous_secrets) {
    check_secret("token_previous_secrets"_kj, secret);
  }

  settings.token_ttl_access = parse_int(values, "token_ttl_access"_kj, 900);
  settings.token_ttl_refresh = parse_int(values, "token_ttl_refresh"_kj, 604800);
  if (settings.token_ttl_access <= 0 || settings.token_ttl_refresh <= 0) {
    throw ConfigException("Token lifetimes must be positive");
  }

  settings.super_user_login = kj::str(lookup(values, "super_user_login"_kj, "super-user"_kj));
  if (settings.super_user_login.size() == 0) {
    throw ConfigException("Setting 'super_user_login' must not be empty");
  }
  settings.super_user_password = kj::str(lookup(values, "super_user_password"_kj, ""_kj));

  settings.table_prefix = kj::str(lookup(values, "table_prefix"_kj, "keyward_"_kj));
  settings.db_schema = kj::str(lookup(values, "db_schema"_kj, ""_kj));
  if (!is_identifier(settings.table_prefix) || !is_identifier(settings.db_schema)) {
    throw ConfigException("Settings 'table_prefix' and 'db_schema' accept only [a-z0-9_]");
  }
  settings.data_dir = kj::str(lookup(values, "data_dir"_kj, ""_kj));

  auto iterations = parse_int(values, "password_hash_iterations"_kj, 120000);
  if (iterations < MIN_PASSWORD_HASH_ITERATIONS || iterations > MAX_PASSWORD_HASH_ITERATIONS) {
    throw ConfigException(kj::str("Setting 'password_hash_iterations' must be between ",
                                  MIN_PASSWORD_HASH_ITERATIONS, " and ",
                                  MAX_PASSWORD_HASH_ITERATIONS));
  }
  settings.password_hash_iterations = static_cast<uint32_t>(iterations);

  auto cache_size = parse_int(values, "permission_cache_size"_kj, 0);
  if (cache_size < 0) {
    throw ConfigException("Setting 'permission_cache_size' must not be negative");
  }
  settings.permission_cache_size = static_cast<size_t>(cache_size);

  settings.revocation_prune_interval = parse_int(values, "revocation_prune_interval"_kj, 300);
  if (settings.revocation_prune_interval < 0) {
    throw ConfigException("Setting 'revocation_prune_interval' must not be negative");
  }

  settings.log_level = to_lower(lookup(values, "log_level"_kj, "info"_kj));
  if (parse_log_level(settings.log_level) == kj::none) {
    throw ConfigException(kj::str("Unknown log level '", settings.log_level, "'"));
  }

  return settings;
}

kj::String Settings::describe() const {
  return kj::str("token_secret=", masked(token_secret),
                 "\ntoken_previous_secrets=", token_previous_secrets.size(), " key(s)",
                 "\ntoken_ttl_access=", token_ttl_access,
                 "\ntoken_ttl_refresh=", token_ttl_refresh,
                 "\nsuper_user_login=", super_user_login,
                 super_user_enabled() ? ""_kj : " (disabled)"_kj,
                 "\nsuper_user_password=", masked(super_user_password),
                 "\ntable_prefix=", table_prefix,
                 "\ndb_schema=", db_schema,
                 "\ndata_dir=", data_dir.size() == 0 ? "<memory>"_kj : data_dir.asPtr(),
                 "\npassword_hash_iterations=", password_hash_iterations,
                 "\npermission_cache_size=", permission_cache_size,
                 "\nrevocation_prune_interval=", revocation_prune_interval,
                 "\nlog_level=", log_level);
}

void apply_log_level(const Settings& settings) {
  KJ_IF_SOME(severity, parse_log_level(settings.log_level)) {
    kj::_::Debug::setLogLevel(severity);
  } else {
    throw ConfigException(kj::str("Unknown log level '", settings.log_level, "'"));
  }
}

} // namespace keyward::core
