#pragma once

#include "keyward/core/error.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace keyward::core {

// Raw field name -> textual value, before typing and validation.
using RawSettings = kj::TreeMap<kj::String, kj::String>;

constexpr size_t MIN_TOKEN_SECRET_LENGTH = 32;
constexpr uint32_t MIN_PASSWORD_HASH_ITERATIONS = 1000;
constexpr uint32_t MAX_PASSWORD_HASH_ITERATIONS = 10000000;

/**
 * @brief Resolved service configuration
 *
 * Produced once at startup by SettingsLoader and handed to every component by const
 * reference. Nothing mutates it after load().
 */
struct Settings {
  kj::String token_secret;
  kj::Array<kj::String> token_previous_secrets;
  int64_t token_ttl_access = 900;
  int64_t token_ttl_refresh = 604800;

  kj::String super_user_login;
  kj::String super_user_password; // empty disables super-user login

  kj::String table_prefix;
  kj::String db_schema;
  kj::String data_dir; // empty keeps the store in memory only

  uint32_t password_hash_iterations = 120000;
  size_t permission_cache_size = 0;
  int64_t revocation_prune_interval = 300;
  kj::String log_level;

  [[nodiscard]] bool super_user_enabled() const {
    return super_user_password.size() > 0;
  }

  // Human-readable dump with secrets masked.
  [[nodiscard]] kj::String describe() const;
};

/**
 * @brief One configuration layer
 *
 * Sources are applied in order; a later source overwrites fields an earlier one set.
 */
class SettingsSource {
public:
  virtual ~SettingsSource() = default;

  [[nodiscard]] virtual kj::StringPtr name() const = 0;
  virtual void apply(RawSettings& values) const = 0;
};

class DefaultsSource final : public SettingsSource {
public:
  [[nodiscard]] kj::StringPtr name() const override {
    return "defaults"_kj;
  }
  void apply(RawSettings& values) const override;
};

/**
 * @brief JSON configuration file, parsed with yyjson
 *
 * Nested objects are flattened with "__" between key segments, arrays of scalars are
 * joined with ','. A missing file is skipped; an unreadable or malformed one raises
 * ConfigException.
 */
class JsonFileSource final : public SettingsSource {
public:
  explicit JsonFileSource(kj::String path) : path_(kj::mv(path)) {}

  [[nodiscard]] kj::StringPtr name() const override {
    return "json-file"_kj;
  }
  void apply(RawSettings& values) const override;

  // Flatten a JSON document into `values`. Exposed for tests.
  static void apply_json(kj::StringPtr json, RawSettings& values);

private:
  kj::String path_;
};

// KEYWARD_<FIELD> environment variables.
class EnvironmentSource final : public SettingsSource {
public:
  explicit EnvironmentSource(kj::StringPtr prefix = "KEYWARD_"_kj) : prefix_(kj::str(prefix)) {}

  [[nodiscard]] kj::StringPtr name() const override {
    return "environment"_kj;
  }
  void apply(RawSettings& values) const override;

private:
  kj::String prefix_;
};

/**
 * @brief Container-style secrets directory
 *
 * Each field is read from a file named keyward_<field>; one trailing newline is
 * stripped. A missing directory is skipped.
 */
class SecretsDirSource final : public SettingsSource {
public:
  explicit SecretsDirSource(kj::String directory) : directory_(kj::mv(directory)) {}

  [[nodiscard]] kj::StringPtr name() const override {
    return "secrets-dir"_kj;
  }
  void apply(RawSettings& values) const override;

private:
  kj::String directory_;
};

// Fixed values, used for command-line overrides and in tests.
class OverrideSource final : public SettingsSource {
public:
  OverrideSource() = default;

  OverrideSource& set(kj::StringPtr field, kj::StringPtr value);

  [[nodiscard]] kj::StringPtr name() const override {
    return "overrides"_kj;
  }
  void apply(RawSettings& values) const override;

private:
  RawSettings values_;
};

class SettingsLoader {
public:
  SettingsLoader() = default;

  SettingsLoader& add(kj::Own<SettingsSource> source);

  /**
   * @brief Loader with the standard layering
   *
   * defaults, then $KEYWARD_CONFIG (default keyward.json), then KEYWARD_* environment
   * variables, then $KEYWARD_SECRETS_LOCATION (default /run/secrets).
   */
  static SettingsLoader standard();

  /**
   * @brief Apply every source and produce validated settings
   *
   * @throws ConfigException on a missing or short token secret, a malformed number or
   *         an unknown log level
   */
  [[nodiscard]] Settings load() const;

private:
  kj::Vector<kj::Own<SettingsSource>> sources_;
};

// Names of every recognised field, in declaration order.
[[nodiscard]] kj::ArrayPtr<const kj::StringPtr> settings_fields();

// Type and validate a raw value map.
[[nodiscard]] Settings parse_settings(const RawSettings& values);

/**
 * @brief Apply settings.log_level to KJ logging
 *
 * Accepted levels: debug, info, warning, error.
 */
void apply_log_level(const Settings& settings);

} // namespace keyward::core
