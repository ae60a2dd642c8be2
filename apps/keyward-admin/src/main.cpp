#include "keyward/auth/auth_service.h"
#include "keyward/auth/key_ring.h"
#include "keyward/auth/password_hasher.h"
#include "keyward/auth/permission_resolver.h"
#include "keyward/auth/token_engine.h"
#include "keyward/core/error.h"
#include "keyward/core/settings.h"
#include "keyward/core/time.h"
#include "keyward/store/memory_store.h"
#include "keyward/store/store_journal.h"

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <kj/async-io.h>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <kj/string.h>
#include <kj/timer.h>
#include <kj/vector.h>

namespace {

using namespace keyward;

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_USAGE = 2;

constexpr kj::StringPtr USAGE = R"(usage: keyward-admin <command> [args]

commands:
  check-config                                 validate settings and print them
  stats                                        record counts and journal statistics
  create-app <slug> <name> [description]       create an application
  list-apps                                    list applications
  create-user <app-slug> <login> <password>    register a user
  create-role <app-slug> <name> <perm>...      create a role
  grant <app-slug> <login> <role>              grant a role to a user
  revoke-grant <app-slug> <login> <role>       take a role away from a user
  login <app-slug> <login> <password>          print an access and a refresh token
  authorize <access-token> <permission>        check one permission
  prune                                        drop expired revocation records
  compact                                      rewrite the journal as one checkpoint
  serve                                        prune periodically until SIGINT/SIGTERM

settings come from keyward.json ($KEYWARD_CONFIG), KEYWARD_* variables and
$KEYWARD_SECRETS_LOCATION.
)"_kj;

std::atomic<int> g_shutdown_signal{0};

void signal_handler(int signal) {
  g_shutdown_signal.store(signal, std::memory_order_release);
}

struct UsageError {
  kj::String message;
};

/**
 * @brief Everything a command needs, wired from one Settings
 *
 * Member order matters: the store journal refers to data_dir, and the auth components
 * refer to the store, so they are declared (and destroyed) in dependency order.
 */
class Runtime {
public:
  explicit Runtime(core::Settings settings)
      : settings_(kj::mv(settings)), store_(open_store()),
        hasher_(settings_.password_hash_iterations),
        keys_(settings_.token_secret, settings_.token_previous_secrets),
        tokens_(keys_, *store_), resolver_(*store_, settings_.permission_cache_size),
        auth_(*store_, hasher_, tokens_, resolver_, auth::AuthConfig::from_settings(settings_)) {}

  KJ_DISALLOW_COPY_AND_MOVE(Runtime);

  const core::Settings& settings() const {
    return settings_;
  }
  store::MemoryCredentialStore& store() {
    return *store_;
  }
  auth::KeyRing& keys() {
    return keys_;
  }
  auth::TokenEngine& tokens() {
    return tokens_;
  }
  auth::AuthService& auth() {
    return auth_;
  }

  store::Application require_app(kj::StringPtr slug) {
    KJ_IF_SOME(app, store_->find_application_by_slug(slug)) {
      return kj::mv(app);
    }
    throw core::NotFound(kj::str("No application with slug '", slug, "'"));
  }

  store::User require_user(const store::Application& app, kj::StringPtr login) {
    KJ_IF_SOME(user, store_->find_user_by_login(app.id, login)) {
      return kj::mv(user);
    }
    throw core::NotFound(kj::str("No user '", login, "' in application '", app.slug, "'"));
  }

  store::Role require_role(const store::Application& app, kj::StringPtr name) {
    KJ_IF_SOME(role, store_->find_role_by_name(app.id, name)) {
      return kj::mv(role);
    }
    throw core::NotFound(kj::str("No role '", name, "' in application '", app.slug, "'"));
  }

private:
  kj::Own<store::MemoryCredentialStore> open_store() {
    auto tables = store::TableNames::make(settings_.db_schema, settings_.table_prefix);
    kj::Own<store::MemoryCredentialStore> opened;

    if (settings_.data_dir.size() == 0) {
      KJ_LOG(WARNING, "data_dir is empty; changes will not survive this process");
      opened = kj::heap<store::MemoryCredentialStore>(kj::mv(tables));
    } else {
      KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
                   filesystem_ = kj::newDiskFilesystem();
                   auto path = filesystem_->getCurrentPath().evalNative(settings_.data_dir);
                   data_dir_ = filesystem_->getRoot().openSubdir(
                       path, kj::WriteMode::CREATE | kj::WriteMode::MODIFY |
                                 kj::WriteMode::CREATE_PARENT);
                 })) {
        throw core::StoreUnavailable(kj::str("Cannot open data directory ", settings_.data_dir,
                                             ": ", exception.getDescription()));
      }
      auto journal = kj::heap<store::StoreJournal>(*data_dir_, tables.clone());
      opened = kj::heap<store::MemoryCredentialStore>(kj::mv(tables), kj::mv(journal));
      KJ_LOG(INFO, "Credential store opened", settings_.data_dir);
    }

    if (settings_.super_user_login.size() > 0) {
      opened->reserve_login(settings_.super_user_login);
    }
    return opened;
  }

  core::Settings settings_;
  kj::Own<kj::Filesystem> filesystem_;
  kj::Own<const kj::Directory> data_dir_;
  kj::Own<store::MemoryCredentialStore> store_;
  auth::PasswordHasher hasher_;
  auth::KeyRing keys_;
  auth::TokenEngine tokens_;
  auth::PermissionResolver resolver_;
  auth::AuthService auth_;
};

void expect_args(kj::ArrayPtr<const kj::StringPtr> args, size_t min, size_t max,
                 kj::StringPtr synopsis) {
  if (args.size() < min || args.size() > max) {
    throw UsageError{kj::str("usage: keyward-admin ", synopsis)};
  }
}

// =============================================================================
// Commands
// =============================================================================

int cmd_check_config(Runtime& rt) {
  std::cout << rt.settings().describe().cStr() << "\n";
  auto ids = rt.keys().key_ids();
  std::cout << "signing keys: " << kj::strArray(ids, ", ").cStr() << "\n";
  return EXIT_OK;
}

int cmd_stats(Runtime& rt) {
  auto stats = rt.store().stats();
  std::cout << "applications:               " << stats.applications << "\n"
            << "users:                      " << stats.users << "\n"
            << "roles:                      " << stats.roles << "\n"
            << "grants:                     " << stats.grants << "\n"
            << "revoked tokens:             " << stats.revoked_tokens << "\n"
            << "applications without users: " << stats.applications_without_users << "\n"
            << "users without roles:        " << stats.users_without_roles << "\n"
            << "roles without permissions:  " << stats.roles_without_permissions << "\n"
            << "generation:                 " << stats.generation << "\n";

  KJ_IF_SOME(journal, rt.store().journal_stats()) {
    std::cout << "journal sequence:           " << journal.current_sequence << "\n"
              << "journal entries replayed:   " << journal.entries_replayed << "\n"
              << "journal corrupted entries:  " << journal.corrupted_entries << "\n"
              << "journal foreign entries:    " << journal.foreign_entries << "\n";
  } else {
    std::cout << "journal:                    none (memory only)\n";
  }
  return EXIT_OK;
}

int cmd_create_app(Runtime& rt, kj::ArrayPtr<const kj::StringPtr> args) {
  expect_args(args, 2, 3, "create-app <slug> <name> [description]"_kj);
  auto description = args.size() > 2 ? args[2] : ""_kj;
  auto app = rt.store().create_application(args[0], args[1], description);
  std::cout << app.id.cStr() << "\n";
  return EXIT_OK;
}

int cmd_list_apps(Runtime& rt) {
  for (auto& app : rt.store().list_applications()) {
    std::cout << app.slug.cStr() << "\t" << app.id.cStr() << "\t"
              << (app.enabled ? "enabled" : "disabled") << "\t" << app.name.cStr() << "\n";
  }
  return EXIT_OK;
}

int cmd_create_user(Runtime& rt, kj::ArrayPtr<const kj::StringPtr> args) {
  expect_args(args, 3, 3, "create-user <app-slug> <login> <password>"_kj);
  auto app = rt.require_app(args[0]);
  auto user = rt.auth().register_user(app.id, args[1], args[2]);
  std::cout << user.id.cStr() << "\n";
  return EXIT_OK;
}

int cmd_create_role(Runtime& rt, kj::ArrayPtr<const kj::StringPtr> args) {
  expect_args(args, 2, SIZE_MAX, "create-role <app-slug> <name> <perm>..."_kj);
  auto app = rt.require_app(args[0]);
  kj::Vector<kj::String> permissions(args.size() - 2);
  for (auto permission : args.slice(2, args.size())) {
    permissions.add(kj::str(permission));
  }
  auto role = rt.store().create_role(app.id, args[1], permissions.asPtr(), ""_kj);
  std::cout << role.id.cStr() << "\n";
  return EXIT_OK;
}

int cmd_grant(Runtime& rt, kj::ArrayPtr<const kj::StringPtr> args, bool grant) {
  expect_args(args, 3, 3,
              grant ? "grant <app-slug> <login> <role>"_kj
                    : "revoke-grant <app-slug> <login> <role>"_kj);
  auto app = rt.require_app(args[0]);
  auto user = rt.require_user(app, args[1]);
  auto role = rt.require_role(app, args[2]);
  if (grant) {
    (void)rt.store().grant_role(app.id, user.id, role.id);
  } else {
    rt.store().revoke_role(app.id, user.id, role.id);
  }
  return EXIT_OK;
}

int cmd_login(Runtime& rt, kj::ArrayPtr<const kj::StringPtr> args) {
  expect_args(args, 3, 3, "login <app-slug> <login> <password>"_kj);
  // An unknown slug still goes through login so the failure looks like any other.
  kj::String app_id = kj::str(args[0]);
  KJ_IF_SOME(app, rt.store().find_application_by_slug(args[0])) {
    app_id = kj::mv(app.id);
  }
  auto pair = rt.auth().login(app_id, args[1], args[2]);
  std::cout << "access:  " << pair.access.token.cStr() << "\n"
            << "refresh: " << pair.refresh.token.cStr() << "\n"
            << "expires: " << core::format_utc_iso8601(pair.access.expires_at).cStr() << "\n";
  return EXIT_OK;
}

int cmd_authorize(Runtime& rt, kj::ArrayPtr<const kj::StringPtr> args) {
  expect_args(args, 2, 2, "authorize <access-token> <permission>"_kj);
  auto claims = rt.auth().authorize(args[0], args[1]);
  std::cout << "allowed: " << claims.subject.cStr() << " in " << claims.application_id.cStr()
            << "\n";
  return EXIT_OK;
}

int cmd_prune(Runtime& rt) {
  std::cout << "pruned " << rt.tokens().prune_revoked() << " revocation records\n";
  return EXIT_OK;
}

int cmd_compact(Runtime& rt) {
  rt.store().compact();
  return EXIT_OK;
}

kj::Promise<void> prune_loop(kj::Timer& timer, auth::TokenEngine& tokens,
                             auth::PruneSchedule schedule) {
  while (g_shutdown_signal.load(std::memory_order_acquire) == 0) {
    if (schedule.due(core::now_unix_seconds())) {
      try {
        auto removed = tokens.prune_revoked();
        if (removed > 0) {
          KJ_LOG(INFO, "Pruned revocation records", removed);
        }
      } catch (const core::StoreUnavailable& e) {
        KJ_LOG(ERROR, "Revocation prune failed; retrying next interval", e.message());
      }
    }
    co_await timer.afterDelay(100 * kj::MILLISECONDS);
  }
  KJ_LOG(INFO, "Shutdown signal received", g_shutdown_signal.load(std::memory_order_acquire));
}

int cmd_serve(Runtime& rt) {
  std::signal(SIGTERM, signal_handler);
  std::signal(SIGINT, signal_handler);

  auto io = kj::setupAsyncIo();
  auth::PruneSchedule schedule(rt.settings().revocation_prune_interval);
  if (schedule.enabled()) {
    KJ_LOG(INFO, "Serving; pruning revocation records periodically",
           rt.settings().revocation_prune_interval);
  } else {
    KJ_LOG(INFO, "Serving; revocation pruning disabled");
  }
  if (!rt.settings().super_user_enabled()) {
    KJ_LOG(INFO, "Super-user login disabled", rt.settings().super_user_login);
  }
  prune_loop(io.provider->getTimer(), rt.tokens(), kj::mv(schedule)).wait(io.waitScope);
  KJ_LOG(INFO, "Stopped");
  return EXIT_OK;
}

int dispatch(kj::StringPtr command, kj::ArrayPtr<const kj::StringPtr> args) {
  // Commands without arguments reject extras before touching the store.
  auto no_args = [&]() { expect_args(args, 0, 0, command); };

  if (command == "check-config" || command == "stats" || command == "list-apps" ||
      command == "prune" || command == "compact" || command == "serve") {
    no_args();
  } else if (command != "create-app" && command != "create-user" && command != "create-role" &&
             command != "grant" && command != "revoke-grant" && command != "login" &&
             command != "authorize") {
    throw UsageError{kj::str("unknown command '", command, "'\n\n", USAGE)};
  }

  auto settings = core::SettingsLoader::standard().load();
  core::apply_log_level(settings);
  Runtime rt(kj::mv(settings));

  if (command == "check-config") return cmd_check_config(rt);
  if (command == "stats") return cmd_stats(rt);
  if (command == "create-app") return cmd_create_app(rt, args);
  if (command == "list-apps") return cmd_list_apps(rt);
  if (command == "create-user") return cmd_create_user(rt, args);
  if (command == "create-role") return cmd_create_role(rt, args);
  if (command == "grant") return cmd_grant(rt, args, true);
  if (command == "revoke-grant") return cmd_grant(rt, args, false);
  if (command == "login") return cmd_login(rt, args);
  if (command == "authorize") return cmd_authorize(rt, args);
  if (command == "prune") return cmd_prune(rt);
  if (command == "compact") return cmd_compact(rt);
  return cmd_serve(rt);
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << USAGE.cStr();
    return EXIT_USAGE;
  }
  kj::StringPtr command = argv[1];
  if (command == "help" || command == "--help" || command == "-h") {
    std::cout << USAGE.cStr();
    return EXIT_OK;
  }

  kj::Vector<kj::StringPtr> args(static_cast<size_t>(argc - 2));
  for (int i = 2; i < argc; ++i) {
    args.add(argv[i]);
  }

  try {
    return dispatch(command, args.asPtr());
  } catch (const UsageError& e) {
    std::cerr << e.message.cStr() << "\n";
    return EXIT_USAGE;
  } catch (const core::KeywardException& e) {
    std::cerr << "error: " << core::to_string(e.code()).cStr() << ": " << e.message().cStr()
              << "\n";
    return EXIT_ERROR;
  } catch (const kj::Exception& e) {
    KJ_LOG(ERROR, "Fatal KJ exception", e.getDescription());
    return EXIT_ERROR;
  } catch (const std::exception& e) {
    KJ_LOG(ERROR, "Fatal std::exception", e.what());
    return EXIT_ERROR;
  }
}
