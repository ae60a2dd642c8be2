#include "keyward/auth/auth_service.h"
#include "keyward/core/error.h"
#include "keyward/core/time.h"
#include "keyward/store/memory_store.h"

#include <kj/test.h>

using namespace keyward::auth;
using keyward::core::Conflict;
using keyward::core::InvalidCredentials;
using keyward::core::ManualClock;
using keyward::core::NotFound;
using keyward::core::PermissionDenied;
using keyward::core::TokenError;
using keyward::core::TokenInvalid;
using keyward::core::ValidationException;
using keyward::store::ApplicationPatch;
using keyward::store::MemoryCredentialStore;
using keyward::store::TableNames;

namespace {

constexpr int64_t START = 1700000000;
const kj::StringPtr SECRET = "auth-service-test-secret-0123456789abcdef"_kj;

kj::Array<kj::String> strings(std::initializer_list<kj::StringPtr> items) {
  auto builder = kj::heapArrayBuilder<kj::String>(items.size());
  for (auto item : items) {
    builder.add(kj::str(item));
  }
  return builder.finish();
}

template <typename E, typename Fn> bool throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

template <typename Fn> TokenError reason_of(Fn&& fn) {
  try {
    fn();
  } catch (const TokenInvalid& e) {
    return e.reason();
  }
  return TokenError::NONE;
}

AuthConfig test_config() {
  AuthConfig config;
  config.access_ttl = 900;
  config.refresh_ttl = 3600;
  config.super_user_login = kj::str("root");
  config.super_user_password = kj::str("root-password");
  return config;
}

// Application "docs" with alice (editor: doc:read, doc:write) and bob (no roles).
struct Fixture {
  ManualClock clock{START};
  MemoryCredentialStore store{TableNames::make(""_kj, "kw_"_kj), clock};
  PasswordHasher hasher;
  KeyRing keys{SECRET};
  TokenEngine tokens{keys, store, clock};
  PermissionResolver resolver{store, 64};
  AuthService auth;

  kj::String app_id;
  kj::String alice_id;
  kj::String bob_id;
  kj::String editor_id;

  explicit Fixture(uint32_t iterations = 1000, AuthConfig config = test_config())
      : hasher(iterations), auth(store, hasher, tokens, resolver, kj::mv(config)) {
    store.reserve_login("root"_kj);
    app_id = kj::mv(store.create_application("docs"_kj, "Docs"_kj, ""_kj).id);
    editor_id = kj::mv(
        store.create_role(app_id, "editor"_kj, strings({"doc:read"_kj, "doc:write"_kj}), ""_kj)
            .id);
    alice_id = kj::mv(auth.register_user(app_id, "alice"_kj, "alice-pw"_kj).id);
    bob_id = kj::mv(auth.register_user(app_id, "bob"_kj, "bob-pw"_kj).id);
    store.grant_role(app_id, alice_id, editor_id);
  }
};

// =============================================================================
// Login and authorization
// =============================================================================

KJ_TEST("AuthService: login issues a paired token set") {
  Fixture f;
  auto pair = f.auth.login(f.app_id, "alice"_kj, "alice-pw"_kj);

  KJ_EXPECT(pair.access.expires_at == START + 900);
  KJ_EXPECT(pair.refresh.expires_at == START + 3600);

  auto claims = f.tokens.validate(pair.access.token, TokenType::ACCESS);
  KJ_EXPECT(claims.subject == f.alice_id);
  KJ_EXPECT(claims.application_id == f.app_id);
  KJ_ASSERT(claims.roles.size() == 1);
  KJ_EXPECT(claims.roles[0] == "editor");
  KJ_IF_SOME(sid, claims.session_id) {
    KJ_EXPECT(sid == pair.refresh.jti);
  } else {
    KJ_FAIL_EXPECT("access token is not paired");
  }
}

KJ_TEST("AuthService: editor may read and write but not delete") {
  Fixture f;
  auto pair = f.auth.login(f.app_id, "alice"_kj, "alice-pw"_kj);

  KJ_EXPECT(f.auth.authorize(pair.access.token, "doc:read"_kj).subject == f.alice_id);
  (void)f.auth.authorize(pair.access.token, "doc:write"_kj);

  bool denied = false;
  try {
    (void)f.auth.authorize(pair.access.token, "doc:delete"_kj);
  } catch (const PermissionDenied& e) {
    denied = true;
    KJ_EXPECT(e.permission() == "doc:delete");
    KJ_EXPECT(e.trace_id().size() > 0);
  }
  KJ_EXPECT(denied);

  auto permissions = f.auth.permissions(pair.access.token);
  KJ_EXPECT(permissions.size() == 2);
}

KJ_TEST("AuthService: user without roles is denied everything") {
  Fixture f;
  auto pair = f.auth.login(f.app_id, "bob"_kj, "bob-pw"_kj);
  KJ_EXPECT(throws<PermissionDenied>([&] { (void)f.auth.authorize(pair.access.token, "doc:read"_kj); }));
  KJ_EXPECT(f.auth.permissions(pair.access.token).empty());
}

KJ_TEST("AuthService: grant changes apply to existing access tokens") {
  Fixture f;
  auto pair = f.auth.login(f.app_id, "bob"_kj, "bob-pw"_kj);
  KJ_EXPECT(throws<PermissionDenied>([&] { (void)f.auth.authorize(pair.access.token, "doc:read"_kj); }));

  f.store.grant_role(f.app_id, f.bob_id, f.editor_id);
  (void)f.auth.authorize(pair.access.token, "doc:read"_kj);

  f.store.revoke_role(f.app_id, f.bob_id, f.editor_id);
  KJ_EXPECT(throws<PermissionDenied>([&] { (void)f.auth.authorize(pair.access.token, "doc:read"_kj); }));
}

KJ_TEST("AuthService: login failures are indistinguishable") {
  Fixture f;
  auto other = f.store.create_application("other"_kj, "Other"_kj, ""_kj);
  ApplicationPatch patch;
  patch.enabled = false;
  f.store.update_application(other.id, kj::mv(patch));
  f.store.set_user_enabled(f.app_id, f.bob_id, false);

  auto failure = [&](kj::StringPtr app_id, kj::StringPtr login, kj::StringPtr password) {
    try {
      (void)f.auth.login(app_id, login, password);
    } catch (const InvalidCredentials& e) {
      KJ_EXPECT(e.trace_id().size() > 0);
      // Strip the per-call trace id so only the shape of the message is compared.
      auto message = kj::str(e.message());
      return kj::str(message.slice(0, message.size() - e.trace_id().size() - 1));
    }
    KJ_FAIL_EXPECT("login should have failed", login);
    return kj::str();
  };

  auto wrong_password = failure(f.app_id, "alice"_kj, "nope"_kj);
  auto unknown_user = failure(f.app_id, "mallory"_kj, "alice-pw"_kj);
  auto unknown_app = failure("no-such-app"_kj, "alice"_kj, "alice-pw"_kj);
  auto disabled_app = failure(other.id, "alice"_kj, "alice-pw"_kj);
  auto disabled_user = failure(f.app_id, "bob"_kj, "bob-pw"_kj);

  KJ_EXPECT(wrong_password == unknown_user);
  KJ_EXPECT(wrong_password == unknown_app);
  KJ_EXPECT(wrong_password == disabled_app);
  KJ_EXPECT(wrong_password == disabled_user);
}

KJ_TEST("AuthService: users are scoped to their application") {
  Fixture f;
  auto other = f.store.create_application("other"_kj, "Other"_kj, ""_kj);
  auto carol = f.auth.register_user(other.id, "carol"_kj, "carol-pw"_kj);
  auto viewer = f.store.create_role(other.id, "viewer"_kj, strings({"doc:read"_kj}), ""_kj);
  f.store.grant_role(other.id, carol.id, viewer.id);

  // Same login, different application.
  KJ_EXPECT(throws<InvalidCredentials>([&] { (void)f.auth.login(f.app_id, "carol"_kj, "carol-pw"_kj); }));
  KJ_EXPECT(throws<InvalidCredentials>([&] { (void)f.auth.login(other.id, "alice"_kj, "alice-pw"_kj); }));

  // A role from one application cannot be granted in another.
  KJ_EXPECT(throws<NotFound>([&] { f.store.grant_role(f.app_id, f.alice_id, viewer.id); }));

  auto pair = f.auth.login(other.id, "carol"_kj, "carol-pw"_kj);
  (void)f.auth.authorize(pair.access.token, "doc:read"_kj);
  KJ_EXPECT(throws<PermissionDenied>([&] { (void)f.auth.authorize(pair.access.token, "doc:write"_kj); }));
}

KJ_TEST("AuthService: login rehashes digests with an outdated cost") {
  Fixture f(1000);
  PasswordHasher stronger(2000);
  AuthService upgraded(f.store, stronger, f.tokens, f.resolver, test_config());

  (void)upgraded.login(f.app_id, "alice"_kj, "alice-pw"_kj);
  KJ_IF_SOME(user, f.store.get_user(f.app_id, f.alice_id)) {
    KJ_EXPECT(user.password_hash.startsWith("$pbkdf2-sha256$2000$"), user.password_hash);
    KJ_EXPECT(!stronger.needs_rehash(user.password_hash));
  } else {
    KJ_FAIL_EXPECT("alice vanished");
  }
  // The old cost still verifies on the old service.
  (void)f.auth.login(f.app_id, "alice"_kj, "alice-pw"_kj);
}

// =============================================================================
// Super-user
// =============================================================================

KJ_TEST("AuthService: super-user holds every permission in any application") {
  Fixture f;
  auto pair = f.auth.login("whatever-app"_kj, "root"_kj, "root-password"_kj);
  auto claims = f.auth.authorize(pair.access.token, "anything:whatsoever"_kj);
  KJ_EXPECT(claims.super_user);
  KJ_EXPECT(claims.subject == "root");
  KJ_EXPECT(f.auth.permissions(pair.access.token).is_all());

  KJ_EXPECT(throws<InvalidCredentials>([&] { (void)f.auth.login(f.app_id, "root"_kj, "wrong"_kj); }));
  KJ_EXPECT(throws<ValidationException>(
      [&] { f.auth.change_password(pair.access.token, "root-password"_kj, "new"_kj); }));
}

KJ_TEST("AuthService: super-user is off without a password") {
  auto config = test_config();
  config.super_user_password = kj::str();
  Fixture f(1000, kj::mv(config));
  KJ_EXPECT(throws<InvalidCredentials>([&] { (void)f.auth.login(f.app_id, "root"_kj, ""_kj); }));
}

KJ_TEST("AuthService: super-user tokens stop working once the super-user is disabled") {
  Fixture f;
  auto pair = f.auth.login(f.app_id, "root"_kj, "root-password"_kj);

  auto disabled_config = test_config();
  disabled_config.super_user_password = kj::str();
  AuthService disabled(f.store, f.hasher, f.tokens, f.resolver, kj::mv(disabled_config));
  KJ_EXPECT(reason_of([&] { (void)disabled.authorize(pair.access.token, "doc:read"_kj); }) ==
            TokenError::INACTIVE_SUBJECT);
  KJ_EXPECT(reason_of([&] { (void)disabled.permissions(pair.access.token); }) ==
            TokenError::INACTIVE_SUBJECT);

  auto renamed_config = test_config();
  renamed_config.super_user_login = kj::str("admin");
  AuthService renamed(f.store, f.hasher, f.tokens, f.resolver, kj::mv(renamed_config));
  KJ_EXPECT(reason_of([&] { (void)renamed.authorize(pair.access.token, "doc:read"_kj); }) ==
            TokenError::INACTIVE_SUBJECT);

  // Unchanged configuration keeps accepting it.
  (void)f.auth.authorize(pair.access.token, "doc:read"_kj);
}

KJ_TEST("AuthService: super-user login cannot be registered") {
  Fixture f;
  KJ_EXPECT(throws<Conflict>([&] { f.auth.register_user(f.app_id, "root"_kj, "pw"_kj); }));
  KJ_EXPECT(throws<Conflict>([&] { f.auth.register_user(f.app_id, "alice"_kj, "pw"_kj); }));
  KJ_EXPECT(throws<ValidationException>([&] { f.auth.register_user(f.app_id, "carol"_kj, ""_kj); }));
  KJ_EXPECT(throws<ValidationException>([&] { f.auth.register_user(f.app_id, ""_kj, "pw"_kj); }));
  KJ_EXPECT(throws<NotFound>([&] { f.auth.register_user("missing"_kj, "carol"_kj, "pw"_kj); }));
}

// =============================================================================
// Refresh and logout
// =============================================================================

KJ_TEST("AuthService: refresh rotates and is single use") {
  Fixture f;
  auto first = f.auth.login(f.app_id, "alice"_kj, "alice-pw"_kj);

  f.clock.advance(60);
  auto second = f.auth.refresh(first.refresh.token);
  KJ_EXPECT(second.refresh.jti != first.refresh.jti);
  KJ_EXPECT(second.access.issued_at == START + 60);
  (void)f.auth.authorize(second.access.token, "doc:read"_kj);

  KJ_EXPECT(reason_of([&] { (void)f.auth.refresh(first.refresh.token); }) == TokenError::REVOKED);
  KJ_EXPECT(reason_of([&] { (void)f.auth.refresh(second.access.token); }) ==
            TokenError::TYPE_MISMATCH);
  (void)f.auth.refresh(second.refresh.token);
}

KJ_TEST("AuthService: refresh picks up current roles") {
  Fixture f;
  auto pair = f.auth.login(f.app_id, "bob"_kj, "bob-pw"_kj);
  KJ_EXPECT(f.tokens.validate(pair.access.token, TokenType::ACCESS).roles.size() == 0);

  f.store.grant_role(f.app_id, f.bob_id, f.editor_id);
  auto next = f.auth.refresh(pair.refresh.token);
  auto claims = f.tokens.validate(next.access.token, TokenType::ACCESS);
  KJ_ASSERT(claims.roles.size() == 1);
  KJ_EXPECT(claims.roles[0] == "editor");
}

KJ_TEST("AuthService: refresh fails once the user is disabled or deleted") {
  Fixture f;
  auto alice = f.auth.login(f.app_id, "alice"_kj, "alice-pw"_kj);
  auto bob = f.auth.login(f.app_id, "bob"_kj, "bob-pw"_kj);

  f.store.set_user_enabled(f.app_id, f.alice_id, false);
  KJ_EXPECT(reason_of([&] { (void)f.auth.refresh(alice.refresh.token); }) ==
            TokenError::INACTIVE_SUBJECT);

  f.store.delete_user(f.app_id, f.bob_id);
  KJ_EXPECT(reason_of([&] { (void)f.auth.refresh(bob.refresh.token); }) ==
            TokenError::INACTIVE_SUBJECT);
}

KJ_TEST("AuthService: refresh token expires") {
  Fixture f;
  auto pair = f.auth.login(f.app_id, "alice"_kj, "alice-pw"_kj);
  f.clock.advance(3600);
  KJ_EXPECT(reason_of([&] { (void)f.auth.refresh(pair.refresh.token); }) == TokenError::EXPIRED);
}

KJ_TEST("AuthService: logout revokes both tokens of the pair") {
  Fixture f;
  auto pair = f.auth.login(f.app_id, "alice"_kj, "alice-pw"_kj);
  auto other = f.auth.login(f.app_id, "alice"_kj, "alice-pw"_kj);

  f.auth.logout(pair.access.token);
  KJ_EXPECT(reason_of([&] { (void)f.auth.authorize(pair.access.token, "doc:read"_kj); }) ==
            TokenError::REVOKED);
  KJ_EXPECT(reason_of([&] { (void)f.auth.refresh(pair.refresh.token); }) == TokenError::REVOKED);
  KJ_EXPECT(reason_of([&] { f.auth.logout(pair.access.token); }) == TokenError::REVOKED);

  // Other sessions are untouched.
  (void)f.auth.authorize(other.access.token, "doc:read"_kj);
}

// =============================================================================
// Password management
// =============================================================================

KJ_TEST("AuthService: change password requires the old one") {
  Fixture f;
  auto pair = f.auth.login(f.app_id, "alice"_kj, "alice-pw"_kj);

  KJ_EXPECT(throws<InvalidCredentials>(
      [&] { f.auth.change_password(pair.access.token, "wrong"_kj, "new-pw"_kj); }));
  KJ_EXPECT(throws<ValidationException>(
      [&] { f.auth.change_password(pair.access.token, "alice-pw"_kj, ""_kj); }));

  f.auth.change_password(pair.access.token, "alice-pw"_kj, "new-pw"_kj);
  KJ_EXPECT(throws<InvalidCredentials>([&] { (void)f.auth.login(f.app_id, "alice"_kj, "alice-pw"_kj); }));
  (void)f.auth.login(f.app_id, "alice"_kj, "new-pw"_kj);
}

KJ_TEST("AuthService: administrative password reset") {
  Fixture f;
  f.auth.reset_password(f.app_id, f.bob_id, "reset-pw"_kj);
  (void)f.auth.login(f.app_id, "bob"_kj, "reset-pw"_kj);
  KJ_EXPECT(throws<InvalidCredentials>([&] { (void)f.auth.login(f.app_id, "bob"_kj, "bob-pw"_kj); }));

  KJ_EXPECT(throws<NotFound>([&] { f.auth.reset_password(f.app_id, "missing"_kj, "pw"_kj); }));
  KJ_EXPECT(throws<ValidationException>([&] { f.auth.reset_password(f.app_id, f.bob_id, ""_kj); }));
}

KJ_TEST("AuthService: config comes from settings") {
  keyward::core::Settings settings;
  settings.token_ttl_access = 120;
  settings.token_ttl_refresh = 240;
  settings.super_user_login = kj::str("admin");
  settings.super_user_password = kj::str("pw");

  auto config = AuthConfig::from_settings(settings);
  KJ_EXPECT(config.access_ttl == 120);
  KJ_EXPECT(config.refresh_ttl == 240);
  KJ_EXPECT(config.super_user_login == "admin");
  KJ_EXPECT(config.super_user_password == "pw");
}

} // namespace
