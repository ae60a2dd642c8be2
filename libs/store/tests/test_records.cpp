#include "keyward/core/error.h"
#include "keyward/store/records.h"

#include <kj/test.h>

using namespace keyward::store;
using keyward::core::ValidationException;

namespace {

template <typename Fn> bool throws_validation(Fn&& fn) {
  try {
    fn();
  } catch (const ValidationException&) {
    return true;
  }
  return false;
}

KJ_TEST("Records: slug validation") {
  validate_slug("acme"_kj);
  validate_slug("acme-prod_2"_kj);

  KJ_EXPECT(throws_validation([] { validate_slug("ab"_kj); }));
  KJ_EXPECT(throws_validation([] { validate_slug("Acme"_kj); }));
  KJ_EXPECT(throws_validation([] { validate_slug("acme corp"_kj); }));
  KJ_EXPECT(throws_validation([] { validate_slug(""_kj); }));

  auto long_slug = kj::heapString(MAX_NAME_LENGTH + 1);
  for (auto& c : long_slug) {
    c = 'a';
  }
  KJ_EXPECT(throws_validation([&] { validate_slug(long_slug); }));
}

KJ_TEST("Records: login and role names allow single characters") {
  validate_login("a"_kj);
  validate_role_name("x"_kj);

  KJ_EXPECT(throws_validation([] { validate_login(""_kj); }));
  KJ_EXPECT(throws_validation([] { validate_login("alice@example"_kj); }));
  KJ_EXPECT(throws_validation([] { validate_role_name("Editors"_kj); }));
}

KJ_TEST("Records: permission format") {
  validate_permission("doc:read"_kj);
  validate_permission("billing.invoice:export"_kj);

  KJ_EXPECT(throws_validation([] { validate_permission("doc"_kj); }));
  KJ_EXPECT(throws_validation([] { validate_permission(":read"_kj); }));
  KJ_EXPECT(throws_validation([] { validate_permission("doc:"_kj); }));
  KJ_EXPECT(throws_validation([] { validate_permission("doc:read:all"_kj); }));
  KJ_EXPECT(throws_validation([] { validate_permission("doc: read"_kj); }));
  KJ_EXPECT(throws_validation([] { validate_permission(""_kj); }));
}

KJ_TEST("Records: normalize keeps first occurrence order") {
  kj::String input[] = {kj::str("doc:write"), kj::str("doc:read"), kj::str("doc:write"),
                        kj::str("user:list")};
  auto result = normalize_permissions(kj::arrayPtr(input, 4));

  KJ_ASSERT(result.size() == 3);
  KJ_EXPECT(result[0] == "doc:write");
  KJ_EXPECT(result[1] == "doc:read");
  KJ_EXPECT(result[2] == "user:list");
}

KJ_TEST("Records: normalize rejects the whole list on one bad entry") {
  kj::String input[] = {kj::str("doc:read"), kj::str("bogus")};
  KJ_EXPECT(throws_validation([&] { (void)normalize_permissions(kj::arrayPtr(input, 2)); }));
}

KJ_TEST("TableNames: prefix and schema qualification") {
  auto plain = TableNames::make(""_kj, ""_kj);
  KJ_EXPECT(plain.users == "users");
  KJ_EXPECT(plain.journal == "journal");

  auto prefixed = TableNames::make(""_kj, "kw_"_kj);
  KJ_EXPECT(prefixed.roles == "kw_roles");

  auto qualified = TableNames::make("auth"_kj, "kw_"_kj);
  KJ_EXPECT(qualified.applications == "auth.kw_applications");
  KJ_EXPECT(qualified.revoked_tokens == "auth.kw_revoked_tokens");
  KJ_EXPECT(qualified.journal == "auth.kw_journal");

  auto copy = qualified.clone();
  KJ_EXPECT(copy.grants == qualified.grants);
}

KJ_TEST("Records: clone is deep") {
  kj::String permissions[] = {kj::str("doc:read")};
  Role role{kj::str("r1"), kj::str("app"), kj::str("reader"), kj::str(""),
            clone_strings(kj::arrayPtr(permissions, 1)), 10, 20};

  auto copy = role.clone();
  role.permissions[0] = kj::str("doc:write");

  KJ_EXPECT(copy.permissions[0] == "doc:read");
  KJ_EXPECT(copy.created_at == 10);
  KJ_EXPECT(copy.updated_at == 20);
}

} // namespace
