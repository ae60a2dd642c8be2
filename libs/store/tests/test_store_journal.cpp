#include "keyward/core/error.h"
#include "keyward/core/time.h"
#include "keyward/store/memory_store.h"
#include "keyward/store/store_journal.h"

#include <cstring>
#include <kj/filesystem.h>
#include <kj/test.h>
#include <kj/time.h>

using namespace keyward::store;

namespace {

JournalConfig fast_config() {
  JournalConfig config;
  config.sync_on_write = false;
  return config;
}

kj::Own<MemoryCredentialStore> open_store(const kj::Directory& dir,
                                          kj::StringPtr prefix = ""_kj,
                                          JournalConfig config = fast_config()) {
  auto tables = TableNames::make(""_kj, prefix);
  auto journal = kj::heap<StoreJournal>(dir, tables.clone(), kj::mv(config));
  return kj::heap<MemoryCredentialStore>(kj::mv(tables), kj::mv(journal));
}

kj::Array<kj::String> perms(std::initializer_list<kj::StringPtr> items) {
  auto builder = kj::heapArrayBuilder<kj::String>(items.size());
  for (auto item : items) {
    builder.add(kj::str(item));
  }
  return builder.finish();
}

// Records every replayed call so tests can check order and content.
class RecordingTarget final : public JournalReplayTarget {
public:
  void restore(StoreSnapshot snapshot) override {
    calls.add(kj::str("restore:", snapshot.applications.size()));
  }
  void put_application(Application record) override {
    calls.add(kj::str("app:", record.slug));
  }
  void remove_application(kj::StringPtr id) override {
    calls.add(kj::str("-app:", id));
  }
  void put_user(User record) override {
    calls.add(kj::str("user:", record.login));
  }
  void remove_user(kj::StringPtr id) override {
    calls.add(kj::str("-user:", id));
  }
  void put_role(Role record) override {
    calls.add(kj::str("role:", record.name));
  }
  void remove_role(kj::StringPtr id) override {
    calls.add(kj::str("-role:", id));
  }
  void put_grant(Grant record) override {
    calls.add(kj::str("grant:", record.role_id));
  }
  void remove_grant(kj::StringPtr, kj::StringPtr role_id) override {
    calls.add(kj::str("-grant:", role_id));
  }
  void put_revoked(RevokedToken record) override {
    calls.add(kj::str("revoked:", record.jti));
  }
  void prune_revoked(int64_t now) override {
    calls.add(kj::str("prune:", now));
  }

  kj::Vector<kj::String> calls;
};

// =============================================================================
// Writing
// =============================================================================

KJ_TEST("StoreJournal: sequence numbers start at one") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  StoreJournal journal(*dir, TableNames::make(""_kj, ""_kj), fast_config());

  RecordingTarget target;
  journal.replay(target);
  KJ_EXPECT(journal.is_healthy());
  KJ_EXPECT(journal.current_sequence() == 0);

  Application app{kj::str("a1"), kj::str("acme"), kj::str("Acme"), kj::str(""), true, 1, 1};
  KJ_EXPECT(journal.log_application_put(app) == 1);
  KJ_EXPECT(journal.log_revoked_put(RevokedToken{kj::str("j1"), 100, 50}) == 2);
  KJ_EXPECT(journal.current_sequence() == 2);

  auto stats = journal.stats();
  KJ_EXPECT(stats.entries_written == 2);
  KJ_EXPECT(stats.bytes_written > 2 * sizeof(JournalEntryHeader));
  KJ_EXPECT(dir->exists(kj::Path("journal_0000000000000001.wal"_kj)));
}

KJ_TEST("StoreJournal: writing before replay is refused") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  StoreJournal journal(*dir, TableNames::make(""_kj, ""_kj), fast_config());

  auto error = kj::runCatchingExceptions([&]() { journal.log_user_delete("u1"_kj); });
  KJ_EXPECT(error != kj::none);
}

// =============================================================================
// Replay
// =============================================================================

KJ_TEST("StoreJournal: replay delivers entries in write order") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  {
    StoreJournal journal(*dir, TableNames::make(""_kj, ""_kj), fast_config());
    RecordingTarget empty;
    journal.replay(empty);

    journal.log_application_put(
        Application{kj::str("a1"), kj::str("acme"), kj::str("Acme"), kj::str(""), true, 1, 1});
    journal.log_user_put(User{kj::str("u1"), kj::str("a1"), kj::str("alice"), kj::str("h"),
                              true, 1, 1});
    journal.log_role_put(Role{kj::str("r1"), kj::str("a1"), kj::str("reader"), kj::str(""),
                              perms({"doc:read"_kj}), 1, 1});
    journal.log_grant_put(Grant{kj::str("u1"), kj::str("r1"), kj::str("a1"), 1});
    journal.log_grant_delete("u1"_kj, "r1"_kj);
    journal.log_revoked_prune(500);
  }

  StoreJournal reopened(*dir, TableNames::make(""_kj, ""_kj), fast_config());
  RecordingTarget target;
  reopened.replay(target);

  KJ_ASSERT(target.calls.size() == 6);
  KJ_EXPECT(target.calls[0] == "app:acme");
  KJ_EXPECT(target.calls[1] == "user:alice");
  KJ_EXPECT(target.calls[2] == "role:reader");
  KJ_EXPECT(target.calls[3] == "grant:r1");
  KJ_EXPECT(target.calls[4] == "-grant:r1");
  KJ_EXPECT(target.calls[5] == "prune:500");
  KJ_EXPECT(reopened.current_sequence() == 6);
  KJ_EXPECT(reopened.stats().entries_replayed == 6);
}

KJ_TEST("StoreJournal: entries for another prefix are skipped") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  auto ours = TableNames::make(""_kj, "kw_"_kj);
  {
    StoreJournal journal(*dir, ours.clone(), fast_config());
    RecordingTarget empty;
    journal.replay(empty);
    journal.log_revoked_put(RevokedToken{kj::str("j1"), 100, 50});
  }

  // Same journal files, but the revoked token table is qualified differently.
  auto foreign = ours.clone();
  foreign.revoked_tokens = kj::str("other_revoked_tokens");
  StoreJournal journal(*dir, kj::mv(foreign), fast_config());
  RecordingTarget target;
  journal.replay(target);

  KJ_EXPECT(target.calls.size() == 0);
  KJ_EXPECT(journal.stats().foreign_entries == 1);
}

KJ_TEST("StoreJournal: torn tail is skipped and cut off") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  auto filename = kj::Path("journal_0000000000000001.wal"_kj);
  {
    StoreJournal journal(*dir, TableNames::make(""_kj, ""_kj), fast_config());
    RecordingTarget empty;
    journal.replay(empty);
    journal.log_revoked_put(RevokedToken{kj::str("j1"), 100, 50});
  }

  // Simulate a crash in the middle of writing the second entry.
  {
    auto file = dir->openFile(filename, kj::WriteMode::MODIFY);
    auto size = file->stat().size;
    kj::byte garbage[64];
    for (auto& b : garbage) {
      b = 0xAB;
    }
    file->write(size, kj::arrayPtr(garbage, sizeof(garbage)));
  }

  {
    StoreJournal journal(*dir, TableNames::make(""_kj, ""_kj), fast_config());
    RecordingTarget target;
    journal.replay(target);
    KJ_ASSERT(target.calls.size() == 1);
    KJ_EXPECT(target.calls[0] == "revoked:j1");
    KJ_EXPECT(journal.stats().corrupted_entries == 1);

    journal.log_revoked_put(RevokedToken{kj::str("j2"), 100, 50});
  }

  // The entry written after recovery must be reachable.
  StoreJournal journal(*dir, TableNames::make(""_kj, ""_kj), fast_config());
  RecordingTarget target;
  journal.replay(target);
  KJ_ASSERT(target.calls.size() == 2);
  KJ_EXPECT(target.calls[1] == "revoked:j2");
  KJ_EXPECT(journal.stats().corrupted_entries == 0);
}

// Flips every bit of one byte in place.
void corrupt_byte(const kj::Directory& dir, kj::PathPtr path, uint64_t offset) {
  auto file = dir.openFile(path, kj::WriteMode::MODIFY);
  auto bytes = file->readAllBytes();
  KJ_ASSERT(offset < bytes.size());
  kj::byte flipped = bytes[offset] ^ 0xFF;
  file->write(offset, kj::arrayPtr(&flipped, 1));
}

KJ_TEST("StoreJournal: replay stops at a corrupted entry in the middle of a file") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  auto filename = kj::Path("journal_0000000000000001.wal"_kj);
  uint64_t first_entry_end = 0;
  uint64_t second_entry_end = 0;
  {
    StoreJournal journal(*dir, TableNames::make(""_kj, ""_kj), fast_config());
    RecordingTarget empty;
    journal.replay(empty);
    journal.log_user_put(User{kj::str("u1"), kj::str("a1"), kj::str("alice"), kj::str("h"),
                              true, 1, 1});
    first_entry_end = journal.stats().bytes_written;
    journal.log_user_delete("u1"_kj);
    second_entry_end = journal.stats().bytes_written;
    journal.log_grant_put(Grant{kj::str("u1"), kj::str("r1"), kj::str("a1"), 1});
  }

  // Last payload byte of the delete entry.
  corrupt_byte(*dir, filename, second_entry_end - 1);

  {
    StoreJournal journal(*dir, TableNames::make(""_kj, ""_kj), fast_config());
    RecordingTarget target;
    journal.replay(target);
    KJ_ASSERT(target.calls.size() == 1);
    KJ_EXPECT(target.calls[0] == "user:alice");
    KJ_EXPECT(journal.stats().corrupted_entries == 1);
    KJ_EXPECT(journal.current_sequence() == 1);
    KJ_EXPECT(journal.is_healthy());

    // The file was cut at the bad entry, so new writes follow the last good one.
    KJ_EXPECT(dir->openFile(filename)->stat().size == first_entry_end);
    journal.log_revoked_put(RevokedToken{kj::str("j2"), 100, 50});
  }

  StoreJournal journal(*dir, TableNames::make(""_kj, ""_kj), fast_config());
  RecordingTarget target;
  journal.replay(target);
  KJ_ASSERT(target.calls.size() == 2);
  KJ_EXPECT(target.calls[0] == "user:alice");
  KJ_EXPECT(target.calls[1] == "revoked:j2");
  KJ_EXPECT(journal.stats().corrupted_entries == 0);
}

KJ_TEST("StoreJournal: corruption in an older file makes the journal read-only") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  JournalConfig config = fast_config();
  config.max_file_size = 1;
  auto first = kj::Path("journal_0000000000000001.wal"_kj);
  {
    StoreJournal journal(*dir, TableNames::make(""_kj, ""_kj), config);
    RecordingTarget empty;
    journal.replay(empty);
    journal.log_user_put(User{kj::str("u1"), kj::str("a1"), kj::str("alice"), kj::str("h"),
                              true, 1, 1});
    journal.log_user_put(User{kj::str("u1"), kj::str("a1"), kj::str("alice"), kj::str("h"),
                              false, 1, 2});
    journal.log_grant_put(Grant{kj::str("u1"), kj::str("r1"), kj::str("a1"), 1});
  }
  auto first_size = dir->openFile(first)->stat().size;
  corrupt_byte(*dir, first, first_size - 1);

  StoreJournal journal(*dir, TableNames::make(""_kj, ""_kj), config);
  RecordingTarget target;
  journal.replay(target);
  KJ_EXPECT(target.calls.size() == 0);
  KJ_EXPECT(journal.stats().corrupted_entries == 1);
  KJ_EXPECT(!journal.is_healthy());

  bool refused = false;
  try {
    journal.log_revoked_put(RevokedToken{kj::str("j1"), 100, 50});
  } catch (const keyward::core::StoreUnavailable&) {
    refused = true;
  }
  KJ_EXPECT(refused);
  KJ_EXPECT(dir->exists(kj::Path("journal_0000000000000003.wal"_kj)));
}

KJ_TEST("StoreJournal: entry timestamps come from the injected clock") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  keyward::core::ManualClock clock(1700000000);
  {
    StoreJournal journal(*dir, TableNames::make(""_kj, ""_kj), fast_config(), clock);
    RecordingTarget empty;
    journal.replay(empty);
    journal.log_revoked_put(RevokedToken{kj::str("j1"), 100, 50});
  }

  auto bytes = dir->openFile(kj::Path("journal_0000000000000001.wal"_kj))->readAllBytes();
  KJ_ASSERT(bytes.size() > sizeof(JournalEntryHeader));
  JournalEntryHeader header;
  std::memcpy(&header, bytes.begin(), sizeof(header));
  KJ_EXPECT(header.timestamp == 1700000000);
}

KJ_TEST("StoreJournal: files rotate at the size limit") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  JournalConfig config = fast_config();
  config.max_file_size = 1;

  {
    StoreJournal journal(*dir, TableNames::make(""_kj, ""_kj), config);
    RecordingTarget empty;
    journal.replay(empty);
    journal.log_revoked_put(RevokedToken{kj::str("j1"), 100, 50});
    journal.log_revoked_put(RevokedToken{kj::str("j2"), 100, 50});
    journal.log_revoked_put(RevokedToken{kj::str("j3"), 100, 50});
    KJ_EXPECT(journal.stats().rotations == 2);
  }
  KJ_EXPECT(dir->exists(kj::Path("journal_0000000000000003.wal"_kj)));

  StoreJournal journal(*dir, TableNames::make(""_kj, ""_kj), config);
  RecordingTarget target;
  journal.replay(target);
  KJ_ASSERT(target.calls.size() == 3);
  KJ_EXPECT(target.calls[2] == "revoked:j3");
}

// =============================================================================
// Store integration
// =============================================================================

KJ_TEST("StoreJournal: store state survives reopen") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  kj::String app_id;
  kj::String user_id;
  uint64_t generation = 0;
  {
    auto store = open_store(*dir);
    auto app = store->create_application("acme"_kj, "Acme"_kj, ""_kj);
    auto user = store->create_user(app.id, "alice"_kj, "hash"_kj);
    auto editor = store->create_role(app.id, "editor"_kj, perms({"doc:write"_kj}), ""_kj);
    auto reader = store->create_role(app.id, "reader"_kj, perms({"doc:read"_kj}), ""_kj);
    store->grant_role(app.id, user.id, editor.id);
    store->grant_role(app.id, user.id, reader.id);
    store->revoke_role(app.id, user.id, editor.id);
    store->set_user_enabled(app.id, user.id, false);
    store->set_user_enabled(app.id, user.id, true);
    store->insert_revoked("jti-1"_kj, 4000000000, 100);
    app_id = kj::mv(app.id);
    user_id = kj::mv(user.id);
    generation = store->generation();
  }

  auto store = open_store(*dir);
  auto roles = store->user_roles(app_id, user_id);
  KJ_EXPECT(roles.active);
  KJ_ASSERT(roles.roles.size() == 1);
  KJ_EXPECT(roles.roles[0] == "reader");
  KJ_ASSERT(roles.permissions.size() == 1);
  KJ_EXPECT(roles.permissions[0] == "doc:read");
  KJ_EXPECT(store->is_revoked("jti-1"_kj));
  KJ_EXPECT(store->find_user_by_login(app_id, "alice"_kj) != kj::none);
  KJ_EXPECT(store->stats().roles == 2);
  KJ_EXPECT(generation > 0);
}

KJ_TEST("StoreJournal: compaction keeps state and drops old files") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  kj::String app_id;
  {
    auto store = open_store(*dir);
    auto app = store->create_application("acme"_kj, "Acme"_kj, ""_kj);
    auto temp = store->create_application("temp"_kj, "Temp"_kj, ""_kj);
    store->create_user(app.id, "alice"_kj, "hash"_kj);
    store->delete_application(temp.id);
    store->insert_revoked("jti-1"_kj, 4000000000, 100);

    store->compact();

    KJ_IF_SOME(stats, store->journal_stats()) {
      KJ_EXPECT(stats.checkpoints == 1);
    } else {
      KJ_FAIL_EXPECT("journal stats missing");
    }
    KJ_EXPECT(!dir->exists(kj::Path("journal_0000000000000001.wal"_kj)));

    // Writes after the checkpoint land in the new file.
    store->create_user(app.id, "bob"_kj, "hash"_kj);
    app_id = kj::mv(app.id);
  }

  auto store = open_store(*dir);
  KJ_EXPECT(store->list_applications().size() == 1);
  KJ_EXPECT(store->find_application_by_slug("temp"_kj) == kj::none);
  KJ_EXPECT(store->list_users(app_id).size() == 2);
  KJ_EXPECT(store->is_revoked("jti-1"_kj));
}

KJ_TEST("StoreJournal: stores with different prefixes share a directory") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  {
    auto a = open_store(*dir, "a_"_kj);
    auto b = open_store(*dir, "b_"_kj);
    a->create_application("alpha"_kj, "Alpha"_kj, ""_kj);
    b->create_application("bravo"_kj, "Bravo"_kj, ""_kj);
  }

  auto a = open_store(*dir, "a_"_kj);
  auto b = open_store(*dir, "b_"_kj);
  KJ_ASSERT(a->list_applications().size() == 1);
  KJ_EXPECT(a->list_applications()[0].slug == "alpha");
  KJ_ASSERT(b->list_applications().size() == 1);
  KJ_EXPECT(b->list_applications()[0].slug == "bravo");
}

KJ_TEST("StoreJournal: failed write leaves the store unchanged") {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  // A directory where the first journal file should go makes the journal unwritable.
  dir->openSubdir(kj::Path("journal_0000000000000001.wal"_kj),
                  kj::WriteMode::CREATE | kj::WriteMode::MODIFY);

  auto store = open_store(*dir);
  KJ_IF_SOME(stats, store->journal_stats()) {
    KJ_EXPECT(stats.entries_written == 0);
  }

  bool unavailable = false;
  try {
    store->create_application("acme"_kj, "Acme"_kj, ""_kj);
  } catch (const keyward::core::StoreUnavailable&) {
    unavailable = true;
  }
  KJ_EXPECT(unavailable);
  KJ_EXPECT(store->list_applications().size() == 0);
  KJ_EXPECT(store->generation() == 0);

  unavailable = false;
  try {
    store->insert_revoked("jti-1"_kj, 4000000000, 100);
  } catch (const keyward::core::StoreUnavailable&) {
    unavailable = true;
  }
  KJ_EXPECT(unavailable);
  KJ_EXPECT(!store->is_revoked("jti-1"_kj));
}

} // namespace
