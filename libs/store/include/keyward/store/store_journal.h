#pragma once

#include "keyward/core/time.h"
#include "keyward/store/records.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/filesystem.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace keyward::store {

// Journal entry types. Put entries carry a full record image.
enum class JournalEntryType : uint8_t {
  ApplicationPut = 1,
  ApplicationDelete = 2,
  UserPut = 3,
  UserDelete = 4,
  RolePut = 5,
  RoleDelete = 6,
  GrantPut = 7,
  GrantDelete = 8,
  RevokedPut = 9,
  RevokedPrune = 10,
  Checkpoint = 11 // Full snapshot; replaces everything replayed before it
};

// Entry header (fixed size, followed by payload_size bytes of payload)
struct JournalEntryHeader {
  uint32_t magic;
  uint32_t version;
  uint64_t sequence;
  int64_t timestamp;
  JournalEntryType type;
  uint8_t reserved[3];
  uint32_t payload_size;
  uint32_t checksum; // CRC32 of the payload

  static constexpr uint32_t MAGIC = 0x4B574A4C; // "KWJL"
  static constexpr uint32_t VERSION = 1;
};

struct JournalConfig {
  uint64_t max_file_size;
  bool sync_on_write;

  JournalConfig() : max_file_size(16 * 1024 * 1024), sync_on_write(true) {}
};

struct JournalStats {
  uint64_t entries_written{0};
  uint64_t entries_replayed{0};
  uint64_t bytes_written{0};
  uint64_t corrupted_entries{0};
  uint64_t foreign_entries{0};
  uint64_t rotations{0};
  uint64_t checkpoints{0};
  uint64_t current_sequence{0};
};

// Complete store contents, written as one checkpoint entry.
struct StoreSnapshot {
  kj::Array<Application> applications;
  kj::Array<User> users;
  kj::Array<Role> roles;
  kj::Array<Grant> grants;
  kj::Array<RevokedToken> revoked_tokens;
};

/**
 * @brief Receiver of replayed journal entries
 *
 * Implemented by the store; every call applies one already-validated change without
 * journaling it again.
 */
class JournalReplayTarget {
public:
  virtual ~JournalReplayTarget() = default;

  virtual void restore(StoreSnapshot snapshot) = 0;
  virtual void put_application(Application record) = 0;
  virtual void remove_application(kj::StringPtr id) = 0;
  virtual void put_user(User record) = 0;
  virtual void remove_user(kj::StringPtr id) = 0;
  virtual void put_role(Role record) = 0;
  virtual void remove_role(kj::StringPtr id) = 0;
  virtual void put_grant(Grant record) = 0;
  virtual void remove_grant(kj::StringPtr user_id, kj::StringPtr role_id) = 0;
  virtual void put_revoked(RevokedToken record) = 0;
  virtual void prune_revoked(int64_t now) = 0;
};

/**
 * @brief Write-ahead journal that makes the credential store durable
 *
 * Files are named `<journal table>_<16 hex digit sequence>.wal` inside the data directory.
 * Each entry payload starts with the qualified table name it applies to; entries written
 * under another schema or prefix are skipped on replay.
 *
 * Replay stops at the first entry that fails its header, length or checksum check. When that
 * entry is in the newest file the file is cut there; when it is in an older file the journal
 * stays read-only until it is repaired.
 *
 * replay() must run once before the first log_*() call. Any log_*() failure throws
 * core::StoreUnavailable and leaves the journal positioned so the next write overwrites
 * the partial entry.
 */
class StoreJournal final {
public:
  StoreJournal(const kj::Directory& directory, TableNames tables,
               JournalConfig config = JournalConfig(),
               const core::Clock& clock = core::system_clock());
  ~StoreJournal() noexcept(false);

  KJ_DISALLOW_COPY_AND_MOVE(StoreJournal);

  uint64_t log_application_put(const Application& record);
  uint64_t log_application_delete(kj::StringPtr id);
  uint64_t log_user_put(const User& record);
  uint64_t log_user_delete(kj::StringPtr id);
  uint64_t log_role_put(const Role& record);
  uint64_t log_role_delete(kj::StringPtr id);
  uint64_t log_grant_put(const Grant& record);
  uint64_t log_grant_delete(kj::StringPtr user_id, kj::StringPtr role_id);
  uint64_t log_revoked_put(const RevokedToken& record);
  uint64_t log_revoked_prune(int64_t now);

  /**
   * @brief Compact the journal
   *
   * Starts a new file holding one checkpoint entry with the full snapshot, syncs it, then
   * removes all older files.
   */
  uint64_t write_checkpoint(const StoreSnapshot& snapshot);

  // Replay all files in sequence order into `target`.
  void replay(JournalReplayTarget& target);

  void sync();

  [[nodiscard]] JournalStats stats() const;
  [[nodiscard]] uint64_t current_sequence() const;
  [[nodiscard]] bool is_healthy() const;
  [[nodiscard]] const TableNames& tables() const {
    return tables_;
  }

private:
  struct State {
    uint64_t sequence{0};
    JournalStats stats;
    bool healthy{true};
    bool replayed{false};
    kj::Maybe<kj::Own<const kj::File>> current_file;
    kj::String current_filename;
    uint64_t current_file_size{0};
  };

  uint64_t write_entry(JournalEntryType type, kj::ArrayPtr<const kj::byte> payload);
  uint64_t write_entry_locked(State& state, JournalEntryType type,
                              kj::ArrayPtr<const kj::byte> payload);
  void open_file_locked(State& state, kj::StringPtr filename);
  void rotate_locked(State& state);
  void dispatch(JournalEntryType type, kj::ArrayPtr<const kj::byte> payload,
                JournalReplayTarget& target, State& state);

  [[nodiscard]] kj::String generate_filename(uint64_t sequence) const;
  [[nodiscard]] kj::Vector<kj::String> list_journal_files() const;
  [[nodiscard]] kj::StringPtr table_for(JournalEntryType type) const;

  const kj::Directory& directory_;
  TableNames tables_;
  JournalConfig config_;
  const core::Clock& clock_;
  kj::MutexGuarded<State> state_;
};

} // namespace keyward::store
