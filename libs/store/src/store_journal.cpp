#include "keyward/store/store_journal.h"

#include "keyward/core/error.h"
#include "keyward/core/time.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <kj/debug.h>

namespace keyward::store {

namespace {

// CRC32 (polynomial 0xEDB88320)
uint32_t crc32(kj::ArrayPtr<const kj::byte> data) {
  uint32_t crc = 0xFFFFFFFF;
  for (auto byte : data) {
    crc ^= static_cast<uint8_t>(byte);
    for (int i = 0; i < 8; ++i) {
      if (crc & 1) {
        crc = (crc >> 1) ^ 0xEDB88320;
      } else {
        crc >>= 1;
      }
    }
  }
  return ~crc;
}

class PayloadWriter {
public:
  void write_string(kj::StringPtr str) {
    uint32_t len = static_cast<uint32_t>(str.size());
    append(&len, sizeof(len));
    append(str.begin(), len);
  }

  void write_strings(kj::ArrayPtr<const kj::String> strings) {
    write_uint32(static_cast<uint32_t>(strings.size()));
    for (auto& s : strings) {
      write_string(s);
    }
  }

  void write_int64(int64_t value) {
    append(&value, sizeof(value));
  }

  void write_uint32(uint32_t value) {
    append(&value, sizeof(value));
  }

  void write_bool(bool value) {
    bytes_.add(static_cast<kj::byte>(value ? 1 : 0));
  }

  kj::Array<kj::byte> finish() {
    return bytes_.releaseAsArray();
  }

private:
  void append(const void* data, size_t size) {
    auto begin = reinterpret_cast<const kj::byte*>(data);
    bytes_.addAll(begin, begin + size);
  }

  kj::Vector<kj::byte> bytes_;
};

// Bounds-checked reader. Any overrun marks the payload corrupt.
class PayloadReader {
public:
  explicit PayloadReader(kj::ArrayPtr<const kj::byte> data) : data_(data) {}

  kj::String read_string() {
    uint32_t len = read_uint32();
    if (!ok_ || offset_ + len > data_.size()) {
      ok_ = false;
      return kj::heapString("");
    }
    auto result = kj::heapString(reinterpret_cast<const char*>(data_.begin() + offset_), len);
    offset_ += len;
    return result;
  }

  kj::Array<kj::String> read_strings() {
    uint32_t count = read_uint32();
    // Each string needs at least its 4-byte length prefix.
    if (!ok_ || count > (data_.size() - offset_) / sizeof(uint32_t)) {
      ok_ = false;
      return kj::heapArray<kj::String>(0);
    }
    auto builder = kj::heapArrayBuilder<kj::String>(count);
    for (uint32_t i = 0; i < count; ++i) {
      builder.add(read_string());
    }
    return builder.finish();
  }

  int64_t read_int64() {
    int64_t value = 0;
    read_raw(&value, sizeof(value));
    return value;
  }

  uint32_t read_uint32() {
    uint32_t value = 0;
    read_raw(&value, sizeof(value));
    return value;
  }

  bool read_bool() {
    if (offset_ >= data_.size()) {
      ok_ = false;
      return false;
    }
    return data_[offset_++] != 0;
  }

  [[nodiscard]] bool ok() const {
    return ok_;
  }

  // Whole payload consumed without overrun.
  [[nodiscard]] bool done() const {
    return ok_ && offset_ == data_.size();
  }

private:
  void read_raw(void* out, size_t size) {
    if (!ok_ || offset_ + size > data_.size()) {
      ok_ = false;
      return;
    }
    std::memcpy(out, data_.begin() + offset_, size);
    offset_ += size;
  }

  kj::ArrayPtr<const kj::byte> data_;
  size_t offset_{0};
  bool ok_{true};
};

// ---------------------------------------------------------------------------
// Record codecs
// ---------------------------------------------------------------------------

void encode(PayloadWriter& w, const Application& r) {
  w.write_string(r.id);
  w.write_string(r.slug);
  w.write_string(r.name);
  w.write_string(r.description);
  w.write_bool(r.enabled);
  w.write_int64(r.created_at);
  w.write_int64(r.updated_at);
}

void encode(PayloadWriter& w, const User& r) {
  w.write_string(r.id);
  w.write_string(r.application_id);
  w.write_string(r.login);
  w.write_string(r.password_hash);
  w.write_bool(r.enabled);
  w.write_int64(r.created_at);
  w.write_int64(r.updated_at);
}

void encode(PayloadWriter& w, const Role& r) {
  w.write_string(r.id);
  w.write_string(r.application_id);
  w.write_string(r.name);
  w.write_string(r.description);
  w.write_strings(r.permissions);
  w.write_int64(r.created_at);
  w.write_int64(r.updated_at);
}

void encode(PayloadWriter& w, const Grant& r) {
  w.write_string(r.user_id);
  w.write_string(r.role_id);
  w.write_string(r.application_id);
  w.write_int64(r.created_at);
}

void encode(PayloadWriter& w, const RevokedToken& r) {
  w.write_string(r.jti);
  w.write_int64(r.expires_at);
  w.write_int64(r.revoked_at);
}

Application decode_application(PayloadReader& r) {
  Application record;
  record.id = r.read_string();
  record.slug = r.read_string();
  record.name = r.read_string();
  record.description = r.read_string();
  record.enabled = r.read_bool();
  record.created_at = r.read_int64();
  record.updated_at = r.read_int64();
  return record;
}

User decode_user(PayloadReader& r) {
  User record;
  record.id = r.read_string();
  record.application_id = r.read_string();
  record.login = r.read_string();
  record.password_hash = r.read_string();
  record.enabled = r.read_bool();
  record.created_at = r.read_int64();
  record.updated_at = r.read_int64();
  return record;
}

Role decode_role(PayloadReader& r) {
  Role record;
  record.id = r.read_string();
  record.application_id = r.read_string();
  record.name = r.read_string();
  record.description = r.read_string();
  record.permissions = r.read_strings();
  record.created_at = r.read_int64();
  record.updated_at = r.read_int64();
  return record;
}

Grant decode_grant(PayloadReader& r) {
  Grant record;
  record.user_id = r.read_string();
  record.role_id = r.read_string();
  record.application_id = r.read_string();
  record.created_at = r.read_int64();
  return record;
}

RevokedToken decode_revoked(PayloadReader& r) {
  RevokedToken record;
  record.jti = r.read_string();
  record.expires_at = r.read_int64();
  record.revoked_at = r.read_int64();
  return record;
}

template <typename T, typename Decode>
kj::Array<T> decode_list(PayloadReader& r, Decode&& decode) {
  uint32_t count = r.read_uint32();
  kj::Vector<T> records;
  for (uint32_t i = 0; i < count && r.ok(); ++i) {
    records.add(decode(r));
  }
  return records.releaseAsArray();
}

template <typename T> void encode_list(PayloadWriter& w, kj::ArrayPtr<const T> records) {
  w.write_uint32(static_cast<uint32_t>(records.size()));
  for (auto& record : records) {
    encode(w, record);
  }
}

} // namespace

StoreJournal::StoreJournal(const kj::Directory& directory, TableNames tables,
                           JournalConfig config, const core::Clock& clock)
    : directory_(directory), tables_(kj::mv(tables)), config_(kj::mv(config)), clock_(clock) {
  KJ_LOG(INFO, "StoreJournal initialized", tables_.journal);
}

StoreJournal::~StoreJournal() noexcept(false) {
  auto lock = state_.lockExclusive();
  KJ_IF_SOME(file, lock->current_file) {
    if (config_.sync_on_write) {
      file->sync();
    }
  }
}

kj::String StoreJournal::generate_filename(uint64_t sequence) const {
  // Format: <journal>_NNNNNNNNNNNNNNNN.wal (16-digit hex, sorts by sequence)
  char hex_buf[17];
  snprintf(hex_buf, sizeof(hex_buf), "%016llx", static_cast<unsigned long long>(sequence));
  return kj::str(tables_.journal, "_", hex_buf, ".wal");
}

kj::Vector<kj::String> StoreJournal::list_journal_files() const {
  kj::Vector<kj::String> result;
  auto prefix = kj::str(tables_.journal, "_");

  for (const auto& entry : directory_.listEntries()) {
    if (entry.type == kj::FsNode::Type::FILE && entry.name.startsWith(prefix) &&
        entry.name.endsWith(".wal"_kj) && entry.name.size() == prefix.size() + 16 + 4) {
      result.add(kj::heapString(entry.name));
    }
  }

  // std::sort - kj::Vector exposes raw pointer iterators
  std::sort(result.begin(), result.end(),
            [](const kj::String& a, const kj::String& b) { return a < b; });
  return result;
}

kj::StringPtr StoreJournal::table_for(JournalEntryType type) const {
  switch (type) {
  case JournalEntryType::ApplicationPut:
  case JournalEntryType::ApplicationDelete:
    return tables_.applications;
  case JournalEntryType::UserPut:
  case JournalEntryType::UserDelete:
    return tables_.users;
  case JournalEntryType::RolePut:
  case JournalEntryType::RoleDelete:
    return tables_.roles;
  case JournalEntryType::GrantPut:
  case JournalEntryType::GrantDelete:
    return tables_.grants;
  case JournalEntryType::RevokedPut:
  case JournalEntryType::RevokedPrune:
    return tables_.revoked_tokens;
  case JournalEntryType::Checkpoint:
    return tables_.journal;
  }
  return tables_.journal;
}

void StoreJournal::open_file_locked(State& state, kj::StringPtr filename) {
  state.current_file = kj::none;
  state.current_file_size = 0;

  auto path = kj::Path::parse(filename);
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               auto file =
                   directory_.openFile(path, kj::WriteMode::CREATE | kj::WriteMode::MODIFY);
               state.current_file_size = file->stat().size;
               state.current_file = kj::mv(file);
             })) {
    KJ_LOG(ERROR, "Failed to open journal file", filename, exception);
    state.healthy = false;
    return;
  }

  state.current_filename = kj::str(filename);
  state.healthy = true;
}

void StoreJournal::rotate_locked(State& state) {
  KJ_IF_SOME(file, state.current_file) {
    file->sync();
  }
  open_file_locked(state, generate_filename(state.sequence + 1));
  state.stats.rotations++;
}

uint64_t StoreJournal::write_entry(JournalEntryType type, kj::ArrayPtr<const kj::byte> payload) {
  auto lock = state_.lockExclusive();
  return write_entry_locked(*lock, type, payload);
}

uint64_t StoreJournal::write_entry_locked(State& state, JournalEntryType type,
                                          kj::ArrayPtr<const kj::byte> payload) {
  KJ_REQUIRE(state.replayed, "StoreJournal::replay() must run before writing");

  if (state.healthy && state.current_file_size >= config_.max_file_size) {
    rotate_locked(state);
  }
  if (!state.healthy) {
    throw core::StoreUnavailable("Journal is not writable");
  }

  KJ_IF_SOME(file, state.current_file) {
    JournalEntryHeader header;
    std::memset(&header, 0, sizeof(header));
    header.magic = JournalEntryHeader::MAGIC;
    header.version = JournalEntryHeader::VERSION;
    header.sequence = state.sequence + 1;
    header.timestamp = clock_.now();
    header.type = type;
    header.payload_size = static_cast<uint32_t>(payload.size());
    header.checksum = crc32(payload);

    uint64_t offset = state.current_file_size;
    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
                 file->write(offset,
                             kj::arrayPtr(reinterpret_cast<const kj::byte*>(&header), sizeof(header)));
                 if (payload.size() > 0) {
                   file->write(offset + sizeof(header), payload);
                 }
                 if (config_.sync_on_write) {
                   file->sync();
                 }
               })) {
      // current_file_size is unchanged, so the next entry overwrites this one.
      KJ_LOG(ERROR, "Journal write failed", state.current_filename, exception);
      throw core::StoreUnavailable(kj::str("Journal write failed: ", exception.getDescription()));
    }

    state.sequence = header.sequence;
    state.current_file_size += sizeof(header) + payload.size();
    state.stats.entries_written++;
    state.stats.bytes_written += sizeof(header) + payload.size();
    state.stats.current_sequence = state.sequence;
    return state.sequence;
  }

  state.healthy = false;
  throw core::StoreUnavailable("No journal file open for writing");
}

// ---------------------------------------------------------------------------
// Typed writers
// ---------------------------------------------------------------------------

uint64_t StoreJournal::log_application_put(const Application& record) {
  PayloadWriter w;
  w.write_string(tables_.applications);
  encode(w, record);
  return write_entry(JournalEntryType::ApplicationPut, w.finish());
}

uint64_t StoreJournal::log_application_delete(kj::StringPtr id) {
  PayloadWriter w;
  w.write_string(tables_.applications);
  w.write_string(id);
  return write_entry(JournalEntryType::ApplicationDelete, w.finish());
}

uint64_t StoreJournal::log_user_put(const User& record) {
  PayloadWriter w;
  w.write_string(tables_.users);
  encode(w, record);
  return write_entry(JournalEntryType::UserPut, w.finish());
}

uint64_t StoreJournal::log_user_delete(kj::StringPtr id) {
  PayloadWriter w;
  w.write_string(tables_.users);
  w.write_string(id);
  return write_entry(JournalEntryType::UserDelete, w.finish());
}

uint64_t StoreJournal::log_role_put(const Role& record) {
  PayloadWriter w;
  w.write_string(tables_.roles);
  encode(w, record);
  return write_entry(JournalEntryType::RolePut, w.finish());
}

uint64_t StoreJournal::log_role_delete(kj::StringPtr id) {
  PayloadWriter w;
  w.write_string(tables_.roles);
  w.write_string(id);
  return write_entry(JournalEntryType::RoleDelete, w.finish());
}

uint64_t StoreJournal::log_grant_put(const Grant& record) {
  PayloadWriter w;
  w.write_string(tables_.grants);
  encode(w, record);
  return write_entry(JournalEntryType::GrantPut, w.finish());
}

uint64_t StoreJournal::log_grant_delete(kj::StringPtr user_id, kj::StringPtr role_id) {
  PayloadWriter w;
  w.write_string(tables_.grants);
  w.write_string(user_id);
  w.write_string(role_id);
  return write_entry(JournalEntryType::GrantDelete, w.finish());
}

uint64_t StoreJournal::log_revoked_put(const RevokedToken& record) {
  PayloadWriter w;
  w.write_string(tables_.revoked_tokens);
  encode(w, record);
  return write_entry(JournalEntryType::RevokedPut, w.finish());
}

uint64_t StoreJournal::log_revoked_prune(int64_t now) {
  PayloadWriter w;
  w.write_string(tables_.revoked_tokens);
  w.write_int64(now);
  return write_entry(JournalEntryType::RevokedPrune, w.finish());
}

uint64_t StoreJournal::write_checkpoint(const StoreSnapshot& snapshot) {
  PayloadWriter w;
  w.write_string(tables_.journal);
  encode_list<Application>(w, snapshot.applications);
  encode_list<User>(w, snapshot.users);
  encode_list<Role>(w, snapshot.roles);
  encode_list<Grant>(w, snapshot.grants);
  encode_list<RevokedToken>(w, snapshot.revoked_tokens);
  auto payload = w.finish();

  auto lock = state_.lockExclusive();
  KJ_REQUIRE(lock->replayed, "StoreJournal::replay() must run before writing");

  if (lock->healthy && lock->current_file_size > 0) {
    rotate_locked(*lock);
  }
  auto seq = write_entry_locked(*lock, JournalEntryType::Checkpoint, payload);
  KJ_IF_SOME(file, lock->current_file) {
    file->sync();
  }
  lock->stats.checkpoints++;

  // Older files are fully superseded by the checkpoint.
  for (auto& filename : list_journal_files()) {
    if (filename == lock->current_filename) {
      continue;
    }
    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
                 directory_.tryRemove(kj::Path::parse(filename));
               })) {
      KJ_LOG(WARNING, "Failed to remove superseded journal file", filename, exception);
    }
  }

  KJ_LOG(INFO, "Journal checkpoint written", seq, snapshot.applications.size(),
         snapshot.users.size(), snapshot.roles.size(), snapshot.grants.size());
  return seq;
}

// ---------------------------------------------------------------------------
// Replay
// ---------------------------------------------------------------------------

void StoreJournal::dispatch(JournalEntryType type, kj::ArrayPtr<const kj::byte> payload,
                            JournalReplayTarget& target, State& state) {
  PayloadReader r(payload);
  auto table = r.read_string();
  if (!r.ok()) {
    state.stats.corrupted_entries++;
    return;
  }
  if (table != table_for(type)) {
    KJ_LOG(WARNING, "Skipping journal entry for another table", table, table_for(type));
    state.stats.foreign_entries++;
    return;
  }

  switch (type) {
  case JournalEntryType::ApplicationPut: {
    auto record = decode_application(r);
    if (r.done()) {
      target.put_application(kj::mv(record));
      return;
    }
    break;
  }
  case JournalEntryType::UserPut: {
    auto record = decode_user(r);
    if (r.done()) {
      target.put_user(kj::mv(record));
      return;
    }
    break;
  }
  case JournalEntryType::RolePut: {
    auto record = decode_role(r);
    if (r.done()) {
      target.put_role(kj::mv(record));
      return;
    }
    break;
  }
  case JournalEntryType::GrantPut: {
    auto record = decode_grant(r);
    if (r.done()) {
      target.put_grant(kj::mv(record));
      return;
    }
    break;
  }
  case JournalEntryType::RevokedPut: {
    auto record = decode_revoked(r);
    if (r.done()) {
      target.put_revoked(kj::mv(record));
      return;
    }
    break;
  }
  case JournalEntryType::ApplicationDelete:
  case JournalEntryType::UserDelete:
  case JournalEntryType::RoleDelete: {
    auto id = r.read_string();
    if (r.done()) {
      if (type == JournalEntryType::ApplicationDelete) {
        target.remove_application(id);
      } else if (type == JournalEntryType::UserDelete) {
        target.remove_user(id);
      } else {
        target.remove_role(id);
      }
      return;
    }
    break;
  }
  case JournalEntryType::GrantDelete: {
    auto user_id = r.read_string();
    auto role_id = r.read_string();
    if (r.done()) {
      target.remove_grant(user_id, role_id);
      return;
    }
    break;
  }
  case JournalEntryType::RevokedPrune: {
    auto now = r.read_int64();
    if (r.done()) {
      target.prune_revoked(now);
      return;
    }
    break;
  }
  case JournalEntryType::Checkpoint: {
    StoreSnapshot snapshot;
    snapshot.applications = decode_list<Application>(r, decode_application);
    snapshot.users = decode_list<User>(r, decode_user);
    snapshot.roles = decode_list<Role>(r, decode_role);
    snapshot.grants = decode_list<Grant>(r, decode_grant);
    snapshot.revoked_tokens = decode_list<RevokedToken>(r, decode_revoked);
    if (r.done()) {
      target.restore(kj::mv(snapshot));
      return;
    }
    break;
  }
  }

  KJ_LOG(WARNING, "Malformed journal payload", static_cast<int>(type));
  state.stats.corrupted_entries++;
}

void StoreJournal::replay(JournalReplayTarget& target) {
  auto lock = state_.lockExclusive();
  auto files = list_journal_files();

  uint64_t last_sequence = 0;
  uint64_t tail_valid_end = 0;
  uint64_t tail_size = 0;
  bool halted = false;
  bool halted_before_tail = false;

  for (size_t i = 0; i < files.size(); ++i) {
    auto& filename = files[i];
    KJ_IF_SOME(file, directory_.tryOpenFile(kj::Path::parse(filename))) {
      auto data = file->readAllBytes();
      size_t offset = 0;
      size_t valid_end = 0;

      while (offset + sizeof(JournalEntryHeader) <= data.size()) {
        JournalEntryHeader header;
        std::memcpy(&header, data.begin() + offset, sizeof(header));

        if (header.magic != JournalEntryHeader::MAGIC ||
            header.version != JournalEntryHeader::VERSION) {
          KJ_LOG(WARNING, "Invalid journal entry header", filename, offset);
          lock->stats.corrupted_entries++;
          halted = true;
          break;
        }
        if (offset + sizeof(header) + header.payload_size > data.size()) {
          KJ_LOG(WARNING, "Truncated journal entry", filename, offset);
          lock->stats.corrupted_entries++;
          halted = true;
          break;
        }

        auto payload = kj::arrayPtr(data.begin() + offset + sizeof(header), header.payload_size);
        size_t next = offset + sizeof(header) + header.payload_size;

        // Later entries may depend on this one, so nothing after it is applied.
        if (crc32(payload) != header.checksum) {
          KJ_LOG(WARNING, "Journal entry checksum mismatch", filename, offset);
          lock->stats.corrupted_entries++;
          halted = true;
          break;
        }
        if (header.sequence <= last_sequence) {
          KJ_LOG(WARNING, "Skipping duplicate journal entry", header.sequence, last_sequence);
          offset = next;
          valid_end = next;
          continue;
        }

        dispatch(header.type, payload, target, *lock);

        last_sequence = header.sequence;
        lock->stats.entries_replayed++;
        offset = next;
        valid_end = next;
      }

      if (i == files.size() - 1) {
        tail_valid_end = valid_end;
        tail_size = data.size();
      } else if (halted || valid_end < data.size()) {
        if (!halted) {
          lock->stats.corrupted_entries++;
        }
        halted_before_tail = true;
        KJ_LOG(ERROR, "Journal corrupted before its newest file; later files not replayed",
               filename, offset, files.back());
        break;
      }
    }
  }

  lock->sequence = kj::max(lock->sequence, last_sequence);
  lock->stats.current_sequence = lock->sequence;
  lock->replayed = true;

  // Resume appending to the newest file, cutting off a torn tail first. A gap before the
  // newest file leaves the journal read-only: appending there would be lost on the next replay.
  if (halted_before_tail) {
    lock->healthy = false;
  } else if (files.size() == 0) {
    open_file_locked(*lock, generate_filename(lock->sequence + 1));
  } else {
    open_file_locked(*lock, files.back());
    if (tail_valid_end < tail_size) {
      KJ_IF_SOME(file, lock->current_file) {
        KJ_LOG(WARNING, "Truncating torn journal tail", files.back(), tail_valid_end, tail_size);
        file->truncate(tail_valid_end);
        lock->current_file_size = tail_valid_end;
      }
    }
  }

  KJ_LOG(INFO, "Journal replayed", files.size(), lock->stats.entries_replayed,
         lock->stats.corrupted_entries, lock->sequence);
}

void StoreJournal::sync() {
  auto lock = state_.lockExclusive();
  KJ_IF_SOME(file, lock->current_file) {
    file->sync();
  }
}

JournalStats StoreJournal::stats() const {
  return state_.lockShared()->stats;
}

uint64_t StoreJournal::current_sequence() const {
  return state_.lockShared()->sequence;
}

bool StoreJournal::is_healthy() const {
  return state_.lockShared()->healthy;
}

} // namespace keyward::store
