#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/mutex.h>
#include <kj/string.h>

namespace keyward::core {

[[nodiscard]] std::int64_t now_unix_seconds();
[[nodiscard]] kj::String format_utc_iso8601(std::int64_t unix_seconds);

/**
 * @brief Source of the current Unix time in seconds
 *
 * Token expiry and revocation pruning read time through this interface so tests can
 * pin the clock to an exact boundary.
 */
class Clock {
public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual std::int64_t now() const = 0;
};

class SystemClock final : public Clock {
public:
  [[nodiscard]] std::int64_t now() const override {
    return now_unix_seconds();
  }
};

// Clock that only moves when told to.
class ManualClock final : public Clock {
public:
  explicit ManualClock(std::int64_t start) : now_(start) {}

  [[nodiscard]] std::int64_t now() const override {
    return *now_.lockShared();
  }

  void set(std::int64_t value) {
    *now_.lockExclusive() = value;
  }

  void advance(std::int64_t seconds) {
    *now_.lockExclusive() += seconds;
  }

private:
  kj::MutexGuarded<std::int64_t> now_;
};

[[nodiscard]] Clock& system_clock();

} // namespace keyward::core
