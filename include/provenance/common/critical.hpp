#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

// Unrecoverable node faults: a store that cannot be read or written, or
// persisted state that no longer decodes. The ledger cannot keep executing
// blocks on top of either, so the process stops after flushing its logs.
namespace provenance::common {

[[noreturn]] inline void halt() {
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  halt();
}

/// `detail` carries the backend's own diagnosis (a RocksDB status, the
/// offending key) next to the ledger's description of what failed.
[[noreturn]] inline void critical(const std::string_view message,
                                  const std::string_view detail) {
  spdlog::critical("{}: {}", message, detail);
  halt();
}

}  // namespace provenance::common
