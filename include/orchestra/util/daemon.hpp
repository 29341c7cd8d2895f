#pragma once

#include "orchestra/core/cancellation.hpp"

namespace orchestra {

[[nodiscard]] auto daemonize() -> bool;

// SIGINT and SIGTERM cancel the shutdown token. The handler only posts a
// semaphore; a watcher thread performs the cancel so waiting loops wake.
// Call after daemonize(). Returns false when the watcher cannot start.
[[nodiscard]] auto setup_signal_handlers() -> bool;
[[nodiscard]] auto shutdown_token() -> CancellationToken;

}  // namespace orchestra
