#include "snotes/app/paste_service.h"
#include "snotes/core/clock.h"
#include "snotes/core/version.h"
#include "snotes/storage/storage_backend.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <exception>
#include <iostream>
#include <memory>
#include <string>

using namespace snotes;

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  auto config = server::parse_args(argc, argv);

  if (config.show_help) {
    std::cout << "Usage: snotes_server [options]\n\n";
    apps::print_usage(std::cout, server::server_options());
    return 0;
  }

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = server::validate_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  std::cerr << "shared-notes paste server v" << core::kBuildVersion << "\n";

  const auto options = server::to_storage_options(config);
  switch (options.backend) {
    case storage::StorageBackend::kSqlite:
      std::cerr << "Storage:     SQLite -- " << options.db_path.value() << "\n";
      break;
    case storage::StorageBackend::kMemory:
      std::cerr << "WARNING: No --db path specified. Running with EPHEMERAL in-memory storage.\n"
                   "         All pastes will be LOST on process exit. Pass --db <path> to\n"
                   "         enable persistence.\n";
      break;
  }
  std::cerr << "Worker id:   " << options.worker_id << "\n";

  core::SystemClock clock;

  std::unique_ptr<storage::IPasteStorage> storage_owner;
  try {
    storage_owner = storage::create_paste_storage(options, clock);
  } catch (const std::exception& e) {
    std::cerr << "Failed to initialize storage: " << e.what() << "\n";
    return 1;
  }

  if (config.sweep_on_start) {
    try {
      const std::size_t removed = app::sweep_expired(*storage_owner);
      std::cerr << "Startup sweep removed " << removed << " expired paste(s)\n";
    } catch (const std::exception& e) {
      std::cerr << "Startup sweep failed: " << e.what() << "\n";
      return 1;
    }
  }

  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  server::ServerContext ctx{*storage_owner, clock, config};
  server::run_server_loop(ctx, std::cin, std::cout, std::cerr);

  return 0;
}
