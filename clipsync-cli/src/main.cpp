/**
 * @file main.cpp
 * @brief clipsync command-line client
 *
 * Keeps the local clipboard in step with every other client of the relay
 * until interrupted (SIGINT / SIGTERM).
 */

#include <clipsync/clipsync.h>

#include <csignal>
#include <iostream>
#include <pthread.h>

using namespace clipsync;

namespace {

int fail(const char *what, const Error &error) {
  logger()->critical("{}: {}", what, error.to_string());
  return 1;
}

} // namespace

int main(int argc, char *argv[]) {
  auto cli = parse_command_line(argc, argv);
  if (cli.is_error()) {
    std::cerr << cli.error().to_string() << "\n\n" << usage(argv[0]);
    return 2;
  }
  if (cli.value().show_help) {
    std::cout << usage(argv[0]);
    return 0;
  }

  const ClientConfig &config = cli.value().config;

  auto logging = init_logging(config.log_level, config.log_file);
  if (logging.is_error()) {
    std::cerr << logging.error().to_string() << std::endl;
    return 2;
  }
  if (!cli.value().config_path.empty()) {
    logger()->debug("loaded config from {}", cli.value().config_path);
  }

  auto valid = config.validate();
  if (valid.is_error()) {
    return fail("invalid configuration", valid.error());
  }

  auto sec = security_init();
  if (sec.is_error()) {
    return fail("crypto init failed", sec.error());
  }

  auto identity = Identity::create(config.client_id, config.key);
  if (identity.is_error()) {
    return fail("invalid identity", identity.error());
  }

  // Block the stop signals before any thread starts so that only sigwait()
  // below receives them
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

  ClipboardFormats formats = register_formats();
  auto backend = create_clipboard_backend(formats);
  if (backend.is_error()) {
    return fail("clipboard unavailable", backend.error());
  }

  ClipboardOwner clipboard(std::move(backend.value()));
  auto owner = clipboard.start();
  if (owner.is_error()) {
    return fail("clipboard unavailable", owner.error());
  }

  auto client = make_client(config, identity.value());
  if (client.is_error()) {
    return fail("cannot create client", client.error());
  }

  SyncOptions options;
  options.watch_interval = config.watch_interval;
  options.queue_capacity = config.queue_capacity;

  SyncService sync(*client.value(), clipboard, identity.value(), options);
  auto started = sync.start();
  if (started.is_error()) {
    return fail("cannot start sync", started.error());
  }

  logger()->info("clipsync {} running against {} (Ctrl+C to stop)",
                 get_version().version_string, config.endpoint);

  int signal_number = 0;
  sigwait(&stop_signals, &signal_number);
  logger()->info("received signal {}, shutting down", signal_number);

  sync.stop();
  clipboard.stop();

  TransportStats t = client.value()->stats();
  SyncStats s = sync.stats();
  logger()->info("sent {} ({} failed), received {} ({} applied), "
                 "{} retries, {} reconnects, {} dropped",
                 t.snapshots_sent, t.send_failures, t.snapshots_received,
                 s.applied, t.upload_retries, t.reconnects, s.dropped);
  return 0;
}
