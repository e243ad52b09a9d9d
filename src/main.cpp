// linkrelayd - relay daemon
//
// Reads inbound messages as JSON lines on stdin, writes deliveries as JSON
// lines on stdout, logs on stderr. Runs until end of input or SIGINT/SIGTERM.
//
// Exit codes:
//   0  clean shutdown
//   1  state store / data dir unusable
//   2  configuration error
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>

#include <unistd.h> // STDIN_FILENO

#include <CLI/CLI.hpp>

#include "linkrelay/code_extractor.hpp"
#include "linkrelay/config.hpp"
#include "linkrelay/http_link_resolver.hpp"
#include "linkrelay/link_filter.hpp"
#include "linkrelay/log.hpp"
#include "linkrelay/pipeline.hpp"
#include "linkrelay/relay.hpp"
#include "linkrelay/retention.hpp"
#include "linkrelay/state_store.hpp"
#include "linkrelay/stats.hpp"
#include "linkrelay/transport/line_transport.hpp"

using namespace linkrelay;

namespace {

std::atomic<bool> g_stop{false};

extern "C" void on_signal(int) { g_stop.store(true); }

// No SA_RESTART: a blocked stdin read returns so the loop can see g_stop.
void install_signals() {
  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

} // namespace

int main(int argc, char** argv) {
  CLI::App app{"linkrelayd - filtered, de-duplicating message relay"};

  std::string env_path;
  std::string data_dir;
  std::string log_level = "info";

  app.add_option("--env", env_path, "Env file (default ./config/.env, then /config/.env)");
  app.add_option("--data-dir", data_dir, "State directory (default DATA_DIR, /data or ./data)");
  app.add_option("--log-level", log_level, "debug|info|warn|error")
     ->check(CLI::IsMember({"debug", "info", "warn", "error"}));

  CLI11_PARSE(app, argc, argv);

  log::Level lvl = log::Level::Info;
  log::parse_level(log_level, lvl);
  log::set_level(lvl);

  // ---- configuration ----
  if (env_path.empty()) env_path = default_env_path();
  std::string err;
  EnvMap file_env;
  if (!read_env_file(env_path, file_env, err)) {
    log::warn() << "event=env_file_unreadable path=" << env_path << " reason=" << err;
  }
  const EnvMap env = with_process_env(file_env);

  Settings settings;
  if (!load_settings(env, settings, err)) {
    log::error() << "event=config_error path=" << env_path << " reason=" << err;
    return 2;
  }
  if (data_dir.empty()) data_dir = resolve_data_dir(env);

  // ---- state ----
  std::error_code ec;
  std::filesystem::create_directories(data_dir, ec);
  if (ec) {
    log::error() << "event=data_dir_failed path=" << data_dir << " reason=" << ec.message();
    return 1;
  }

  StateStore store;
  if (!store.open(data_dir + "/state.db", err)) {
    log::error() << "event=store_open_failed path=" << data_dir << "/state.db reason=" << err;
    return 1;
  }

  StatsRecorder stats(data_dir + "/stats.json");
  stats.load();
  if (!stats.set_status(ServiceStatus::Running, err)) {
    log::error() << "event=stats_write_failed reason=" << err;
  }

  // ---- workers ----
  LiveConfig       live(env_path);
  HttpLinkResolver resolver;
  LinkFilterChain  filters(store, resolver);
  CodeExtractor    extractor(live);

  transport::LineSource      source(std::cin, STDIN_FILENO);
  transport::LineDestination destination(std::cout, settings.dest_chat);

  ForwardingPipeline pipeline(store, filters, extractor, destination, stats);
  Relay              relay(pipeline, settings.source_chats);
  RetentionScheduler scheduler(store, live);

  install_signals();
  std::thread sweeper([&scheduler] { scheduler.run(); });

  log::info() << "event=service_start sources=" << format_source_list(settings.source_chats)
              << " dest=" << settings.dest_chat << " data_dir=" << data_dir;

  // ---- receive loop ----
  while (!g_stop.load()) {
    InboundMessage msg;
    const transport::RxResult rx = source.receive(msg, err);
    if (rx == transport::RxResult::None) {
      if (!g_stop.load()) log::info() << "event=input_closed";
      break;
    }
    if (rx == transport::RxResult::Error) {
      if (!g_stop.load()) log::error() << "event=receive_failed reason=" << err;
      break;
    }

    if (relay.add_message(msg) == Admit::InboxFull) {
      relay.drain();
      relay.add_message(msg);
    }
    // Batch while more input is already waiting; drain before blocking again.
    if (!source.ready()) relay.drain();
  }

  // ---- shutdown ----
  scheduler.stop();
  sweeper.join();
  relay.drain();

  const RelayCounters& c = relay.counters();
  log::info() << "event=service_stop forwarded=" << c.forwarded
              << " duplicate_code=" << c.duplicate_code
              << " already_processed=" << c.already_processed
              << " delivery_failed=" << c.delivery_failed
              << " store_failed=" << c.store_failed
              << " refused=" << c.refused;

  store.close();
  if (!stats.set_status(ServiceStatus::Stopped, err)) {
    log::error() << "event=stats_write_failed reason=" << err;
  }
  return 0;
}
