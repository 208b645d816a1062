/**
 * @file main.cpp
 * @brief meshbot daemon: bridge transport in, replies out, around meshbot::Bot.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); load and validate the JSON config.
 *  - Open the bridge: SLIP over a serial TTY (--dev) or JSON lines on stdio (--stdio).
 *  - Build the command registry (builtin + configured plugin sets) once.
 *  - Loop: poll one frame → node frames update the directory, packet frames go
 *    to bot.handle_packet(now) → drain bot.get_message(out) into send_text.
 *  - Optionally seed/save the node directory snapshot (--directory).
 *
 * Notes:
 *  - stdout carries frames in --stdio mode; every log line goes to stderr.
 *  - Exit codes: 0 normal stop, 1 transport failure, 2 config/usage error.
 *  - Mailbox and session state live in memory only; a restart clears them.
 */

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

#include <unistd.h>   // STDIN_FILENO / STDOUT_FILENO

#include <curl/curl.h>
#include "CLI/CLI.hpp"

#include "meshbot/bot.hpp"
#include "meshbot/bridge.hpp"
#include "meshbot/commands.hpp"
#include "meshbot/command_registry.hpp"
#include "meshbot/config.hpp"
#include "meshbot/log.hpp"
#include "meshbot/node_directory.hpp"
#include "meshbot/serial_io.hpp"
#include "meshbot/weather.hpp"

using namespace meshbot;

// ---------- small utilities ----------

static volatile std::sig_atomic_t g_stop = 0;

static void on_signal(int) { g_stop = 1; }

// No SA_RESTART: a signal must interrupt poll() so the loop sees g_stop.
static void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

static uint64_t now_ms_system() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static int fail(const std::string& reason, int code) {
  std::fprintf(stderr, "status=error reason=%s\n", reason.c_str());
  return code;
}

// Process-wide libcurl init/cleanup pair.
struct CurlGlobal {
  CurlGlobal()  { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobal() { curl_global_cleanup(); }
};

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config = "config.json";
  std::string opt_dev;
  int         opt_baud = 0;
  bool        opt_stdio = false;
  int         opt_channel = -1;
  std::string opt_directory;
  bool        opt_verbose = false;
  int         opt_boot_delay_ms = 2000;

  CLI::App app{"meshbot - command bot for a mesh radio network"};
  app.add_option("-c,--config", opt_config, "Path to JSON config")->capture_default_str();
  app.add_option("--dev", opt_dev, "Serial device of the radio bridge (overrides meshtastic.device)");
  app.add_option("--baud", opt_baud, "Serial baud rate (overrides meshtastic.baud)");
  app.add_flag("--stdio", opt_stdio, "Talk to the bridge over stdin/stdout (JSON lines)");
  app.add_option("--channel", opt_channel, "Monitored channel index (overrides meshtastic.channel_index)")
     ->check(CLI::Range(0, 255));
  app.add_option("--directory", opt_directory, "Node directory snapshot to load at start and save at exit");
  app.add_option("--boot-delay-ms", opt_boot_delay_ms, "Wait after opening the serial port")
     ->capture_default_str()->check(CLI::Range(0, 60000));
  app.add_flag("-v,--verbose", opt_verbose, "Debug logging");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  // Config: file first, then command line overrides
  Config cfg;
  std::string err;
  if (!load_config(opt_config, cfg, err)) return fail("config:" + err, 2);
  if (!opt_dev.empty())  cfg.mesh.device = opt_dev;
  if (opt_baud > 0)      cfg.mesh.baud = opt_baud;
  if (opt_channel >= 0)  cfg.mesh.channel_index = opt_channel;

  set_log_level(opt_verbose ? LogLevel::Debug : cfg.log.level);

  CommandRegistry registry(cfg.bot.command_collision);
  if (!build_registry(cfg.bot, registry, err)) return fail("registry:" + err, 2);

  MemoryNodeDirectory directory;
  if (!opt_directory.empty()) {
    if (load_directory(opt_directory, directory, err)) {
      log_event(LogLevel::Info, "directory_loaded",
                "path=" + opt_directory + " nodes=" + std::to_string(directory.size()));
    } else if (err == "open_failed") {
      log_event(LogLevel::Info, "directory_new", "path=" + opt_directory);
    } else {
      return fail("directory:" + err, 2);
    }
  }

  // Transport
  int fd = -1;
  if (!opt_stdio) {
    fd = open_serial(cfg.mesh.device, cfg.mesh.baud, opt_boot_delay_ms, err);
    if (fd < 0) return fail("transport:" + err, 1);
  }
  std::unique_ptr<BridgeTransport> transport = opt_stdio
      ? std::make_unique<BridgeTransport>(STDIN_FILENO, STDOUT_FILENO, Framing::Lines)
      : std::make_unique<BridgeTransport>(fd, fd, Framing::Slip, /*owns_fds*/true);

  CurlGlobal curl;
  OpenMeteoWeather weather(cfg.weather);

  const uint64_t started = now_ms_system();
  Bot bot(cfg, registry, directory, &weather, started);

  install_signal_handlers();
  log_event(LogLevel::Info, "startup",
            "transport=" + std::string(opt_stdio ? "stdio" : cfg.mesh.device) +
            " channel=" + std::to_string(cfg.mesh.channel_index) +
            " prefix=" + cfg.bot.command_prefix +
            " commands=" + std::to_string(registry.size()) +
            " nodes=" + std::to_string(directory.size()));

  int rc = 0;
  while (!g_stop) {
    BridgeEvent ev;
    err.clear();
    const auto st = transport->poll(ev, 250, err);

    if (st == MeshTransport::PollStatus::Closed) {
      log_event(LogLevel::Info, "transport_closed");
      break;
    }
    if (st == MeshTransport::PollStatus::Error) {
      log_event(LogLevel::Error, "transport_error", "reason=" + err);
      rc = 1;
      break;
    }
    if (st == MeshTransport::PollStatus::Event) {
      switch (ev.kind) {
        case BridgeEventKind::Packet:    bot.handle_packet(ev.packet, now_ms_system()); break;
        case BridgeEventKind::Node:      directory.upsert(ev.node); break;
        case BridgeEventKind::LocalNode: directory.set_local_key(ev.node.key); break;
      }
    }

    // Drain replies
    OutboundText out;
    while (bot.get_message(out)) {
      std::string send_err;
      if (!transport->send_text(out.channel_index, out.text, send_err)) {
        log_event(LogLevel::Warn, "send_failed", "reason=" + send_err);
      }
    }
  }

  if (!opt_directory.empty()) {
    if (!save_directory(opt_directory, directory, err)) {
      log_event(LogLevel::Error, "directory_save_failed", "path=" + opt_directory + " reason=" + err);
    }
  }

  log_event(LogLevel::Info, "shutdown",
            "messages=" + std::to_string(bot.state().counter(COUNTER_MESSAGES_SEEN)) +
            " commands=" + std::to_string(bot.state().counter(COUNTER_COMMANDS_EXECUTED)) +
            " pending_mail=" + std::to_string(bot.mailbox().size()) +
            " dropped_replies=" + std::to_string(bot.dropped_replies()) +
            " rejected_frames=" + std::to_string(transport->rejected_frames()));
  return rc;
}
