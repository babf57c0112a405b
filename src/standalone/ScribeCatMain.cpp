// Repository: Retrovue-scribe
// Component: scribe_cat
// Purpose: Pipes stdin lines through a FormattingWriter into a file, socket or stdout.
// Copyright (c) 2025 RetroVue
//
// Each input line becomes one log line: timestamp, level prefix, text.
// Useful for eyeballing output formats and for feeding log collectors.
//
//   some_command | scribe_cat --file /var/log/app.log --level warn
//   some_command | scribe_cat --tcp 127.0.0.1:5140

#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <signal.h>

#include "scribe/log/FormattingWriter.hpp"
#include "scribe/log/Log.hpp"
#include "scribe/log/WriterConfig.hpp"
#include "scribe/log/WriterErrors.hpp"
#include "scribe/log/WriterFactory.hpp"
#include "scribe/time/SystemTimeSource.hpp"
#include "scribe/timing/TimestampCache.hpp"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string file_path;
  std::string tcp_host;
  uint16_t tcp_port = 0;
  scribe::log::Level level = scribe::log::Level::kInfo;  // level of every emitted line
  bool flush_each_line = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Writes each stdin line as a leveled, timestamped log line.\n"
            << "\n"
            << "DESTINATION (default: stdout):\n"
            << "  --file PATH          Append to PATH\n"
            << "  --tcp HOST:PORT      Stream to a TCP listener\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --level NAME         Level of emitted lines (default: info)\n"
            << "  --flush-each-line    Flush after every line instead of when the buffer fills\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  SCRIBE_LEVEL         Threshold; lines below it are dropped\n"
            << "  SCRIBE_BUFFER_BYTES  Buffer capacity (default: page size)\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
      return args;
    } else if (arg == "--file" && i + 1 < argc) {
      args.file_path = argv[++i];
    } else if (arg == "--tcp" && i + 1 < argc) {
      std::string endpoint = argv[++i];
      size_t colon = endpoint.rfind(':');
      if (colon == std::string::npos || colon == 0 || colon + 1 == endpoint.size()) {
        args.error = "--tcp expects HOST:PORT, got " + endpoint;
        return args;
      }
      long port = std::strtol(endpoint.c_str() + colon + 1, nullptr, 10);
      if (port <= 0 || port > 65535) {
        args.error = "invalid port in " + endpoint;
        return args;
      }
      args.tcp_host = endpoint.substr(0, colon);
      args.tcp_port = static_cast<uint16_t>(port);
    } else if (arg == "--level" && i + 1 < argc) {
      auto level = scribe::log::ParseLevel(argv[++i]);
      if (!level) {
        args.error = std::string("unknown level: ") + argv[i];
        return args;
      }
      args.level = *level;
    } else if (arg == "--flush-each-line") {
      args.flush_each_line = true;
    } else {
      args.error = "unknown argument: " + arg;
      return args;
    }
  }

  if (!args.file_path.empty() && !args.tcp_host.empty()) {
    args.error = "--file and --tcp are mutually exclusive";
    return args;
  }
  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "[scribe_cat] " << args.error << "\n";
    PrintUsage(argv[0]);
    return 2;
  }

  // No SA_RESTART: a blocked stdin read must return so the loop can stop.
  struct sigaction sa = {};
  sa.sa_handler = SignalHandler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  // A closed stdout reader (scribe_cat | head) becomes EPIPE, reported as a
  // sink failure with exit code 1 instead of a silent SIGPIPE death.
  struct sigaction ignore = {};
  ignore.sa_handler = SIG_IGN;
  sigemptyset(&ignore.sa_mask);
  sigaction(SIGPIPE, &ignore, nullptr);

  auto timestamps = std::make_shared<scribe::timing::TimestampCache>(
      std::make_shared<scribe::time::SystemTimeSource>());
  timestamps->Start();

  const scribe::log::WriterConfig config = scribe::log::WriterConfig::FromEnvironment();
  std::shared_ptr<scribe::log::FormattingWriter> writer;
  try {
    if (!args.file_path.empty()) {
      writer = scribe::log::NewFileWriter(args.file_path, timestamps, config);
    } else if (!args.tcp_host.empty()) {
      writer = scribe::log::NewSocketWriter(args.tcp_host, args.tcp_port, timestamps, config);
    } else {
      writer = scribe::log::NewConsoleWriter(timestamps, config);
    }
  } catch (const std::exception& e) {
    std::cerr << "[scribe_cat] " << e.what() << "\n";
    return 1;
  }

  scribe::log::Log facade(writer);
  int exit_code = 0;
  std::string line;
  try {
    while (!g_termination_requested.load(std::memory_order_acquire) &&
           std::getline(std::cin, line)) {
      if (!facade.Enabled(args.level)) continue;
      writer->Write(args.level, line);
      if (args.flush_each_line && !writer->Flush()) {
        std::cerr << "[scribe_cat] flush to " << writer->DestinationName() << " failed\n";
        exit_code = 1;
        break;
      }
    }
  } catch (const scribe::log::SinkError& e) {
    std::cerr << "[scribe_cat] " << e.what() << "\n";
    exit_code = 1;
  }

  if (!writer->Close()) {
    exit_code = 1;
  }
  timestamps->Stop();
  return exit_code;
}
