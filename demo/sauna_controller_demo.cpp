#include "sauna_controller/interface.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>
#include <sys/select.h>
#include <unistd.h>

using sauna_controller::Interface;
using sauna_controller::Status;

namespace {

std::atomic<bool> g_stop_requested(false);

void onStopSignal(int) {
  g_stop_requested = true;
}

enum class InputEvent {
  kLine,
  kStopSignal,
  kClosed,
};

// Waits for a full line on stdin, waking every 200 ms to notice a signal.
InputEvent readLine(std::string* line) {
  while (!g_stop_requested) {
    fd_set rfds;
    FD_ZERO(&rfds);
    FD_SET(STDIN_FILENO, &rfds);
    timeval tv{};
    tv.tv_usec = 200000;
    const int ret = ::select(STDIN_FILENO + 1, &rfds, nullptr, nullptr, &tv);
    if (ret < 0 && errno != EINTR) return InputEvent::kClosed;
    if (ret > 0 && FD_ISSET(STDIN_FILENO, &rfds)) {
      return std::getline(std::cin, *line) ? InputEvent::kLine : InputEvent::kClosed;
    }
  }
  return InputEvent::kStopSignal;
}

std::vector<std::string> splitWords(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> words;
  std::string word;
  while (iss >> word) words.push_back(word);
  return words;
}

void report(const Status& r) {
  if (r.ok) {
    if (!r.message.empty() && r.message != "ok") std::cout << "ok: " << r.message << "\n";
    return;
  }
  std::cout << "error[" << sauna_controller::errorKindName(r.kind) << "]: " << r.message << "\n";
}

void printUsage() {
  std::cout
      << "console:\n"
      << "  start | stop                 begin or end background polling\n"
      << "  loadcfg <path>               read a config file (applies on next init)\n"
      << "  showcfg                      print the configured saunas\n"
      << "  devices                      list enabled saunas\n"
      << "  cmds <sauna>                 list what a sauna accepts\n"
      << "  help | quit\n"
      << "per sauna, as <sauna> <command> [args]:\n"
      << "  show | poll | resolve | map  diagnostics\n"
      << "  discover [host...]           look for a controller (factory hosts by default)\n"
      << "  set_temp <20-110>            set_profile <1-7>      status <0-3>\n"
      << "  light <on|off>               aux <on|off>           stop_session\n"
      << "  start_session [profile=2] [temperature=80] [session_time=01:00]\n"
      << "                [ventilation_time=00:15] [aroma=0] [humidity=0]\n";
}

void printConfig(const Interface& sdk) {
  const std::string& path = sdk.loadedConfigPath();
  std::cout << "config: " << (path.empty() ? "(builtin)" : path) << "\n";
  for (const auto& d : sdk.deviceDefaults()) {
    std::cout << "  " << d.id << (d.enable ? "" : " (disabled)") << "  " << d.host << ":"
              << d.port << " unit " << d.unit_id << ", every " << d.scan_interval
              << "s, re-resolve after " << d.resolve_failure_threshold << " failures, gap "
              << d.io_gap_ms << "ms, timeout " << d.timeout_sec << "s";
    if (d.light_register >= 0) std::cout << ", light@" << d.light_register;
    if (d.aux_register >= 0) std::cout << ", aux@" << d.aux_register;
    std::cout << ", model " << d.controller_model << "\n";
  }
}

void printSaunas(const Interface& sdk) {
  const auto saunas = sdk.enabledDevices();
  if (saunas.empty()) std::cout << "no sauna enabled\n";
  for (const auto& id : saunas) std::cout << "  " << id << "\n";
}

using ConsoleCommand = std::function<void(const std::vector<std::string>& words)>;

std::map<std::string, ConsoleCommand> consoleCommands(Interface& sdk) {
  std::map<std::string, ConsoleCommand> commands;
  commands["help"] = [](const std::vector<std::string>&) { printUsage(); };
  commands["start"] = [&sdk](const std::vector<std::string>&) { report(sdk.start()); };
  commands["stop"] = [&sdk](const std::vector<std::string>&) { report(sdk.stop()); };
  commands["showcfg"] = [&sdk](const std::vector<std::string>&) { printConfig(sdk); };
  commands["devices"] = [&sdk](const std::vector<std::string>&) { printSaunas(sdk); };
  commands["loadcfg"] = [&sdk](const std::vector<std::string>& words) {
    if (words.size() != 2) {
      std::cout << "loadcfg needs exactly one path\n";
      return;
    }
    report(sdk.loadConfig(words[1]));
  };
  commands["cmds"] = [&sdk](const std::vector<std::string>& words) {
    if (words.size() != 2) {
      std::cout << "cmds needs a sauna id\n";
      return;
    }
    const auto accepted = sdk.availableCommands(words[1]);
    if (accepted.empty()) {
      std::cout << "no enabled sauna named " << words[1] << "\n";
      return;
    }
    std::cout << words[1] << ":";
    for (const auto& cmd : accepted) std::cout << " " << cmd;
    std::cout << "\n";
  };
  return commands;
}

}  // namespace

int main() {
  std::signal(SIGINT, onStopSignal);
  std::signal(SIGTERM, onStopSignal);

  Interface sdk;
  const Status init = sdk.init();
  if (!init.ok) {
    std::cerr << "sauna controller failed to initialize: " << init.message << std::endl;
    return 1;
  }
  std::cout << init.message << std::endl;
  printSaunas(sdk);
  std::cout << "type 'help' for commands" << std::endl;
  report(sdk.start());

  const std::map<std::string, ConsoleCommand> commands = consoleCommands(sdk);
  std::string line;
  while (true) {
    std::cout << "\nsauna> " << std::flush;
    const InputEvent event = readLine(&line);
    if (event != InputEvent::kLine) {
      std::cout << "\n" << (event == InputEvent::kStopSignal ? "stop requested" : "input closed")
                << ", stopping polling\n";
      report(sdk.stop());
      break;
    }

    const std::vector<std::string> words = splitWords(line);
    if (words.empty()) continue;
    if (words[0] == "quit" || words[0] == "exit") {
      report(sdk.stop());
      break;
    }
    const auto console = commands.find(words[0]);
    if (console != commands.end()) {
      console->second(words);
      continue;
    }

    // Anything else addresses one sauna.
    if (words.size() < 2) {
      std::cout << "usage: <sauna> <command> [args], see 'cmds " << words[0] << "'\n";
      continue;
    }
    report(sdk.dispatchCommand(words[0], std::vector<std::string>(words.begin() + 1, words.end())));
  }

  return 0;
}
