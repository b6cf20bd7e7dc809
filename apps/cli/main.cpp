#include "bounded_cache/cache.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {
std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::vector<std::string> split(const std::string &line) {
  std::istringstream in(line);
  std::vector<std::string> out;
  std::string tok;
  while (in >> tok)
    out.push_back(tok);
  return out;
}

void print_usage() {
  std::cout << "commands:\n"
               "  set <key> <value> [category]\n"
               "  get <key>\n"
               "  del <key>\n"
               "  stats | health | sweep | clear | quit\n";
}
} // namespace

int main(int argc, char **argv) {
  std::string config_path;
  std::string log_level = "info";
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (a == "--log-level" && i + 1 < argc)
      log_level = argv[++i];
  }
  spdlog::set_level(spdlog::level::from_str(log_level));

  bounded_cache::CacheConfig cfg = bounded_cache::default_config();
  if (!config_path.empty()) {
    std::string err;
    if (!bounded_cache::load_config_file(config_path, cfg, &err)) {
      std::cerr << "config error: " << err << "\n";
      return 1;
    }
  }

  bounded_cache::BoundedCache cache(cfg);
  print_usage();

  std::string line;
  while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
    auto cmd = split(line);
    if (cmd.empty())
      continue;
    const auto op = lower(cmd[0]);
    if (op == "quit" || op == "exit") {
      break;
    } else if (op == "set") {
      if (cmd.size() < 3) {
        std::cout << "(error) set <key> <value> [category]\n";
        continue;
      }
      const std::string category = cmd.size() > 3 ? cmd[3] : "default";
      cache.set(cmd[1], bounded_cache::Value(cmd[2].begin(), cmd[2].end()),
                category);
      std::cout << "OK\n";
    } else if (op == "get") {
      if (cmd.size() != 2) {
        std::cout << "(error) get <key>\n";
        continue;
      }
      auto v = cache.get(cmd[1]);
      if (!v)
        std::cout << "(nil)\n";
      else
        std::cout << std::string(v->begin(), v->end()) << "\n";
    } else if (op == "del") {
      if (cmd.size() != 2) {
        std::cout << "(error) del <key>\n";
        continue;
      }
      std::cout << (cache.erase(cmd[1]) ? 1 : 0) << "\n";
    } else if (op == "stats") {
      std::cout << cache.info();
    } else if (op == "health") {
      auto h = cache.health();
      std::cout << bounded_cache::to_string(h.status) << "\n";
      for (const auto &issue : h.issues)
        std::cout << "  " << issue << "\n";
    } else if (op == "sweep") {
      std::cout << "expired:" << cache.sweep() << "\n";
    } else if (op == "clear") {
      cache.clear();
      std::cout << "OK\n";
    } else {
      print_usage();
    }
  }
  cache.shutdown();
  return 0;
}
