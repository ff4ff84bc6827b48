#include "../../../Application/dhall-dump/token_dump.hpp"
#include "../../../Domain/dhall-lang/lexer.hpp"
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using json   = nlohmann::json;

static const char *kVersion = "dhall-lex 0.1.0";

struct CliOptions {
  std::string mode;
  std::string input;
  fs::path outPath;
  bool verbose = false;
};

static bool g_verbose = false;

template <typename... Args>
static void log_cli(fmt::format_string<Args...> f, Args &&...args) {
  if (!g_verbose)
    return;
  fmt::print(stderr, "[cli] ");
  fmt::print(stderr, f, std::forward<Args>(args)...);
  fmt::print(stderr, "\n");
}

static void write_text_atomic(const fs::path &target, const std::string &text) {
  std::error_code ec;
  if (auto parent = target.parent_path(); !parent.empty())
    fs::create_directories(parent, ec);
  fs::path tmp = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out)
      throw std::runtime_error(std::string("cannot open temp file: ") + tmp.string());
    out.write(text.data(), (std::streamsize)text.size());
    out.flush();
    if (!out)
      throw std::runtime_error(std::string("cannot flush temp file: ") + tmp.string());
  }
#if defined(_WIN32)
  fs::remove(target, ec);
#endif
  fs::rename(tmp, target, ec);
  if (ec)
    throw std::runtime_error(std::string("rename failed: ") + tmp.string() + " -> " + target.string() + ": " + ec.message());
}

// Prints to stdout and, with --out, mirrors the text into the target file.
static int emit(const CliOptions &opt, const std::string &text, int rc) {
  std::cout << text;
  if (opt.outPath.empty())
    return rc;
  try {
    log_cli("writing output to: {}", opt.outPath.string());
    write_text_atomic(opt.outPath, text);
  } catch (const std::exception &ex) {
    fmt::print(stderr, "write output failed: {}\n", ex.what());
    return 1;
  }
  return rc;
}

static bool read_input(const std::string &fileArg, std::string &src) {
  std::stringstream ss;
  if (fileArg == "-") {
    ss << std::cin.rdbuf();
  } else {
    std::ifstream ifs(fileArg, std::ios::binary);
    if (!ifs)
      return false;
    ss << ifs.rdbuf();
  }
  src = ss.str();
  return true;
}

static void trace_tokens(const std::vector<dhall::Token> &toks) {
  for (const auto &t : toks)
    log_cli("token {} at {}:{}", dhall::kind_name(t.kind), t.line, t.col);
}

static int handle_tokens(const CliOptions &opt, dhall::Lexer &lx) {
  std::ostringstream os;
  try {
    for (;;) {
      auto t = lx.next();
      log_cli("token {} at {}:{}", dhall::kind_name(t.kind), t.line, t.col);
      os << dhall::format_token_line(t) << "\n";
      if (t.kind == dhall::TokenKind::Eof)
        break;
    }
  } catch (const dhall::LexError &e) {
    os << "lex error: " << e.what() << "\n";
    return emit(opt, os.str(), 1);
  }
  return emit(opt, os.str(), 0);
}

static int handle_json(const CliOptions &opt, dhall::Lexer &lx) {
  try {
    auto toks = lx.Lex();
    trace_tokens(toks);
    log_cli("lexed {} tokens", toks.size());
    return emit(opt, dhall::dump_json(dhall::tokens_to_json(toks), 2) + "\n", 0);
  } catch (const dhall::LexError &e) {
    json j;
    j["diagnostics"] = json::array({dhall::error_to_json(e)});
    return emit(opt, dhall::dump_json(j) + "\n", 1);
  }
}

static int handle_check(const CliOptions &opt, dhall::Lexer &lx) {
  json j;
  j["diagnostics"] = json::array();
  try {
    auto toks = lx.Lex();
    trace_tokens(toks);
    log_cli("check ok: {} tokens", toks.size());
  } catch (const dhall::LexError &e) {
    j["diagnostics"].push_back(dhall::error_to_json(e));
  }
  return emit(opt, dhall::dump_json(j) + "\n", j["diagnostics"].empty() ? 0 : 1);
}

int main(int argc, char **argv) {
  CliOptions opt;

  auto print_usage = []() {
    std::cout << "Usage: dhall-lex [--tokens|--check|--json] [--out PATH] [--verbose] <file|->\n"
                 "       dhall-lex --version | --help\n";
  };

  if (argc >= 2)
    opt.mode = argv[1];
  if (opt.mode == "--help" || argc < 2) {
    print_usage();
    return 0;
  }
  if (opt.mode == "--version") {
    std::cout << kVersion << "\n";
    return 0;
  }
  if (!(opt.mode == "--tokens" || opt.mode == "--check" || opt.mode == "--json") || argc < 3) {
    print_usage();
    return 2;
  }

  if (const char *trace = std::getenv("DHALL_LEX_TRACE"); trace && std::string(trace) == "1")
    opt.verbose = true;

  // flags may appear in any order after the mode
  std::vector<std::string> positional;
  for (int i = 2; i < argc; ++i) {
    std::string a = argv[i];
    if (a.rfind("--out=", 0) == 0) { opt.outPath = fs::path(a.substr(6)); continue; }
    if (a == "--out" && i + 1 < argc) { opt.outPath = fs::path(argv[++i]); continue; }
    if (a == "--verbose") { opt.verbose = true; continue; }
    if (a == "-" || (!a.empty() && a[0] != '-')) { positional.push_back(a); continue; }
    fmt::print(stderr, "unknown flag: {}\n", a);
    print_usage();
    return 2;
  }
  if (positional.empty()) {
    print_usage();
    return 2;
  }
  opt.input = positional.back();
  g_verbose = opt.verbose;

  if (!opt.outPath.empty()) {
    std::error_code ec;
    auto abs = fs::absolute(opt.outPath, ec);
    if (!ec)
      opt.outPath = abs;
  }

  log_cli("mode:  {}", opt.mode);
  log_cli("input: {}", opt.input);

  std::string src;
  if (!read_input(opt.input, src)) {
    if (opt.mode == "--check") {
      json j;
      j["diagnostics"] = json::array({json{{"message", "cannot open file: " + opt.input}, {"line", 0}, {"col", 0}}});
      return emit(opt, dhall::dump_json(j) + "\n", 1);
    }
    fmt::print(stderr, "cannot open file: {}\n", opt.input);
    return 1;
  }
  log_cli("read {} bytes", src.size());

  dhall::Lexer lx(std::move(src));
  if (opt.mode == "--tokens")
    return handle_tokens(opt, lx);
  if (opt.mode == "--json")
    return handle_json(opt, lx);
  return handle_check(opt, lx);
}
