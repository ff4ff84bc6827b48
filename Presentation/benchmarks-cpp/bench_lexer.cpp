#include <benchmark/benchmark.h>
#include "../../Domain/dhall-lang/lexer.hpp"
#include <memory>
#include <string>

static const char* kSample =
  "-- sample configuration\n"
  "let makeUser = \\(user : Text) ->\n"
  "  { home = \"/home/${user}\", shell = ./shells/bash.dhall, uid = +1000 }\n"
  "in  [ makeUser \"alice\", makeUser \"bob\" ] ++ https://example.com/users.dhall\n";

static std::shared_ptr<const std::string> make_source(int copies){
  std::string s;
  for (int i = 0; i < copies; ++i) s += kSample;
  return std::make_shared<const std::string>(std::move(s));
}

static void BM_LexAll(benchmark::State& state) {
  auto src = make_source((int)state.range(0));
  for (auto _ : state) {
    dhall::Lexer lx(src);
    auto toks = lx.Lex();
    benchmark::DoNotOptimize(toks.size());
  }
  state.SetBytesProcessed((int64_t)state.iterations() * (int64_t)src->size());
}

BENCHMARK(BM_LexAll)->Arg(1)->Arg(64)->Arg(1024);

static void BM_PullNext(benchmark::State& state) {
  auto src = make_source(64);
  for (auto _ : state) {
    dhall::Lexer lx(src);
    std::size_t n = 0;
    while (lx.next().kind != dhall::TokenKind::Eof) ++n;
    benchmark::DoNotOptimize(n);
  }
}

BENCHMARK(BM_PullNext);

static void BM_BigNatural(benchmark::State& state) {
  std::string src = "+" + std::string((std::size_t)state.range(0), '7');
  for (auto _ : state) {
    dhall::Lexer lx(src);
    auto t = lx.next();
    benchmark::DoNotOptimize(t.nat().is_zero());
  }
}

BENCHMARK(BM_BigNatural)->Arg(20)->Arg(200)->Arg(2000);

BENCHMARK_MAIN();
