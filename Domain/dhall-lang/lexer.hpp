#pragma once
#include "lex_error.hpp"
#include "token.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dhall {

  // Pull-based maximal-munch tokenizer.
  //
  // Every call to next() returns one token; whitespace and `--` comments are
  // consumed without producing one. At end of input next() returns Eof, and
  // keeps returning it. A lexical error is thrown as LexError and the lexer
  // stays failed: later calls rethrow the same error.
  //
  // Instances are independent. Several lexers may scan the same buffer
  // through the shared_ptr constructor, each with its own cursor.
  class Lexer {
  public:
    explicit Lexer(std::string src) : src_(std::make_shared<const std::string>(std::move(src))) {}
    explicit Lexer(std::shared_ptr<const std::string> src) : src_(std::move(src)) {}

    Token next();

    // Drains next() into a vector that ends with exactly one Eof token.
    std::vector<Token> Lex();

    const std::string &source() const {
      return *src_;
    }

  private:
    struct Cursor {
      std::size_t offset{0};
      std::size_t line{1};
      std::size_t col{1};
    };

    static void advance(Cursor &c, std::string_view consumed);

    [[noreturn]] void fail(LexErrorKind kind, std::string message, const Cursor &at);

    std::shared_ptr<const std::string> src_;
    Cursor cur_{};
    std::optional<LexError> error_{};
  };

} // namespace dhall
