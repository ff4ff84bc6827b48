#pragma once
#include "big_nat.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>

namespace dhall {

  enum class TokenKind {
    Eof,
    // punctuation
    LParen,
    RParen,
    LBrace,
    RBrace,
    LDoubleBrace, // {{
    RDoubleBrace, // }}
    LBracket,
    RBracket,
    Colon,
    Comma,
    Dot,
    Equal,
    // operators
    AndAnd,
    OrOr,
    Plus,
    PlusPlus,
    Minus,
    Star,
    Arrow,  // -> or U+2192
    Lambda, // \ or U+03BB
    At,
    // keywords
    KwLet,
    KwIn,
    KwType,
    KwKind,
    KwForall, // forall or U+2200
    KwBool,
    KwTrue,
    KwFalse,
    KwIf,
    KwThen,
    KwElse,
    KwNatural,
    KwNaturalFold,
    KwInteger,
    KwText,
    KwDouble,
    KwMaybe,
    KwNothing,
    KwJust,
    KwListBuild,
    KwListFold,
    // payload carrying
    TextLit,
    NaturalLit,
    DoubleLit,
    Number,
    Label,
    File,
    Url,
  };

  // Byte range [begin, end) into the source buffer.
  struct Span {
    std::size_t begin{0};
    std::size_t end{0};
  };

  using TokenValue = std::variant<std::monostate, std::string, BigNat, double, std::filesystem::path>;

  // TextLit, Label and Url hold a std::string; NaturalLit and Number a BigNat;
  // DoubleLit a double; File a path. Fixed-text kinds and Eof hold nothing.
  struct Token {
    TokenKind kind{};
    TokenValue value{};
    Span span{};
    std::size_t line{1};
    std::size_t col{1};

    const std::string &text() const {
      return std::get<std::string>(value);
    }
    const BigNat &nat() const {
      return std::get<BigNat>(value);
    }
    double dbl() const {
      return std::get<double>(value);
    }
    const std::filesystem::path &path() const {
      return std::get<std::filesystem::path>(value);
    }
  };

  // Stable identifier for dumps and diagnostics, e.g. "KwLet", "TextLit".
  const char *kind_name(TokenKind k);

  // Canonical spelling of a fixed-text kind; empty for payload kinds and Eof.
  const char *spelling(TokenKind k);

  // Surface text of a token. Never throws on a well-formed token.
  std::string render(const Token &t);

  // Re-quote decoded text so that decode_text(quote_text(s)) == s.
  std::string quote_text(const std::string &s);

} // namespace dhall
