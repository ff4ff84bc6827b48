#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace dhall {

  enum class LexErrorKind {
    UnmatchedCharacter,
    InvalidEscape,
    InvalidNumericLiteral,
    InvalidUtf8,
    UnterminatedText,
  };

  const char *lex_error_kind_name(LexErrorKind k);

  // Fatal lexical error. what() is "[line L:C] message".
  class LexError : public std::runtime_error {
  public:
    LexError(LexErrorKind kind, std::string message, std::size_t offset, std::size_t line, std::size_t col,
             std::string fragment);

    LexErrorKind kind() const {
      return kind_;
    }
    const std::string &message() const {
      return message_;
    }
    std::size_t offset() const {
      return offset_;
    }
    std::size_t line() const {
      return line_;
    }
    std::size_t col() const {
      return col_;
    }
    // Offending source bytes, at most one UTF-8 sequence.
    const std::string &fragment() const {
      return fragment_;
    }

  private:
    LexErrorKind kind_;
    std::string message_;
    std::size_t offset_;
    std::size_t line_;
    std::size_t col_;
    std::string fragment_;
  };

} // namespace dhall
