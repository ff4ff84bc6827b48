#include "lex_error.hpp"
#include <sstream>

namespace dhall {

  namespace {

    std::string format_what(std::size_t line, std::size_t col, const std::string &message) {
      std::ostringstream os;
      os << "[line " << line << ":" << col << "] " << message;
      return os.str();
    }

  } // namespace

  const char *lex_error_kind_name(LexErrorKind k) {
    switch (k) {
    case LexErrorKind::UnmatchedCharacter:
      return "UnmatchedCharacter";
    case LexErrorKind::InvalidEscape:
      return "InvalidEscape";
    case LexErrorKind::InvalidNumericLiteral:
      return "InvalidNumericLiteral";
    case LexErrorKind::InvalidUtf8:
      return "InvalidUtf8";
    case LexErrorKind::UnterminatedText:
      return "UnterminatedText";
    }
    return "Unknown";
  }

  LexError::LexError(LexErrorKind kind, std::string message, std::size_t offset, std::size_t line, std::size_t col,
                     std::string fragment)
      : std::runtime_error(format_what(line, col, message)), kind_(kind), message_(std::move(message)),
        offset_(offset), line_(line), col_(col), fragment_(std::move(fragment)) {}

} // namespace dhall
