#pragma once
#include "big_nat.hpp"
#include "lex_error.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace dhall {

  // Why a literal failed to decode. `at` is a byte index into the decoder's input.
  struct DecodeFailure {
    LexErrorKind kind{LexErrorKind::InvalidNumericLiteral};
    std::size_t at{0};
    std::string message{};
  };

  // Length of the UTF-8 sequence introduced by `lead` (1 for ASCII and stray bytes).
  std::size_t utf8_seq_len(unsigned char lead);

  // True when `s` is well-formed UTF-8; otherwise `bad_at` is the first offending byte.
  bool valid_utf8(std::string_view s, std::size_t &bad_at);

  // [0-9]+ -> BigNat
  bool decode_integer(std::string_view digits, BigNat &out, DecodeFailure &err);

  // [0-9]+(\.[0-9]+)?([eE][+-]?[0-9]+)? -> nearest double. Overflow is rejected.
  bool decode_double(std::string_view text, double &out, DecodeFailure &err);

  // "..." with backslash escapes -> decoded text.
  bool decode_text(std::string_view quoted, std::string &out, DecodeFailure &err);

  // /abs, ../rel kept verbatim; ./rel loses its "./" prefix.
  bool decode_path(std::string_view text, std::filesystem::path &out, DecodeFailure &err);

  // Verbatim copy after UTF-8 validation (labels, URLs).
  bool decode_utf8(std::string_view text, std::string &out, DecodeFailure &err);

} // namespace dhall
