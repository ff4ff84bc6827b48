#include "decode.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace dhall {

  namespace {

    struct Escape {
      char code;
      char value;
    };

    const Escape kEscapes[] = {
        {'"', '"'},  {'\\', '\\'}, {'/', '/'},  {'\'', '\''}, {'b', '\b'}, {'f', '\f'},
        {'n', '\n'}, {'r', '\r'},  {'t', '\t'}, {'v', '\v'},  {'a', '\a'}, {'0', '\0'},
    };

    bool is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    bool fail(DecodeFailure &err, LexErrorKind kind, std::size_t at, std::string message) {
      err.kind    = kind;
      err.at      = at;
      err.message = std::move(message);
      return false;
    }

  } // namespace

  std::size_t utf8_seq_len(unsigned char lead) {
    if (lead < 0x80)
      return 1;
    if ((lead & 0xE0) == 0xC0)
      return 2;
    if ((lead & 0xF0) == 0xE0)
      return 3;
    if ((lead & 0xF8) == 0xF0)
      return 4;
    return 1;
  }

  bool valid_utf8(std::string_view s, std::size_t &bad_at) {
    std::size_t i = 0;
    while (i < s.size()) {
      auto c = (unsigned char)s[i];
      if (c < 0x80) {
        ++i;
        continue;
      }
      std::size_t n = utf8_seq_len(c);
      if (n == 1 || c == 0xC0 || c == 0xC1 || c > 0xF4 || i + n > s.size()) {
        bad_at = i;
        return false;
      }
      uint32_t cp = c & (0xFF >> (n + 1));
      for (std::size_t k = 1; k < n; ++k) {
        auto cc = (unsigned char)s[i + k];
        if ((cc & 0xC0) != 0x80) {
          bad_at = i;
          return false;
        }
        cp = (cp << 6) | (cc & 0x3F);
      }
      // overlong forms, surrogates, beyond U+10FFFF
      if ((n == 3 && cp < 0x800) || (n == 4 && cp < 0x10000) || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
        bad_at = i;
        return false;
      }
      i += n;
    }
    return true;
  }

  bool decode_integer(std::string_view digits, BigNat &out, DecodeFailure &err) {
    if (!BigNat::parse_dec(digits, out))
      return fail(err, LexErrorKind::InvalidNumericLiteral, 0, "malformed integer literal");
    return true;
  }

  bool decode_double(std::string_view text, double &out, DecodeFailure &err) {
    std::size_t i = 0;
    auto digits   = [&]() {
      std::size_t s = i;
      while (i < text.size() && is_digit(text[i]))
        ++i;
      return i > s;
    };

    if (!digits())
      return fail(err, LexErrorKind::InvalidNumericLiteral, i, "malformed double literal");
    if (i < text.size() && text[i] == '.') {
      ++i;
      if (!digits())
        return fail(err, LexErrorKind::InvalidNumericLiteral, i, "missing digits after '.'");
    }
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
      ++i;
      if (i < text.size() && (text[i] == '+' || text[i] == '-'))
        ++i;
      if (!digits())
        return fail(err, LexErrorKind::InvalidNumericLiteral, i, "missing exponent digits");
    }
    if (i != text.size())
      return fail(err, LexErrorKind::InvalidNumericLiteral, i, "trailing characters in double literal");

    std::string buf(text);
    errno   = 0;
    char *e = nullptr;
    double v = std::strtod(buf.c_str(), &e);
    if (e != buf.c_str() + buf.size())
      return fail(err, LexErrorKind::InvalidNumericLiteral, 0, "malformed double literal");
    // ERANGE on underflow still yields the nearest representable value
    if (errno == ERANGE && std::isinf(v))
      return fail(err, LexErrorKind::InvalidNumericLiteral, 0, "double literal out of range");
    out = v;
    return true;
  }

  bool decode_text(std::string_view quoted, std::string &out, DecodeFailure &err) {
    if (quoted.size() < 2 || quoted.front() != '"' || quoted.back() != '"')
      return fail(err, LexErrorKind::UnterminatedText, 0, "unterminated text literal");

    std::size_t bad = 0;
    if (!valid_utf8(quoted, bad))
      return fail(err, LexErrorKind::InvalidUtf8, bad, "invalid UTF-8 in text literal");

    std::string_view body = quoted.substr(1, quoted.size() - 2);
    out.clear();
    out.reserve(body.size());
    for (std::size_t i = 0; i < body.size(); ++i) {
      char c = body[i];
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (i + 1 >= body.size())
        return fail(err, LexErrorKind::InvalidEscape, i + 1, "dangling '\\' at end of text literal");
      char code  = body[i + 1];
      bool found = false;
      for (const auto &esc : kEscapes) {
        if (esc.code == code) {
          out.push_back(esc.value);
          found = true;
          break;
        }
      }
      if (!found)
        return fail(err, LexErrorKind::InvalidEscape, i + 1, std::string("unknown escape sequence '\\") + code + "'");
      ++i;
    }
    return true;
  }

  bool decode_path(std::string_view text, std::filesystem::path &out, DecodeFailure &err) {
    std::size_t skip = 0;
    if (text.size() >= 2 && text[0] == '.' && text[1] == '/')
      skip = 2;
    std::string decoded;
    if (!decode_utf8(text.substr(skip), decoded, err)) {
      err.at += skip;
      return false;
    }
    out = std::filesystem::u8path(decoded);
    return true;
  }

  bool decode_utf8(std::string_view text, std::string &out, DecodeFailure &err) {
    std::size_t bad = 0;
    if (!valid_utf8(text, bad))
      return fail(err, LexErrorKind::InvalidUtf8, bad, "invalid UTF-8 sequence");
    out.assign(text.data(), text.size());
    return true;
  }

} // namespace dhall
