#include "lexer.hpp"
#include "decode.hpp"
#include <algorithm>
#include <cstring>
#include <initializer_list>
#include <sstream>

namespace dhall {

  namespace {

    enum class Action {
      Skip,
      Emit,
      Text,
      Natural,
      Number,
      Double,
      Label,
      File,
      Url,
    };

    using Matcher = std::size_t (*)(std::string_view rest);

    // One scanner rule. A rule either matches an exact literal or runs a
    // matcher returning the length of its longest match (0: no match).
    struct Rule {
      const char *literal;
      Matcher match;
      Action action;
      TokenKind kind;
    };

    bool is_digit(char c) {
      return c >= '0' && c <= '9';
    }
    bool is_alpha(char c) {
      return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }
    bool is_white(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }
    bool is_opchar(char c) {
      return c != '\0' && std::strchr("!#$%&*+./<=>?@\\^|-~", c) != nullptr;
    }

    std::size_t count_digits(std::string_view s, std::size_t from) {
      std::size_t i = from;
      while (i < s.size() && is_digit(s[i]))
        ++i;
      return i - from;
    }

    std::size_t count_nonwhite(std::string_view s, std::size_t from) {
      std::size_t i = from;
      while (i < s.size() && !is_white(s[i]))
        ++i;
      return i - from;
    }

    bool starts_with(std::string_view s, std::string_view prefix) {
      return s.substr(0, prefix.size()) == prefix;
    }

    std::size_t match_whitespace(std::string_view s) {
      std::size_t i = 0;
      while (i < s.size() && is_white(s[i]))
        ++i;
      return i;
    }

    std::size_t match_comment(std::string_view s) {
      if (!starts_with(s, "--"))
        return 0;
      std::size_t i = 2;
      while (i < s.size() && s[i] != '\n')
        ++i;
      return i;
    }

    // "([^"] | \\.)*"
    // A backslash is both an ordinary character and the start of an escape
    // pair; both readings are tracked and the last reachable closing quote wins.
    std::size_t match_text(std::string_view s) {
      if (s.empty() || s[0] != '"')
        return 0;
      bool in = true, esc = false;
      std::size_t best = 0;
      for (std::size_t i = 1; i < s.size() && (in || esc); ++i) {
        char c    = s[i];
        bool nin  = esc;
        bool nesc = false;
        if (in) {
          if (c == '"') {
            best = i + 1;
          } else {
            nin = true;
            if (c == '\\')
              nesc = true;
          }
        }
        in  = nin;
        esc = nesc;
      }
      return best;
    }

    std::size_t match_natural(std::string_view s) {
      if (s.empty() || s[0] != '+')
        return 0;
      std::size_t n = count_digits(s, 1);
      return n ? 1 + n : 0;
    }

    std::size_t match_number(std::string_view s) {
      return count_digits(s, 0);
    }

    std::size_t match_double(std::string_view s) {
      std::size_t i = count_digits(s, 0);
      if (!i)
        return 0;
      if (i < s.size() && s[i] == '.') {
        std::size_t frac = count_digits(s, i + 1);
        if (frac)
          i += 1 + frac;
      }
      if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        std::size_t j = i + 1;
        if (j < s.size() && (s[j] == '+' || s[j] == '-'))
          ++j;
        std::size_t exp = count_digits(s, j);
        if (exp)
          i = j + exp;
      }
      return i;
    }

    std::size_t match_label(std::string_view s) {
      if (s.empty())
        return 0;
      if (is_alpha(s[0]) || s[0] == '_') {
        std::size_t i = 1;
        while (i < s.size() && (is_alpha(s[i]) || is_digit(s[i]) || s[i] == '_' || s[i] == '/'))
          ++i;
        return i;
      }
      if (s[0] == '(') {
        std::size_t i = 1;
        while (i < s.size() && is_opchar(s[i]))
          ++i;
        if (i > 1 && i < s.size() && s[i] == ')')
          return i + 1;
      }
      return 0;
    }

    std::size_t match_path(std::string_view s) {
      for (std::string_view prefix : {"../", "./", "/"}) {
        if (starts_with(s, prefix)) {
          std::size_t n = count_nonwhite(s, prefix.size());
          return n ? prefix.size() + n : 0;
        }
      }
      return 0;
    }

    std::size_t match_url(std::string_view s) {
      for (std::string_view scheme : {"https://", "http://"}) {
        if (starts_with(s, scheme)) {
          std::size_t n = count_nonwhite(s, scheme.size());
          return n ? scheme.size() + n : 0;
        }
      }
      return 0;
    }

    // Declaration order is precedence on equal-length matches: fixed text
    // comes before the generic label rule so `let` is KwLet, and Number
    // comes before Double so `42` stays a Number.
    const Rule kRules[] = {
        {nullptr, match_whitespace, Action::Skip, TokenKind::Eof},
        {nullptr, match_comment, Action::Skip, TokenKind::Eof},

        {"(", nullptr, Action::Emit, TokenKind::LParen},
        {")", nullptr, Action::Emit, TokenKind::RParen},
        {"{{", nullptr, Action::Emit, TokenKind::LDoubleBrace},
        {"}}", nullptr, Action::Emit, TokenKind::RDoubleBrace},
        {"{", nullptr, Action::Emit, TokenKind::LBrace},
        {"}", nullptr, Action::Emit, TokenKind::RBrace},
        {"[", nullptr, Action::Emit, TokenKind::LBracket},
        {"]", nullptr, Action::Emit, TokenKind::RBracket},
        {":", nullptr, Action::Emit, TokenKind::Colon},
        {",", nullptr, Action::Emit, TokenKind::Comma},
        {".", nullptr, Action::Emit, TokenKind::Dot},
        {"=", nullptr, Action::Emit, TokenKind::Equal},
        {"&&", nullptr, Action::Emit, TokenKind::AndAnd},
        {"||", nullptr, Action::Emit, TokenKind::OrOr},
        {"++", nullptr, Action::Emit, TokenKind::PlusPlus},
        {"+", nullptr, Action::Emit, TokenKind::Plus},
        {"-", nullptr, Action::Emit, TokenKind::Minus},
        {"*", nullptr, Action::Emit, TokenKind::Star},
        {"@", nullptr, Action::Emit, TokenKind::At},
        {"->", nullptr, Action::Emit, TokenKind::Arrow},
        {"\xE2\x86\x92", nullptr, Action::Emit, TokenKind::Arrow}, // U+2192
        {"\\", nullptr, Action::Emit, TokenKind::Lambda},
        {"\xCE\xBB", nullptr, Action::Emit, TokenKind::Lambda}, // U+03BB

        {"let", nullptr, Action::Emit, TokenKind::KwLet},
        {"in", nullptr, Action::Emit, TokenKind::KwIn},
        {"Type", nullptr, Action::Emit, TokenKind::KwType},
        {"Kind", nullptr, Action::Emit, TokenKind::KwKind},
        {"forall", nullptr, Action::Emit, TokenKind::KwForall},
        {"\xE2\x88\x80", nullptr, Action::Emit, TokenKind::KwForall}, // U+2200
        {"Bool", nullptr, Action::Emit, TokenKind::KwBool},
        {"True", nullptr, Action::Emit, TokenKind::KwTrue},
        {"False", nullptr, Action::Emit, TokenKind::KwFalse},
        {"if", nullptr, Action::Emit, TokenKind::KwIf},
        {"then", nullptr, Action::Emit, TokenKind::KwThen},
        {"else", nullptr, Action::Emit, TokenKind::KwElse},
        {"Natural", nullptr, Action::Emit, TokenKind::KwNatural},
        {"Natural/fold", nullptr, Action::Emit, TokenKind::KwNaturalFold},
        {"Integer", nullptr, Action::Emit, TokenKind::KwInteger},
        {"Text", nullptr, Action::Emit, TokenKind::KwText},
        {"Double", nullptr, Action::Emit, TokenKind::KwDouble},
        {"Maybe", nullptr, Action::Emit, TokenKind::KwMaybe},
        {"Nothing", nullptr, Action::Emit, TokenKind::KwNothing},
        {"Just", nullptr, Action::Emit, TokenKind::KwJust},
        {"List/build", nullptr, Action::Emit, TokenKind::KwListBuild},
        {"List/fold", nullptr, Action::Emit, TokenKind::KwListFold},

        {nullptr, match_text, Action::Text, TokenKind::TextLit},
        {nullptr, match_natural, Action::Natural, TokenKind::NaturalLit},
        {nullptr, match_number, Action::Number, TokenKind::Number},
        {nullptr, match_double, Action::Double, TokenKind::DoubleLit},
        {nullptr, match_label, Action::Label, TokenKind::Label},
        {nullptr, match_path, Action::File, TokenKind::File},
        {nullptr, match_url, Action::Url, TokenKind::Url},
    };

    std::size_t match_rule(const Rule &r, std::string_view rest) {
      if (r.literal) {
        std::string_view lit(r.literal);
        return starts_with(rest, lit) ? lit.size() : 0;
      }
      return r.match(rest);
    }

    // Length of the offending fragment at the head of rest: one whole
    // code point, or a single byte when the sequence is malformed.
    std::size_t fragment_len(std::string_view rest) {
      if (rest.empty())
        return 0;
      std::size_t n   = std::min(utf8_seq_len((unsigned char)rest[0]), rest.size());
      std::size_t bad = 0;
      return valid_utf8(rest.substr(0, n), bad) ? n : 1;
    }

    std::string describe_byte(std::string_view fragment) {
      std::ostringstream os;
      auto c = (unsigned char)fragment[0];
      if (c >= 0x20 && c < 0x7F) {
        os << "unexpected character '" << (char)c << "'";
      } else if (c >= 0x80 && fragment.size() > 1) {
        os << "unexpected character '" << fragment << "'";
      } else {
        static const char kHex[] = "0123456789abcdef";
        os << "unexpected byte 0x" << kHex[c >> 4] << kHex[c & 0xF];
      }
      return os.str();
    }

  } // namespace

  void Lexer::advance(Cursor &c, std::string_view consumed) {
    for (char ch : consumed) {
      if (ch == '\n') {
        ++c.line;
        c.col = 1;
      } else if (((unsigned char)ch & 0xC0) != 0x80) {
        ++c.col;
      }
    }
    c.offset += consumed.size();
  }

  void Lexer::fail(LexErrorKind kind, std::string message, const Cursor &at) {
    std::string_view rest = std::string_view(*src_).substr(at.offset);
    std::size_t n         = fragment_len(rest);
    error_.emplace(kind, std::move(message), at.offset, at.line, at.col, std::string(rest.substr(0, n)));
    throw *error_;
  }

  Token Lexer::next() {
    if (error_)
      throw *error_;

    const std::string_view src(*src_);
    for (;;) {
      Cursor start = cur_;
      if (start.offset >= src.size()) {
        Token eof;
        eof.kind = TokenKind::Eof;
        eof.span = Span{src.size(), src.size()};
        eof.line = start.line;
        eof.col  = start.col;
        return eof;
      }

      std::string_view rest = src.substr(start.offset);
      const Rule *best      = nullptr;
      std::size_t best_len  = 0;
      for (const auto &r : kRules) {
        std::size_t len = match_rule(r, rest);
        if (len > best_len) {
          best     = &r;
          best_len = len;
        }
      }
      if (!best) {
        std::size_t n = fragment_len(rest);
        fail(LexErrorKind::UnmatchedCharacter, describe_byte(rest.substr(0, n)), start);
      }

      std::string_view lexeme = rest.substr(0, best_len);
      advance(cur_, lexeme);
      if (best->action == Action::Skip)
        continue;

      Token t;
      t.kind = best->kind;
      t.span = Span{start.offset, start.offset + best_len};
      t.line = start.line;
      t.col  = start.col;

      DecodeFailure err;
      bool ok = true;
      switch (best->action) {
      case Action::Emit:
        break;
      case Action::Text: {
        std::string s;
        ok      = decode_text(lexeme, s, err);
        t.value = std::move(s);
        break;
      }
      case Action::Natural: {
        BigNat n;
        ok = decode_integer(lexeme.substr(1), n, err);
        if (!ok)
          ++err.at; // past the '+'
        t.value = std::move(n);
        break;
      }
      case Action::Number: {
        BigNat n;
        ok      = decode_integer(lexeme, n, err);
        t.value = std::move(n);
        break;
      }
      case Action::Double: {
        double d = 0.0;
        ok       = decode_double(lexeme, d, err);
        t.value  = d;
        break;
      }
      case Action::Label:
      case Action::Url: {
        std::string s;
        ok      = decode_utf8(lexeme, s, err);
        t.value = std::move(s);
        break;
      }
      case Action::File: {
        std::filesystem::path p;
        ok      = decode_path(lexeme, p, err);
        t.value = std::move(p);
        break;
      }
      case Action::Skip:
        break;
      }

      if (!ok) {
        Cursor at = start;
        advance(at, lexeme.substr(0, std::min(err.at, lexeme.size())));
        fail(err.kind, std::move(err.message), at);
      }
      return t;
    }
  }

  std::vector<Token> Lexer::Lex() {
    std::vector<Token> out;
    while (true) {
      out.push_back(next());
      if (out.back().kind == TokenKind::Eof)
        break;
    }
    return out;
  }

} // namespace dhall
