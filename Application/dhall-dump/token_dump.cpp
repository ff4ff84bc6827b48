#include "token_dump.hpp"
#include <fmt/core.h>

namespace dhall {

  using json = nlohmann::json;

  json token_to_json(const Token &t) {
    json j;
    j["kind"]  = kind_name(t.kind);
    j["text"]  = render(t);
    j["line"]  = t.line;
    j["col"]   = t.col;
    j["begin"] = t.span.begin;
    j["end"]   = t.span.end;

    switch (t.kind) {
    case TokenKind::TextLit:
    case TokenKind::Label:
    case TokenKind::Url:
      j["value"] = t.text();
      break;
    case TokenKind::NaturalLit:
    case TokenKind::Number:
      // decimal string: the value may not fit any JSON number
      j["value"] = t.nat().to_string();
      break;
    case TokenKind::DoubleLit:
      j["value"] = t.dbl();
      break;
    case TokenKind::File:
      j["value"] = t.path().u8string();
      break;
    default:
      break;
    }
    return j;
  }

  json tokens_to_json(const std::vector<Token> &toks) {
    json j;
    j["tokens"] = json::array();
    for (const auto &t : toks)
      j["tokens"].push_back(token_to_json(t));
    return j;
  }

  json error_to_json(const LexError &e) {
    json j;
    j["message"]  = e.message();
    j["kind"]     = lex_error_kind_name(e.kind());
    j["line"]     = e.line();
    j["col"]      = e.col();
    j["offset"]   = e.offset();
    j["fragment"] = e.fragment();
    return j;
  }

  std::string format_token_line(const Token &t) {
    if (t.kind == TokenKind::Eof)
      return fmt::format("{}:{} {}", t.line, t.col, kind_name(t.kind));
    return fmt::format("{}:{} {} {}", t.line, t.col, kind_name(t.kind), render(t));
  }

  std::string dump_json(const json &j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
  }

} // namespace dhall
