#pragma once
#include "../../Domain/dhall-lang/lex_error.hpp"
#include "../../Domain/dhall-lang/token.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dhall {

  // {"kind", "text", "line", "col", "begin", "end"[, "value"]}
  nlohmann::json token_to_json(const Token &t);

  // {"tokens": [...]}
  nlohmann::json tokens_to_json(const std::vector<Token> &toks);

  // {"message", "kind", "line", "col", "offset", "fragment"}
  nlohmann::json error_to_json(const LexError &e);

  // "line:col Kind text"
  std::string format_token_line(const Token &t);

  // Serializes without throwing on invalid UTF-8 (offending bytes are replaced).
  std::string dump_json(const nlohmann::json &j, int indent = -1);

} // namespace dhall
