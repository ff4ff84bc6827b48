#include "token.hpp"
#include <fmt/core.h>

namespace dhall {

  const char *kind_name(TokenKind k) {
    switch (k) {
    case TokenKind::Eof: return "Eof";
    case TokenKind::LParen: return "LParen";
    case TokenKind::RParen: return "RParen";
    case TokenKind::LBrace: return "LBrace";
    case TokenKind::RBrace: return "RBrace";
    case TokenKind::LDoubleBrace: return "LDoubleBrace";
    case TokenKind::RDoubleBrace: return "RDoubleBrace";
    case TokenKind::LBracket: return "LBracket";
    case TokenKind::RBracket: return "RBracket";
    case TokenKind::Colon: return "Colon";
    case TokenKind::Comma: return "Comma";
    case TokenKind::Dot: return "Dot";
    case TokenKind::Equal: return "Equal";
    case TokenKind::AndAnd: return "AndAnd";
    case TokenKind::OrOr: return "OrOr";
    case TokenKind::Plus: return "Plus";
    case TokenKind::PlusPlus: return "PlusPlus";
    case TokenKind::Minus: return "Minus";
    case TokenKind::Star: return "Star";
    case TokenKind::Arrow: return "Arrow";
    case TokenKind::Lambda: return "Lambda";
    case TokenKind::At: return "At";
    case TokenKind::KwLet: return "KwLet";
    case TokenKind::KwIn: return "KwIn";
    case TokenKind::KwType: return "KwType";
    case TokenKind::KwKind: return "KwKind";
    case TokenKind::KwForall: return "KwForall";
    case TokenKind::KwBool: return "KwBool";
    case TokenKind::KwTrue: return "KwTrue";
    case TokenKind::KwFalse: return "KwFalse";
    case TokenKind::KwIf: return "KwIf";
    case TokenKind::KwThen: return "KwThen";
    case TokenKind::KwElse: return "KwElse";
    case TokenKind::KwNatural: return "KwNatural";
    case TokenKind::KwNaturalFold: return "KwNaturalFold";
    case TokenKind::KwInteger: return "KwInteger";
    case TokenKind::KwText: return "KwText";
    case TokenKind::KwDouble: return "KwDouble";
    case TokenKind::KwMaybe: return "KwMaybe";
    case TokenKind::KwNothing: return "KwNothing";
    case TokenKind::KwJust: return "KwJust";
    case TokenKind::KwListBuild: return "KwListBuild";
    case TokenKind::KwListFold: return "KwListFold";
    case TokenKind::TextLit: return "TextLit";
    case TokenKind::NaturalLit: return "NaturalLit";
    case TokenKind::DoubleLit: return "DoubleLit";
    case TokenKind::Number: return "Number";
    case TokenKind::Label: return "Label";
    case TokenKind::File: return "File";
    case TokenKind::Url: return "Url";
    }
    return "Unknown";
  }

  const char *spelling(TokenKind k) {
    switch (k) {
    case TokenKind::LParen: return "(";
    case TokenKind::RParen: return ")";
    case TokenKind::LBrace: return "{";
    case TokenKind::RBrace: return "}";
    case TokenKind::LDoubleBrace: return "{{";
    case TokenKind::RDoubleBrace: return "}}";
    case TokenKind::LBracket: return "[";
    case TokenKind::RBracket: return "]";
    case TokenKind::Colon: return ":";
    case TokenKind::Comma: return ",";
    case TokenKind::Dot: return ".";
    case TokenKind::Equal: return "=";
    case TokenKind::AndAnd: return "&&";
    case TokenKind::OrOr: return "||";
    case TokenKind::Plus: return "+";
    case TokenKind::PlusPlus: return "++";
    case TokenKind::Minus: return "-";
    case TokenKind::Star: return "*";
    case TokenKind::Arrow: return "->";
    case TokenKind::Lambda: return "\\";
    case TokenKind::At: return "@";
    case TokenKind::KwLet: return "let";
    case TokenKind::KwIn: return "in";
    case TokenKind::KwType: return "Type";
    case TokenKind::KwKind: return "Kind";
    case TokenKind::KwForall: return "forall";
    case TokenKind::KwBool: return "Bool";
    case TokenKind::KwTrue: return "True";
    case TokenKind::KwFalse: return "False";
    case TokenKind::KwIf: return "if";
    case TokenKind::KwThen: return "then";
    case TokenKind::KwElse: return "else";
    case TokenKind::KwNatural: return "Natural";
    case TokenKind::KwNaturalFold: return "Natural/fold";
    case TokenKind::KwInteger: return "Integer";
    case TokenKind::KwText: return "Text";
    case TokenKind::KwDouble: return "Double";
    case TokenKind::KwMaybe: return "Maybe";
    case TokenKind::KwNothing: return "Nothing";
    case TokenKind::KwJust: return "Just";
    case TokenKind::KwListBuild: return "List/build";
    case TokenKind::KwListFold: return "List/fold";
    default: return "";
    }
  }

  std::string quote_text(const std::string &s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
      switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\v': out += "\\v"; break;
      case '\a': out += "\\a"; break;
      case '\0': out += "\\0"; break;
      default: out.push_back(c); break;
      }
    }
    out.push_back('"');
    return out;
  }

  namespace {

    std::string render_double(double d) {
      std::string s = fmt::format("{}", d);
      // "314" would read back as a Number
      if (s.find_first_of(".eEni") == std::string::npos)
        s += ".0";
      return s;
    }

  } // namespace

  std::string render(const Token &t) {
    switch (t.kind) {
    case TokenKind::Eof:
      return "";
    case TokenKind::TextLit:
      if (auto *s = std::get_if<std::string>(&t.value))
        return quote_text(*s);
      return "\"\"";
    case TokenKind::NaturalLit:
      if (auto *n = std::get_if<BigNat>(&t.value))
        return "+" + n->to_string();
      return "+0";
    case TokenKind::Number:
      if (auto *n = std::get_if<BigNat>(&t.value))
        return n->to_string();
      return "0";
    case TokenKind::DoubleLit:
      if (auto *d = std::get_if<double>(&t.value))
        return render_double(*d);
      return "0.0";
    case TokenKind::Label:
    case TokenKind::Url:
      if (auto *s = std::get_if<std::string>(&t.value))
        return *s;
      return "";
    case TokenKind::File:
      if (auto *p = std::get_if<std::filesystem::path>(&t.value))
        return p->u8string();
      return "";
    default:
      return spelling(t.kind);
    }
  }

} // namespace dhall
