#include "capi.hpp"
#include "../../Application/dhall-dump/token_dump.hpp"
#include "../../Domain/dhall-lang/lexer.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <cstring>
#include <string>

using json = nlohmann::json;

static char* dup_utf8(const std::string& s){
  char* p = (char*)std::malloc(s.size()+1);
  if (!p) return nullptr;
  std::memcpy(p, s.data(), s.size());
  p[s.size()] = '\0';
  return p;
}

extern "C" {

DHALL_API void dhall_free(char* ptr){ if(ptr) std::free(ptr); }

DHALL_API int dhall_tokenize_json(const char* source_utf8, char** out_json, char** out_error){
  if (!source_utf8 || !out_json || !out_error) return 1;
  *out_json = nullptr; *out_error = nullptr;
  try{
    dhall::Lexer lex(std::string{source_utf8});
    auto toks = lex.Lex();
    *out_json = dup_utf8(dhall::dump_json(dhall::tokens_to_json(toks)));
    if (!*out_json) { *out_error = dup_utf8("alloc failure"); return 2; }
    return 0;
  } catch (const dhall::LexError& ex){
    *out_error = dup_utf8(dhall::dump_json(dhall::error_to_json(ex)));
    return 4;
  } catch (const std::exception& ex){
    *out_error = dup_utf8(ex.what());
    return 3;
  }
}

DHALL_API int dhall_check_source(const char* source_utf8, char** out_json, char** out_error){
  if (!source_utf8 || !out_json || !out_error) return 1;
  *out_json = nullptr; *out_error = nullptr;
  try{
    json out; out["diagnostics"] = json::array();
    try{
      dhall::Lexer lex(std::string{source_utf8});
      (void)lex.Lex();
    } catch (const dhall::LexError& ex){
      out["diagnostics"].push_back(dhall::error_to_json(ex));
    }
    *out_json = dup_utf8(dhall::dump_json(out));
    if (!*out_json) { *out_error = dup_utf8("alloc failure"); return 2; }
    return 0;
  } catch (const std::exception& ex){
    *out_error = dup_utf8(ex.what());
    return 3;
  }
}

} // extern "C"
