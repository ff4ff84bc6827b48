#pragma once
#include <cstdint>

#if defined(_WIN32)
  #define DHALL_API __declspec(dllexport)
#else
  #define DHALL_API __attribute__((visibility("default")))
#endif

extern "C" {
  // Tokenizes UTF-8 source. 0 on success: *out_json -> {"tokens": [...]} (free with dhall_free).
  // 4 on a lexical error: *out_error -> JSON diagnostic. 1 on null arguments, 3 on internal failure.
  DHALL_API int dhall_tokenize_json(const char* source_utf8, char** out_json, char** out_error);
  // *out_json -> {"diagnostics": [...]}, empty when the whole source lexes. 0 on success.
  DHALL_API int dhall_check_source(const char* source_utf8, char** out_json, char** out_error);
  // Releases strings returned by this library.
  DHALL_API void dhall_free(char* ptr);
}
