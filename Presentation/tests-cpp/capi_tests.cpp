#include <gtest/gtest.h>
#include "../../Infrastructure/dhall-capi/capi.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST(CApi, TokenizeToJson){
  char* out = nullptr; char* err = nullptr;
  ASSERT_EQ(dhall_tokenize_json("let x = +1", &out, &err), 0);
  ASSERT_NE(out, nullptr);
  EXPECT_EQ(err, nullptr);
  auto j = json::parse(out);
  dhall_free(out);
  ASSERT_EQ(j["tokens"].size(), 5u);
  EXPECT_EQ(j["tokens"][0]["kind"], "KwLet");
  EXPECT_EQ(j["tokens"][3]["kind"], "NaturalLit");
  EXPECT_EQ(j["tokens"][3]["value"], "1");
  EXPECT_EQ(j["tokens"][3]["text"], "+1");
}

TEST(CApi, LexicalErrorIsStructured){
  char* out = nullptr; char* err = nullptr;
  ASSERT_EQ(dhall_tokenize_json("x `", &out, &err), 4);
  EXPECT_EQ(out, nullptr);
  ASSERT_NE(err, nullptr);
  auto j = json::parse(err);
  dhall_free(err);
  EXPECT_EQ(j["kind"], "UnmatchedCharacter");
  EXPECT_EQ(j["col"], 3u);
}

TEST(CApi, CheckSource){
  char* out = nullptr; char* err = nullptr;
  ASSERT_EQ(dhall_check_source("\"ok\"", &out, &err), 0);
  EXPECT_TRUE(json::parse(out)["diagnostics"].empty());
  dhall_free(out);

  ASSERT_EQ(dhall_check_source("\"bad \\q\"", &out, &err), 0);
  auto j = json::parse(out);
  dhall_free(out);
  ASSERT_EQ(j["diagnostics"].size(), 1u);
  EXPECT_EQ(j["diagnostics"][0]["kind"], "InvalidEscape");
}

TEST(CApi, NullArguments){
  char* out = nullptr; char* err = nullptr;
  EXPECT_EQ(dhall_tokenize_json(nullptr, &out, &err), 1);
  EXPECT_EQ(dhall_check_source("x", nullptr, &err), 1);
  dhall_free(nullptr);
}
