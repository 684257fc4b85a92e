#include <catch2/catch.hpp>

#include "core/json.hpp"

using namespace saveli;

TEST_CASE("json parses nested documents", "[json]") {
  json::Value v = json::parse(
      R"({"version": 1, "games": [{"title": "A \"quoted\" game", "custom": true}], "ratio": 0.5, "none": null})");

  REQUIRE(v.is_object());
  CHECK(v.at("version").as_int() == 1);
  CHECK(v.at("version").is_integer());
  CHECK(v.at("ratio").as_double() == Approx(0.5));
  CHECK(v.at("none").is_null());

  const auto &games = v.at("games").items();
  REQUIRE(games.size() == 1);
  CHECK(games[0].at("title").as_string() == "A \"quoted\" game");
  CHECK(games[0].at("custom").as_bool());
}

TEST_CASE("json decodes escapes and unicode", "[json]") {
  json::Value v = json::parse(R"(["a\\b", "tab\there", "é", "😀"])");
  const auto &items = v.items();
  CHECK(items[0].as_string() == "a\\b");
  CHECK(items[1].as_string() == "tab\there");
  CHECK(items[2].as_string() == "\xc3\xa9");
  CHECK(items[3].as_string() == "\xf0\x9f\x98\x80");
}

TEST_CASE("json rejects malformed input", "[json]") {
  CHECK_THROWS_AS(json::parse(""), json::Error);
  CHECK_THROWS_AS(json::parse("{"), json::Error);
  CHECK_THROWS_AS(json::parse(R"({"a": 1,})"), json::Error);
  CHECK_THROWS_AS(json::parse(R"({"a" 1})"), json::Error);
  CHECK_THROWS_AS(json::parse("[1] trailing"), json::Error);
  CHECK_THROWS_AS(json::parse(R"("unterminated)"), json::Error);
  CHECK_THROWS_AS(json::parse("tru"), json::Error);
  CHECK_THROWS_AS(json::parse("01"), json::Error);
}

TEST_CASE("json accessors report type mismatches", "[json]") {
  json::Value v = json::parse(R"({"version": "1", "n": 1.5})");
  CHECK_THROWS_AS(v.at("version").as_int(), json::Error);
  CHECK_THROWS_AS(v.at("n").as_int(), json::Error);
  CHECK_THROWS_AS(v.at("missing"), json::Error);
  CHECK_THROWS_AS(v.items(), json::Error);
  CHECK(v.find("missing") == nullptr);
}

TEST_CASE("json integers outside int64 are not narrowed", "[json]") {
  CHECK_THROWS_AS(json::parse("1e30").as_int(), json::Error);
  CHECK_THROWS_AS(json::parse("-1e30").as_int(), json::Error);

  json::Value big = json::parse("99999999999999999999");
  CHECK_FALSE(big.is_integer());
  CHECK(big.as_double() == Approx(1e20));
  CHECK_THROWS_AS(big.as_int(), json::Error);

  CHECK(json::parse("9007199254740992").as_int() == 9007199254740992LL);
  CHECK(json::parse("3e2").as_int() == 300);
}

TEST_CASE("json dump keeps member order and indents", "[json]") {
  json::Value root = json::Value::object();
  root["version"] = json::Value(1);
  json::Value games = json::Value::array();
  json::Value game = json::Value::object();
  game["title"] = json::Value("T");
  game["id"] = json::Value("t");
  games.push_back(game);
  root["games"] = games;
  root["empty"] = json::Value::array();

  CHECK(json::dump(root) ==
        R"({"version":1,"games":[{"title":"T","id":"t"}],"empty":[]})");
  CHECK(json::dump(root, 2) == "{\n"
                               "  \"version\": 1,\n"
                               "  \"games\": [\n"
                               "    {\n"
                               "      \"title\": \"T\",\n"
                               "      \"id\": \"t\"\n"
                               "    }\n"
                               "  ],\n"
                               "  \"empty\": []\n"
                               "}");
}

TEST_CASE("json dump escapes strings", "[json]") {
  json::Value v("line\n\"q\"\\");
  CHECK(json::dump(v) == R"("line\n\"q\"\\")");
  CHECK(json::parse(json::dump(v)).as_string() == v.as_string());
}
