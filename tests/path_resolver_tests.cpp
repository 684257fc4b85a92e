#include <catch2/catch.hpp>

#include "core/path_resolver.hpp"
#include "test_helpers.hpp"

using namespace saveli;
using saveli::test::EnvGuard;

TEST_CASE("expand_env substitutes both variable forms", "[resolver]") {
  EnvGuard a("SAVELI_TEST_A", "/games");
  EnvGuard b("SAVELI_TEST_B", "data");

  CHECK(expand_env("$SAVELI_TEST_A/x") == "/games/x");
  CHECK(expand_env("${SAVELI_TEST_A}/${SAVELI_TEST_B}") == "/games/data");
  CHECK(expand_env("${SAVELI_TEST_A}suffix") == "/gamessuffix");
  CHECK(expand_env("no variables") == "no variables");
}

TEST_CASE("expand_env treats undefined variables as empty", "[resolver]") {
  EnvGuard unset("SAVELI_TEST_UNSET", nullptr);
  CHECK(expand_env("$SAVELI_TEST_UNSET/save") == "/save");
  CHECK(expand_env("${SAVELI_TEST_UNSET}") == "");
}

TEST_CASE("expand_env keeps stray dollar signs", "[resolver]") {
  CHECK(expand_env("cost$") == "cost$");
  CHECK(expand_env("$5") == "$5");
  CHECK(expand_env("${unterminated") == "${unterminated");
  CHECK(expand_env("${1bad}") == "${1bad}");
}

TEST_CASE("resolve_save_path accepts absolute expansions", "[resolver]") {
  EnvGuard home("SAVELI_TEST_HOME", "/home/player");

  fs::path out;
  auto err = resolve_save_path("  $SAVELI_TEST_HOME/.game/saves/  ", out);
  REQUIRE_FALSE(err.has_value());
  CHECK(out == fs::path("/home/player/.game/saves"));
}

TEST_CASE("resolve_save_path with an unset variable", "[resolver]") {
  EnvGuard unset("TESTVAR", nullptr);

  fs::path out;
  auto err = resolve_save_path("$TESTVAR/save", out);
  REQUIRE_FALSE(err.has_value());
  CHECK(out == fs::path("/save"));

  fs::path untouched("/unchanged");
  err = resolve_save_path("${TESTVAR}save", untouched);
  REQUIRE(err.has_value());
  CHECK(err->kind == PathError::Kind::Relative);
  CHECK(err->expanded == "save");
  CHECK(untouched == fs::path("/unchanged"));
}

TEST_CASE("resolve_save_path rejects relative and empty paths",
          "[resolver]") {
  fs::path out;
  auto err = resolve_save_path("relative/dir", out);
  REQUIRE(err.has_value());
  CHECK(err->kind == PathError::Kind::Relative);
  CHECK(err->message().find("relative/dir") != std::string::npos);

  CHECK(resolve_save_path("   ", out).has_value());
}

TEST_CASE("resolve_save_path accepts literal absolute paths", "[resolver]") {
  fs::path out;
  CHECK_FALSE(resolve_save_path("/opt/game/save.dat", out).has_value());
  CHECK(out == fs::path("/opt/game/save.dat"));
}
