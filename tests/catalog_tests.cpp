#include <catch2/catch.hpp>

#include "core/catalog.hpp"
#include "core/default_catalog.hpp"
#include "defs.hpp"
#include "test_helpers.hpp"

using namespace saveli;
using saveli::test::EnvGuard;
using saveli::test::TempDir;

static std::string catalog_with_version(int version) {
  return "{\"version\": " + std::to_string(version) + ", \"games\": []}";
}

TEST_CASE("Catalog accepts current and older versions", "[catalog]") {
  CHECK_NOTHROW(Catalog::load(catalog_with_version(CATALOG_VERSION)));
  CHECK_NOTHROW(Catalog::load(catalog_with_version(CATALOG_VERSION - 1)));
}

TEST_CASE("Catalog rejects newer versions", "[catalog]") {
  try {
    Catalog::load(catalog_with_version(CATALOG_VERSION + 1));
    FAIL("expected CatalogError");
  } catch (const CatalogError &e) {
    CHECK(e.kind() == CatalogError::Kind::TooNew);
    CHECK(std::string(e.what()).find("too new") != std::string::npos);
  }
}

TEST_CASE("Catalog treats huge versions as too new", "[catalog]") {
  const char *docs[] = {
      R"({"version": 1e30, "games": []})",
      R"({"version": 2e0, "games": []})",
      R"({"version": 99999999999999999999, "games": []})",
  };
  for (const char *doc : docs) {
    INFO(doc);
    try {
      Catalog::load(doc);
      FAIL("expected CatalogError");
    } catch (const CatalogError &e) {
      CHECK(e.kind() == CatalogError::Kind::TooNew);
    }
  }
}

TEST_CASE("Catalog rejects fractional and negative versions", "[catalog]") {
  const char *docs[] = {
      R"({"version": 1.5, "games": []})",
      R"({"version": -1, "games": []})",
  };
  for (const char *doc : docs) {
    INFO(doc);
    try {
      Catalog::load(doc);
      FAIL("expected CatalogError");
    } catch (const CatalogError &e) {
      CHECK(e.kind() == CatalogError::Kind::Parse);
    }
  }
}

TEST_CASE("Catalog with no games loads empty", "[catalog]") {
  Catalog catalog = Catalog::load(R"({"version":1,"games":[]})");
  CHECK(catalog.entries().empty());
  CHECK(catalog.version() == 1);
}

TEST_CASE("Catalog reports malformed documents as parse errors",
          "[catalog]") {
  const char *docs[] = {
      "not json",
      R"({"games": []})",
      R"({"version": 1})",
      R"({"version": "1", "games": []})",
      R"({"version": 1, "games": [{"id": "x", "saves": []}]})",
      R"({"version": 1, "games": [{"title": "X", "id": "x", "saves": [{"id": "s"}]}]})",
  };
  for (const char *doc : docs) {
    INFO(doc);
    try {
      Catalog::load(doc);
      FAIL("expected CatalogError");
    } catch (const CatalogError &e) {
      CHECK(e.kind() == CatalogError::Kind::Parse);
    }
  }
}

TEST_CASE("Catalog prefers custom entries over bundled ones", "[catalog]") {
  Catalog catalog = Catalog::load(R"({
    "version": 1,
    "games": [
      {"title": "Bundled", "id": "dup", "saves": [{"id": "s", "path": "/bundled"}]},
      {"title": "Zeta", "id": "zeta", "saves": []},
      {"title": "Mine", "id": "dup", "custom": true, "saves": [{"id": "s", "path": "/mine"}]},
      {"title": "Alpha", "id": "alpha", "saves": []}
    ]
  })");

  const auto &entries = catalog.entries();
  REQUIRE(entries.size() == 3);
  CHECK(entries[0].id == "alpha");
  CHECK(entries[1].id == "dup");
  CHECK(entries[2].id == "zeta");

  const Entry *dup = catalog.find("dup");
  REQUIRE(dup != nullptr);
  CHECK(dup->custom);
  CHECK(dup->title == "Mine");
  CHECK(dup->saves[0].resolved == fs::path("/mine"));
}

TEST_CASE("Catalog resolves every save path on load", "[catalog]") {
  EnvGuard unset("TESTVAR", nullptr);
  EnvGuard home("SAVELI_TEST_HOME", "/home/p");

  Catalog catalog = Catalog::load(R"({"version": 1, "games": [
    {"title": "G1", "id": "g1", "saves": [{"id": "s1", "path": "$TESTVAR/save"}]},
    {"title": "G2", "id": "g2", "saves": [{"id": "s2", "path": " ${SAVELI_TEST_HOME}/g2 "}]}
  ]})");

  CHECK(catalog.find("g1")->saves[0].resolved == fs::path("/save"));
  CHECK(catalog.find("g2")->saves[0].resolved == fs::path("/home/p/g2"));
  CHECK(catalog.find("g2")->saves[0].raw == "${SAVELI_TEST_HOME}/g2");
}

TEST_CASE("Catalog load fails entirely on one relative path", "[catalog]") {
  EnvGuard unset("TESTVAR", nullptr);
  try {
    Catalog::load(R"({"version": 1, "games": [
      {"title": "Good", "id": "good", "saves": [{"id": "s", "path": "/ok"}]},
      {"title": "Bad", "id": "bad", "saves": [{"id": "s", "path": "${TESTVAR}rel"}]}
    ]})");
    FAIL("expected CatalogError");
  } catch (const CatalogError &e) {
    CHECK(e.kind() == CatalogError::Kind::InvalidPath);
    CHECK(std::string(e.what()).find("bad") != std::string::npos);
  }
}

TEST_CASE("Catalog search matches id or title", "[catalog]") {
  Catalog catalog = Catalog::load(R"({"version": 1, "games": [
    {"title": "Hollow Knight", "id": "hollow-knight", "saves": []},
    {"title": "Celeste", "id": "celeste", "saves": []}
  ]})");

  CHECK(catalog.search("Hollow").size() == 1);
  CHECK(catalog.search("celeste").size() == 1);
  CHECK(catalog.search("l").size() == 2);
  CHECK(catalog.search("hollow").size() == 1); // id match
  CHECK(catalog.search("CELESTE").empty());
  CHECK_THROWS_AS(catalog.search(""), std::invalid_argument);
}

TEST_CASE("Catalog open seeds the bundled catalog", "[catalog]") {
  TempDir storage;
  fs::path file = storage.path() / CATALOG_FILE_NAME;
  REQUIRE_FALSE(fs::exists(file));

  Catalog catalog = Catalog::open(storage.path());
  CHECK(fs::exists(file));
  CHECK(catalog.path() == file);

  Catalog bundled = Catalog::load(default_catalog_json());
  CHECK(catalog.entries().size() == bundled.entries().size());
  CHECK_FALSE(catalog.entries().empty());

  // Second open reads the file that was written
  Catalog reopened = Catalog::open(storage.path());
  CHECK(reopened.entries().size() == catalog.entries().size());
}

TEST_CASE("Catalog open reads an existing file", "[catalog]") {
  TempDir storage;
  saveli::test::write_text(storage.path() / CATALOG_FILE_NAME,
                           R"({"version": 1, "games": [
    {"title": "Only", "id": "only", "saves": [{"id": "s", "path": "/only"}]}
  ]})");

  Catalog catalog = Catalog::open(storage.path());
  REQUIRE(catalog.entries().size() == 1);
  CHECK(catalog.entries()[0].id == "only");
}

TEST_CASE("Catalog save never writes resolved paths", "[catalog]") {
  TempDir storage;
  EnvGuard home("SAVELI_TEST_HOME", "/home/p");
  saveli::test::write_text(storage.path() / CATALOG_FILE_NAME,
                           R"({"version": 0, "games": [
    {"title": "G", "id": "g", "saves": [{"id": "s", "path": "$SAVELI_TEST_HOME/g"}]}
  ]})");

  Catalog catalog = Catalog::open(storage.path());
  REQUIRE(catalog.save());

  std::string text = saveli::test::read_text(catalog.path());
  CHECK(text.find("$SAVELI_TEST_HOME/g") != std::string::npos);
  CHECK(text.find("/home/p") == std::string::npos);
  CHECK(text.find("\"custom\"") == std::string::npos);
  CHECK(text.find("\"version\": 1") != std::string::npos);
}

TEST_CASE("Catalog add upserts custom entries", "[catalog]") {
  TempDir storage;
  saveli::test::write_text(storage.path() / CATALOG_FILE_NAME,
                           R"({"version": 1, "games": [
    {"title": "Bundled", "id": "game", "saves": [{"id": "s", "path": "/bundled"}]}
  ]})");
  Catalog catalog = Catalog::open(storage.path());

  Entry first;
  first.title = "First";
  first.id = "game";
  first.saves.push_back(SavePath{"s", "/first", "/first"});
  REQUIRE(catalog.add(first));

  Entry second = first;
  second.title = "Second";
  REQUIRE(catalog.add(second));

  size_t custom = 0;
  size_t bundled = 0;
  for (const auto &e : catalog.entries()) {
    if (e.id == "game") {
      (e.custom ? custom : bundled)++;
    }
  }
  CHECK(custom == 1);
  CHECK(bundled == 1);
  CHECK(catalog.find("game")->title == "Second");

  // Persisted and dedupped again on reload
  Catalog reloaded = Catalog::load_from(catalog.path());
  REQUIRE(reloaded.entries().size() == 1);
  CHECK(reloaded.entries()[0].custom);
  CHECK(reloaded.entries()[0].title == "Second");
}
