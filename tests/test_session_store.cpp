#include "session_store.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace prdeck;
namespace fs = std::filesystem;

namespace {

SessionState sample_session() {
  SessionState s;
  s.repositories = {Repository{"acme", "widgets", "main"},
                    Repository{"acme", "gadgets", "develop"}};
  s.selected_tab = 1;
  s.filter = PrFilter::Chore;
  s.selected_prs["acme/widgets@main"] = {3, 5};
  s.show_timestamps = true;
  s.theme = ThemeKind::Light;
  return s;
}

} // namespace

TEST_CASE("session JSON round trip") {
  SessionState s = sample_session();
  CHECK(session_from_json(session_to_json(s)) == s);
}

TEST_CASE("session JSON defaults missing fields") {
  SessionState s = session_from_json(R"({"repositories":[{"org":"a","repo":"b"}]})");
  REQUIRE(s.repositories.size() == 1);
  CHECK(s.repositories[0].branch == "main");
  CHECK(s.selected_tab == 0);
  CHECK(s.filter == PrFilter::None);
  CHECK(s.theme == ThemeKind::Dark);
  CHECK_FALSE(s.show_timestamps);
}

TEST_CASE("malformed session JSON is rejected") {
  CHECK_THROWS_AS(session_from_json("not json"), std::runtime_error);
  CHECK_THROWS_AS(session_from_json("[1,2]"), std::runtime_error);
  CHECK_THROWS_AS(session_from_json(R"({"repositories":[{"repo":"b"}]})"),
                  std::runtime_error);
}

TEST_CASE("session store saves into nested directories") {
  const fs::path dir = fs::temp_directory_path() / "prdeck_session_test";
  fs::remove_all(dir);
  const std::string path = (dir / "nested" / "session.json").string();
  SessionStore store(path);
  CHECK(store.load() == SessionState{});

  store.save(sample_session());
  REQUIRE(fs::exists(path));
  CHECK(store.load() == sample_session());

  {
    std::ofstream f(path);
    f << "{ broken";
  }
  CHECK(store.load() == SessionState{});
  fs::remove_all(dir);
}

TEST_CASE("empty session path disables persistence") {
  SessionStore store("");
  store.save(sample_session());
  CHECK(store.load() == SessionState{});
}
