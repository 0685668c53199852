// Copyright (c) 2024 liudegui. MIT License.
// Tests for dbal::OpenQueryRegistry and ResultId.

#include <catch2/catch_test_macros.hpp>
#include <vector>

#include "dbal/open_query_registry.hpp"

using namespace dbal;

namespace {

struct Stmt {
  int32_t tag = 0;
};

using Registry = OpenQueryRegistry<Stmt*>;

}  // namespace

TEST_CASE("ResultId: live and cached spaces are disjoint", "[registry]") {
  Stmt stmt;
  ResultId live = ResultId::FromHandle(&stmt);
  ResultId cached = ResultId::Cached(1);

  REQUIRE(live.Valid());
  REQUIRE_FALSE(live.IsCached());
  REQUIRE(cached.Valid());
  REQUIRE(cached.IsCached());
  REQUIRE(live != cached);
  REQUIRE_FALSE(ResultId::Invalid().Valid());
}

TEST_CASE("OpenQueryRegistry: add and find", "[registry]") {
  Registry registry;
  Stmt stmt;
  ResultId id = ResultId::FromHandle(&stmt);

  REQUIRE(registry.Empty());
  REQUIRE(registry.Add(id, &stmt, "SELECT 1"));
  REQUIRE(registry.Contains(id));
  REQUIRE(registry.Size() == 1);

  Registry::Entry* entry = registry.Find(id);
  REQUIRE(entry != nullptr);
  REQUIRE(entry->handle == &stmt);
  REQUIRE(entry->position == 0);
  REQUIRE(entry->query == "SELECT 1");
}

TEST_CASE("OpenQueryRegistry: rejects duplicates and bad input",
          "[registry]") {
  Registry registry;
  Stmt stmt;
  ResultId id = ResultId::FromHandle(&stmt);

  REQUIRE(registry.Add(id, &stmt));
  REQUIRE_FALSE(registry.Add(id, &stmt));
  REQUIRE_FALSE(registry.Add(ResultId::Invalid(), &stmt));
  REQUIRE_FALSE(registry.Add(ResultId::Cached(5), nullptr));
  REQUIRE(registry.Size() == 1);
}

TEST_CASE("OpenQueryRegistry: advance", "[registry]") {
  Registry registry;
  Stmt stmt;
  ResultId id = ResultId::FromHandle(&stmt);
  registry.Add(id, &stmt);

  registry.Advance(id);
  registry.Advance(id);
  REQUIRE(registry.Find(id)->position == 2);

  // Unknown ids are ignored.
  registry.Advance(ResultId::Cached(9));
}

TEST_CASE("OpenQueryRegistry: remove hands back the handle", "[registry]") {
  Registry registry;
  Stmt stmt;
  ResultId id = ResultId::FromHandle(&stmt);
  registry.Add(id, &stmt);

  REQUIRE(registry.Remove(id) == &stmt);
  REQUIRE_FALSE(registry.Contains(id));
  REQUIRE(registry.Find(id) == nullptr);
  REQUIRE(registry.Remove(id) == nullptr);
}

TEST_CASE("OpenQueryRegistry: drain releases everything", "[registry]") {
  Registry registry;
  Stmt a, b, c;
  registry.Add(ResultId::FromHandle(&a), &a);
  registry.Add(ResultId::FromHandle(&b), &b);
  registry.Add(ResultId::FromHandle(&c), &c);

  std::vector<Stmt*> released;
  registry.Drain([&released](Stmt* s) { released.push_back(s); });
  REQUIRE(released.size() == 3);
  REQUIRE(registry.Empty());
}
