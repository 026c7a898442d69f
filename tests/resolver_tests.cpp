#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "sourcer/resolver.h"

#include "scratch_dir.h"

using sourcer::Exhausted;
using sourcer::Found;
using sourcer::NotFound;
using sourcer::Resolver;
using sourcer::SearchResult;

namespace {

class ResolverTest : public sourcer::test::ScratchDirTest {};

// Returns a fixed result and counts its calls.
class StubSearcher : public sourcer::Searcher {
public:
    StubSearcher(std::string name, SearchResult result, int& calls)
    : m_name{std::move(name)}, m_result{std::move(result)}, m_calls{calls} {}

    [[nodiscard]] std::string_view name() const override { return m_name; }

    [[nodiscard]] SearchResult search(std::string_view) const override {
        ++m_calls;
        return m_result;
    }

private:
    std::string m_name;
    SearchResult m_result;
    int& m_calls;
};

NotFound not_found(std::vector<std::string> paths) {
    NotFound result;

    for (auto& path : paths) {
        result.attempted.emplace_back(std::move(path));
    }

    return result;
}

std::vector<std::string> paths(const Exhausted& exhausted) {
    std::vector<std::string> result;

    for (const auto& attempt : exhausted.attempts) {
        result.push_back(attempt.path.string());
    }

    return result;
}

} // namespace

TEST_F(ResolverTest, DefaultSearcherIsInstalledFirst) {
    Resolver resolver;

    EXPECT_EQ(resolver.searchers(), std::vector<std::string>{"default"});
    EXPECT_TRUE(resolver.search_path().empty());
}

TEST_F(ResolverTest, EndToEndWithTwoTemplates) {
    touch("mod.ext");

    Resolver resolver;
    ASSERT_TRUE(resolver.search_path().append("./%s"));
    ASSERT_TRUE(resolver.search_path().append("./%s.ext"));

    auto found = resolver.resolve("mod");
    ASSERT_TRUE(std::holds_alternative<Found>(found));
    EXPECT_EQ(std::get<Found>(found).path.string(), "./mod.ext");

    auto missing = resolver.resolve("missing");
    ASSERT_TRUE(std::holds_alternative<Exhausted>(missing));

    const auto& exhausted = std::get<Exhausted>(missing);
    EXPECT_EQ(exhausted.name, "missing");
    EXPECT_EQ(
        paths(exhausted),
        (std::vector<std::string>{"./missing", "./missing.ext"}));

    for (const auto& attempt : exhausted.attempts) {
        EXPECT_EQ(attempt.searcher, "default");
    }
}

TEST_F(ResolverTest, ExistingLiteralNeverReachesLaterSearchers) {
    touch("lib.sh");

    int calls = 0;

    Resolver resolver;
    resolver.add_searcher(
        std::make_unique<StubSearcher>("stub", not_found({"x"}), calls));

    auto result = resolver.resolve("./lib.sh");

    ASSERT_TRUE(std::holds_alternative<Found>(result));
    EXPECT_EQ(std::get<Found>(result).path.string(), "./lib.sh");
    EXPECT_EQ(calls, 0);
}

TEST_F(ResolverTest, LaterSearcherSuccessDiscardsEarlierFailures) {
    int first_calls = 0;
    int second_calls = 0;
    int third_calls = 0;

    Resolver resolver;
    ASSERT_TRUE(resolver.remove_searcher("default"));

    resolver.add_searcher(
        std::make_unique<StubSearcher>(
            "first", not_found({"a", "b", "c"}), first_calls));
    resolver.add_searcher(
        std::make_unique<StubSearcher>(
            "second", Found{"found/mod.sh"}, second_calls));
    resolver.add_searcher(
        std::make_unique<StubSearcher>(
            "third", Found{"never"}, third_calls));

    auto result = resolver.resolve("mod");

    ASSERT_TRUE(std::holds_alternative<Found>(result));
    EXPECT_EQ(std::get<Found>(result).path.string(), "found/mod.sh");

    EXPECT_EQ(first_calls, 1);
    EXPECT_EQ(second_calls, 1);
    EXPECT_EQ(third_calls, 0);
}

TEST_F(ResolverTest, FailuresAggregateInChainOrder) {
    Resolver resolver;
    ASSERT_TRUE(resolver.search_path().append("./%s.sh"));

    resolver.add_searcher("first", [](std::string_view name) -> SearchResult {
        return not_found({std::string{"one/"} + std::string{name}});
    });
    resolver.add_searcher("second", [](std::string_view name) -> SearchResult {
        return not_found(
            {std::string{"two/"} + std::string{name},
             std::string{"three/"} + std::string{name}});
    });

    EXPECT_EQ(
        resolver.searchers(),
        (std::vector<std::string>{"default", "first", "second"}));

    auto result = resolver.resolve("mod");
    ASSERT_TRUE(std::holds_alternative<Exhausted>(result));

    const auto& exhausted = std::get<Exhausted>(result);
    EXPECT_EQ(
        paths(exhausted),
        (std::vector<std::string>{"./mod.sh", "one/mod", "two/mod", "three/mod"}));

    ASSERT_EQ(exhausted.attempts.size(), 4);
    EXPECT_EQ(exhausted.attempts[0].searcher, "default");
    EXPECT_EQ(exhausted.attempts[1].searcher, "first");
    EXPECT_EQ(exhausted.attempts[2].searcher, "second");
    EXPECT_EQ(exhausted.attempts[3].searcher, "second");
}

TEST_F(ResolverTest, EverySearcherReceivesTheOriginalName) {
    std::vector<std::string> seen;

    Resolver resolver;
    ASSERT_TRUE(resolver.remove_searcher("default"));

    for (auto name : {"first", "second"}) {
        resolver.add_searcher(name, [&](std::string_view module) -> SearchResult {
            seen.emplace_back(module);
            return not_found({"nope"});
        });
    }

    EXPECT_TRUE(std::holds_alternative<Exhausted>(resolver.resolve("lib/x")));
    EXPECT_EQ(seen, (std::vector<std::string>{"lib/x", "lib/x"}));
}

TEST_F(ResolverTest, EmptyChainIsExhaustedWithoutAttempts) {
    Resolver resolver;

    ASSERT_TRUE(resolver.remove_searcher("default"));
    EXPECT_FALSE(resolver.remove_searcher("default"));

    auto result = resolver.resolve("mod");
    ASSERT_TRUE(std::holds_alternative<Exhausted>(result));
    EXPECT_TRUE(std::get<Exhausted>(result).attempts.empty());
}

TEST_F(ResolverTest, DuplicateCandidatesArePreserved) {
    Resolver resolver;
    ASSERT_TRUE(resolver.search_path().append("%s"));

    auto result = resolver.resolve("./foo");
    ASSERT_TRUE(std::holds_alternative<Exhausted>(result));

    EXPECT_EQ(
        paths(std::get<Exhausted>(result)),
        (std::vector<std::string>{"./foo", "./foo"}));
}
