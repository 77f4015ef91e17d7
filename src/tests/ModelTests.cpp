// SPDX-License-Identifier: Apache-2.0
#include <speech/ArgumentChecks.hpp>
#include <speech/Model.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "TestFixtures.hpp"

using namespace vosklink;

TEST_CASE("Model load fails for a missing directory", "[model]")
{
    auto model = Model::load("/nonexistent/vosklink/model");
    REQUIRE(!model.has_value());
    CHECK(model.error().code == ErrorCode::ModelLoadFailed);
}

TEST_CASE("Model load treats an empty path as a failed load", "[model]")
{
    auto model = Model::load("");
    REQUIRE(!model.has_value());
    CHECK(model.error().code == ErrorCode::ModelLoadFailed);
}

TEST_CASE("Model load rejects malformed paths", "[model]")
{
    SECTION("too long")
    {
        auto model = Model::load(std::string(MaxPathLength + 1, 'a'));
        REQUIRE(!model.has_value());
        CHECK(model.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("embedded NUL")
    {
        auto model = Model::load(std::string("/models\0/en", 11));
        REQUIRE(!model.has_value());
        CHECK(model.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("Path length bound is inclusive", "[model]")
{
    CHECK(checkNativeString("", MaxPathLength, "path").has_value());
    CHECK(checkNativeString(std::string(MaxPathLength, 'a'), MaxPathLength, "path").has_value());
    CHECK(!checkNativeString(std::string(MaxPathLength + 1, 'a'), MaxPathLength, "path").has_value());
}

TEST_CASE("findWord is a pure lookup", "[model][fixture]")
{
    auto model = test::fixtureModel();

    auto first = model->findWord("one");
    auto second = model->findWord("one");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(*first >= 0);
    CHECK(*first == *second);

    auto unknown = model->findWord("xyzzyqqq");
    REQUIRE(unknown.has_value());
    CHECK(*unknown == -1);
}

TEST_CASE("findWord rejects malformed words", "[model][fixture]")
{
    auto model = test::fixtureModel();

    auto tooLong = model->findWord(std::string(MaxWordLength + 1, 'a'));
    REQUIRE(!tooLong.has_value());
    CHECK(tooLong.error().code == ErrorCode::InvalidArgument);

    auto withNul = model->findWord(std::string("on\0e", 4));
    REQUIRE(!withNul.has_value());
    CHECK(withNul.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("findWord reports an empty word as unknown", "[model][fixture]")
{
    auto model = test::fixtureModel();

    auto symbol = model->findWord("");
    REQUIRE(symbol.has_value());
    CHECK(*symbol == -1);
}

TEST_CASE("Model release is idempotent", "[model][fixture]")
{
    auto const path = test::fixtureModel()->path();

    auto loaded = Model::load(path);
    REQUIRE(loaded.has_value());
    auto model = *loaded;

    CHECK(!model->isReleased());
    model->release();
    model->release();
    CHECK(model->isReleased());

    auto symbol = model->findWord("one");
    REQUIRE(!symbol.has_value());
    CHECK(symbol.error().code == ErrorCode::ResourceReleased);
}
