#include <catch2/catch_test_macros.hpp>
#include "engine/FixtureStore.hpp"
#include "api/StaticFileHandler.hpp"
#include "core/Types.hpp"
#include "TestUtils.hpp"
#include <filesystem>

using namespace mockapi;
namespace fs = std::filesystem;

class FixtureStoreTestFixture {
public:
    FixtureStoreTestFixture()
        : testDir_(testing::makeTempDir("mockapi_store_test"))
        , store_(testDir_) {
        testing::writeFile(testDir_ / "index.json", "{\"name\":\"root\"}\n");
        testing::writeFile(testDir_ / "api/health/index.json", "{\"status\":\"ok\"}");
        testing::writeFile(testDir_ / "notes.txt", "hello");
        testing::writeFile(testDir_ / "empty.json", "");
    }

    ~FixtureStoreTestFixture() {
        fs::remove_all(testDir_);
    }

    fs::path testDir_;
    FixtureStore store_;
};

// ============================================================
// FixtureStore
// ============================================================

TEST_CASE_METHOD(FixtureStoreTestFixture, "FixtureStore: Reads raw bytes", "[store]") {
    REQUIRE(store_.read("index.json") == "{\"name\":\"root\"}\n");
    REQUIRE(store_.read("api/health/index.json") == "{\"status\":\"ok\"}");
    REQUIRE(store_.read("empty.json").empty());
}

TEST_CASE_METHOD(FixtureStoreTestFixture, "FixtureStore: Repeated reads are identical", "[store]") {
    REQUIRE(store_.read("index.json") == store_.read("index.json"));
}

TEST_CASE_METHOD(FixtureStoreTestFixture, "FixtureStore: Existence checks", "[store]") {
    REQUIRE(store_.exists("index.json"));
    REQUIRE(store_.exists("api/health"));
    REQUIRE_FALSE(store_.isFile("api/health"));
    REQUIRE(store_.isFile("api/health/index.json"));
    REQUIRE_FALSE(store_.exists("api/missing/index.json"));
}

TEST_CASE_METHOD(FixtureStoreTestFixture, "FixtureStore: Missing file throws NotFoundError", "[store]") {
    try {
        store_.read("api/missing/index.json");
        FAIL("expected NotFoundError");
    }
    catch (const NotFoundError& e) {
        REQUIRE(e.getPath() == "api/missing/index.json");
        REQUIRE(std::string(e.what()) == "File not found: api/missing/index.json");
    }
}

TEST_CASE_METHOD(FixtureStoreTestFixture, "FixtureStore: Directory read is not found", "[store]") {
    REQUIRE_THROWS_AS(store_.read("api/health"), NotFoundError);
}

TEST_CASE_METHOD(FixtureStoreTestFixture, "FixtureStore: File deleted after check is not found", "[store]") {
    REQUIRE(store_.exists("notes.txt"));
    fs::remove(testDir_ / "notes.txt");
    REQUIRE_THROWS_AS(store_.read("notes.txt"), NotFoundError);
}

TEST_CASE_METHOD(FixtureStoreTestFixture, "FixtureStore: Lookups are confined to the root", "[store]") {
    testing::writeFile(testDir_.parent_path() / (testDir_.filename().string() + "_sibling.json"), "{}");

    std::string escape = "../" + testDir_.filename().string() + "_sibling.json";
    REQUIRE_FALSE(store_.resolve(escape).has_value());
    REQUIRE_FALSE(store_.exists(escape));
    REQUIRE_THROWS_AS(store_.read(escape), NotFoundError);

    REQUIRE_FALSE(store_.resolve("api/../../x").has_value());
    REQUIRE(store_.resolve("api/../index.json").has_value());

    fs::remove(testDir_.parent_path() / (testDir_.filename().string() + "_sibling.json"));
}

TEST_CASE_METHOD(FixtureStoreTestFixture, "FixtureStore: Absolute request paths stay under the root", "[store]") {
    auto resolved = store_.resolve("/index.json");
    REQUIRE(resolved.has_value());
    REQUIRE(*resolved == store_.getRoot() / "index.json");
}

TEST_CASE("FixtureStore: Trailing slash on root is ignored", "[store]") {
    auto dir = testing::makeTempDir("mockapi_store_slash");
    testing::writeFile(dir / "index.json", "{}");

    FixtureStore store(dir.string() + "/");
    REQUIRE(store.exists("index.json"));
    REQUIRE(store.read("index.json") == "{}");

    fs::remove_all(dir);
}

// ============================================================
// StaticFileHandler
// ============================================================

TEST_CASE("StaticFileHandler: Content type by extension", "[static]") {
    REQUIRE(StaticFileHandler::contentTypeFor("a/b.json") == "application/json");
    REQUIRE(StaticFileHandler::contentTypeFor("foo.txt") == "text/plain");
    REQUIRE(StaticFileHandler::contentTypeFor("INDEX.HTML") == "text/html");
    REQUIRE(StaticFileHandler::contentTypeFor("logo.png") == "image/png");
    REQUIRE(StaticFileHandler::contentTypeFor("archive.xyz") == "application/octet-stream");
    REQUIRE(StaticFileHandler::contentTypeFor("v1.0/README") == "application/octet-stream");
}

TEST_CASE_METHOD(FixtureStoreTestFixture, "StaticFileHandler: Serves file with its type", "[static]") {
    StaticFileHandler handler(store_);
    StaticFile file = handler.serve("notes.txt");

    REQUIRE(file.content == "hello");
    REQUIRE(file.contentType == "text/plain");
}

TEST_CASE_METHOD(FixtureStoreTestFixture, "StaticFileHandler: Missing file throws NotFoundError", "[static]") {
    StaticFileHandler handler(store_);
    REQUIRE_THROWS_AS(handler.serve("foo.txt"), NotFoundError);
}
