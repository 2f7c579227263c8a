// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "app/command_dispatcher.hpp"
#include "store/note_store.hpp"
#include "util/files.hpp"
#include "util/time.hpp"
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>

using namespace notekeep;
using json = nlohmann::json;

namespace {

class DispatcherFixture {
public:
    explicit DispatcherFixture(const std::string& name)
        : dir_(std::filesystem::temp_directory_path() / ("notekeep_" + name)) {
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        store::NoteStore::Options opts;
        opts.db_path = dir_ / "notes.db";
        store_ = std::make_unique<store::NoteStore>(opts);
        util::OpState state;
        REQUIRE(store_->Init(state));
        dispatcher_ = std::make_unique<app::CommandDispatcher>(*store_, dir_);
    }

    ~DispatcherFixture() {
        dispatcher_.reset();
        store_.reset();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    app::CommandResponse Run(const std::string& method, std::vector<std::string> params = {}) {
        return dispatcher_->Execute(method, params);
    }

    app::CommandDispatcher& dispatcher() { return *dispatcher_; }
    store::NoteStore& store() { return *store_; }
    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
    std::unique_ptr<store::NoteStore> store_;
    std::unique_ptr<app::CommandDispatcher> dispatcher_;
};

} // namespace

TEST_CASE("CommandDispatcher note commands", "[dispatcher]") {
    DispatcherFixture fx("dispatcher_notes");

    SECTION("add then list") {
        util::MockTimeScope mock(1729857600);
        auto added = fx.Run("add", {"Groceries", "Milk, eggs"});
        REQUIRE(added.ok);
        REQUIRE(added.body["version"] == 1);
        int64_t id = added.body["id"].get<int64_t>();

        auto list = fx.Run("list");
        REQUIRE(list.ok);
        REQUIRE(list.body.is_array());
        REQUIRE(list.body.size() == 1);
        REQUIRE(list.body[0]["id"] == id);
        REQUIRE(list.body[0]["title"] == "Groceries");
        REQUIRE(list.body[0]["body"] == "Milk, eggs");
        REQUIRE(list.body[0]["created_at"] == 1729857600);
        REQUIRE(list.body[0]["created"] == "2024-10-25 12:00:00 UTC");
    }

    SECTION("version follows successful mutations only") {
        REQUIRE(fx.dispatcher().version().value() == 0);
        auto added = fx.Run("add", {"a", "b"});
        REQUIRE(added.ok);
        REQUIRE(fx.dispatcher().version().value() == 1);

        auto bad = fx.Run("add", {"", ""});
        REQUIRE_FALSE(bad.ok);
        REQUIRE(bad.body["error"] == "title and note cannot be empty");
        REQUIRE(bad.body["kind"] == "ValidationFailed");
        REQUIRE(fx.dispatcher().version().value() == 1);

        std::string id = std::to_string(added.body["id"].get<int64_t>());
        REQUIRE(fx.Run("edit", {id, "a2", "b2"}).ok);
        REQUIRE(fx.Run("delete", {id}).ok);
        REQUIRE(fx.dispatcher().version().value() == 3);

        auto version = fx.Run("version");
        REQUIRE(version.ok);
        REQUIRE(version.body["data_version"] == 3);
    }

    SECTION("show, edit and delete of a missing note") {
        auto show = fx.Run("show", {"99"});
        REQUIRE_FALSE(show.ok);
        REQUIRE(show.body["kind"] == "NotFound");
        REQUIRE(show.body["error"] == "note not found");

        REQUIRE(fx.Run("edit", {"99", "t", "b"}).body["kind"] == "NotFound");
        REQUIRE(fx.Run("delete", {"99"}).body["kind"] == "NotFound");
        REQUIRE(fx.dispatcher().version().value() == 0);
    }

    SECTION("oversized body is rejected with guidance") {
        auto bad = fx.Run("add", {"t", std::string(2001, 'y')});
        REQUIRE_FALSE(bad.ok);
        REQUIRE(bad.body["error"] == "note cannot exceed 2000 characters");
    }

    SECTION("search and count") {
        REQUIRE(fx.Run("add", {"Groceries", "Milk, eggs"}).ok);
        REQUIRE(fx.Run("add", {"Work", "Report"}).ok);

        auto hits = fx.Run("search", {"milk"});
        REQUIRE(hits.ok);
        REQUIRE(hits.body.size() == 1);
        REQUIRE(hits.body[0]["title"] == "Groceries");

        auto count = fx.Run("count");
        REQUIRE(count.ok);
        REQUIRE(count.body["count"] == 2);
    }

    SECTION("usage errors") {
        REQUIRE_FALSE(fx.Run("add", {"only title"}).ok);
        REQUIRE_FALSE(fx.Run("show").ok);

        auto bad_id = fx.Run("delete", {"abc"});
        REQUIRE_FALSE(bad_id.ok);
        REQUIRE(bad_id.body["error"] == "Invalid note id: abc");

        auto unknown = fx.Run("frobnicate");
        REQUIRE_FALSE(unknown.ok);
        REQUIRE(unknown.body["error"] == "Unknown command: frobnicate");
        REQUIRE_FALSE(fx.dispatcher().HasCommand("frobnicate"));
        REQUIRE(fx.dispatcher().HasCommand("export"));
    }

    SECTION("closed store gives an opaque error") {
        fx.store().Close();
        auto list = fx.Run("list");
        REQUIRE_FALSE(list.ok);
        REQUIRE(list.body["kind"] == "StoreUnavailable");
        REQUIRE(list.body["error"] == "a technical error occurred, please try again");
    }
}

TEST_CASE("CommandDispatcher file commands", "[dispatcher][files]") {
    DispatcherFixture fx("dispatcher_files");

    SECTION("export writes every note") {
        REQUIRE(fx.Run("add", {"one", "1"}).ok);
        REQUIRE(fx.Run("add", {"two", "2"}).ok);

        auto path = fx.dir() / "out" / "export.json";
        auto exported = fx.Run("export", {path.string()});
        REQUIRE(exported.ok);
        REQUIRE(exported.body["notes"] == 2);

        json j = json::parse(util::read_file_string(path));
        REQUIRE(j.is_array());
        REQUIRE(j.size() == 2);
        REQUIRE(j[0]["title"] == "two");
        REQUIRE(j[1]["title"] == "one");
    }

    SECTION("export to an unusable path fails with IOFailure") {
        auto blocker = fx.dir() / "blocker";
        REQUIRE(util::atomic_write_file(blocker, std::string("x")));

        auto exported = fx.Run("export", {(blocker / "export.json").string()});
        REQUIRE_FALSE(exported.ok);
        REQUIRE(exported.body["kind"] == "IOFailure");
    }

    SECTION("draft round trip") {
        auto empty = fx.Run("loaddraft");
        REQUIRE(empty.ok);
        REQUIRE(empty.body["text"] == "");

        REQUIRE(fx.Run("savedraft", {"half", "written", "\"thought\""}).ok);
        REQUIRE(std::filesystem::exists(fx.dispatcher().draft_path()));

        auto loaded = fx.Run("loaddraft");
        REQUIRE(loaded.ok);
        REQUIRE(loaded.body["text"] == "half written \"thought\"");

        // Saving a draft is not a note mutation
        REQUIRE(fx.dispatcher().version().value() == 0);
    }

    SECTION("corrupt draft is reported, not thrown") {
        REQUIRE(util::atomic_write_file(fx.dispatcher().draft_path(), std::string("{not json")));
        auto loaded = fx.Run("loaddraft");
        REQUIRE_FALSE(loaded.ok);
        REQUIRE(loaded.body["kind"] == "IOFailure");

        REQUIRE(util::atomic_write_file(fx.dispatcher().draft_path(), std::string("{\"other\": 1}")));
        loaded = fx.Run("loaddraft");
        REQUIRE_FALSE(loaded.ok);
        REQUIRE(loaded.body["kind"] == "IOFailure");
    }
}

TEST_CASE("CommandResponse renders JSON with a trailing newline", "[dispatcher]") {
    app::CommandResponse response{true, {{"count", 2}}};
    std::string rendered = response.Render();
    REQUIRE(rendered.back() == '\n');
    REQUIRE(json::parse(rendered)["count"] == 2);

    // Invalid UTF-8 does not throw during rendering
    app::CommandResponse bad{false, {{"error", std::string("\xFF")}}};
    REQUIRE_FALSE(bad.Render().empty());
}
