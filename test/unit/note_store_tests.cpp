// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "store/note_store.hpp"
#include "util/time.hpp"
#include <chrono>
#include <filesystem>
#include <sqlite3.h>
#include <string>

using namespace notekeep;
using notekeep::util::ErrorKind;
using notekeep::util::OpState;

namespace {

// Fresh database file under the temp directory, removed on scope exit
class TempNoteDb {
public:
    explicit TempNoteDb(const std::string& name)
        : dir_(std::filesystem::temp_directory_path() / ("notekeep_" + name)) {
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }
    ~TempNoteDb() {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path path() const { return dir_ / "notes.db"; }

    store::NoteStore::Options options(std::chrono::milliseconds timeout =
                                          std::chrono::milliseconds(5000)) const {
        store::NoteStore::Options opts;
        opts.db_path = path();
        opts.busy_timeout = timeout;
        return opts;
    }

private:
    std::filesystem::path dir_;
};

// Plain sqlite connection for poking at the file behind the store's back
class RawConnection {
public:
    explicit RawConnection(const std::filesystem::path& path) {
        REQUIRE(sqlite3_open(path.c_str(), &db_) == SQLITE_OK);
    }
    ~RawConnection() { sqlite3_close(db_); }

    int Exec(const std::string& sql) {
        return sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr);
    }

private:
    sqlite3* db_{nullptr};
};

std::string Repeat(const std::string& s, size_t n) {
    std::string out;
    for (size_t i = 0; i < n; ++i) {
        out += s;
    }
    return out;
}

} // namespace

TEST_CASE("NoteStore init", "[store]") {
    TempNoteDb tmp("store_init");
    store::NoteStore store(tmp.options());
    OpState state;

    SECTION("creates an empty table") {
        REQUIRE(store.Init(state));
        REQUIRE(store.IsOpen());
        auto notes = store.ListAll(state);
        REQUIRE(notes.has_value());
        REQUIRE(notes->empty());
        REQUIRE(std::filesystem::exists(tmp.path()));
    }

    SECTION("is idempotent and keeps existing rows") {
        REQUIRE(store.Init(state));
        REQUIRE(store.Insert("Groceries", "Milk, eggs", state).has_value());
        REQUIRE(store.Init(state));

        store::NoteStore reopened(tmp.options());
        REQUIRE(reopened.Init(state));
        auto count = reopened.Count(state);
        REQUIRE(count.has_value());
        REQUIRE(*count == 1);
    }

    SECTION("uses WAL journaling") {
        REQUIRE(store.Init(state));
        auto mode = store.JournalMode(state);
        REQUIRE(mode.has_value());
        REQUIRE(*mode == "wal");
    }

    SECTION("operations before Init report StoreUnavailable") {
        REQUIRE_FALSE(store.ListAll(state).has_value());
        REQUIRE(state.GetKind() == ErrorKind::StoreUnavailable);

        state.Reset();
        REQUIRE_FALSE(store.Insert("t", "b", state).has_value());
        REQUIRE(state.GetKind() == ErrorKind::StoreUnavailable);
    }

    SECTION("operations after Close report StoreUnavailable") {
        REQUIRE(store.Init(state));
        store.Close();
        REQUIRE_FALSE(store.IsOpen());
        REQUIRE_FALSE(store.Delete(1, state));
        REQUIRE(state.GetKind() == ErrorKind::StoreUnavailable);
    }
}

TEST_CASE("NoteStore init on an unusable path", "[store]") {
    store::NoteStore::Options opts;
    opts.db_path = std::filesystem::temp_directory_path() / "notekeep_missing_dir_xyz" /
                   "nested" / "notes.db";
    std::filesystem::remove_all(std::filesystem::temp_directory_path() /
                                "notekeep_missing_dir_xyz");
    store::NoteStore store(opts);

    OpState state;
    REQUIRE_FALSE(store.Init(state));
    REQUIRE(state.GetKind() == ErrorKind::StoreUnavailable);
    REQUIRE(state.UserMessage() == "a technical error occurred, please try again");
    REQUIRE_FALSE(store.IsOpen());
}

TEST_CASE("NoteStore insert and list", "[store]") {
    TempNoteDb tmp("store_insert");
    store::NoteStore store(tmp.options());
    OpState state;
    REQUIRE(store.Init(state));

    SECTION("round trip") {
        util::MockTimeScope mock(1729857600);
        auto id = store.Insert("Groceries", "Milk, eggs", state);
        REQUIRE(id.has_value());
        REQUIRE(state.IsValid());

        auto notes = store.ListAll(state);
        REQUIRE(notes.has_value());
        REQUIRE(notes->size() == 1);
        const auto& note = notes->front();
        REQUIRE(note.id == *id);
        REQUIRE(note.title == "Groceries");
        REQUIRE(note.body == "Milk, eggs");
        REQUIRE(note.created_at == 1729857600);

        auto fetched = store.Get(*id, state);
        REQUIRE(fetched.has_value());
        REQUIRE(*fetched == note);
    }

    SECTION("surrounding whitespace is trimmed") {
        auto id = store.Insert("  Groceries\n", "\tMilk, eggs  ", state);
        REQUIRE(id.has_value());
        auto note = store.Get(*id, state);
        REQUIRE(note.has_value());
        REQUIRE(note->title == "Groceries");
        REQUIRE(note->body == "Milk, eggs");
    }

    SECTION("list is ordered newest id first") {
        auto a = store.Insert("a", "first", state);
        auto b = store.Insert("b", "second", state);
        auto c = store.Insert("c", "third", state);
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(c.has_value());
        REQUIRE(*a < *b);
        REQUIRE(*b < *c);

        auto notes = store.ListAll(state);
        REQUIRE(notes.has_value());
        REQUIRE(notes->size() == 3);
        REQUIRE((*notes)[0].id == *c);
        REQUIRE((*notes)[1].id == *b);
        REQUIRE((*notes)[2].id == *a);
    }

    SECTION("ids are not reused after delete") {
        auto first = store.Insert("one", "1", state);
        auto second = store.Insert("two", "2", state);
        REQUIRE(second.has_value());
        REQUIRE(store.Delete(*second, state));
        auto third = store.Insert("three", "3", state);
        REQUIRE(third.has_value());
        REQUIRE(*third > *second);
        REQUIRE(*first != *third);
    }

    SECTION("multibyte text survives") {
        auto id = store.Insert("Caf\xC3\xA9", "\xE6\x97\xA5\xE6\x9C\xAC \xF0\x9F\x93\x9D", state);
        REQUIRE(id.has_value());
        auto note = store.Get(*id, state);
        REQUIRE(note.has_value());
        REQUIRE(note->title == "Caf\xC3\xA9");
        REQUIRE(note->body == "\xE6\x97\xA5\xE6\x9C\xAC \xF0\x9F\x93\x9D");
    }
}

TEST_CASE("NoteStore validation", "[store][validation]") {
    TempNoteDb tmp("store_validation");
    store::NoteStore store(tmp.options());
    OpState state;
    REQUIRE(store.Init(state));

    auto expect_rejected = [&](const std::string& title, const std::string& body,
                               const std::string& reason) {
        OpState s;
        REQUIRE_FALSE(store.Insert(title, body, s).has_value());
        REQUIRE(s.GetKind() == ErrorKind::ValidationFailed);
        REQUIRE(s.GetRejectReason() == reason);
        REQUIRE(s.UserMessage() == reason);
    };

    SECTION("empty fields") {
        expect_rejected("", "", "title and note cannot be empty");
        expect_rejected("t", "", "note cannot be empty");
        expect_rejected("", "b", "title cannot be empty");
        expect_rejected("   ", "\n\t", "title and note cannot be empty");
    }

    SECTION("body length limit counts characters") {
        expect_rejected("t", std::string(2001, 'y'), "note cannot exceed 2000 characters");
        REQUIRE(store.Insert("t", std::string(2000, 'y'), state).has_value());

        // 2000 two-byte characters are 4000 bytes but still within the limit
        REQUIRE(store.Insert("t", Repeat("\xC3\xA9", 2000), state).has_value());
        expect_rejected("t", Repeat("\xC3\xA9", 2001), "note cannot exceed 2000 characters");
    }

    SECTION("limit applies after trimming") {
        REQUIRE(store.Insert("t", "  " + std::string(2000, 'y') + "  ", state).has_value());
    }

    SECTION("malformed UTF-8") {
        expect_rejected("bad \xC3", "body", "title must be valid UTF-8");
        expect_rejected("title", "\xFF\xFE", "note must be valid UTF-8");
    }

    SECTION("rejections leave the store unchanged") {
        expect_rejected("", "", "title and note cannot be empty");
        auto count = store.Count(state);
        REQUIRE(count.has_value());
        REQUIRE(*count == 0);
    }
}

TEST_CASE("NoteStore storage constraints reject raw writes", "[store][validation]") {
    TempNoteDb tmp("store_constraints");
    store::NoteStore store(tmp.options());
    OpState state;
    REQUIRE(store.Init(state));

    RawConnection raw(tmp.path());
    REQUIRE(raw.Exec("INSERT INTO notes (title, body) VALUES ('', 'x')") == SQLITE_CONSTRAINT);
    REQUIRE(raw.Exec("INSERT INTO notes (title, body) VALUES ('x', '   ')") == SQLITE_CONSTRAINT);
    REQUIRE(raw.Exec("INSERT INTO notes (title, body) VALUES ('x', '" +
                     std::string(2001, 'y') + "')") == SQLITE_CONSTRAINT);
    REQUIRE(raw.Exec("INSERT INTO notes (title, body) VALUES ('x', NULL)") == SQLITE_CONSTRAINT);

    // A valid raw insert gets a default created_at
    REQUIRE(raw.Exec("INSERT INTO notes (title, body) VALUES ('raw', 'row')") == SQLITE_OK);

    auto notes = store.ListAll(state);
    REQUIRE(notes.has_value());
    REQUIRE(notes->size() == 1);
    REQUIRE(notes->front().title == "raw");
    REQUIRE(notes->front().created_at > 0);
}

TEST_CASE("NoteStore update", "[store]") {
    TempNoteDb tmp("store_update");
    store::NoteStore store(tmp.options());
    OpState state;
    REQUIRE(store.Init(state));

    std::optional<int64_t> id;
    {
        util::MockTimeScope mock(1700000000);
        id = store.Insert("Groceries", "Milk, eggs", state);
    }
    REQUIRE(id.has_value());

    SECTION("replaces title and body, keeps created_at") {
        util::MockTimeScope later(1800000000);
        REQUIRE(store.Update(*id, "Shopping", "Milk, eggs, bread", state));

        auto note = store.Get(*id, state);
        REQUIRE(note.has_value());
        REQUIRE(note->title == "Shopping");
        REQUIRE(note->body == "Milk, eggs, bread");
        REQUIRE(note->created_at == 1700000000);
    }

    SECTION("missing id reports NotFound and changes nothing") {
        auto before = store.ListAll(state);
        REQUIRE(before.has_value());

        OpState s;
        REQUIRE_FALSE(store.Update(*id + 100, "x", "y", s));
        REQUIRE(s.GetKind() == ErrorKind::NotFound);
        REQUIRE(s.UserMessage() == "note not found");

        auto after = store.ListAll(state);
        REQUIRE(after.has_value());
        REQUIRE(*after == *before);
    }

    SECTION("invalid fields are rejected before touching the row") {
        OpState s;
        REQUIRE_FALSE(store.Update(*id, "", "", s));
        REQUIRE(s.GetKind() == ErrorKind::ValidationFailed);

        auto note = store.Get(*id, state);
        REQUIRE(note.has_value());
        REQUIRE(note->title == "Groceries");
    }
}

TEST_CASE("NoteStore delete", "[store]") {
    TempNoteDb tmp("store_delete");
    store::NoteStore store(tmp.options());
    OpState state;
    REQUIRE(store.Init(state));

    auto keep = store.Insert("keep", "me", state);
    auto drop = store.Insert("drop", "me", state);
    REQUIRE(keep.has_value());
    REQUIRE(drop.has_value());

    REQUIRE(store.Delete(*drop, state));

    OpState second;
    REQUIRE_FALSE(store.Delete(*drop, second));
    REQUIRE(second.GetKind() == ErrorKind::NotFound);

    OpState get_state;
    REQUIRE_FALSE(store.Get(*drop, get_state).has_value());
    REQUIRE(get_state.GetKind() == ErrorKind::NotFound);

    auto notes = store.ListAll(state);
    REQUIRE(notes.has_value());
    REQUIRE(notes->size() == 1);
    REQUIRE(notes->front().id == *keep);
}

TEST_CASE("NoteStore search and count", "[store]") {
    TempNoteDb tmp("store_search");
    store::NoteStore store(tmp.options());
    OpState state;
    REQUIRE(store.Init(state));

    auto groceries = store.Insert("Groceries", "Milk, eggs", state);
    auto work = store.Insert("Work", "Finish the EGG report", state);
    auto percent = store.Insert("Budget", "50% off_sale", state);
    REQUIRE(groceries.has_value());
    REQUIRE(work.has_value());
    REQUIRE(percent.has_value());

    SECTION("matches title or body, ASCII case-insensitive") {
        auto hits = store.Search("egg", state);
        REQUIRE(hits.has_value());
        REQUIRE(hits->size() == 2);
        REQUIRE((*hits)[0].id == *work);
        REQUIRE((*hits)[1].id == *groceries);

        hits = store.Search("groc", state);
        REQUIRE(hits.has_value());
        REQUIRE(hits->size() == 1);
    }

    SECTION("wildcards match literally") {
        auto hits = store.Search("%", state);
        REQUIRE(hits.has_value());
        REQUIRE(hits->size() == 1);
        REQUIRE(hits->front().id == *percent);

        hits = store.Search("f_s", state);
        REQUIRE(hits.has_value());
        REQUIRE(hits->size() == 1);

        hits = store.Search("e_g", state);
        REQUIRE(hits.has_value());
        REQUIRE(hits->empty());
    }

    SECTION("blank needle lists everything") {
        auto hits = store.Search("  ", state);
        REQUIRE(hits.has_value());
        REQUIRE(hits->size() == 3);
    }

    SECTION("count follows writes") {
        auto count = store.Count(state);
        REQUIRE(count.has_value());
        REQUIRE(*count == 3);
        REQUIRE(store.Delete(*work, state));
        count = store.Count(state);
        REQUIRE(count.has_value());
        REQUIRE(*count == 2);
    }
}

TEST_CASE("NoteStore concurrency with another connection", "[store][concurrency]") {
    TempNoteDb tmp("store_busy");
    store::NoteStore store(tmp.options(std::chrono::milliseconds(100)));
    OpState state;
    REQUIRE(store.Init(state));
    auto existing = store.Insert("Groceries", "Milk, eggs", state);
    REQUIRE(existing.has_value());

    RawConnection writer(tmp.path());
    REQUIRE(writer.Exec("BEGIN IMMEDIATE") == SQLITE_OK);
    REQUIRE(writer.Exec("INSERT INTO notes (title, body) VALUES ('pending', 'row')") == SQLITE_OK);

    SECTION("writes time out with StoreBusy") {
        OpState s;
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(store.Insert("blocked", "write", s).has_value());
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(s.GetKind() == ErrorKind::StoreBusy);
        REQUIRE(s.UserMessage() == "the note store is busy, please try again");
        REQUIRE(elapsed >= std::chrono::milliseconds(50));
        REQUIRE(elapsed < std::chrono::seconds(5));
    }

    SECTION("readers see the last committed state") {
        auto notes = store.ListAll(state);
        REQUIRE(notes.has_value());
        REQUIRE(notes->size() == 1);
        REQUIRE(notes->front().id == *existing);
    }

    SECTION("writes succeed once the lock is released") {
        REQUIRE(writer.Exec("COMMIT") == SQLITE_OK);
        OpState s;
        REQUIRE(store.Insert("after", "commit", s).has_value());
        auto count = store.Count(s);
        REQUIRE(count.has_value());
        REQUIRE(*count == 3);
    }

    // Only the sections that left the transaction open have anything to undo
    int rc = writer.Exec("ROLLBACK");
    CHECK((rc == SQLITE_OK || rc == SQLITE_ERROR));
}
