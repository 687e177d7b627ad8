// Unit tests for ProfileStore - profile and contact persistence
#include <catch2/catch_test_macros.hpp>
#include "network/protocol.hpp"
#include "profile_store.hpp"
#include "util/files.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include "../util/temp_dir.hpp"

using namespace parley;
using parley::app::ProfileStore;
using parley::test::TempDir;

namespace {

network::PeerKey Key(uint8_t fill) {
    return network::PeerKey(protocol::PUBLIC_KEY_SIZE, fill);
}

} // namespace

TEST_CASE("ProfileStore - First run", "[app][profile]") {
    TempDir dir("parley_store");
    ProfileStore store(dir.path());

    REQUIRE(store.Load());
    CHECK(store.GetContacts().empty());
    CHECK(store.GetMyInfo().nickname.empty());
    CHECK(std::filesystem::is_directory(dir / "files"));
    CHECK(store.get_files_directory() == (dir / "files").string());
}

TEST_CASE("ProfileStore - Own profile", "[app][profile]") {
    TempDir dir("parley_store");
    util::MockTimeScope mock(1700000000);

    {
        ProfileStore store(dir.path());
        REQUIRE(store.Load());

        SECTION("Not offered before it exists") {
            CHECK_FALSE(store.get_my_info(0).has_value());
        }

        SECTION("Changes are offered to peers that are behind") {
            REQUIRE(store.SetMyInfo("alice", "hello"));
            auto info = store.get_my_info(0);
            REQUIRE(info.has_value());
            CHECK(info->nickname == "alice");
            CHECK(info->time == 1700000000000);
            CHECK_FALSE(store.get_my_info(info->time).has_value());

            util::AdvanceMockTimeMillis(1000);
            REQUIRE(store.SetMyInfo("alice", "updated"));
            CHECK(store.get_my_info(1700000000000).has_value());
        }

        SECTION("Oversized fields are refused") {
            CHECK_FALSE(store.SetMyInfo(std::string(protocol::MAX_NICKNAME_LENGTH + 1, 'x'), ""));
            CHECK_FALSE(store.SetMyInfo("ok", std::string(protocol::MAX_INFO_LENGTH + 1, 'x')));
            CHECK(store.GetMyInfo().nickname.empty());
        }
    }
}

TEST_CASE("ProfileStore - Persists across restarts", "[app][profile]") {
    TempDir dir("parley_store");
    util::MockTimeScope mock(1700000000);

    {
        ProfileStore store(dir.path());
        REQUIRE(store.Load());
        REQUIRE(store.SetMyInfo("bob", "about bob"));

        network::ContactInfo carol;
        carol.time = 42;
        carol.nickname = "carol";
        carol.avatar = {0x89, 0x50};
        store.update_contact_info(Key(0xCC), carol);
        REQUIRE(store.RememberAddress(Key(0xCC), "10.0.0.1:5050"));
    }

    ProfileStore reloaded(dir.path());
    REQUIRE(reloaded.Load());
    CHECK(reloaded.GetMyInfo().nickname == "bob");
    CHECK(reloaded.GetMyInfo().info == "about bob");

    auto contact = reloaded.GetContact(Key(0xCC));
    REQUIRE(contact.has_value());
    CHECK(contact->info.nickname == "carol");
    CHECK(contact->info.time == 42);
    CHECK(contact->info.avatar == std::vector<uint8_t>{0x89, 0x50});
    CHECK(contact->updated == 1700000000000);
    CHECK(contact->addresses == std::vector<std::string>{"10.0.0.1:5050"});
    CHECK(reloaded.get_contact_update_time(Key(0xCC)) == 1700000000000);
    CHECK(reloaded.get_contact_update_time(Key(0xDD)) == 0);
}

TEST_CASE("ProfileStore - Address history", "[app][profile]") {
    TempDir dir("parley_store");
    ProfileStore store(dir.path());
    REQUIRE(store.Load());

    for (int i = 1; i <= 6; ++i) {
        REQUIRE(store.RememberAddress(Key(1), "10.0.0." + std::to_string(i) + ":5050"));
    }
    // Seen again moves to the front without duplicating
    REQUIRE(store.RememberAddress(Key(1), "10.0.0.4:5050"));
    CHECK_FALSE(store.RememberAddress(Key(1), ""));

    auto contact = store.GetContact(Key(1));
    REQUIRE(contact.has_value());
    CHECK(contact->addresses == std::vector<std::string>{
                                    "10.0.0.4:5050", "10.0.0.6:5050",
                                    "10.0.0.5:5050", "10.0.0.3:5050"});
}

TEST_CASE("ProfileStore - Corrupted files", "[app][profile]") {
    TempDir dir("parley_store");

    SECTION("Broken contacts file fails the load") {
        REQUIRE(util::atomic_write_file(dir / "contacts.json", std::string("{oops")));
        ProfileStore store(dir.path());
        CHECK_FALSE(store.Load());
    }

    SECTION("Entries with bad keys are skipped") {
        std::string good = util::HexStr(Key(0xAB));
        REQUIRE(util::atomic_write_file(
            dir / "contacts.json",
            std::string(R"({"zz": {}, "abcd": {}, ")") + good +
                R"(": {"updated": 5, "addresses": ["1.2.3.4:1"]}})"));
        ProfileStore store(dir.path());
        REQUIRE(store.Load());
        CHECK(store.GetContacts().size() == 1);
        CHECK(store.get_contact_update_time(Key(0xAB)) == 5);
    }
}
