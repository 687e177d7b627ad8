// Unit tests for the daemon console - command parsing and event output
#include <catch2/catch_test_macros.hpp>
#include "console.hpp"
#include "network/protocol.hpp"
#include "profile_store.hpp"
#include "../util/temp_dir.hpp"
#include <sstream>

using namespace parley;
using namespace parley::app;
using Kind = ConsoleCommand::Kind;

TEST_CASE("Console - Parse commands", "[app][console]") {
    std::string error;

    SECTION("Message with free text") {
        auto cmd = ParseConsoleCommand("/msg abcdef  hello there  ", error);
        REQUIRE(cmd.has_value());
        CHECK(cmd->kind == Kind::MSG);
        CHECK(cmd->target == "abcdef");
        CHECK(cmd->argument == "hello there");
        CHECK(error.empty());
    }

    SECTION("Connect") {
        auto cmd = ParseConsoleCommand("/connect 00ff 10.0.0.1:5050", error);
        REQUIRE(cmd.has_value());
        CHECK(cmd->kind == Kind::CONNECT);
        CHECK(cmd->argument == "10.0.0.1:5050");
    }

    SECTION("Commands without arguments") {
        CHECK(ParseConsoleCommand("/peers", error)->kind == Kind::PEERS);
        CHECK(ParseConsoleCommand("  /quit ", error)->kind == Kind::QUIT);
        CHECK(ParseConsoleCommand("/call ab", error)->kind == Kind::CALL);
    }

    SECTION("Mute takes on or off") {
        auto cmd = ParseConsoleCommand("/mute ab on", error);
        REQUIRE(cmd.has_value());
        CHECK(cmd->argument == "on");
        CHECK_FALSE(ParseConsoleCommand("/mute ab maybe", error).has_value());
        CHECK(error == "Usage: /mute <pubkey> on|off");
    }

    SECTION("Empty line is silently ignored") {
        CHECK_FALSE(ParseConsoleCommand("   ", error).has_value());
        CHECK(error.empty());
    }

    SECTION("Unknown command") {
        CHECK_FALSE(ParseConsoleCommand("/dance", error).has_value());
        CHECK(error == "Unknown command /dance, try /help");
    }

    SECTION("Usage errors") {
        CHECK_FALSE(ParseConsoleCommand("/msg", error).has_value());
        CHECK(error == "Usage: /msg <pubkey> <text>");
        CHECK_FALSE(ParseConsoleCommand("/msg xyz hi", error).has_value());
        CHECK_FALSE(ParseConsoleCommand("/msg abcd", error).has_value());
        CHECK_FALSE(ParseConsoleCommand("/peers now", error).has_value());
        CHECK(error == "Usage: /peers");
    }

    SECTION("Help lists every command") {
        auto help = ConsoleHelp();
        for (const char* name : {"/connect", "/msg", "/call", "/answer", "/reject",
                                 "/hangup", "/mute", "/nick", "/peers", "/contacts",
                                 "/help", "/quit"}) {
            CHECK(help.find(name) != std::string::npos);
        }
    }
}

TEST_CASE("Console - Listener output", "[app][console]") {
    test::TempDir dir("parley_console");
    auto store = std::make_shared<ProfileStore>(dir.path());
    REQUIRE(store->Load());

    std::ostringstream out;
    ConsoleListener listener(out, store);
    network::PeerKey peer(protocol::PUBLIC_KEY_SIZE, 0xAB);

    SECTION("Connect remembers the address") {
        listener.on_client_connected(peer, "10.0.0.9:5050", 3);
        CHECK(out.str().find("connected: abababababab") != std::string::npos);
        auto contact = store->GetContact(peer);
        REQUIRE(contact.has_value());
        CHECK(contact->addresses.front() == "10.0.0.9:5050");
    }

    SECTION("Nickname is shown once known") {
        network::ContactInfo info;
        info.time = 1;
        info.nickname = "dave";
        store->update_contact_info(peer, info);

        std::string text = "hi";
        listener.on_message_received(peer, 1, 0, 0, 0, protocol::content::TEXT,
                                     std::vector<uint8_t>(text.begin(), text.end()));
        CHECK(out.str().find("<dave (abababababab)> hi") != std::string::npos);
    }

    SECTION("Attachments and other types") {
        std::string meta = R"({"name":"x1.png","text":"cat"})";
        listener.on_message_received(peer, 1, 0, 0, 0, protocol::content::IMAGE,
                                     std::vector<uint8_t>(meta.begin(), meta.end()));
        CHECK(out.str().find("[image x1.png] cat") != std::string::npos);

        listener.on_message_received(peer, 2, 1, 0, 5, protocol::content::REACTION,
                                     {0x01, 0x02});
        CHECK(out.str().find("(reply) [type 10, 2 bytes] (edited)") != std::string::npos);
    }

    SECTION("Undelivered and calls") {
        listener.on_message_delivered(peer, 77, false);
        CHECK(out.str().find("message 77") != std::string::npos);

        listener.on_incoming_call(peer, false);
        CHECK(out.str().find("incoming call from abababababab") != std::string::npos);

        listener.on_call_status_changed(calls::CallStatus::IN_CALL, peer);
        CHECK(out.str().find(": in_call") != std::string::npos);
    }
}
