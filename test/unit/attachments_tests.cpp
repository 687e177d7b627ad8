// Unit tests for network/attachments - IMAGE/FILE wire packing
#include <catch2/catch_test_macros.hpp>
#include "network/attachments.hpp"
#include "network/protocol.hpp"
#include "util/endian.hpp"
#include "util/files.hpp"
#include "../util/temp_dir.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

using namespace parley;
using namespace parley::network;
using json = nlohmann::json;
using parley::test::TempDir;

namespace {

std::vector<uint8_t> Bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

json ParseJson(const std::vector<uint8_t>& bytes) {
    return json::parse(bytes.begin(), bytes.end());
}

const std::vector<uint8_t> kPng = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 0x00};

} // namespace

TEST_CASE("Attachments - image_extension", "[network][attachments]") {
    CHECK(image_extension({0xFF, 0xD8, 0xFF, 0xE0}) == ".jpg");
    CHECK(image_extension(kPng) == ".png");
    CHECK(image_extension(Bytes("GIF89a")) == ".gif");
    CHECK(image_extension({'R', 'I', 'F', 'F', 0x10, 0, 0, 0, 'W', 'E', 'B', 'P'}) == ".webp");
    CHECK(image_extension({'R', 'I', 'F', 'F', 0x10, 0, 0, 0, 'W', 'A', 'V', 'E'}) == "");
    CHECK(image_extension({}) == "");
    CHECK(image_extension({0x00, 0xFF, 0xD8, 0xFF}, 1) == ".jpg");
}

TEST_CASE("Attachments - pack", "[network][attachments]") {
    TempDir dir("parley_attach");
    REQUIRE(util::atomic_write_file(dir / "photo", kPng));

    SECTION("Embeds metadata then file bytes") {
        auto meta = Bytes(R"({"name":"photo","text":"look"})");
        auto wire = pack_attachment(meta, dir.path());
        REQUIRE(wire.has_value());
        REQUIRE(wire->size() == 4 + meta.size() + kPng.size());
        CHECK(util::ReadBE32(wire->data()) == meta.size());
        CHECK(std::equal(kPng.begin(), kPng.end(), wire->begin() + 4 + meta.size()));
    }

    SECTION("Rejects bad metadata") {
        CHECK_FALSE(pack_attachment(Bytes("not json"), dir.path()).has_value());
        CHECK_FALSE(pack_attachment(Bytes(R"({"text":"x"})"), dir.path()).has_value());
        CHECK_FALSE(pack_attachment(Bytes(R"({"name":5})"), dir.path()).has_value());
    }

    SECTION("Without a files directory nothing is read") {
        CHECK_FALSE(pack_attachment(Bytes(R"({"name":"photo"})"), "").has_value());
    }

    SECTION("Rejects missing files and path escapes") {
        CHECK_FALSE(pack_attachment(Bytes(R"({"name":"nope"})"), dir.path()).has_value());
        CHECK_FALSE(pack_attachment(Bytes(R"({"name":"../photo"})"), dir.path()).has_value());
        CHECK_FALSE(pack_attachment(Bytes(R"({"name":".."})"), dir.path()).has_value());
    }
}

TEST_CASE("Attachments - unpack", "[network][attachments]") {
    TempDir sender_dir("parley_attach_tx");
    TempDir receiver_dir("parley_attach_rx");
    REQUIRE(util::atomic_write_file(sender_dir / "photo", kPng));

    SECTION("Image stored under a random name with sniffed extension") {
        auto wire = pack_attachment(Bytes(R"({"name":"photo","text":"look"})"),
                                    sender_dir.path());
        REQUIRE(wire.has_value());

        auto meta = ParseJson(unpack_attachment(protocol::content::IMAGE, *wire,
                                                receiver_dir.path()));
        std::string name = meta["name"];
        CHECK(name != "photo");
        CHECK(name.size() == protocol::ATTACHMENT_NAME_LENGTH + 4);
        CHECK(name.substr(name.size() - 4) == ".png");
        CHECK(meta["text"] == "look");
        CHECK(util::read_file(receiver_dir / name) == kPng);
    }

    SECTION("File keeps the original extension") {
        REQUIRE(util::atomic_write_file(sender_dir / "doc", std::string("%PDF-1.4")));
        auto wire = pack_attachment(
            Bytes(R"({"name":"doc","originalName":"report.pdf"})"), sender_dir.path());
        REQUIRE(wire.has_value());

        auto meta = ParseJson(unpack_attachment(protocol::content::FILE, *wire,
                                                receiver_dir.path()));
        std::string name = meta["name"];
        CHECK(name.substr(name.size() - 4) == ".pdf");
        CHECK(util::read_file_string(receiver_dir / name) == "%PDF-1.4");
    }

    SECTION("Without a files directory nothing is written") {
        auto wire = pack_attachment(Bytes(R"({"name":"photo"})"), sender_dir.path());
        REQUIRE(wire.has_value());
        auto meta = ParseJson(unpack_attachment(protocol::content::IMAGE, *wire, ""));
        CHECK(meta["text"] == CORRUPTED_ATTACHMENT_TEXT);
        CHECK(meta["name"] == "");
    }

    SECTION("Malformed payloads become the placeholder") {
        std::vector<std::vector<uint8_t>> bad = {
            {},
            {0x00, 0x00},
            {0x00, 0x00, 0x00, 0x20, '{', '}'},
            {0x00, 0x00, 0x00, 0x02, 'x', 'x', 0x01},
        };
        for (const auto& wire : bad) {
            auto meta = ParseJson(unpack_attachment(protocol::content::IMAGE, wire,
                                                    receiver_dir.path()));
            CHECK(meta["text"] == CORRUPTED_ATTACHMENT_TEXT);
            CHECK(meta["name"] == "");
        }
    }
}
