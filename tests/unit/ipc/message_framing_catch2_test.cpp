// FrameReader / MessageFramer behavior on split, batched and oversized input

#include <catch2/catch_test_macros.hpp>

#include <toolhub/daemon/ipc/message_framing.h>

#include <cstring>
#include <vector>

using namespace toolhub::daemon;
using nlohmann::json;

namespace {

std::vector<uint8_t> frame(const json& j) {
    MessageFramer framer;
    auto res = framer.frame_message(j);
    REQUIRE(res);
    return res.value();
}

std::vector<uint8_t> rawHeader(uint32_t length) {
    std::vector<uint8_t> out(MessageFramer::HEADER_SIZE);
    const uint32_t net = MessageFramer::to_network(length);
    std::memcpy(out.data(), &net, sizeof(net));
    return out;
}

} // namespace

TEST_CASE("MessageFramer writes a big-endian length prefix", "[ipc][framing][catch2]") {
    auto bytes = frame(json{{"a", 1}});
    const std::string payload = json{{"a", 1}}.dump();
    REQUIRE(bytes.size() == 4 + payload.size());
    CHECK(bytes[0] == 0);
    CHECK(bytes[1] == 0);
    CHECK(bytes[2] == 0);
    CHECK(bytes[3] == payload.size());
    CHECK(std::string(bytes.begin() + 4, bytes.end()) == payload);
}

TEST_CASE("MessageFramer rejects messages over the configured maximum", "[ipc][framing][catch2]") {
    MessageFramer framer(16);
    std::vector<uint8_t> buffer{1, 2, 3};
    auto res = framer.frame_message_into(json{{"payload", std::string(64, 'x')}}, buffer);
    REQUIRE_FALSE(res);
    CHECK(buffer.size() == 3);
}

TEST_CASE("FrameReader decodes several frames from one chunk", "[ipc][framing][catch2]") {
    std::vector<uint8_t> stream;
    for (int i = 0; i < 3; ++i) {
        auto f = frame(json{{"seq", i}});
        stream.insert(stream.end(), f.begin(), f.end());
    }

    FrameReader reader;
    auto result = reader.feed(stream);
    REQUIRE(result.messages.size() == 3);
    for (int i = 0; i < 3; ++i) {
        CHECK(result.messages[static_cast<size_t>(i)]["seq"] == i);
    }
    CHECK(result.status == FrameReader::FrameStatus::FrameComplete);
    CHECK_FALSE(reader.has_data());
}

TEST_CASE("FrameReader reassembles frames split at every byte", "[ipc][framing][catch2]") {
    auto first = frame(json{{"method", "daemon.status"}});
    auto second = frame(json{{"method", "tool.list"}});
    std::vector<uint8_t> stream(first);
    stream.insert(stream.end(), second.begin(), second.end());

    FrameReader reader;
    std::vector<json> decoded;
    for (uint8_t byte : stream) {
        auto result = reader.feed(&byte, 1);
        for (auto& m : result.messages) {
            decoded.push_back(std::move(m));
        }
    }
    REQUIRE(decoded.size() == 2);
    CHECK(decoded[0]["method"] == "daemon.status");
    CHECK(decoded[1]["method"] == "tool.list");
    CHECK(reader.buffered_bytes() == 0);
}

TEST_CASE("FrameReader keeps a partial trailing frame buffered", "[ipc][framing][catch2]") {
    auto f = frame(json{{"k", "v"}});
    FrameReader reader;

    auto result = reader.feed(f.data(), f.size() - 2);
    CHECK(result.messages.empty());
    CHECK(result.status == FrameReader::FrameStatus::NeedMoreData);
    CHECK(reader.buffered_bytes() == f.size() - 2);

    result = reader.feed(f.data() + f.size() - 2, 2);
    REQUIRE(result.messages.size() == 1);
    CHECK(result.messages[0]["k"] == "v");
}

TEST_CASE("FrameReader discards the buffer on an oversized declared length",
          "[ipc][framing][catch2]") {
    FrameReader reader(32);
    auto header = rawHeader(1024);
    header.insert(header.end(), 10, 'x');

    auto result = reader.feed(header);
    CHECK(result.overflowed());
    CHECK(result.messages.empty());
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].status == FrameReader::FrameStatus::FrameTooLarge);
    CHECK_FALSE(reader.has_data());
}

TEST_CASE("FrameReader keeps frames decoded before an oversized one in the same chunk",
          "[ipc][framing][catch2]") {
    FrameReader reader(64);
    auto good = frame(json{{"ok", true}});
    auto bad = rawHeader(4096);
    std::vector<uint8_t> stream(good);
    stream.insert(stream.end(), bad.begin(), bad.end());

    auto result = reader.feed(stream);
    REQUIRE(result.messages.size() == 1);
    CHECK(result.messages[0]["ok"] == true);
    CHECK(result.overflowed());
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].messagesBefore == 1);
    CHECK_FALSE(reader.has_data());
}

TEST_CASE("FrameReader reports invalid JSON and continues with the next frame",
          "[ipc][framing][catch2]") {
    const std::string garbage = "{not json";
    auto stream = rawHeader(static_cast<uint32_t>(garbage.size()));
    stream.insert(stream.end(), garbage.begin(), garbage.end());
    auto good = frame(json{{"after", 1}});
    stream.insert(stream.end(), good.begin(), good.end());

    FrameReader reader;
    auto result = reader.feed(stream);
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].status == FrameReader::FrameStatus::InvalidFrame);
    CHECK(result.errors[0].messagesBefore == 0);
    REQUIRE(result.messages.size() == 1);
    CHECK(result.messages[0]["after"] == 1);
}

TEST_CASE("FrameReader accepts an empty chunk", "[ipc][framing][catch2]") {
    FrameReader reader;
    auto result = reader.feed(std::span<const uint8_t>{});
    CHECK(result.messages.empty());
    CHECK(result.errors.empty());
    CHECK(result.status == FrameReader::FrameStatus::NeedMoreData);
}
