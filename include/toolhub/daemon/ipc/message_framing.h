#pragma once

#include <toolhub/core/types.h>
#include <toolhub/daemon/ipc/ipc_protocol.h>

#include <nlohmann/json.hpp>

#include <bit>
#include <cstdint>
#include <span>
#include <vector>

namespace toolhub::daemon {

// Length-prefixed framing: uint32 big-endian payload length followed by UTF-8 JSON.
class MessageFramer {
public:
    static constexpr size_t HEADER_SIZE = sizeof(uint32_t);

    explicit MessageFramer(size_t max_message_size = MAX_MESSAGE_SIZE)
        : max_message_size_(max_message_size) {}

    // Append one framed message to buffer, preserving existing contents. On failure the buffer
    // is restored to its original size.
    Result<void> frame_message_into(const nlohmann::json& message,
                                    std::vector<uint8_t>& buffer) const;
    Result<std::vector<uint8_t>> frame_message(const nlohmann::json& message) const;

    [[nodiscard]] size_t max_message_size() const noexcept { return max_message_size_; }

    static uint32_t to_network(uint32_t value) noexcept {
        if constexpr (std::endian::native != std::endian::big) {
            return __builtin_bswap32(value);
        }
        return value;
    }

    static uint32_t from_network(uint32_t value) noexcept { return to_network(value); }

    // Decode the length prefix at the start of data (which must hold HEADER_SIZE bytes)
    static uint32_t read_length(const uint8_t* data) noexcept;

private:
    size_t max_message_size_;
};

// Buffered frame decoder. Feed it arbitrary chunks of the byte stream; every complete frame
// in the buffer is decoded and returned in order.
class FrameReader {
public:
    explicit FrameReader(size_t max_frame_size = MAX_MESSAGE_SIZE)
        : max_frame_size_(max_frame_size) {}

    // Non-copyable and non-movable to avoid accidental duplication across coroutine frames
    FrameReader(const FrameReader&) = delete;
    FrameReader& operator=(const FrameReader&) = delete;
    FrameReader(FrameReader&&) = delete;
    FrameReader& operator=(FrameReader&&) = delete;

    enum class FrameStatus {
        NeedMoreData,
        FrameComplete,
        InvalidFrame, // well-framed payload that is not valid JSON
        FrameTooLarge // declared length over the ceiling; buffer discarded
    };

    struct FrameError {
        FrameStatus status;
        std::string message;
        // Number of messages decoded earlier in the same feed(); places the error in frame order
        size_t messagesBefore = 0;
    };

    struct FeedResult {
        std::vector<nlohmann::json> messages;
        std::vector<FrameError> errors;
        FrameStatus status = FrameStatus::NeedMoreData;

        [[nodiscard]] bool overflowed() const noexcept {
            return status == FrameStatus::FrameTooLarge;
        }
    };

    FeedResult feed(std::span<const uint8_t> data);
    FeedResult feed(const uint8_t* data, size_t size) { return feed(std::span{data, size}); }

    [[nodiscard]] bool has_data() const noexcept { return !buffer_.empty(); }
    [[nodiscard]] size_t buffered_bytes() const noexcept { return buffer_.size(); }

    void reset() noexcept;

private:
    std::vector<uint8_t> buffer_;
    size_t max_frame_size_;
};

} // namespace toolhub::daemon
