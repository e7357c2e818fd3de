#include <toolhub/daemon/ipc/message_framing.h>

#include <spdlog/spdlog.h>
#include <cstring>

namespace toolhub::daemon {

// ============================================================================
// MessageFramer Implementation
// ============================================================================

uint32_t MessageFramer::read_length(const uint8_t* data) noexcept {
    uint32_t length = 0;
    std::memcpy(&length, data, sizeof(length));
    return from_network(length);
}

Result<void> MessageFramer::frame_message_into(const nlohmann::json& message,
                                               std::vector<uint8_t>& buffer) const {
    std::string payload;
    try {
        payload = message.dump();
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::SerializationError,
                     std::string("Failed to serialize message: ") + e.what()};
    }

    if (payload.size() > max_message_size_) {
        return Error{ErrorCode::InvalidData, "Message size " + std::to_string(payload.size()) +
                                                 " exceeds maximum " +
                                                 std::to_string(max_message_size_)};
    }

    const auto base = buffer.size();
    buffer.resize(base + HEADER_SIZE + payload.size());

    const uint32_t length = to_network(static_cast<uint32_t>(payload.size()));
    std::memcpy(buffer.data() + base, &length, HEADER_SIZE);
    if (!payload.empty()) {
        std::memcpy(buffer.data() + base + HEADER_SIZE, payload.data(), payload.size());
    }
    return Result<void>();
}

Result<std::vector<uint8_t>> MessageFramer::frame_message(const nlohmann::json& message) const {
    std::vector<uint8_t> frame;
    auto res = frame_message_into(message, frame);
    if (!res)
        return res.error();
    return frame;
}

// ============================================================================
// FrameReader Implementation
// ============================================================================

void FrameReader::reset() noexcept {
    buffer_.clear();
}

FrameReader::FeedResult FrameReader::feed(std::span<const uint8_t> data) {
    FeedResult result;
    buffer_.insert(buffer_.end(), data.begin(), data.end());

    size_t offset = 0;
    while (buffer_.size() - offset >= MessageFramer::HEADER_SIZE) {
        const uint32_t length = MessageFramer::read_length(buffer_.data() + offset);

        if (length > max_frame_size_) {
            spdlog::debug("FrameReader: declared frame length {} exceeds maximum {}", length,
                          max_frame_size_);
            result.errors.push_back(
                {FrameStatus::FrameTooLarge, "Frame length " + std::to_string(length) +
                                                 " exceeds maximum " +
                                                 std::to_string(max_frame_size_),
                 result.messages.size()});
            result.status = FrameStatus::FrameTooLarge;
            // No resynchronization: everything buffered so far is dropped
            reset();
            return result;
        }

        const size_t frame_size = MessageFramer::HEADER_SIZE + length;
        if (buffer_.size() - offset < frame_size) {
            break;
        }

        const auto* payload =
            reinterpret_cast<const char*>(buffer_.data() + offset + MessageFramer::HEADER_SIZE);
        auto parsed = nlohmann::json::parse(payload, payload + length, nullptr, false);
        offset += frame_size;

        if (parsed.is_discarded()) {
            result.errors.push_back({FrameStatus::InvalidFrame,
                                     "Failed to parse frame payload of " +
                                         std::to_string(length) + " bytes as JSON",
                                     result.messages.size()});
            result.status = FrameStatus::InvalidFrame;
            continue;
        }

        result.messages.push_back(std::move(parsed));
        if (result.status == FrameStatus::NeedMoreData) {
            result.status = FrameStatus::FrameComplete;
        }
    }

    if (offset > 0) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
    }
    return result;
}

} // namespace toolhub::daemon
