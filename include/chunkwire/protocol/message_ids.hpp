#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "chunkwire/protocol/chunk.hpp"

namespace chunkwire::protocol {

// Unix socket path shared by the example client and server.
inline constexpr std::string_view kSocketName = "/tmp/chunk_example";

// Convenient names for multiples of a second.
struct TimeUnit {
    static constexpr std::int64_t SECOND = 1;
    static constexpr std::int64_t MINUTE = 60;
    static constexpr std::int64_t HOUR = 3600;
    static constexpr std::int64_t DAY = 86400;
    static constexpr std::int64_t WEEK = 7 * DAY;
};

// Chunk ID codes used by the example request/reply protocol. The codec never
// interprets these; they are here for tools and for the protocol layer.
namespace ids {

// No operation, no contents. Reply is kReplyNoop. Keeps an idle connection
// from timing out.
inline constexpr Tag kRequestNoop{"NOOP"};
// Reply when there is nothing to return. No data.
inline constexpr Tag kReplyNoop{"NOOP"};
// Shut down the server. Reply is kReplyNoop.
inline constexpr Tag kRequestShutdown{"SHUT"};
// Echo the request contents back. Reply is kReplyEcho with equal contents.
inline constexpr Tag kRequestEcho{"ECHO"};
inline constexpr Tag kReplyEcho{"ECHO"};
// Delay for kInterval seconds, then reply with kReplyNoop.
inline constexpr Tag kRequestDelay{"DLAY"};
// Compute with one kOperator ("+", "-", "*", "/", "%" or "**") and its
// kOperand children. "+" and "*" take any number of operands, the others
// exactly two. Reply is kReplyAnswer.
inline constexpr Tag kRequestCompute{"CMPU"};
// Contains kStatus and, on success, kValue.
inline constexpr Tag kReplyAnswer{"ANSR"};

// Decimal number string, fractional part allowed.
inline constexpr Tag kInterval{"NTVL"};
inline constexpr Tag kOperator{"OPER"};
// Integer, float or complex number string.
inline constexpr Tag kOperand{"OPND"};
// Integer, float or complex number string.
inline constexpr Tag kValue{"VALU"};
// Decimal integer string: 1 for success, 0 for failure.
inline constexpr Tag kStatus{"STS "};

}  // namespace ids

struct MessageId {
    Tag tag;
    std::string_view name;
    std::string_view description;
};

// Every known ID, one entry per distinct tag.
std::span<const MessageId> message_ids();

// Descriptive name for a known tag, or std::nullopt.
std::optional<std::string_view> message_id_name(const Tag& tag);

}  // namespace chunkwire::protocol
