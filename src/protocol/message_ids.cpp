#include "chunkwire/protocol/message_ids.hpp"

#include <algorithm>
#include <array>

namespace chunkwire::protocol {

namespace {

// Request and reply share a tag for NOOP and ECHO.
constexpr std::array<MessageId, 11> kMessageIds{{
    {ids::kRequestNoop, "noop", "no operation / empty reply"},
    {ids::kRequestShutdown, "request_shutdown", "shut down the server"},
    {ids::kRequestEcho, "echo", "echo contents back to the client"},
    {ids::kRequestDelay, "request_delay", "reply after an interval"},
    {ids::kRequestCompute, "request_compute", "perform a computation"},
    {ids::kReplyAnswer, "reply_answer", "result of a computation"},
    {ids::kInterval, "interval", "decimal number of seconds"},
    {ids::kOperator, "operator", "one of + - * / % **"},
    {ids::kOperand, "operand", "integer, float or complex number"},
    {ids::kValue, "value", "integer, float or complex number"},
    {ids::kStatus, "status", "1 for success, 0 for failure"},
}};

}  // namespace

std::span<const MessageId> message_ids() { return kMessageIds; }

std::optional<std::string_view> message_id_name(const Tag& tag) {
    auto it = std::find_if(
        kMessageIds.begin(), kMessageIds.end(),
        [&tag](const MessageId& entry) { return entry.tag == tag; });
    if (it == kMessageIds.end()) {
        return std::nullopt;
    }
    return it->name;
}

}  // namespace chunkwire::protocol
