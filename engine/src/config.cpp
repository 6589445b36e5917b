#include "lanxfer/engine/config.hpp"

namespace lanxfer::engine
{

    std::string_view to_string(PacketPolicy policy) noexcept
    {
        switch (policy)
        {
        case PacketPolicy::Drop:
            return "drop";
        case PacketPolicy::ReplyError:
            return "reply_error";
        }
        return "unknown";
    }

    std::optional<PacketPolicy> packet_policy_from_string(std::string_view value) noexcept
    {
        if (value == "drop")
        {
            return PacketPolicy::Drop;
        }
        if (value == "reply_error" || value == "reply-error")
        {
            return PacketPolicy::ReplyError;
        }
        return std::nullopt;
    }

} // namespace lanxfer::engine
