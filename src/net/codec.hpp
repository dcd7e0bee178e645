//
// codec.hpp
//

#ifndef CASHFLOW_CODEC_HPP
#define CASHFLOW_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

#include "generated/flatbuffers/cashflow_net_generated.h"

namespace cashflow::net
{
    struct ParseError
    {
        std::string message;
    };

    // A StateMsg turned back into an engine state. Decks hold placeholders of the sent sizes,
    // cards are resolved from the reference tables, and the log holds only the sent tail.
    struct DecodedState
    {
        std::string room;
        core::GameState state;
        std::vector<core::ActionType> valid_actions;
        std::uint32_t log_size{};
    };

    struct Welcome
    {
        std::string room;
        core::PlayerId player_id;
    };

    inline constexpr std::size_t DefaultLogTail = 20;

    auto ToFbPhase(core::TurnPhase p) noexcept -> gen::net::TurnPhase;
    auto FromFbPhase(gen::net::TurnPhase p) noexcept -> core::TurnPhase;
    auto ToFbActionType(core::ActionType t) noexcept -> gen::net::ActionType;
    auto FromFbActionType(gen::net::ActionType t) noexcept -> core::ActionType;

    // --- Outbound builders ---

    auto BuildAction(core::GameAction const& a, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer;

    // `s` is expected to be sanitized already; only deck sizes are written either way.
    auto BuildState(std::string_view room,
                    core::GameState const& s,
                    std::span<core::ActionType const> valid,
                    std::uint64_t msg_id,
                    std::size_t log_tail = DefaultLogTail) -> flatbuffers::DetachedBuffer;

    auto BuildError(std::string_view message, std::uint64_t reply_to, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildWelcome(std::string_view room, core::PlayerId const& player, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode (buffers are verified first) ---

    auto PeekMessage(std::span<std::byte const> bytes) -> std::expected<gen::net::Message, ParseError>;

    auto DecodeAction(std::span<std::byte const> bytes) -> std::expected<core::GameAction, ParseError>;
    auto DecodeState(std::span<std::byte const> bytes) -> std::expected<DecodedState, ParseError>;
    auto DecodeError(std::span<std::byte const> bytes) -> std::expected<std::string, ParseError>;
    auto DecodeWelcome(std::span<std::byte const> bytes) -> std::expected<Welcome, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return std::as_bytes(std::span{buf.data(), buf.size()});
    }
} // namespace cashflow::net

#endif //CASHFLOW_CODEC_HPP
