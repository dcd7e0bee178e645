// File: src/NetAiClientMain.cpp
//
// Headless client that plays through RandomAgent. Connects to cashflowd, waits for its
// WelcomeMsg, then answers every StateMsg in which it has something to do.
//
#include <charconv>
#include <cstdint>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <system_error>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "core/Actions.hpp"
#include "core/RandomAgent.hpp"
#include "core/State.hpp"
#include "net/codec.hpp"

namespace
{
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;

    struct CmdLine
    {
        std::string url{"ws://127.0.0.1:9002"};
        std::uint64_t seed{424242ULL};
        std::string name{"bot"};
    };

    auto ParseArgs(int argc, char** argv) -> CmdLine
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string_view const k = argv[i];
            if (k == "--url" && i + 1 < argc)
            {
                c.url = argv[++i];
            }
            else if (k == "--name" && i + 1 < argc)
            {
                c.name = argv[++i];
            }
            else if (k == "--seed" && i + 1 < argc)
            {
                std::string_view const v = argv[++i];
                auto const [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), c.seed);
                if (ec != std::errc{} || ptr != v.data() + v.size())
                {
                    std::print("[NetAI] bad --seed '{}', keeping {}\n", v, c.seed);
                }
            }
        }
        return c;
    }

    // Identifies a decision point, so the bot answers each one at most once.
    struct TurnKey
    {
        std::uint32_t log_size{};
        std::uint32_t turn{};
        cashflow::core::TurnPhase phase{};

        auto operator==(TurnKey const&) const -> bool = default;
    };
} // anon

auto main(int argc, char** argv) -> int
{
    CmdLine const cfg = ParseArgs(argc, argv);
    std::print("[NetAI] {} connecting to {} | seed={}\n", cfg.name, cfg.url, cfg.seed);

    WsClient c;
    c.clear_access_channels(websocketpp::log::alevel::all);
    c.init_asio();

    cashflow::core::RandomAgent agent(cfg.seed);
    std::optional<cashflow::net::Welcome> seat;
    std::optional<TurnKey> last_answered;
    std::uint64_t next_msg_id = 1;

    c.set_message_handler([&](websocketpp::connection_hdl hdl, WsClient::message_ptr msg)
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[NetAI] ignoring non-binary frame\n");
            return;
        }

        std::string const& pl = msg->get_payload();
        std::span<std::byte const> const bytes{reinterpret_cast<std::byte const*>(pl.data()), pl.size()};

        auto const kind = cashflow::net::PeekMessage(bytes);
        if (!kind)
        {
            std::print("[NetAI] bad frame: {}\n", kind.error().message);
            return;
        }

        switch (*kind)
        {
        case cashflow::gen::net::Message::WelcomeMsg:
        {
            auto w = cashflow::net::DecodeWelcome(bytes);
            if (!w) return;
            std::print("[NetAI] {} seated as {} in {}\n", cfg.name, w->player_id, w->room);
            seat = std::move(*w);
            return;
        }
        case cashflow::gen::net::Message::ErrorMsg:
        {
            auto const e = cashflow::net::DecodeError(bytes);
            std::print("[NetAI] server refused: {}\n", e ? *e : e.error().message);
            // let the next state retry the same decision point
            last_answered.reset();
            return;
        }
        case cashflow::gen::net::Message::StateMsg:
            break;
        default:
            std::print("[NetAI] unexpected message type {}\n", static_cast<int>(*kind));
            return;
        }

        if (!seat) return;

        auto decoded = cashflow::net::DecodeState(bytes);
        if (!decoded)
        {
            std::print("[NetAI] state decode failed: {}\n", decoded.error().message);
            return;
        }
        cashflow::core::GameState const& s = decoded->state;

        if (s.turn_phase == cashflow::core::TurnPhase::GameOver)
        {
            std::print("[NetAI] game over after {} turn(s), winner {}\n", s.turn_number, s.winner.value_or("none"));
            websocketpp::lib::error_code ec;
            c.close(hdl, websocketpp::close::status::normal, "Game over", ec);
            return;
        }

        TurnKey const key{decoded->log_size, s.turn_number, s.turn_phase};
        if (last_answered == key) return;

        std::optional<cashflow::core::GameAction> const action = agent.Play(s, seat->player_id);
        if (!action) return;

        last_answered = key;
        std::print("[NetAI] {} turn {} {} -> {}\n", seat->player_id, s.turn_number, to_string(s.turn_phase),
                   to_string(cashflow::core::TypeOf(*action)));

        flatbuffers::DetachedBuffer const buf = cashflow::net::BuildAction(*action, next_msg_id++);
        websocketpp::lib::error_code ec;
        c.send(hdl, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
        if (ec) std::print("[NetAI] send failed: {}\n", ec.message());
    });

    c.set_close_handler([&](websocketpp::connection_hdl)
    {
        std::print("[NetAI] connection closed\n");
    });

    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = c.get_connection(cfg.url, ec);
    if (ec)
    {
        std::print("[NetAI] connect failed: {}\n", ec.message());
        return 1;
    }
    c.connect(con);
    c.run();
    return 0;
}
