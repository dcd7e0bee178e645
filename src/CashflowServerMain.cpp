// File: src/CashflowServerMain.cpp
//
// Authoritative game server: WebSocket++ (no TLS) over standalone Asio.
// Connections are seated into rooms of --players; a full room starts its session.
// Every binary frame is an ActionMsg. After each action the sanitized state goes to
// the whole room, or an ErrorMsg goes back to the submitter.

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <format>
#include <map>
#include <mutex>
#include <optional>
#include <print>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/CardData.hpp"
#include "core/Exception.hpp"
#include "core/Types.hpp"
#include "net/codec.hpp"
#include "session/SessionManager.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl = websocketpp::connection_hdl;
    using cashflow::session::ConnId;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::size_t players{2};
        std::uint64_t seed{12345ULL};
        std::size_t rooms{0};          // 0 = no limit
    };

    template <typename T>
    auto ReadNumber(std::string_view text, T& dst) -> bool
    {
        auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), dst);
        return ec == std::errc{} && ptr == text.data() + text.size();
    }

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string_view const key = argv[i];
            if (i + 1 >= argc)
            {
                std::print("[cashflowd] {} expects a value\n", key);
                break;
            }
            std::string_view const val = argv[++i];

            bool ok = true;
            if (key == "--port") ok = ReadNumber(val, c.port);
            else if (key == "--players") ok = ReadNumber(val, c.players);
            else if (key == "--seed") ok = ReadNumber(val, c.seed);
            else if (key == "--rooms") ok = ReadNumber(val, c.rooms);
            else std::print("[cashflowd] unknown option {}\n", key);

            if (!ok) std::print("[cashflowd] bad value '{}' for {}, keeping default\n", val, key);
        }
        if (c.players < 1) c.players = 1;
        if (c.players > 6) c.players = 6;
        return c;
    }

    class Server
    {
    public:
        explicit Server(ServerConfig cfg) :
            cfg_(cfg)
        {
            ws_.clear_access_channels(websocketpp::log::alevel::all);
            ws_.set_access_channels(websocketpp::log::alevel::connect | websocketpp::log::alevel::disconnect);
            ws_.init_asio();

            ws_.set_open_handler([this](Hdl hdl) { OnOpen(hdl); });
            ws_.set_close_handler([this](Hdl hdl) { OnClose(hdl); });
            ws_.set_message_handler([this](Hdl hdl, WsServer::message_ptr msg) { OnMessage(hdl, msg); });
        }

        auto Run() -> void
        {
            ws_.set_reuse_addr(true);
            ws_.listen(cfg_.port);
            ws_.start_accept();
            std::print("[cashflowd] listening on port {} | {} player(s) per room\n", cfg_.port, cfg_.players);
            ws_.run();
        }

    private:
        auto Send(ConnId conn, flatbuffers::DetachedBuffer const& buf) -> void
        {
            auto const it = conns_.find(conn);
            if (it == conns_.end()) return;

            websocketpp::lib::error_code ec;
            ws_.send(it->second, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
            if (ec) std::print("[cashflowd] send to connection {} failed: {}\n", conn, ec.message());
        }

        auto Broadcast(std::string const& room, cashflow::session::ActionResult const& r) -> void
        {
            auto const members = members_.find(room);
            if (members == members_.end()) return; // closed while the action ran
            flatbuffers::DetachedBuffer const buf = cashflow::net::BuildState(room, r.state, r.valid_actions, next_msg_id_++);
            for (ConnId const c : members->second) Send(c, buf);
        }

        auto OnOpen(Hdl hdl) -> void
        {
            std::scoped_lock lk(mx_);
            if (cfg_.rooms != 0 && rooms_started_ >= cfg_.rooms && lobby_.empty())
            {
                std::print("[cashflowd] connection refused: room limit reached\n");
                websocketpp::lib::error_code ec;
                ws_.close(hdl, websocketpp::close::status::policy_violation, "Room limit reached", ec);
                return;
            }

            ConnId const conn = next_conn_++;
            hdl_to_conn_[hdl] = conn;
            conns_[conn] = hdl;
            lobby_.push_back(conn);
            std::print("[cashflowd] connection {} waiting ({} of {})\n", conn, lobby_.size(), cfg_.players);

            if (lobby_.size() >= cfg_.players) StartRoom();
        }

        // Caller holds mx_.
        auto StartRoom() -> void
        {
            std::string const room = std::format("room-{}", ++rooms_started_);

            std::vector<cashflow::core::PlayerSeat> roster;
            for (std::size_t i = 0; i < lobby_.size(); ++i)
            {
                roster.push_back({.id = std::format("p{}", i + 1), .name = std::format("Player {}", i + 1)});
            }

            cashflow::core::Config const gcfg{.seed = cfg_.seed + rooms_started_};
            cashflow::session::ActionResult const first =
                sessions_.CreateRoom(room, roster, cashflow::core::data::Professions(), gcfg);

            for (std::size_t i = 0; i < lobby_.size(); ++i)
            {
                ConnId const c = lobby_[i];
                sessions_.BindConnection(c, room, roster[i].id);
                conn_room_[c] = room;
                members_[room].push_back(c);
                Send(c, cashflow::net::BuildWelcome(room, roster[i].id, next_msg_id_++));
            }
            lobby_.clear();

            std::print("[cashflowd] {} started with {} player(s)\n", room, roster.size());
            Broadcast(room, first);
        }

        auto OnClose(Hdl hdl) -> void
        {
            ConnId conn{};
            std::optional<std::string> room;
            {
                std::scoped_lock lk(mx_);
                auto const it = hdl_to_conn_.find(hdl);
                if (it == hdl_to_conn_.end()) return;
                conn = it->second;
                if (auto const r = conn_room_.find(conn); r != conn_room_.end()) room = r->second;
            }

            std::string const& payload = msg->get_payload();
            std::span<std::byte const> const bytes{reinterpret_cast<std::byte const*>(payload.data()), payload.size()};

            auto action = cashflow::net::DecodeAction(bytes);
            if (!action)
            {
                std::print("[cashflowd] connection {} sent a bad frame: {}\n", conn, action.error().message);
                std::scoped_lock lk(mx_);
                Send(conn, cashflow::net::BuildError(action.error().message, 0, next_msg_id_++));
                return;
            }

            // the room's own executor serialises this; other rooms keep running meanwhile
            cashflow::session::ActionResult const result = sessions_.Submit(conn, std::move(*action)).get();

            std::scoped_lock lk(mx_);
            if (!result.success)
            {
                Send(conn, cashflow::net::BuildError(result.error.value_or("Rejected"), 0, next_msg_id_++));
                if (room && result.error != cashflow::session::UnauthorizedError)
                {
                    // rejected actions still log, so everyone sees the new line
                    Broadcast(*room, result);
                }
                return;
            }
            if (!room) return;

            Broadcast(*room, result);
            if (result.state.turn_phase == cashflow::core::TurnPhase::GameOver)
            {
                std::print("[cashflowd] {} finished after {} turn(s), winner {}\n",
                           *room, result.state.turn_number, result.state.winner.value_or("none"));
            }
        }

    private:
        ServerConfig cfg_;
        WsServer ws_;
        cashflow::session::SessionManager sessions_;

        std::mutex mx_;
        ConnId next_conn_{1};
        std::uint64_t next_msg_id_{1};
        std::size_t rooms_started_{0};
        std::map<Hdl, ConnId, std::owner_less<Hdl>> hdl_to_conn_;
        std::unordered_map<ConnId, Hdl> conns_;
        std::vector<ConnId> lobby_;
        std::unordered_map<ConnId, std::string> conn_room_;
        std::unordered_map<std::string, std::vector<ConnId>> members_;
    };
} // anon

auto main(int argc, char** argv) -> int
{
    ServerConfig const cfg = ParseArgs(argc, argv);
    try
    {
        Server server(cfg);
        server.Run();
    }
    catch (cashflow::core::error::OmegaException<cashflow::core::error::Code> const& e)
    {
        std::print("[cashflowd] fatal: {}\n", e.to_str());
        return 1;
    }
    catch (websocketpp::exception const& e)
    {
        std::print("[cashflowd] websocket failure: {}\n", e.what());
        return 1;
    }
    return 0;
}
