//
// SessionManager.hpp
//

#ifndef CASHFLOW_SESSIONMANAGER_HPP
#define CASHFLOW_SESSIONMANAGER_HPP

#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>

#include "GameSession.hpp"

namespace cashflow::session
{
    using ConnId = std::uint64_t;

    inline constexpr std::string_view UnauthorizedError = "Unauthorized";

    // Rooms, connection bindings and the per-room action queue.
    //
    // Every room owns a FIFO of jobs. A submitter that finds its room idle drains the queue
    // itself, so at most one job per room runs at any moment and jobs run in the order they
    // were queued. Rooms never share a lock while a job runs.
    class SessionManager
    {
    public:
        SessionManager() = default;

        SessionManager(SessionManager const&) = delete;
        auto operator=(SessionManager const&) -> SessionManager& = delete;

        // Throws StateError when the room already exists.
        auto CreateRoom(std::string const& room,
                        std::span<core::PlayerSeat const> roster,
                        std::span<core::ProfessionSP const> professions,
                        core::Config const& config = {}) -> ActionResult;

        auto CloseRoom(std::string const& room) -> bool;
        auto HasRoom(std::string const& room) const -> bool;

        auto BindConnection(ConnId conn, std::string const& room, core::PlayerId const& player) -> void;
        auto UnbindConnection(ConnId conn) -> void;

        // "Unauthorized" comes back at once, without queueing, when `conn` is not bound to the
        // action's player. Otherwise the action joins its room's queue.
        auto Submit(ConnId conn, GameAction action) -> std::future<ActionResult>;

        // Sanitized state of a room, read in queue order.
        auto Query(std::string const& room) -> std::future<ActionResult>;

    private:
        struct Binding
        {
            std::string room;
            core::PlayerId player;
        };

        struct Room
        {
            std::unique_ptr<GameSession> session;
            std::mutex mtx;
            std::deque<std::packaged_task<ActionResult()>> queue;
            bool draining{false};
        };

        auto FindRoom(std::string const& room) const -> std::shared_ptr<Room>;
        static auto Enqueue(std::shared_ptr<Room> const& room,
                            std::function<ActionResult(GameSession&)> job) -> std::future<ActionResult>;
        static auto Drain(Room& room) -> void;

    private:
        mutable std::mutex mtx_;
        std::unordered_map<std::string, std::shared_ptr<Room>> rooms_;
        std::unordered_map<ConnId, Binding> bindings_;
    };
}

#endif //CASHFLOW_SESSIONMANAGER_HPP
