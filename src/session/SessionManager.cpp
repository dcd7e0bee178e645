//
// SessionManager.cpp
//

#include "SessionManager.hpp"

#include <format>
#include <print>
#include <utility>

#include "../core/Exception.hpp"

namespace cashflow::session
{
    namespace
    {
        auto Ready(ActionResult r) -> std::future<ActionResult>
        {
            std::promise<ActionResult> p;
            p.set_value(std::move(r));
            return p.get_future();
        }

        auto Refused(std::string_view why) -> ActionResult
        {
            return ActionResult{.success = false, .state = {}, .error = std::string{why}, .valid_actions = {}};
        }
    }

    auto SessionManager::CreateRoom(std::string const& room,
                                    std::span<core::PlayerSeat const> roster,
                                    std::span<core::ProfessionSP const> professions,
                                    core::Config const& config) -> ActionResult
    {
        auto r = std::make_shared<Room>();
        r->session = std::make_unique<GameSession>(room, roster, professions, config);
        ActionResult first = r->session->Snapshot();

        {
            std::scoped_lock lk(mtx_);
            if (rooms_.contains(room))
            {
                CF_THROW(core::error::Code::State, std::format("room {} already exists", room));
            }
            rooms_.emplace(room, std::move(r));
        }
        std::print("[Session] room {} created with {} player(s)\n", room, roster.size());
        return first;
    }

    auto SessionManager::CloseRoom(std::string const& room) -> bool
    {
        std::scoped_lock lk(mtx_);
        std::erase_if(bindings_, [&](auto const& kv) { return kv.second.room == room; });
        // queued jobs keep the room alive through their shared_ptr until they finish
        bool const erased = rooms_.erase(room) > 0;
        if (erased) std::print("[Session] room {} closed\n", room);
        return erased;
    }

    auto SessionManager::HasRoom(std::string const& room) const -> bool
    {
        std::scoped_lock lk(mtx_);
        return rooms_.contains(room);
    }

    auto SessionManager::BindConnection(ConnId conn, std::string const& room, core::PlayerId const& player) -> void
    {
        std::scoped_lock lk(mtx_);
        if (!rooms_.contains(room))
        {
            CF_THROW(core::error::Code::State, std::format("cannot bind connection {} to unknown room {}", conn, room));
        }
        bindings_.insert_or_assign(conn, Binding{.room = room, .player = player});
    }

    auto SessionManager::UnbindConnection(ConnId conn) -> void
    {
        std::scoped_lock lk(mtx_);
        bindings_.erase(conn);
    }

    auto SessionManager::FindRoom(std::string const& room) const -> std::shared_ptr<Room>
    {
        std::scoped_lock lk(mtx_);
        auto const it = rooms_.find(room);
        return it == rooms_.end() ? nullptr : it->second;
    }

    auto SessionManager::Submit(ConnId conn, GameAction action) -> std::future<ActionResult>
    {
        std::shared_ptr<Room> room;
        {
            std::scoped_lock lk(mtx_);
            auto const b = bindings_.find(conn);
            if (b == bindings_.end() || b->second.player != core::ActorOf(action))
            {
                std::print("[Session] connection {} refused: {} claimed by an unbound seat\n",
                           conn, core::ActorOf(action));
                return Ready(Refused(UnauthorizedError));
            }
            auto const r = rooms_.find(b->second.room);
            if (r == rooms_.end()) return Ready(Refused("Room closed"));
            room = r->second;
        }

        return Enqueue(room, [a = std::move(action)](GameSession& s) mutable
        {
            return s.ProcessAction(std::move(a));
        });
    }

    auto SessionManager::Query(std::string const& room) -> std::future<ActionResult>
    {
        std::shared_ptr<Room> r = FindRoom(room);
        if (!r) return Ready(Refused("Room closed"));
        return Enqueue(r, [](GameSession& s) { return s.Snapshot(); });
    }

    auto SessionManager::Enqueue(std::shared_ptr<Room> const& room,
                                 std::function<ActionResult(GameSession&)> job) -> std::future<ActionResult>
    {
        std::packaged_task<ActionResult()> task(
            [r = room, j = std::move(job)]() mutable
            {
                return j(*r->session);
            }
        );
        std::future<ActionResult> fut = task.get_future();

        bool drain = false;
        {
            std::scoped_lock lk(room->mtx);
            room->queue.push_back(std::move(task));
            if (!room->draining)
            {
                room->draining = true;
                drain = true;
            }
        }
        if (drain) Drain(*room);
        return fut;
    }

    auto SessionManager::Drain(Room& room) -> void
    {
        for (;;)
        {
            std::packaged_task<ActionResult()> next;
            {
                std::scoped_lock lk(room.mtx);
                if (room.queue.empty())
                {
                    room.draining = false;
                    return;
                }
                next = std::move(room.queue.front());
                room.queue.pop_front();
            }
            // exceptions land in the job's future
            next();
        }
    }
}
