#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <type_traits>

#include "../core/Finance.hpp"
#include "../core/Game.hpp"

using namespace cashflow::core;

namespace
{

auto s_dice(Dice const& d) -> std::string
{
    return std::format("{}+{}", d[0], d[1]);
}

auto s_pos(Player const& p) -> std::string
{
    return p.in_fast_track ? std::format("FT{}", p.fast_track_position) : std::format("RR{}", p.position);
}

auto s_player(Player const& p) -> std::string
{
    return std::format("{}[{} cash=${} cf=${}{}{}]", p.id, s_pos(p), p.cash,
                       p.in_fast_track ? p.fast_track_cash_flow : finance::CashFlow(p),
                       p.is_bankrupt ? " bankrupt" : "",
                       p.has_escaped ? " escaped" : "");
}

} // anonymous namespace

namespace cashflow::core::debug
{

auto Describe(GameAction const& a) -> std::string
{
    std::string const head = std::format("{}({}", to_string(TypeOf(a)), ActorOf(a));
    std::string const tail = std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, RollDiceAction>)
            {
                return std::format(", {}{}", s_dice(act.dice_values), act.use_both_dice ? " both" : "");
            }
            else if constexpr (std::is_same_v<T, ChooseDealTypeAction>)
            {
                return act.deal_type == DealSize::Small ? ", small" : ", big";
            }
            else if constexpr (std::is_same_v<T, BuyAssetAction>)
            {
                return act.shares ? std::format(", {} shares", *act.shares) : std::string{};
            }
            else if constexpr (std::is_same_v<T, SellAssetAction>)
            {
                return std::format(", {} x{} @${}", act.asset_id,
                                   act.shares ? std::to_string(*act.shares) : std::string{"all"},
                                   act.price ? std::to_string(*act.price) : std::string{"?"});
            }
            else if constexpr (std::is_same_v<T, TakeLoanAction>)
            {
                return std::format(", ${}", act.amount);
            }
            else if constexpr (std::is_same_v<T, PayOffLoanAction>)
            {
                return std::format(", {} ${}", act.loan_type, act.amount);
            }
            else if constexpr (std::is_same_v<T, ChooseDreamAction>)
            {
                return std::format(", {}", act.dream);
            }
            else if constexpr (std::is_same_v<T, SellToMarketAction>)
            {
                return std::format(", {}", act.asset_id);
            }
            else if constexpr (std::is_same_v<T, OfferDealToPlayerAction>)
            {
                return std::format(" -> {}, ${}", act.target_player_id, act.asking_price);
            }
            else
            {
                return {};
            }
        },
        a
    );
    return head + tail + ")";
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameState const& s, std::uint64_t seed) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Players={}\n", s.players.size());
    for (Player const& p : s.players)
    {
        out_ << std::format("  {} \"{}\" {} salary=${} cash=${} cf=${}\n",
                            p.id, p.name, p.profession, p.statement.salary, p.cash, finance::CashFlow(p));
    }
    out_.flush();
}

auto AuditLogger::action(GameState const& s, GameAction const& a) -> void
{
    out_ << std::format("T{} phase={} cur={} | {}\n",
                        s.turn_number, to_string(s.turn_phase), s_player(s.Current()), Describe(a));
}

auto AuditLogger::outcome(GameState const& before, GameState const& after) -> void
{
    out_ << std::format("Outcome: {}\n", IsInvalidResult(before, after) ? "Invalid" : "Applied");
    for (std::size_t i = before.log.size(); i < after.log.size(); ++i)
    {
        out_ << std::format("  [{}] {}\n", after.log[i].player_id, after.log[i].message);
    }
}

auto AuditLogger::end(GameState const& s) -> void
{
    out_ << std::format("Turns={}\n", s.turn_number);
    out_ << std::format("Winner={}\n", s.winner.value_or("-"));
    for (Player const& p : s.players)
    {
        out_ << std::format("  {}\n", s_player(p));
    }
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace cashflow::core::debug
