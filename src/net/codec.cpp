//
// codec.cpp
//
#include "codec.hpp"

#include <type_traits>
#include <utility>

#include "../core/CardData.hpp"

namespace fb = cashflow::gen::net;

namespace
{
    // Layouts must line up; both ends cast straight across.
    static_assert(static_cast<int>(cashflow::core::TurnPhase::WaitingForDealResponse) ==
                  static_cast<int>(fb::TurnPhase::WaitingForDealResponse));
    static_assert(static_cast<int>(cashflow::core::ActionType::DeclinePlayerDeal) ==
                  static_cast<int>(fb::ActionType::DeclinePlayerDeal));
    static_assert(static_cast<int>(cashflow::core::ActiveCardKind::Doodad) == static_cast<int>(fb::ActiveCardKind::Doodad));
    static_assert(static_cast<int>(cashflow::core::RealEstateType::Commercial) ==
                  static_cast<int>(fb::RealEstateType::Commercial));
    // union slot 0 is NONE
    static_assert(static_cast<std::size_t>(fb::Action::MAX) == cashflow::core::ActionTypeCount);

    auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    auto Verified(std::span<std::byte const> bytes) -> std::expected<fb::Envelope const*, cashflow::net::ParseError>
    {
        using cashflow::net::ParseError;
        if (bytes.size() < sizeof(flatbuffers::uoffset_t)) return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<std::uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier)) return std::unexpected(ParseError{"buffer failed verification"});

        fb::Envelope const* env = fb::GetEnvelope(data);
        if (!env || env->message_type() == fb::Message::NONE) return std::unexpected(ParseError{"empty envelope"});
        return env;
    }

    auto Finish(flatbuffers::FlatBufferBuilder& fbb, fb::Message type, flatbuffers::Offset<void> msg)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = fb::CreateEnvelope(fbb, type, msg);
        fbb.Finish(env);
        return fbb.Release();
    }
} // anonymous

namespace cashflow::net
{
    using namespace cashflow::core;

    auto ToFbPhase(TurnPhase p) noexcept -> fb::TurnPhase
    {
        return static_cast<fb::TurnPhase>(std::to_underlying(p));
    }

    auto FromFbPhase(fb::TurnPhase p) noexcept -> TurnPhase
    {
        return static_cast<TurnPhase>(std::to_underlying(p));
    }

    auto ToFbActionType(ActionType t) noexcept -> fb::ActionType
    {
        return static_cast<fb::ActionType>(std::to_underlying(t));
    }

    auto FromFbActionType(fb::ActionType t) noexcept -> ActionType
    {
        return static_cast<ActionType>(std::to_underlying(t));
    }

    // ---------- Action (client → server) ----------

    auto BuildAction(GameAction const& action, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const pid = fbb.CreateString(ActorOf(action));

        auto const [type, body] = std::visit(
            [&]<typename T0>(T0 const& a) -> std::pair<fb::Action, flatbuffers::Offset<void>>
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, RollDiceAction>)
                {
                    return {fb::Action::Action_RollDice,
                            fb::CreateAction_RollDice(fbb, pid,
                                                      static_cast<std::uint8_t>(a.dice_values[0]),
                                                      static_cast<std::uint8_t>(a.dice_values[1]),
                                                      a.use_both_dice).Union()};
                }
                else if constexpr (std::is_same_v<T, ChooseDealTypeAction>)
                {
                    auto const size = a.deal_type == DealSize::Small ? fb::DealSize::Small : fb::DealSize::Big;
                    return {fb::Action::Action_ChooseDealType, fb::CreateAction_ChooseDealType(fbb, pid, size).Union()};
                }
                else if constexpr (std::is_same_v<T, BuyAssetAction>)
                {
                    return {fb::Action::Action_BuyAsset,
                            fb::CreateAction_BuyAsset(fbb, pid, a.shares.has_value(), a.shares.value_or(0)).Union()};
                }
                else if constexpr (std::is_same_v<T, SellAssetAction>)
                {
                    auto const id = fbb.CreateString(a.asset_id);
                    return {fb::Action::Action_SellAsset,
                            fb::CreateAction_SellAsset(fbb, pid, id, a.shares.has_value(), a.shares.value_or(0),
                                                       a.price.has_value(), a.price.value_or(0)).Union()};
                }
                else if constexpr (std::is_same_v<T, SkipDealAction>)
                {
                    return {fb::Action::Action_SkipDeal, fb::CreateAction_SkipDeal(fbb, pid).Union()};
                }
                else if constexpr (std::is_same_v<T, PayExpenseAction>)
                {
                    return {fb::Action::Action_PayExpense, fb::CreateAction_PayExpense(fbb, pid).Union()};
                }
                else if constexpr (std::is_same_v<T, AcceptCharityAction>)
                {
                    return {fb::Action::Action_AcceptCharity, fb::CreateAction_AcceptCharity(fbb, pid).Union()};
                }
                else if constexpr (std::is_same_v<T, DeclineCharityAction>)
                {
                    return {fb::Action::Action_DeclineCharity, fb::CreateAction_DeclineCharity(fbb, pid).Union()};
                }
                else if constexpr (std::is_same_v<T, TakeLoanAction>)
                {
                    return {fb::Action::Action_TakeLoan, fb::CreateAction_TakeLoan(fbb, pid, a.amount).Union()};
                }
                else if constexpr (std::is_same_v<T, PayOffLoanAction>)
                {
                    auto const loan = fbb.CreateString(a.loan_type);
                    return {fb::Action::Action_PayOffLoan, fb::CreateAction_PayOffLoan(fbb, pid, loan, a.amount).Union()};
                }
                else if constexpr (std::is_same_v<T, EndTurnAction>)
                {
                    return {fb::Action::Action_EndTurn, fb::CreateAction_EndTurn(fbb, pid).Union()};
                }
                else if constexpr (std::is_same_v<T, CollectPayDayAction>)
                {
                    return {fb::Action::Action_CollectPayDay, fb::CreateAction_CollectPayDay(fbb, pid).Union()};
                }
                else if constexpr (std::is_same_v<T, ChooseDreamAction>)
                {
                    auto const dream = fbb.CreateString(a.dream);
                    return {fb::Action::Action_ChooseDream, fb::CreateAction_ChooseDream(fbb, pid, dream).Union()};
                }
                else if constexpr (std::is_same_v<T, SellToMarketAction>)
                {
                    auto const id = fbb.CreateString(a.asset_id);
                    return {fb::Action::Action_SellToMarket, fb::CreateAction_SellToMarket(fbb, pid, id).Union()};
                }
                else if constexpr (std::is_same_v<T, DeclineMarketAction>)
                {
                    return {fb::Action::Action_DeclineMarket, fb::CreateAction_DeclineMarket(fbb, pid).Union()};
                }
                else if constexpr (std::is_same_v<T, DeclareBankruptcyAction>)
                {
                    return {fb::Action::Action_DeclareBankruptcy, fb::CreateAction_DeclareBankruptcy(fbb, pid).Union()};
                }
                else if constexpr (std::is_same_v<T, OfferDealToPlayerAction>)
                {
                    auto const target = fbb.CreateString(a.target_player_id);
                    return {fb::Action::Action_OfferDealToPlayer,
                            fb::CreateAction_OfferDealToPlayer(fbb, pid, target, a.asking_price).Union()};
                }
                else if constexpr (std::is_same_v<T, AcceptPlayerDealAction>)
                {
                    return {fb::Action::Action_AcceptPlayerDeal, fb::CreateAction_AcceptPlayerDeal(fbb, pid).Union()};
                }
                else if constexpr (std::is_same_v<T, DeclinePlayerDealAction>)
                {
                    return {fb::Action::Action_DeclinePlayerDeal, fb::CreateAction_DeclinePlayerDeal(fbb, pid).Union()};
                }
                else
                {
                    static_assert(!sizeof(T), "action without a wire form");
                }
            },
            action);

        auto const msg = fb::CreateActionMsg(fbb, msg_id, type, body);
        return Finish(fbb, fb::Message::ActionMsg, msg.Union());
    }

    // ---------- State (server → client) ----------

    namespace
    {
        auto BuildAsset(flatbuffers::FlatBufferBuilder& fbb, Asset const& asset) -> flatbuffers::Offset<fb::AssetEntry>
        {
            return std::visit([&]<typename A0>(A0 const& a) -> flatbuffers::Offset<fb::AssetEntry>
            {
                using A = std::decay_t<A0>;
                auto const id = fbb.CreateString(a.id);
                auto const name = fbb.CreateString(a.name);

                if constexpr (std::is_same_v<A, StockAsset>)
                {
                    auto const sym = fbb.CreateString(a.symbol);
                    auto const st = fb::CreateStock(fbb, id, name, sym, a.shares, a.cost_per_share, a.dividend_per_share);
                    return fb::CreateAssetEntry(fbb, fb::AssetBody::Stock, st.Union());
                }
                else if constexpr (std::is_same_v<A, RealEstateAsset>)
                {
                    auto const re = fb::CreateRealEstate(fbb, id, name,
                                                         static_cast<fb::RealEstateType>(std::to_underlying(a.sub_type)),
                                                         a.cost, a.mortgage, a.down_payment, a.cash_flow);
                    return fb::CreateAssetEntry(fbb, fb::AssetBody::RealEstate, re.Union());
                }
                else
                {
                    auto const biz = fb::CreateBusiness(fbb, id, name, a.cost, a.mortgage, a.down_payment, a.cash_flow);
                    return fb::CreateAssetEntry(fbb, fb::AssetBody::Business, biz.Union());
                }
            }, asset);
        }

        auto BuildPlayer(flatbuffers::FlatBufferBuilder& fbb, Player const& p) -> flatbuffers::Offset<fb::PlayerView>
        {
            std::vector<flatbuffers::Offset<fb::AssetEntry>> assets;
            assets.reserve(p.statement.assets.size());
            for (Asset const& a : p.statement.assets) assets.push_back(BuildAsset(fbb, a));

            std::vector<flatbuffers::Offset<fb::Liability>> liabilities;
            liabilities.reserve(p.statement.liabilities.size());
            for (Liability const& l : p.statement.liabilities)
            {
                liabilities.push_back(fb::CreateLiability(fbb, fbb.CreateString(l.name), l.balance, l.payment));
            }

            Expenses const& e = p.statement.expenses;
            auto const exp = fb::CreateExpenses(fbb, e.taxes, e.home_mortgage_payment, e.school_loan_payment,
                                                e.car_loan_payment, e.credit_card_payment, e.other_expenses,
                                                e.per_child_expense, e.child_count);

            auto const id = fbb.CreateString(p.id);
            auto const name = fbb.CreateString(p.name);
            auto const prof = fbb.CreateString(p.profession);
            auto const asset_vec = fbb.CreateVector(assets);
            auto const liab_vec = fbb.CreateVector(liabilities);
            auto const dream = p.dream ? fbb.CreateString(*p.dream) : flatbuffers::Offset<flatbuffers::String>{};

            return fb::CreatePlayerView(
                fbb, id, name, prof,
                /*salary*/ p.statement.salary,
                /*expenses*/ exp,
                asset_vec, liab_vec,
                /*cash*/ p.cash,
                /*position*/ static_cast<std::uint8_t>(p.position),
                p.in_fast_track,
                static_cast<std::uint8_t>(p.fast_track_position),
                p.fast_track_cash_flow,
                p.has_escaped, p.has_won,
                dream,
                p.downsized_turns_left, p.charity_turns_left,
                p.bank_loan_amount,
                p.is_bankrupt, p.bankrupt_turns_left);
        }

        auto FaceUpId(ActiveCard const& c) -> std::pair<std::string, std::string>
        {
            return std::visit([]<typename C0>(C0 const& card) -> std::pair<std::string, std::string>
            {
                using C = std::decay_t<C0>;
                if constexpr (std::is_same_v<C, std::monostate>) return {};
                else return {card.card->id, card.card->title};
            }, c);
        }
    }

    auto BuildState(std::string_view room,
                    GameState const& s,
                    std::span<ActionType const> valid,
                    std::uint64_t msg_id,
                    std::size_t log_tail) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fb::PlayerView>> players;
        players.reserve(s.players.size());
        for (Player const& p : s.players) players.push_back(BuildPlayer(fbb, p));
        auto const player_vec = fbb.CreateVector(players);

        auto const [card_id, card_title] = FaceUpId(s.active_card);
        auto const active = fb::CreateActiveCard(fbb, static_cast<fb::ActiveCardKind>(std::to_underlying(KindOf(s.active_card))),
                                                 fbb.CreateString(card_id), fbb.CreateString(card_title));

        auto const u32 = [](std::size_t n) { return static_cast<std::uint32_t>(n); };
        auto const decks = fb::CreateDeckSizes(fbb,
                                               u32(s.decks.small_deals.size()), u32(s.decks.big_deals.size()),
                                               u32(s.decks.market.size()), u32(s.decks.doodads.size()),
                                               u32(s.decks.small_deal_discard.size()), u32(s.decks.big_deal_discard.size()),
                                               u32(s.decks.market_discard.size()), u32(s.decks.doodad_discard.size()));

        std::vector<flatbuffers::Offset<fb::LogLine>> lines;
        std::size_t const first = s.log.size() > log_tail ? s.log.size() - log_tail : 0;
        for (std::size_t i = first; i < s.log.size(); ++i)
        {
            LogEntry const& e = s.log[i];
            lines.push_back(fb::CreateLogLine(fbb, e.turn, fbb.CreateString(e.player_id), fbb.CreateString(e.message)));
        }
        auto const log_vec = fbb.CreateVector(lines);

        auto const winner = s.winner ? fbb.CreateString(*s.winner) : flatbuffers::Offset<flatbuffers::String>{};

        flatbuffers::Offset<fb::PendingDeal> pending{};
        if (s.pending_player_deal)
        {
            PendingPlayerDeal const& d = *s.pending_player_deal;
            pending = fb::CreatePendingDeal(fbb, fbb.CreateString(d.seller_id), fbb.CreateString(d.buyer_id),
                                            fbb.CreateString(d.card->id), d.asking_price);
        }

        std::vector<std::uint8_t> valid_raw;
        valid_raw.reserve(valid.size());
        for (ActionType const t : valid) valid_raw.push_back(std::to_underlying(t));
        auto const valid_vec = fbb.CreateVector(valid_raw);

        auto const room_str = fbb.CreateString(room);

        auto const msg = fb::CreateStateMsg(
            fbb, msg_id, room_str, player_vec,
            /*current_player_index*/ static_cast<std::uint8_t>(s.current_player_index),
            ToFbPhase(s.turn_phase),
            active,
            /*has_dice*/ s.dice_result.has_value(),
            /*die1*/ static_cast<std::uint8_t>(s.dice_result ? (*s.dice_result)[0] : 0),
            /*die2*/ static_cast<std::uint8_t>(s.dice_result ? (*s.dice_result)[1] : 0),
            decks, log_vec,
            /*log_size*/ u32(s.log.size()),
            s.turn_number, winner, pending,
            s.next_asset_id, s.pay_days_remaining, s.fast_track_win_cash_flow,
            valid_vec);
        return Finish(fbb, fb::Message::StateMsg, msg.Union());
    }

    // ---------- Error / Welcome (server → client) ----------

    auto BuildError(std::string_view message, std::uint64_t reply_to, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(message);
        auto const err = fb::CreateErrorMsg(fbb, msg_id, reply_to, txt);
        return Finish(fbb, fb::Message::ErrorMsg, err.Union());
    }

    auto BuildWelcome(std::string_view room, PlayerId const& player, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const r = fbb.CreateString(room);
        auto const p = fbb.CreateString(player);
        auto const w = fb::CreateWelcomeMsg(fbb, msg_id, r, p);
        return Finish(fbb, fb::Message::WelcomeMsg, w.Union());
    }

    // ---------- Decode ----------

    auto PeekMessage(std::span<std::byte const> bytes) -> std::expected<fb::Message, ParseError>
    {
        auto const env = Verified(bytes);
        if (!env) return std::unexpected(env.error());
        return (*env)->message_type();
    }

    auto DecodeAction(std::span<std::byte const> bytes) -> std::expected<GameAction, ParseError>
    {
        auto const env = Verified(bytes);
        if (!env) return std::unexpected(env.error());

        auto const* am = (*env)->message_as_ActionMsg();
        if (!am) return std::unexpected(ParseError{"not an ActionMsg"});

        switch (am->action_type())
        {
        case fb::Action::Action_RollDice:
        {
            auto const* a = am->action_as_Action_RollDice();
            return RollDiceAction{Str(a->player_id()), Dice{a->die1(), a->die2()}, a->use_both_dice()};
        }
        case fb::Action::Action_ChooseDealType:
        {
            auto const* a = am->action_as_Action_ChooseDealType();
            DealSize const size = a->deal_type() == fb::DealSize::Big ? DealSize::Big : DealSize::Small;
            return ChooseDealTypeAction{Str(a->player_id()), size};
        }
        case fb::Action::Action_BuyAsset:
        {
            auto const* a = am->action_as_Action_BuyAsset();
            return BuyAssetAction{Str(a->player_id()),
                                  a->has_shares() ? std::optional<std::int64_t>{a->shares()} : std::nullopt};
        }
        case fb::Action::Action_SellAsset:
        {
            auto const* a = am->action_as_Action_SellAsset();
            return SellAssetAction{Str(a->player_id()), Str(a->asset_id()),
                                   a->has_shares() ? std::optional<std::int64_t>{a->shares()} : std::nullopt,
                                   a->has_price() ? std::optional<Money>{a->price()} : std::nullopt};
        }
        case fb::Action::Action_SkipDeal:
            return SkipDealAction{Str(am->action_as_Action_SkipDeal()->player_id())};
        case fb::Action::Action_PayExpense:
            return PayExpenseAction{Str(am->action_as_Action_PayExpense()->player_id())};
        case fb::Action::Action_AcceptCharity:
            return AcceptCharityAction{Str(am->action_as_Action_AcceptCharity()->player_id())};
        case fb::Action::Action_DeclineCharity:
            return DeclineCharityAction{Str(am->action_as_Action_DeclineCharity()->player_id())};
        case fb::Action::Action_TakeLoan:
        {
            auto const* a = am->action_as_Action_TakeLoan();
            return TakeLoanAction{Str(a->player_id()), a->amount()};
        }
        case fb::Action::Action_PayOffLoan:
        {
            auto const* a = am->action_as_Action_PayOffLoan();
            return PayOffLoanAction{Str(a->player_id()), Str(a->loan_type()), a->amount()};
        }
        case fb::Action::Action_EndTurn:
            return EndTurnAction{Str(am->action_as_Action_EndTurn()->player_id())};
        case fb::Action::Action_CollectPayDay:
            return CollectPayDayAction{Str(am->action_as_Action_CollectPayDay()->player_id())};
        case fb::Action::Action_ChooseDream:
        {
            auto const* a = am->action_as_Action_ChooseDream();
            return ChooseDreamAction{Str(a->player_id()), Str(a->dream())};
        }
        case fb::Action::Action_SellToMarket:
        {
            auto const* a = am->action_as_Action_SellToMarket();
            return SellToMarketAction{Str(a->player_id()), Str(a->asset_id())};
        }
        case fb::Action::Action_DeclineMarket:
            return DeclineMarketAction{Str(am->action_as_Action_DeclineMarket()->player_id())};
        case fb::Action::Action_DeclareBankruptcy:
            return DeclareBankruptcyAction{Str(am->action_as_Action_DeclareBankruptcy()->player_id())};
        case fb::Action::Action_OfferDealToPlayer:
        {
            auto const* a = am->action_as_Action_OfferDealToPlayer();
            return OfferDealToPlayerAction{Str(a->player_id()), Str(a->target_player_id()), a->asking_price()};
        }
        case fb::Action::Action_AcceptPlayerDeal:
            return AcceptPlayerDealAction{Str(am->action_as_Action_AcceptPlayerDeal()->player_id())};
        case fb::Action::Action_DeclinePlayerDeal:
            return DeclinePlayerDealAction{Str(am->action_as_Action_DeclinePlayerDeal()->player_id())};
        default:
            return std::unexpected(ParseError{"unknown action variant"});
        }
    }

    namespace
    {
        auto ReadAsset(fb::AssetEntry const& e) -> std::expected<Asset, ParseError>
        {
            switch (e.body_type())
            {
            case fb::AssetBody::Stock:
            {
                auto const* a = e.body_as_Stock();
                return StockAsset{.id = Str(a->id()), .name = Str(a->name()), .symbol = Str(a->symbol()),
                                  .shares = a->shares(), .cost_per_share = a->cost_per_share(),
                                  .dividend_per_share = a->dividend_per_share()};
            }
            case fb::AssetBody::RealEstate:
            {
                auto const* a = e.body_as_RealEstate();
                return RealEstateAsset{.id = Str(a->id()), .name = Str(a->name()),
                                       .sub_type = static_cast<RealEstateType>(std::to_underlying(a->sub_type())),
                                       .cost = a->cost(), .mortgage = a->mortgage(),
                                       .down_payment = a->down_payment(), .cash_flow = a->cash_flow()};
            }
            case fb::AssetBody::Business:
            {
                auto const* a = e.body_as_Business();
                return BusinessAsset{.id = Str(a->id()), .name = Str(a->name()), .cost = a->cost(),
                                     .mortgage = a->mortgage(), .down_payment = a->down_payment(),
                                     .cash_flow = a->cash_flow()};
            }
            default:
                return std::unexpected(ParseError{"asset without a body"});
            }
        }

        auto ReadPlayer(fb::PlayerView const& v) -> std::expected<Player, ParseError>
        {
            Player p;
            p.id = Str(v.id());
            p.name = Str(v.name());
            p.profession = Str(v.profession());
            p.statement.salary = v.salary();
            if (auto const* e = v.expenses())
            {
                p.statement.expenses = Expenses{
                    .taxes = e->taxes(),
                    .home_mortgage_payment = e->home_mortgage_payment(),
                    .school_loan_payment = e->school_loan_payment(),
                    .car_loan_payment = e->car_loan_payment(),
                    .credit_card_payment = e->credit_card_payment(),
                    .other_expenses = e->other_expenses(),
                    .per_child_expense = e->per_child_expense(),
                    .child_count = e->child_count()};
            }
            if (auto const* as = v.assets())
            {
                for (auto const* e : *as)
                {
                    auto a = ReadAsset(*e);
                    if (!a) return std::unexpected(a.error());
                    p.statement.assets.push_back(std::move(*a));
                }
            }
            if (auto const* ls = v.liabilities())
            {
                for (auto const* l : *ls)
                {
                    p.statement.liabilities.push_back(Liability{Str(l->name()), l->balance(), l->payment()});
                }
            }
            p.cash = v.cash();
            p.position = v.position();
            p.in_fast_track = v.in_fast_track();
            p.fast_track_position = v.fast_track_position();
            p.fast_track_cash_flow = v.fast_track_cash_flow();
            p.has_escaped = v.has_escaped();
            p.has_won = v.has_won();
            if (v.dream()) p.dream = v.dream()->str();
            p.downsized_turns_left = v.downsized_turns_left();
            p.charity_turns_left = v.charity_turns_left();
            p.bank_loan_amount = v.bank_loan_amount();
            p.is_bankrupt = v.is_bankrupt();
            p.bankrupt_turns_left = v.bankrupt_turns_left();
            return p;
        }

        auto ReadActiveCard(fb::ActiveCard const* c) -> std::expected<ActiveCard, ParseError>
        {
            if (!c || c->kind() == fb::ActiveCardKind::None) return ActiveCard{};

            std::string const id = Str(c->card_id());
            switch (c->kind())
            {
            case fb::ActiveCardKind::SmallDeal:
            case fb::ActiveCardKind::BigDeal:
                if (DealSP d = data::FindDeal(id))
                {
                    if (c->kind() == fb::ActiveCardKind::SmallDeal) return ActiveCard{ActiveSmallDeal{std::move(d)}};
                    return ActiveCard{ActiveBigDeal{std::move(d)}};
                }
                break;
            case fb::ActiveCardKind::Market:
                if (MarketSP m = data::FindMarket(id)) return ActiveCard{ActiveMarket{std::move(m)}};
                break;
            case fb::ActiveCardKind::Doodad:
                if (DoodadSP d = data::FindDoodad(id)) return ActiveCard{ActiveDoodad{std::move(d)}};
                break;
            default:
                break;
            }
            return std::unexpected(ParseError{"unknown card id " + id});
        }
    }

    auto DecodeState(std::span<std::byte const> bytes) -> std::expected<DecodedState, ParseError>
    {
        auto const env = Verified(bytes);
        if (!env) return std::unexpected(env.error());

        auto const* sm = (*env)->message_as_StateMsg();
        if (!sm) return std::unexpected(ParseError{"not a StateMsg"});

        DecodedState out;
        out.room = Str(sm->room());
        GameState& s = out.state;

        if (auto const* ps = sm->players())
        {
            for (auto const* v : *ps)
            {
                auto p = ReadPlayer(*v);
                if (!p) return std::unexpected(p.error());
                s.players.push_back(std::move(*p));
            }
        }
        if (s.players.empty()) return std::unexpected(ParseError{"state without players"});
        if (sm->current_player_index() >= s.players.size())
        {
            return std::unexpected(ParseError{"current player index out of range"});
        }
        s.current_player_index = sm->current_player_index();
        s.turn_phase = FromFbPhase(sm->turn_phase());

        auto active = ReadActiveCard(sm->active_card());
        if (!active) return std::unexpected(active.error());
        s.active_card = std::move(*active);

        if (sm->has_dice()) s.dice_result = Dice{sm->die1(), sm->die2()};

        if (auto const* d = sm->decks())
        {
            s.decks.small_deals.resize(d->small_deals());
            s.decks.big_deals.resize(d->big_deals());
            s.decks.market.resize(d->market());
            s.decks.doodads.resize(d->doodads());
            s.decks.small_deal_discard.resize(d->small_deal_discard());
            s.decks.big_deal_discard.resize(d->big_deal_discard());
            s.decks.market_discard.resize(d->market_discard());
            s.decks.doodad_discard.resize(d->doodad_discard());
        }

        if (auto const* log = sm->log())
        {
            for (auto const* l : *log)
            {
                s.log.push_back(LogEntry{.turn = l->turn(), .player_id = Str(l->player_id()), .message = Str(l->message())});
            }
        }
        out.log_size = sm->log_size();
        s.turn_number = sm->turn_number();
        if (sm->winner()) s.winner = sm->winner()->str();

        if (auto const* pd = sm->pending_deal())
        {
            DealSP card = data::FindDeal(Str(pd->card_id()));
            if (!card) return std::unexpected(ParseError{"pending deal names an unknown card"});
            s.pending_player_deal = PendingPlayerDeal{
                .seller_id = Str(pd->seller_id()),
                .buyer_id = Str(pd->buyer_id()),
                .card = std::move(card),
                .asking_price = pd->asking_price()};
        }

        s.next_asset_id = sm->next_asset_id();
        s.pay_days_remaining = sm->pay_days_remaining();
        s.fast_track_win_cash_flow = sm->fast_track_win_cash_flow();

        if (auto const* va = sm->valid_actions())
        {
            for (auto const t : *va)
            {
                if (t >= ActionTypeCount) return std::unexpected(ParseError{"unknown action type"});
                out.valid_actions.push_back(static_cast<ActionType>(t));
            }
        }
        return out;
    }

    auto DecodeError(std::span<std::byte const> bytes) -> std::expected<std::string, ParseError>
    {
        auto const env = Verified(bytes);
        if (!env) return std::unexpected(env.error());
        auto const* em = (*env)->message_as_ErrorMsg();
        if (!em) return std::unexpected(ParseError{"not an ErrorMsg"});
        return Str(em->message());
    }

    auto DecodeWelcome(std::span<std::byte const> bytes) -> std::expected<Welcome, ParseError>
    {
        auto const env = Verified(bytes);
        if (!env) return std::unexpected(env.error());
        auto const* wm = (*env)->message_as_WelcomeMsg();
        if (!wm) return std::unexpected(ParseError{"not a WelcomeMsg"});
        return Welcome{.room = Str(wm->room()), .player_id = Str(wm->player_id())};
    }
} // namespace cashflow::net
