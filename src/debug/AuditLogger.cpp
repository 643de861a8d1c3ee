//
// AuditLogger.cpp
//

#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <vector>

using namespace hexwar::core;

namespace
{

auto s_hex(Hex const h) -> std::string
{
    return std::format("({},{})", h.col, h.row);
}

auto s_rolls(AttackOutcome const& a) -> std::string
{
    std::string body;
    for (std::size_t i{}; i < a.rolls.size(); ++i)
    {
        AttackRoll const& r = a.rolls[i];
        body += (i ? "," : "");
        body += std::format("{}/{}/{}", r.hit, r.wound, r.save);
    }
    return body;
}

} // anonymous namespace

namespace hexwar::core::debug
{

auto FormatRequest(ActionRequest const& a) -> std::string
{
    std::string s = std::format("{} u{}", to_string(a.kind), a.unit);
    if (a.target_unit) s += std::format(" -> u{}", *a.target_unit);
    if (a.target_hex) s += std::format(" @{}", s_hex(*a.target_hex));
    return s;
}

auto FormatRecord(ActionRecord const& rec) -> std::string
{
    ActionResult const& r = rec.result;
    std::string line = std::format("#{} T{} {} P{} {} => {}",
                                   rec.step, rec.turn, to_string(rec.phase),
                                   static_cast<int>(rec.player), FormatRequest(rec.request),
                                   to_string(r.outcome));

    if (r.violation) line += std::format(" [{}]", error::describe(*r.violation));

    for (UnitDelta const& d : r.deltas)
    {
        if (d.from != d.to) line += std::format(" u{}:{}->{}", d.unit, s_hex(d.from), s_hex(d.to));
        if (d.hp_before != d.hp_after) line += std::format(" u{}:hp{}->{}", d.unit, d.hp_before, d.hp_after);
    }

    if (r.attack)
    {
        line += std::format(" atk={} hits={} wounds={} dmg={}{} rolls=[{}]",
                            r.attack->attacks, r.attack->hits, r.attack->wounds, r.attack->damage,
                            r.attack->killed ? " KILL" : "", s_rolls(*r.attack));
    }

    if (r.charge)
    {
        line += std::format(" charge={} need={} {}",
                            r.charge->roll, r.charge->required, r.charge->success ? "made" : "failed");
    }

    line += std::format(" reward={:.3f}", r.reward);
    if (r.terminal) line += " END";
    return line;
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameImpl const& game) -> void
{
    GameState const& s = game.State();
    out_ << std::format("Seed={}\n", game.Seed());
    out_ << std::format("Board={}x{} Walls={}\n", s.board->Cols(), s.board->Rows(), s.board->Walls().size());
    out_ << std::format("Limits turns={} steps={}\n", s.max_turns, s.max_steps);
    for (Unit const& u : s.units)
    {
        out_ << std::format("Unit u{} P{} {} at {} hp={}\n",
                            u.id, static_cast<int>(u.player), u.profile->name, s_hex(u.pos), u.hp);
    }
    out_.flush();
}

auto AuditLogger::record(ActionRecord const& rec) -> void
{
    out_ << FormatRecord(rec) << '\n';
}

auto AuditLogger::end(GameImpl const& game) -> void
{
    GameState const& s = game.State();
    out_ << std::format("Winner={} Truncated={} Steps={} Live=[{},{}]\n",
                        s.winner ? static_cast<int>(*s.winner) : -1,
                        s.truncated, s.steps, s.LiveCount(0), s.LiveCount(1));
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace hexwar::core::debug
