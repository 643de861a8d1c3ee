//
// RandomAi.cpp
//

#include "RandomAi.hpp"

#include <ranges>
#include <vector>
#include "Exception.hpp"

namespace hexwar::core
{
    RandomAI::RandomAI(std::uint64_t const seed, double const pass_chance) :
        rng_(seed),
        pass_chance_(pass_chance) {}

    auto RandomAI::Play(std::shared_ptr<GameSnapshot const> snapshot) -> ActionRequest
    {
        HXW_ASSERT(snapshot != nullptr, "RandomAI asked to play without a snapshot");
        GameSnapshot const& s = *snapshot;
        if (s.legal.empty()) HXW_THROW(error::Code::State, "RandomAI asked to play with no legal actions");

        auto pick = [this](auto const& v) -> std::size_t
        {
            return std::uniform_int_distribution<std::size_t>(0, v.size() - 1)(rng_);
        };

        auto const active = std::ranges::to<std::vector<ActionRequest>>(
            s.legal | std::views::filter([](ActionRequest const& a) { return a.kind != ActionKind::Pass; }));

        bool const pass = active.empty() || std::bernoulli_distribution(pass_chance_)(rng_);
        if (!pass) return active[pick(active)];

        auto const passes = std::ranges::to<std::vector<ActionRequest>>(
            s.legal | std::views::filter([](ActionRequest const& a) { return a.kind == ActionKind::Pass; }));
        HXW_ASSERT(!passes.empty(), "Legal set without a Pass");
        return passes[pick(passes)];
    }
}
