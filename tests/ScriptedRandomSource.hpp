#pragma once

#include "RandomSource.hpp"

#include <deque>
#include <utility>

namespace gridflow::testing
{
    // Replays queued answers; once a queue runs dry it answers 0 / low.
    class ScriptedRandomSource : public IRandomSource
    {
    public:
        ScriptedRandomSource(std::deque<std::size_t> indices = {}, std::deque<double> fractions = {})
            : indices(std::move(indices)), fractions(std::move(fractions))
        {
        }

        std::size_t pickIndex(std::size_t count) override
        {
            pick_calls++;
            std::size_t value = 0;
            if (!indices.empty())
            {
                value = indices.front();
                indices.pop_front();
            }
            return count == 0 ? 0 : value % count;
        }

        // Fractions are positions inside [low, high)
        double uniform(double low, double high) override
        {
            double fraction = 0.0;
            if (!fractions.empty())
            {
                fraction = fractions.front();
                fractions.pop_front();
            }
            return low + fraction * (high - low);
        }

        void reseed(uint32_t) override {}

        std::size_t pick_calls = 0;

    private:
        std::deque<std::size_t> indices;
        std::deque<double> fractions;
    };
} // namespace gridflow::testing
