#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>

namespace gridflow
{
    // Every random decision in the simulation goes through this interface so a
    // run can be replayed from a seed, or scripted entirely in tests.
    class IRandomSource
    {
    public:
        virtual ~IRandomSource() = default;

        // Uniform index in [0, count); count must be positive
        virtual std::size_t pickIndex(std::size_t count) = 0;

        // Uniform real in [low, high)
        virtual double uniform(double low, double high) = 0;

        virtual void reseed(uint32_t seed) = 0;
    };

    class MersenneRandomSource : public IRandomSource
    {
    public:
        explicit MersenneRandomSource(uint32_t seed = 1)
            : engine(seed)
        {
        }

        std::size_t pickIndex(std::size_t count) override
        {
            if (count == 0)
            {
                throw std::invalid_argument("pickIndex requires a non-empty range");
            }
            std::uniform_int_distribution<std::size_t> dist(0, count - 1);
            return dist(engine);
        }

        double uniform(double low, double high) override
        {
            if (!(high > low))
            {
                return low;
            }
            std::uniform_real_distribution<double> dist(low, high);
            return dist(engine);
        }

        void reseed(uint32_t seed) override
        {
            engine.seed(seed);
        }

    private:
        std::mt19937 engine;
    };

} // namespace gridflow
