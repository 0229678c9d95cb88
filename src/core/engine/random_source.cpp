// src/core/engine/random_source.cpp

#include "random_source.hpp"

namespace Geneva
{
    namespace Engine
    {
        SeededRandomSource::SeededRandomSource()
        {
            std::random_device device;
            std::seed_seq seq{device(), device(), device(), device()};
            engine_.seed(seq);
        }

        SeededRandomSource::SeededRandomSource(uint64_t seed)
            : engine_(seed)
        {
        }

        uint64_t SeededRandomSource::next()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return engine_();
        }

    } // namespace Engine
} // namespace Geneva
