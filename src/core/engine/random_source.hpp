// src/core/engine/random_source.hpp

#ifndef GENEVA_RANDOM_SOURCE_HPP
#define GENEVA_RANDOM_SOURCE_HPP

#include <cstdint>
#include <mutex>
#include <random>

namespace Geneva
{
    namespace Engine
    {
        /**
         * @brief Source of random numbers for corrupt tampering
         */
        class RandomSource
        {
        public:
            virtual ~RandomSource() = default;

            virtual uint64_t next() = 0;
        };

        /**
         * @brief mt19937_64 generator, safe to share between threads
         */
        class SeededRandomSource : public RandomSource
        {
        public:
            /**
             * @brief Seed from std::random_device
             */
            SeededRandomSource();
            explicit SeededRandomSource(uint64_t seed);

            uint64_t next() override;

        private:
            std::mutex mutex_;
            std::mt19937_64 engine_;
        };

    } // namespace Engine
} // namespace Geneva

#endif // GENEVA_RANDOM_SOURCE_HPP
