// src/core/engine/strategy_types.hpp

#ifndef GENEVA_STRATEGY_TYPES_HPP
#define GENEVA_STRATEGY_TYPES_HPP

#include <string>
#include <cstddef>
#include <stdexcept>

namespace Geneva
{
    namespace Engine
    {
        /**
         * @brief Packet layer a trigger or action refers to
         */
        enum class Protocol
        {
            TCP,
            IP
        };

        /**
         * @brief How a tamper action changes a field
         */
        enum class TamperMode
        {
            REPLACE, // set to literal
            CORRUPT, // random perturbation
            ADD      // increment / append
        };

        /**
         * @brief Direction of a packet relative to the protected host
         */
        enum class Direction
        {
            OUTBOUND,
            INBOUND
        };

        enum class ActionType
        {
            SEND,
            DROP,
            DUPLICATE,
            FRAGMENT,
            TAMPER
        };

        std::string protocolToString(Protocol protocol);

        /**
         * @brief Parse a protocol keyword (case-insensitive)
         */
        bool parseProtocol(const std::string &text, Protocol &protocol);

        std::string tamperModeToString(TamperMode mode);
        bool parseTamperMode(const std::string &text, TamperMode &mode);

        std::string directionToString(Direction direction);

        /**
         * @brief Accepts "outbound"/"out" and "inbound"/"in" (case-insensitive)
         */
        bool parseDirection(const std::string &text, Direction &direction);

        std::string actionTypeToString(ActionType type);

        // ==================== Errors ====================

        /**
         * @brief Compile failure categories
         */
        enum class CompileErrorKind
        {
            NONE,
            SYNTAX,    // malformed token stream
            PARSE,     // grammar structure violation
            VALIDATION // semantic rule violation
        };

        std::string compileErrorKindToString(CompileErrorKind kind);

        /**
         * @brief Describes why a strategy failed to compile
         */
        struct CompileError
        {
            static constexpr size_t NO_POSITION = static_cast<size_t>(-1);

            CompileErrorKind kind = CompileErrorKind::NONE;
            size_t position = NO_POSITION; // byte offset into the source
            std::string expected;          // token or rule that was expected
            std::string node;              // canonical text of the offending node
            std::string message;

            bool hasError() const { return kind != CompileErrorKind::NONE; }

            /**
             * @brief "<kind> error at position N: message (expected X)"
             */
            std::string toString() const;
        };

        /**
         * @brief Raised when a packet cannot be processed by a valid strategy
         *
         * Signals an internal inconsistency between the matcher, the
         * validator and the field registry, never bad user input.
         */
        class ExecutorError : public std::runtime_error
        {
        public:
            explicit ExecutorError(const std::string &message)
                : std::runtime_error(message) {}
        };

    } // namespace Engine
} // namespace Geneva

#endif // GENEVA_STRATEGY_TYPES_HPP
