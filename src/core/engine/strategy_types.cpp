// src/core/engine/strategy_types.cpp

#include "strategy_types.hpp"
#include "common/utils.hpp"
#include <sstream>

namespace Geneva
{
    namespace Engine
    {
        std::string protocolToString(Protocol protocol)
        {
            switch (protocol)
            {
            case Protocol::TCP:
                return "tcp";
            case Protocol::IP:
                return "ip";
            }
            return "unknown";
        }

        bool parseProtocol(const std::string &text, Protocol &protocol)
        {
            std::string lower = Common::Utils::toLowerCase(text);
            if (lower == "tcp")
            {
                protocol = Protocol::TCP;
                return true;
            }
            if (lower == "ip")
            {
                protocol = Protocol::IP;
                return true;
            }
            return false;
        }

        std::string tamperModeToString(TamperMode mode)
        {
            switch (mode)
            {
            case TamperMode::REPLACE:
                return "replace";
            case TamperMode::CORRUPT:
                return "corrupt";
            case TamperMode::ADD:
                return "add";
            }
            return "unknown";
        }

        bool parseTamperMode(const std::string &text, TamperMode &mode)
        {
            if (text == "replace")
                mode = TamperMode::REPLACE;
            else if (text == "corrupt")
                mode = TamperMode::CORRUPT;
            else if (text == "add")
                mode = TamperMode::ADD;
            else
                return false;
            return true;
        }

        std::string directionToString(Direction direction)
        {
            return direction == Direction::OUTBOUND ? "outbound" : "inbound";
        }

        bool parseDirection(const std::string &text, Direction &direction)
        {
            std::string lower = Common::Utils::toLowerCase(text);
            if (lower == "outbound" || lower == "out")
            {
                direction = Direction::OUTBOUND;
                return true;
            }
            if (lower == "inbound" || lower == "in")
            {
                direction = Direction::INBOUND;
                return true;
            }
            return false;
        }

        std::string actionTypeToString(ActionType type)
        {
            switch (type)
            {
            case ActionType::SEND:
                return "send";
            case ActionType::DROP:
                return "drop";
            case ActionType::DUPLICATE:
                return "duplicate";
            case ActionType::FRAGMENT:
                return "fragment";
            case ActionType::TAMPER:
                return "tamper";
            }
            return "unknown";
        }

        std::string compileErrorKindToString(CompileErrorKind kind)
        {
            switch (kind)
            {
            case CompileErrorKind::NONE:
                return "no";
            case CompileErrorKind::SYNTAX:
                return "Syntax";
            case CompileErrorKind::PARSE:
                return "Parse";
            case CompileErrorKind::VALIDATION:
                return "Validation";
            }
            return "Unknown";
        }

        std::string CompileError::toString() const
        {
            std::ostringstream oss;
            oss << compileErrorKindToString(kind) << " error";
            if (position != NO_POSITION)
            {
                oss << " at position " << position;
            }
            oss << ": " << message;
            if (!expected.empty())
            {
                oss << " (expected " << expected << ")";
            }
            if (!node.empty())
            {
                oss << " in '" << node << "'";
            }
            return oss.str();
        }

    } // namespace Engine
} // namespace Geneva
