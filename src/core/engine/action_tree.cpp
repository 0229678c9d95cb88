// src/core/engine/action_tree.cpp

#include "action_tree.hpp"
#include <algorithm>
#include <sstream>

namespace Geneva
{
    namespace Engine
    {
        namespace
        {
            bool isSend(const Action *action)
            {
                return action == nullptr || action->getType() == ActionType::SEND;
            }

            std::string forestToString(const Forest &forest)
            {
                std::string result;
                for (const auto &tree : forest)
                {
                    if (!result.empty())
                        result += " ";
                    result += tree.toString();
                }
                return result;
            }

            size_t forestDepth(const Forest &forest)
            {
                size_t depth = 0;
                for (const auto &tree : forest)
                {
                    depth = std::max(depth, tree.depth());
                }
                return depth;
            }
        }

        // ==================== Trigger ====================

        Trigger::Trigger(Protocol protocol, const std::string &field, const std::string &value)
            : protocol_(protocol), field_(field), value_(value)
        {
        }

        std::string Trigger::toString() const
        {
            return "[" + protocolToString(protocol_) + ":" + field_ + ":" + value_ + "]";
        }

        // ==================== Composite actions ====================

        CompositeAction::CompositeAction(ActionPtr left, ActionPtr right)
            : left_(std::move(left)), right_(std::move(right))
        {
        }

        size_t CompositeAction::depth() const
        {
            size_t left_depth = left_ ? left_->depth() : 0;
            size_t right_depth = right_ ? right_->depth() : 0;
            return 1 + std::max(left_depth, right_depth);
        }

        std::string CompositeAction::bodyToString() const
        {
            if (isSend(left_.get()) && isSend(right_.get()))
            {
                return "";
            }

            std::string left = isSend(left_.get()) ? "" : left_->toString();
            std::string right = isSend(right_.get()) ? "" : right_->toString();
            return "(" + left + "," + right + ")";
        }

        DuplicateAction::DuplicateAction(ActionPtr left, ActionPtr right)
            : CompositeAction(std::move(left), std::move(right))
        {
        }

        std::string DuplicateAction::toString() const
        {
            return "duplicate" + bodyToString();
        }

        FragmentAction::FragmentAction(Protocol protocol, uint32_t offset, bool in_order,
                                       ActionPtr left, ActionPtr right)
            : CompositeAction(std::move(left), std::move(right)),
              protocol_(protocol), offset_(offset), in_order_(in_order)
        {
        }

        std::string FragmentAction::toString() const
        {
            std::ostringstream oss;
            oss << "fragment{" << protocolToString(protocol_) << ":" << offset_ << ":"
                << (in_order_ ? "True" : "False") << "}" << bodyToString();
            return oss.str();
        }

        // ==================== Tamper ====================

        TamperAction::TamperAction(Protocol protocol, const std::string &field, TamperMode mode,
                                   std::optional<std::string> value)
            : protocol_(protocol), field_(field), mode_(mode), value_(std::move(value))
        {
        }

        std::string TamperAction::toString() const
        {
            std::string result = "tamper{" + protocolToString(protocol_) + ":" + field_ + ":" +
                                 tamperModeToString(mode_);
            if (value_ && mode_ != TamperMode::CORRUPT)
            {
                result += ":" + *value_;
            }
            return result + "}";
        }

        // ==================== ActionTree ====================

        ActionTree::ActionTree(Trigger trigger, ActionPtr action)
            : trigger_(std::move(trigger)), action_(std::move(action))
        {
            if (!action_)
            {
                action_ = std::make_unique<SendAction>();
            }
        }

        std::string ActionTree::toString() const
        {
            return trigger_.toString() + "-" + action_->toString() + "-|";
        }

        // ==================== Strategy ====================

        Strategy::Strategy(Forest outbound, Forest inbound)
            : outbound_(std::move(outbound)), inbound_(std::move(inbound))
        {
        }

        const Forest &Strategy::getForest(Direction direction) const
        {
            return direction == Direction::OUTBOUND ? outbound_ : inbound_;
        }

        size_t Strategy::maxDepth() const
        {
            return std::max(forestDepth(outbound_), forestDepth(inbound_));
        }

        std::string Strategy::toString() const
        {
            std::string outbound = forestToString(outbound_);
            std::string inbound = forestToString(inbound_);

            std::string result;
            if (!outbound.empty())
                result += outbound + " ";
            result += "\\/";
            if (!inbound.empty())
                result += " " + inbound;
            return result;
        }

    } // namespace Engine
} // namespace Geneva
