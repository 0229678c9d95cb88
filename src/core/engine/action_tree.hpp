// src/core/engine/action_tree.hpp

#ifndef GENEVA_ACTION_TREE_HPP
#define GENEVA_ACTION_TREE_HPP

#include "strategy_types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Geneva
{
    namespace Engine
    {
        /**
         * @brief Field-equality predicate: [protocol:field:value]
         */
        class Trigger
        {
        public:
            Trigger(Protocol protocol, const std::string &field, const std::string &value);

            Protocol getProtocol() const { return protocol_; }
            const std::string &getField() const { return field_; }
            const std::string &getValue() const { return value_; }

            std::string toString() const;

        private:
            Protocol protocol_;
            std::string field_;
            std::string value_;
        };

        /**
         * @brief Base class for all actions
         *
         * Action trees are built once by the parser and never modified.
         * Composite actions own their children.
         */
        class Action
        {
        public:
            virtual ~Action() = default;

            virtual ActionType getType() const = 0;

            /**
             * @brief Canonical text of this action and its children
             */
            virtual std::string toString() const = 0;

            /**
             * @brief Number of composite actions on the longest path from here
             */
            virtual size_t depth() const { return 0; }
        };

        using ActionPtr = std::unique_ptr<Action>;

        class SendAction : public Action
        {
        public:
            ActionType getType() const override { return ActionType::SEND; }
            std::string toString() const override { return "send"; }
        };

        class DropAction : public Action
        {
        public:
            ActionType getType() const override { return ActionType::DROP; }
            std::string toString() const override { return "drop"; }
        };

        /**
         * @brief Action with optional left/right children; absent means send
         */
        class CompositeAction : public Action
        {
        public:
            CompositeAction(ActionPtr left, ActionPtr right);

            /**
             * @brief Child applied to the first copy/fragment (nullptr = send)
             */
            const Action *getLeft() const { return left_.get(); }
            const Action *getRight() const { return right_.get(); }

            size_t depth() const override;

        protected:
            /**
             * @brief "(left,right)" with send children elided, or "" if both are send
             */
            std::string bodyToString() const;

        private:
            ActionPtr left_;
            ActionPtr right_;
        };

        class DuplicateAction : public CompositeAction
        {
        public:
            DuplicateAction(ActionPtr left, ActionPtr right);

            ActionType getType() const override { return ActionType::DUPLICATE; }
            std::string toString() const override;
        };

        class FragmentAction : public CompositeAction
        {
        public:
            FragmentAction(Protocol protocol, uint32_t offset, bool in_order,
                           ActionPtr left, ActionPtr right);

            ActionType getType() const override { return ActionType::FRAGMENT; }
            std::string toString() const override;

            Protocol getProtocol() const { return protocol_; }

            /**
             * @brief Split point, in bytes from the start of the protocol's payload
             */
            uint32_t getOffset() const { return offset_; }
            bool isInOrder() const { return in_order_; }

        private:
            Protocol protocol_;
            uint32_t offset_;
            bool in_order_;
        };

        class TamperAction : public Action
        {
        public:
            TamperAction(Protocol protocol, const std::string &field, TamperMode mode,
                         std::optional<std::string> value);

            ActionType getType() const override { return ActionType::TAMPER; }
            std::string toString() const override;

            Protocol getProtocol() const { return protocol_; }
            const std::string &getField() const { return field_; }
            TamperMode getMode() const { return mode_; }
            const std::optional<std::string> &getValue() const { return value_; }

        private:
            Protocol protocol_;
            std::string field_;
            TamperMode mode_;
            std::optional<std::string> value_;
        };

        /**
         * @brief A trigger and the action run when it matches
         */
        class ActionTree
        {
        public:
            ActionTree(Trigger trigger, ActionPtr action);

            const Trigger &getTrigger() const { return trigger_; }
            const Action &getAction() const { return *action_; }

            size_t depth() const { return action_->depth(); }

            /**
             * @brief "[proto:field:value]-action-|"
             */
            std::string toString() const;

        private:
            Trigger trigger_;
            ActionPtr action_;
        };

        using Forest = std::vector<ActionTree>;

        /**
         * @brief Compiled strategy: one forest per direction
         *
         * Immutable once built; safe to share between threads.
         */
        class Strategy
        {
        public:
            Strategy(Forest outbound, Forest inbound);

            const Forest &getForest(Direction direction) const;
            const Forest &getOutbound() const { return outbound_; }
            const Forest &getInbound() const { return inbound_; }

            size_t treeCount(Direction direction) const { return getForest(direction).size(); }

            bool isEmpty() const { return outbound_.empty() && inbound_.empty(); }

            /**
             * @brief Deepest action tree in either forest
             */
            size_t maxDepth() const;

            /**
             * @brief "outbound-trees \/ inbound-trees"
             */
            std::string toString() const;

        private:
            Forest outbound_;
            Forest inbound_;
        };

    } // namespace Engine
} // namespace Geneva

#endif // GENEVA_ACTION_TREE_HPP
