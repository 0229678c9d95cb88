// src/core/engine/strategy_parser.hpp

#ifndef GENEVA_STRATEGY_PARSER_HPP
#define GENEVA_STRATEGY_PARSER_HPP

#include "action_tree.hpp"
#include "strategy_types.hpp"
#include <string>
#include <vector>
#include <memory>

namespace Geneva
{
    namespace Engine
    {
        /**
         * @brief Token for lexical analysis
         */
        struct Token
        {
            enum class Type
            {
                WORD,      // keywords, fields, values, offsets
                LBRACKET,  // [
                RBRACKET,  // ]
                LPAREN,    // (
                RPAREN,    // )
                LBRACE,    // {
                RBRACE,    // }
                COMMA,     // ,
                COLON,     // :
                DASH,      // -
                TREE_END,  // -|
                SEPARATOR, // \/
                END        // End of input
            };

            Type type;
            std::string value;
            size_t position;

            Token(Type t = Type::END, const std::string& v = "", size_t p = 0)
                : type(t), value(v), position(p) {}

            static std::string typeToString(Type type);
        };

        /**
         * @brief Lexer for strategy text
         *
         * Only spaces are skipped. A word is a run of letters and digits,
         * optionally joined by single hyphens ("options-mss"); a hyphen not
         * followed by a letter or digit is punctuation.
         */
        class Lexer
        {
        public:
            explicit Lexer(const std::string& input);

            /**
             * @brief Tokenize input string
             * @return Tokens ending with END, or empty on error
             */
            std::vector<Token> tokenize();

            bool hasError() const { return error_.hasError(); }
            const CompileError& getError() const { return error_; }

        private:
            std::string input_;
            size_t pos_;
            CompileError error_;

            char peek() const;
            char peekNext() const;
            char advance();
            bool isAtEnd() const;

            Token readWord();

            void setError(size_t position, const std::string& expected, const std::string& message);
        };

        /**
         * @brief Recursive-descent parser producing an (unvalidated) Strategy
         */
        class Parser
        {
        public:
            /**
             * @brief Deepest action nesting the parser will follow
             */
            static constexpr size_t MAX_NESTING = 256;

            Parser();

            /**
             * @brief Parse strategy text
             * @return Strategy, or nullptr with getError() describing the failure
             */
            std::unique_ptr<Strategy> parse(const std::string& text);

            const CompileError& getError() const { return error_; }

            /**
             * @brief Check syntax only
             */
            static bool validate(const std::string& text, std::string& error);

        private:
            std::vector<Token> tokens_;
            size_t pos_;
            size_t nesting_;
            CompileError error_;

            const Token& current() const;
            Token advance();
            bool match(Token::Type type);
            bool check(Token::Type type) const;
            bool isAtEnd() const;

            Token expect(Token::Type type, const std::string& expected);
            std::string expectWord(const std::string& expected);

            // Recursive descent parsing
            std::unique_ptr<Strategy> parseStrategy();
            Forest parseForest();
            ActionTree parseActionTree();
            Trigger parseTrigger();
            ActionPtr parseAction();
            ActionPtr parseDuplicate();
            ActionPtr parseFragment();
            ActionPtr parseTamper();
            void parseRuleBody(ActionPtr& left, ActionPtr& right);

            Protocol parseProtocolKeyword();
            std::string parseValueLiteral(const std::string& expected);

            /**
             * @brief Record a parse error at the current token and abort
             */
            [[noreturn]] void fail(const std::string& expected, const std::string& message);
        };

    } // namespace Engine
} // namespace Geneva

#endif // GENEVA_STRATEGY_PARSER_HPP
