// src/core/engine/strategy_parser.cpp

#include "strategy_parser.hpp"
#include "common/utils.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace Geneva
{
    namespace Engine
    {
        namespace
        {
            /**
             * @brief Unwinds the parser after fail() has recorded the error
             */
            class ParseAbort : public std::runtime_error
            {
            public:
                explicit ParseAbort(const std::string& message)
                    : std::runtime_error(message) {}
            };

            bool isAlnum(char c)
            {
                return std::isalnum(static_cast<unsigned char>(c)) != 0;
            }

            bool isValueLiteral(const std::string& text)
            {
                if (text.empty())
                {
                    return false;
                }
                for (char c : text)
                {
                    if (!isAlnum(c))
                    {
                        return false;
                    }
                }
                return true;
            }

            std::string describe(const Token& token)
            {
                if (token.type == Token::Type::END)
                {
                    return "end of input";
                }
                return "'" + token.value + "'";
            }

            /**
             * @brief Tracks recursion depth of parseAction()
             */
            class NestingGuard
            {
            public:
                explicit NestingGuard(size_t& nesting) : nesting_(nesting) { ++nesting_; }
                ~NestingGuard() { --nesting_; }

                NestingGuard(const NestingGuard&) = delete;
                NestingGuard& operator=(const NestingGuard&) = delete;

            private:
                size_t& nesting_;
            };
        }

        std::string Token::typeToString(Type type)
        {
            switch (type)
            {
            case Type::WORD:
                return "word";
            case Type::LBRACKET:
                return "'['";
            case Type::RBRACKET:
                return "']'";
            case Type::LPAREN:
                return "'('";
            case Type::RPAREN:
                return "')'";
            case Type::LBRACE:
                return "'{'";
            case Type::RBRACE:
                return "'}'";
            case Type::COMMA:
                return "','";
            case Type::COLON:
                return "':'";
            case Type::DASH:
                return "'-'";
            case Type::TREE_END:
                return "'-|'";
            case Type::SEPARATOR:
                return "'\\/'";
            case Type::END:
                return "end of input";
            }
            return "unknown";
        }

        // ==================== Lexer Implementation ====================

        Lexer::Lexer(const std::string& input)
            : input_(input), pos_(0)
        {
        }

        std::vector<Token> Lexer::tokenize()
        {
            std::vector<Token> tokens;

            while (!isAtEnd())
            {
                char c = peek();
                size_t start_pos = pos_;

                if (c == ' ')
                {
                    advance();
                    continue;
                }

                switch (c)
                {
                case '[':
                    advance();
                    tokens.emplace_back(Token::Type::LBRACKET, "[", start_pos);
                    continue;
                case ']':
                    advance();
                    tokens.emplace_back(Token::Type::RBRACKET, "]", start_pos);
                    continue;
                case '(':
                    advance();
                    tokens.emplace_back(Token::Type::LPAREN, "(", start_pos);
                    continue;
                case ')':
                    advance();
                    tokens.emplace_back(Token::Type::RPAREN, ")", start_pos);
                    continue;
                case '{':
                    advance();
                    tokens.emplace_back(Token::Type::LBRACE, "{", start_pos);
                    continue;
                case '}':
                    advance();
                    tokens.emplace_back(Token::Type::RBRACE, "}", start_pos);
                    continue;
                case ',':
                    advance();
                    tokens.emplace_back(Token::Type::COMMA, ",", start_pos);
                    continue;
                case ':':
                    advance();
                    tokens.emplace_back(Token::Type::COLON, ":", start_pos);
                    continue;
                case '-':
                    advance();
                    if (peek() == '|')
                    {
                        advance();
                        tokens.emplace_back(Token::Type::TREE_END, "-|", start_pos);
                    }
                    else
                    {
                        tokens.emplace_back(Token::Type::DASH, "-", start_pos);
                    }
                    continue;
                case '\\':
                    if (peekNext() != '/')
                    {
                        setError(start_pos, "'\\/'", "Stray backslash");
                        return {};
                    }
                    advance();
                    advance();
                    tokens.emplace_back(Token::Type::SEPARATOR, "\\/", start_pos);
                    continue;
                default:
                    break;
                }

                if (isAlnum(c))
                {
                    tokens.push_back(readWord());
                    continue;
                }

                std::string shown = std::isprint(static_cast<unsigned char>(c))
                                        ? std::string(1, c)
                                        : "\\x" + Common::Utils::bytesToHex(&c, 1);
                setError(start_pos, "", "Unexpected character '" + shown + "'");
                return {};
            }

            tokens.emplace_back(Token::Type::END, "", pos_);
            return tokens;
        }

        char Lexer::peek() const
        {
            return isAtEnd() ? '\0' : input_[pos_];
        }

        char Lexer::peekNext() const
        {
            return pos_ + 1 < input_.length() ? input_[pos_ + 1] : '\0';
        }

        char Lexer::advance()
        {
            return input_[pos_++];
        }

        bool Lexer::isAtEnd() const
        {
            return pos_ >= input_.length();
        }

        Token Lexer::readWord()
        {
            size_t start = pos_;

            while (!isAtEnd())
            {
                if (isAlnum(peek()))
                {
                    advance();
                }
                else if (peek() == '-' && isAlnum(peekNext()))
                {
                    advance();
                }
                else
                {
                    break;
                }
            }

            return Token(Token::Type::WORD, input_.substr(start, pos_ - start), start);
        }

        void Lexer::setError(size_t position, const std::string& expected, const std::string& message)
        {
            error_.kind = CompileErrorKind::SYNTAX;
            error_.position = position;
            error_.expected = expected;
            error_.message = message;
            spdlog::error(error_.toString());
        }

        // ==================== Parser Implementation ====================

        Parser::Parser()
            : pos_(0), nesting_(0)
        {
        }

        std::unique_ptr<Strategy> Parser::parse(const std::string& text)
        {
            error_ = CompileError();
            pos_ = 0;
            nesting_ = 0;

            Lexer lexer(text);
            tokens_ = lexer.tokenize();

            if (lexer.hasError())
            {
                error_ = lexer.getError();
                return nullptr;
            }

            try
            {
                return parseStrategy();
            }
            catch (const ParseAbort&)
            {
                return nullptr;
            }
        }

        bool Parser::validate(const std::string& text, std::string& error)
        {
            Parser parser;
            auto strategy = parser.parse(text);

            if (!strategy)
            {
                error = parser.getError().toString();
                return false;
            }

            return true;
        }

        const Token& Parser::current() const
        {
            if (pos_ >= tokens_.size())
            {
                return tokens_.back(); // END token
            }
            return tokens_[pos_];
        }

        Token Parser::advance()
        {
            if (pos_ < tokens_.size())
            {
                return tokens_[pos_++];
            }
            return tokens_.back();
        }

        bool Parser::match(Token::Type type)
        {
            if (check(type))
            {
                advance();
                return true;
            }
            return false;
        }

        bool Parser::check(Token::Type type) const
        {
            return current().type == type;
        }

        bool Parser::isAtEnd() const
        {
            return current().type == Token::Type::END;
        }

        Token Parser::expect(Token::Type type, const std::string& expected)
        {
            if (!check(type))
            {
                fail(expected, "Unexpected " + describe(current()));
            }
            return advance();
        }

        std::string Parser::expectWord(const std::string& expected)
        {
            if (!check(Token::Type::WORD))
            {
                fail(expected, "Unexpected " + describe(current()));
            }
            return advance().value;
        }

        void Parser::fail(const std::string& expected, const std::string& message)
        {
            error_.kind = CompileErrorKind::PARSE;
            error_.position = current().position;
            error_.expected = expected;
            error_.node.clear();
            error_.message = message;
            spdlog::error(error_.toString());
            throw ParseAbort(message);
        }

        // ==================== Strategy Parsing ====================

        std::unique_ptr<Strategy> Parser::parseStrategy()
        {
            Forest outbound = parseForest();

            if (!match(Token::Type::SEPARATOR))
            {
                fail("'[' or '\\/'", "Missing forest separator, got " + describe(current()));
            }

            Forest inbound = parseForest();

            if (!isAtEnd())
            {
                if (check(Token::Type::SEPARATOR))
                {
                    fail("'[' or end of input", "More than one forest separator");
                }
                fail("'[' or end of input", "Unexpected " + describe(current()) + " after inbound forest");
            }

            return std::make_unique<Strategy>(std::move(outbound), std::move(inbound));
        }

        Forest Parser::parseForest()
        {
            Forest forest;
            while (check(Token::Type::LBRACKET))
            {
                forest.push_back(parseActionTree());
            }
            return forest;
        }

        ActionTree Parser::parseActionTree()
        {
            Trigger trigger = parseTrigger();
            expect(Token::Type::DASH, "'-'");
            ActionPtr action = parseAction();
            expect(Token::Type::TREE_END, "'-|'");
            return ActionTree(std::move(trigger), std::move(action));
        }

        Trigger Parser::parseTrigger()
        {
            expect(Token::Type::LBRACKET, "'['");
            Protocol protocol = parseProtocolKeyword();
            expect(Token::Type::COLON, "':'");
            std::string field = expectWord("field name");
            expect(Token::Type::COLON, "':'");
            std::string value = parseValueLiteral("trigger value");
            expect(Token::Type::RBRACKET, "']'");
            return Trigger(protocol, field, value);
        }

        ActionPtr Parser::parseAction()
        {
            NestingGuard guard(nesting_);
            if (nesting_ > MAX_NESTING)
            {
                fail("action", "Actions nested too deeply");
            }

            if (!check(Token::Type::WORD))
            {
                fail("action", "Unexpected " + describe(current()));
            }

            const std::string keyword = current().value;

            if (keyword == "send")
            {
                advance();
                return std::make_unique<SendAction>();
            }
            if (keyword == "drop")
            {
                advance();
                return std::make_unique<DropAction>();
            }
            if (keyword == "duplicate")
            {
                return parseDuplicate();
            }
            if (keyword == "fragment")
            {
                return parseFragment();
            }
            if (keyword == "tamper")
            {
                return parseTamper();
            }

            fail("action", "Unknown action '" + keyword + "'");
        }

        ActionPtr Parser::parseDuplicate()
        {
            advance(); // 'duplicate'

            ActionPtr left;
            ActionPtr right;
            parseRuleBody(left, right);
            return std::make_unique<DuplicateAction>(std::move(left), std::move(right));
        }

        ActionPtr Parser::parseFragment()
        {
            advance(); // 'fragment'

            expect(Token::Type::LBRACE, "'{'");
            Protocol protocol = parseProtocolKeyword();
            expect(Token::Type::COLON, "':'");

            if (!check(Token::Type::WORD))
            {
                fail("offset", "Unexpected " + describe(current()));
            }
            uint64_t offset = 0;
            if (!Common::Utils::parseUnsigned(current().value, offset) ||
                offset > std::numeric_limits<uint32_t>::max())
            {
                fail("offset", "Invalid fragment offset '" + current().value + "'");
            }
            advance();

            expect(Token::Type::COLON, "':'");

            if (!check(Token::Type::WORD) ||
                (current().value != "True" && current().value != "False"))
            {
                fail("'True' or 'False'", "Unexpected " + describe(current()));
            }
            bool in_order = advance().value == "True";

            expect(Token::Type::RBRACE, "'}'");

            ActionPtr left;
            ActionPtr right;
            parseRuleBody(left, right);
            return std::make_unique<FragmentAction>(protocol, static_cast<uint32_t>(offset), in_order,
                                                    std::move(left), std::move(right));
        }

        ActionPtr Parser::parseTamper()
        {
            advance(); // 'tamper'

            expect(Token::Type::LBRACE, "'{'");
            Protocol protocol = parseProtocolKeyword();
            expect(Token::Type::COLON, "':'");
            std::string field = expectWord("field name");
            expect(Token::Type::COLON, "':'");

            if (!check(Token::Type::WORD))
            {
                fail("tamper mode", "Unexpected " + describe(current()));
            }
            TamperMode mode;
            if (!parseTamperMode(current().value, mode))
            {
                fail("'replace', 'corrupt' or 'add'", "Unknown tamper mode '" + current().value + "'");
            }
            advance();

            // Presence against the mode is checked by the validator
            std::optional<std::string> value;
            if (match(Token::Type::COLON))
            {
                value = parseValueLiteral("tamper value");
            }

            expect(Token::Type::RBRACE, "'}'");
            return std::make_unique<TamperAction>(protocol, field, mode, std::move(value));
        }

        void Parser::parseRuleBody(ActionPtr& left, ActionPtr& right)
        {
            if (!match(Token::Type::LPAREN))
            {
                return;
            }

            if (!check(Token::Type::COMMA))
            {
                left = parseAction();
            }
            expect(Token::Type::COMMA, "','");

            if (!check(Token::Type::RPAREN))
            {
                right = parseAction();
            }
            expect(Token::Type::RPAREN, "')'");
        }

        Protocol Parser::parseProtocolKeyword()
        {
            if (!check(Token::Type::WORD))
            {
                fail("protocol", "Unexpected " + describe(current()));
            }

            Protocol protocol;
            if (!parseProtocol(current().value, protocol))
            {
                fail("'tcp' or 'ip'", "Unknown protocol '" + current().value + "'");
            }
            advance();
            return protocol;
        }

        std::string Parser::parseValueLiteral(const std::string& expected)
        {
            if (!check(Token::Type::WORD))
            {
                fail(expected, "Unexpected " + describe(current()));
            }
            if (!isValueLiteral(current().value))
            {
                fail(expected, "Value '" + current().value + "' may only contain letters and digits");
            }
            return advance().value;
        }

    } // namespace Engine
} // namespace Geneva
