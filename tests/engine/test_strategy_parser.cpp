// tests/engine/test_strategy_parser.cpp
#include <gtest/gtest.h>
#include "core/engine/strategy_parser.hpp"
#include <string>

using namespace Geneva::Engine;

// ==================== Lexer Tests ====================
class LexerTest : public ::testing::Test
{
protected:
    std::vector<Token::Type> types(const std::string &text)
    {
        Lexer lexer(text);
        std::vector<Token::Type> result;
        for (const auto &token : lexer.tokenize())
        {
            result.push_back(token.type);
        }
        return result;
    }
};

TEST_F(LexerTest, TokenizesActionTree)
{
    using T = Token::Type;
    EXPECT_EQ(types("[TCP:flags:S]-drop-| \\/"),
              (std::vector<T>{T::LBRACKET, T::WORD, T::COLON, T::WORD, T::COLON, T::WORD, T::RBRACKET,
                              T::DASH, T::WORD, T::TREE_END, T::SEPARATOR, T::END}));
}

TEST_F(LexerTest, DashedFieldNameIsOneWord)
{
    Lexer lexer("options-mss-|");
    auto tokens = lexer.tokenize();
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].value, "options-mss");
    EXPECT_EQ(tokens[1].type, Token::Type::TREE_END);
    EXPECT_EQ(tokens[1].position, 11u);
}

TEST_F(LexerTest, StrayBackslashIsSyntaxError)
{
    Lexer lexer("[TCP:flags:S]-drop-| \\ ");
    EXPECT_TRUE(lexer.tokenize().empty());
    ASSERT_TRUE(lexer.hasError());
    EXPECT_EQ(lexer.getError().kind, CompileErrorKind::SYNTAX);
    EXPECT_EQ(lexer.getError().position, 21u);
}

TEST_F(LexerTest, UnexpectedCharacterIsSyntaxError)
{
    Lexer lexer("[TCP:flags:S]-drop-|\t\\/");
    EXPECT_TRUE(lexer.tokenize().empty());
    EXPECT_EQ(lexer.getError().kind, CompileErrorKind::SYNTAX);
    EXPECT_EQ(lexer.getError().position, 20u);
}

// ==================== Parser Tests ====================
class StrategyParserTest : public ::testing::Test
{
protected:
    std::unique_ptr<Strategy> parse(const std::string &text)
    {
        return parser.parse(text);
    }

    Parser parser;
};

TEST_F(StrategyParserTest, EmptyStrategy)
{
    auto strategy = parse("\\/");
    ASSERT_NE(strategy, nullptr);
    EXPECT_TRUE(strategy->isEmpty());
    EXPECT_EQ(strategy->toString(), "\\/");
}

TEST_F(StrategyParserTest, ForestTreeCounts)
{
    auto strategy = parse("[TCP:flags:S]-drop-| [IP:ttl:64]-duplicate-| \\/ [TCP:flags:SA]-send-|");
    ASSERT_NE(strategy, nullptr);
    EXPECT_EQ(strategy->treeCount(Direction::OUTBOUND), 2u);
    EXPECT_EQ(strategy->treeCount(Direction::INBOUND), 1u);
}

TEST_F(StrategyParserTest, ParsesTrigger)
{
    auto strategy = parse("[TCP:flags:PA]-drop-| \\/");
    ASSERT_NE(strategy, nullptr);
    const Trigger &trigger = strategy->getOutbound()[0].getTrigger();
    EXPECT_EQ(trigger.getProtocol(), Protocol::TCP);
    EXPECT_EQ(trigger.getField(), "flags");
    EXPECT_EQ(trigger.getValue(), "PA");
    EXPECT_EQ(strategy->getOutbound()[0].getAction().getType(), ActionType::DROP);
}

TEST_F(StrategyParserTest, ProtocolKeywordIsCaseInsensitive)
{
    auto strategy = parse("[Ip:ttl:64]-tamper{tcp:window:replace:10}-| \\/");
    ASSERT_NE(strategy, nullptr);
    EXPECT_EQ(strategy->toString(), "[ip:ttl:64]-tamper{tcp:window:replace:10}-| \\/");
}

TEST_F(StrategyParserTest, ParsesDuplicateWithBody)
{
    auto strategy = parse("[TCP:flags:PA]-duplicate(tamper{TCP:flags:replace:R},drop)-| \\/");
    ASSERT_NE(strategy, nullptr);

    const auto &action = static_cast<const DuplicateAction &>(strategy->getOutbound()[0].getAction());
    ASSERT_EQ(action.getType(), ActionType::DUPLICATE);
    ASSERT_NE(action.getLeft(), nullptr);
    ASSERT_NE(action.getRight(), nullptr);

    const auto *tamper = static_cast<const TamperAction *>(action.getLeft());
    EXPECT_EQ(tamper->getProtocol(), Protocol::TCP);
    EXPECT_EQ(tamper->getField(), "flags");
    EXPECT_EQ(tamper->getMode(), TamperMode::REPLACE);
    ASSERT_TRUE(tamper->getValue().has_value());
    EXPECT_EQ(*tamper->getValue(), "R");
    EXPECT_EQ(action.getRight()->getType(), ActionType::DROP);
}

TEST_F(StrategyParserTest, OmittedSubActionsAreNull)
{
    auto strategy = parse("[TCP:flags:S]-duplicate(,drop)-| [TCP:flags:A]-duplicate(drop,)-| "
                          "[TCP:flags:R]-duplicate(,)-| \\/");
    ASSERT_NE(strategy, nullptr);

    const auto &first = static_cast<const CompositeAction &>(strategy->getOutbound()[0].getAction());
    EXPECT_EQ(first.getLeft(), nullptr);
    EXPECT_NE(first.getRight(), nullptr);

    const auto &second = static_cast<const CompositeAction &>(strategy->getOutbound()[1].getAction());
    EXPECT_NE(second.getLeft(), nullptr);
    EXPECT_EQ(second.getRight(), nullptr);

    const auto &third = static_cast<const CompositeAction &>(strategy->getOutbound()[2].getAction());
    EXPECT_EQ(third.getLeft(), nullptr);
    EXPECT_EQ(third.getRight(), nullptr);
}

TEST_F(StrategyParserTest, ParsesFragment)
{
    auto strategy = parse("[TCP:flags:PA]-fragment{tcp:8:False}(send,tamper{IP:ttl:corrupt})-| \\/");
    ASSERT_NE(strategy, nullptr);

    const auto &fragment = static_cast<const FragmentAction &>(strategy->getOutbound()[0].getAction());
    ASSERT_EQ(fragment.getType(), ActionType::FRAGMENT);
    EXPECT_EQ(fragment.getProtocol(), Protocol::TCP);
    EXPECT_EQ(fragment.getOffset(), 8u);
    EXPECT_FALSE(fragment.isInOrder());
    EXPECT_EQ(fragment.toString(), "fragment{tcp:8:False}(,tamper{ip:ttl:corrupt})");
}

TEST_F(StrategyParserTest, FragmentOffsetLimits)
{
    EXPECT_NE(parse("[TCP:flags:S]-fragment{ip:4294967295:True}-| \\/"), nullptr);

    EXPECT_EQ(parse("[TCP:flags:S]-fragment{ip:4294967296:True}-| \\/"), nullptr);
    EXPECT_EQ(parser.getError().kind, CompileErrorKind::PARSE);
    EXPECT_EQ(parser.getError().expected, "offset");

    EXPECT_EQ(parse("[TCP:flags:S]-fragment{ip:abc:True}-| \\/"), nullptr);
}

TEST_F(StrategyParserTest, FragmentBooleanIsCaseSensitive)
{
    EXPECT_EQ(parse("[TCP:flags:S]-fragment{tcp:8:true}-| \\/"), nullptr);
    EXPECT_EQ(parser.getError().expected, "'True' or 'False'");
}

TEST_F(StrategyParserTest, DeeplyNestedActions)
{
    std::string nested = "drop";
    for (int i = 0; i < 20; ++i)
    {
        nested = "duplicate(" + nested + ",)";
    }
    auto strategy = parse("[TCP:flags:S]-" + nested + "-| \\/");
    ASSERT_NE(strategy, nullptr);
    EXPECT_EQ(strategy->maxDepth(), 20u);
}

TEST_F(StrategyParserTest, NestingGuardStopsRunawayInput)
{
    std::string nested = "drop";
    for (size_t i = 0; i <= Parser::MAX_NESTING; ++i)
    {
        nested = "duplicate(" + nested + ",)";
    }
    EXPECT_EQ(parse("[TCP:flags:S]-" + nested + "-| \\/"), nullptr);
    EXPECT_EQ(parser.getError().kind, CompileErrorKind::PARSE);
}

// ==================== Parse Error Tests ====================
TEST_F(StrategyParserTest, SeparatorIsMandatory)
{
    EXPECT_EQ(parse("[TCP:flags:S]-drop-|"), nullptr);
    EXPECT_EQ(parser.getError().kind, CompileErrorKind::PARSE);
    EXPECT_NE(parser.getError().message.find("separator"), std::string::npos);

    EXPECT_EQ(parse(""), nullptr);
}

TEST_F(StrategyParserTest, SecondSeparatorIsRejected)
{
    EXPECT_EQ(parse("\\/ \\/"), nullptr);
    EXPECT_EQ(parser.getError().message, "More than one forest separator");
    EXPECT_EQ(parser.getError().position, 3u);
}

TEST_F(StrategyParserTest, GrammarViolations)
{
    const char *invalid[] = {
        "[TCP:flags:S]drop-| \\/",         // missing '-'
        "[TCP:flags:S]-drop \\/",          // missing '-|'
        "[TCP:flags]-drop-| \\/",          // missing value
        "[UDP:sport:53]-drop-| \\/",       // unknown protocol
        "[TCP:flags:S]-explode-| \\/",     // unknown action
        "[TCP:flags:S]-tamper{TCP:flags:flip:R}-| \\/",
        "[TCP:flags:S]-tamper{TCP:flags:replace:R}(drop,)-| \\/",
        "[TCP:flags:S]-duplicate(drop)-| \\/",
        "[TCP:flags:S]-duplicate(drop,drop,drop)-| \\/",
        "[TCP:flags:S]-fragment(drop,)-| \\/",
        "[TCP:flags:S-A]-drop-| \\/",
    };

    for (const char *text : invalid)
    {
        EXPECT_EQ(parse(text), nullptr) << text;
        EXPECT_EQ(parser.getError().kind, CompileErrorKind::PARSE) << text;
        EXPECT_NE(parser.getError().position, CompileError::NO_POSITION) << text;
    }
}

TEST_F(StrategyParserTest, ErrorReportsPositionAndExpectation)
{
    EXPECT_EQ(parse("[TCP:flags:S]-drop \\/"), nullptr);
    const CompileError &error = parser.getError();
    EXPECT_EQ(error.position, 19u);
    EXPECT_EQ(error.expected, "'-|'");
    EXPECT_NE(error.toString().find("Parse error at position 19"), std::string::npos);
}

TEST_F(StrategyParserTest, ValidateHelper)
{
    std::string error;
    EXPECT_TRUE(Parser::validate("\\/ [TCP:flags:SA]-drop-|", error));
    EXPECT_FALSE(Parser::validate("[TCP:flags:SA]-drop-|", error));
    EXPECT_FALSE(error.empty());
}

TEST_F(StrategyParserTest, ParserIsReusable)
{
    EXPECT_EQ(parse("garbage"), nullptr);
    EXPECT_TRUE(parser.getError().hasError());

    EXPECT_NE(parse("\\/"), nullptr);
    EXPECT_FALSE(parser.getError().hasError());
}

// ==================== Canonical Form Tests ====================
class CanonicalFormTest : public ::testing::TestWithParam<std::pair<std::string, std::string>>
{
};

TEST_P(CanonicalFormTest, PrintsCanonicalText)
{
    Parser parser;
    auto strategy = parser.parse(GetParam().first);
    ASSERT_NE(strategy, nullptr) << parser.getError().toString();
    EXPECT_EQ(strategy->toString(), GetParam().second);

    // Canonical text parses back to itself
    auto again = parser.parse(strategy->toString());
    ASSERT_NE(again, nullptr);
    EXPECT_EQ(again->toString(), strategy->toString());
}

INSTANTIATE_TEST_SUITE_P(
    PublishedStrategies, CanonicalFormTest,
    ::testing::Values(
        std::make_pair(std::string("[TCP:flags:PA]-duplicate(tamper{TCP:dataofs:replace:10},tamper{TCP:chksum:corrupt})-| \\/"),
                       std::string("[tcp:flags:PA]-duplicate(tamper{tcp:dataofs:replace:10},tamper{tcp:chksum:corrupt})-| \\/")),
        std::make_pair(std::string("[TCP:flags:S]-duplicate(send,send)-| \\/"),
                       std::string("[tcp:flags:S]-duplicate-| \\/")),
        std::make_pair(std::string("[TCP:flags:PA]-duplicate(send,drop)-|   \\/"),
                       std::string("[tcp:flags:PA]-duplicate(,drop)-| \\/")),
        std::make_pair(std::string("\\/ [TCP:flags:SA]-tamper{TCP:flags:replace:R}-|"),
                       std::string("\\/ [tcp:flags:SA]-tamper{tcp:flags:replace:R}-|")),
        std::make_pair(std::string("[TCP:flags:PA]-fragment{tcp:8:False}-| [TCP:flags:A]-send-| \\/"),
                       std::string("[tcp:flags:PA]-fragment{tcp:8:False}-| [tcp:flags:A]-send-| \\/")),
        std::make_pair(std::string("[IP:ttl:64]-fragment{ip:16:True}(drop,send)-| \\/ [IP:ttl:1]-drop-|"),
                       std::string("[ip:ttl:64]-fragment{ip:16:True}(drop,)-| \\/ [ip:ttl:1]-drop-|"))));
