#include <array>
#include <string>
#include <string_view>
#include <utility>

#include <ast/assign_expression.hpp>
#include <ast/binary_expression.hpp>
#include <ast/literal_expression.hpp>
#include <ast/logical_expression.hpp>
#include <ast/statements.hpp>
#include <ast/variable_expression.hpp>
#include <gtest/gtest.h>
#include <lexer/lexer.hpp>
#include <parser/parser.hpp>

#include "testutils.hpp"

namespace
{
struct error_test
{
    std::string_view input;
    std::string_view expected_message;
    std::size_t expected_line;
};

auto parse_with_errors(std::string_view input) -> parsed_program
{
    auto prsr = parser {lexer {input}};
    auto prgrm = prsr.parse_program();
    EXPECT_FALSE(prsr.errors().empty()) << "expected errors while parsing `" << input << "`";
    return {std::move(prgrm), std::move(prsr)};
}
}  // namespace

TEST(parsing, testOperatorPrecedenceParsing)
{
    struct test
    {
        std::string_view input;
        std::string_view expected;
    };

    const std::array tests {
        test {"-a * b;", "((-a) * b);"},
        test {"!-a;", "(!(-a));"},
        test {"!!true;", "(!(!true));"},
        test {"a + b - c;", "((a + b) - c);"},
        test {"a * b / c;", "((a * b) / c);"},
        test {"a + b * c;", "(a + (b * c));"},
        test {"a + b / c - d;", "((a + (b / c)) - d);"},
        test {"a == b != c;", "((a == b) != c);"},
        test {"a < b == c >= d;", "((a < b) == (c >= d));"},
        test {"1 + 2 > 3 - 4;", "((1 + 2) > (3 - 4));"},
        test {"3 <= 4 != 5 > 6;", "((3 <= 4) != (5 > 6));"},
        test {"!true == false;", "((!true) == false);"},
        test {"a or b and c;", "(a or (b and c));"},
        test {"a and b or c and d;", "((a and b) or (c and d));"},
        test {"a or b or c;", "((a or b) or c);"},
        test {"a == b and c;", "((a == b) and c);"},
        test {"a = b = c;", "(a = (b = c));"},
        test {"a = b or c;", "(a = (b or c));"},
        test {"(1 + 2) * 3;", "((group (1 + 2)) * 3);"},
        test {"-(5 + 5);", "(-(group (5 + 5)));"},
        test {"((a));", "(group (group a));"},
        test {R"("a" + "b";)", R"(("a" + "b");)"},
        test {"nil;", "nil;"},
        test {"1.5 * 2;", "(1.5 * 2);"},
    };

    for (const auto& [input, expected] : tests) {
        const auto [prgrm, _] = assert_program(input);
        EXPECT_EQ(prgrm->string(), expected) << "while parsing `" << input << "`";
    }
}

TEST(parsing, testStatementRendering)
{
    struct test
    {
        std::string_view input;
        std::string_view expected;
    };

    const std::array tests {
        test {"var x;", "var x;"},
        test {"var x = 1 + 2;", "var x = (1 + 2);"},
        test {"print x;", "print x;"},
        test {R"(print "hi";)", R"(print "hi";)"},
        test {"{}", "{ }"},
        test {"{ var a = 1; print a; }", "{ var a = 1; print a; }"},
        test {"{ { } }", "{ { } }"},
        test {"if (a) print 1;", "if a print 1;"},
        test {"if (a) print 1; else print 2;", "if a print 1; else print 2;"},
        test {"while (x < 3) x = x + 1;", "while (x < 3) (x = (x + 1));"},
        test {"while (true) { }", "while true { }"},
        test {"var a = 1;\nprint a;\na = 2;", "var a = 1;\nprint a;\n(a = 2);"},
        test {"", ""},
    };

    for (const auto& [input, expected] : tests) {
        const auto [prgrm, _] = assert_program(input);
        EXPECT_EQ(prgrm->string(), expected) << "while parsing `" << input << "`";
    }
}

TEST(parsing, testVarStatement)
{
    const auto [prgrm, _] = assert_program("var answer = 42; var empty;");
    ASSERT_EQ(prgrm->statements.size(), 2);

    const auto* with_init = dynamic_cast<const var_statement*>(prgrm->statements[0].get());
    ASSERT_TRUE(with_init);
    EXPECT_EQ(with_init->name, "answer");
    const auto* literal = dynamic_cast<const literal_expression*>(with_init->initializer.get());
    ASSERT_TRUE(literal);
    EXPECT_EQ(literal->value, object {42.0});

    const auto* without_init = dynamic_cast<const var_statement*>(prgrm->statements[1].get());
    ASSERT_TRUE(without_init);
    EXPECT_EQ(without_init->name, "empty");
    EXPECT_EQ(without_init->initializer.get(), nullptr);
}

TEST(parsing, testAssignmentTargetsAVariable)
{
    const auto [prgrm, _] = assert_program("a = 1;");
    ASSERT_EQ(prgrm->statements.size(), 1);
    const auto* stmt = dynamic_cast<const expression_statement*>(prgrm->statements[0].get());
    ASSERT_TRUE(stmt);
    const auto* assign = dynamic_cast<const assign_expression*>(stmt->expr.get());
    ASSERT_TRUE(assign);
    EXPECT_EQ(assign->name, "a");
    EXPECT_EQ(assign->loc().column, 1);
}

TEST(parsing, testLogicalOperatorsBuildLogicalNodes)
{
    const auto [prgrm, _] = assert_program("a and b; a + b;");
    ASSERT_EQ(prgrm->statements.size(), 2);
    const auto* first = dynamic_cast<const expression_statement*>(prgrm->statements[0].get());
    const auto* second = dynamic_cast<const expression_statement*>(prgrm->statements[1].get());
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_TRUE(dynamic_cast<const logical_expression*>(first->expr.get()));
    EXPECT_TRUE(dynamic_cast<const binary_expression*>(second->expr.get()));
}

TEST(parsing, testDanglingElseBindsToNearestIf)
{
    const auto [prgrm, _] = assert_program("if (a) if (b) print 1; else print 2;");
    ASSERT_EQ(prgrm->statements.size(), 1);
    const auto* outer = dynamic_cast<const if_statement*>(prgrm->statements[0].get());
    ASSERT_TRUE(outer);
    EXPECT_EQ(outer->alternative.get(), nullptr);
    const auto* inner = dynamic_cast<const if_statement*>(outer->consequence.get());
    ASSERT_TRUE(inner);
    ASSERT_NE(inner->alternative.get(), nullptr);
    EXPECT_EQ(inner->alternative->string(), "print 2;");
}

TEST(parsing, testForLoopDesugaring)
{
    struct test
    {
        std::string_view input;
        std::string_view expected;
    };

    const std::array tests {
        test {"for (var i = 0; i < 3; i = i + 1) print i;",
              "{ var i = 0; while (i < 3) { print i; (i = (i + 1)); } }"},
        test {"for (;;) print 1;", "{ while true print 1; }"},
        test {"for (x = 0; x < 1;) { print x; }", "{ (x = 0); while (x < 1) { print x; } }"},
        test {"for (; a; a = a - 1) { }", "{ while a { { } (a = (a - 1)); } }"},
    };

    for (const auto& [input, expected] : tests) {
        const auto [prgrm, _] = assert_program(input);
        EXPECT_EQ(prgrm->string(), expected) << "while parsing `" << input << "`";
    }

    const auto [prgrm, _] = assert_program("for (;;) print 1;");
    const auto* block = dynamic_cast<const block_statement*>(prgrm->statements[0].get());
    ASSERT_TRUE(block);
    ASSERT_EQ(block->statements.size(), 1);
    const auto* loop = dynamic_cast<const while_statement*>(block->statements[0].get());
    ASSERT_TRUE(loop);
    const auto* condition = dynamic_cast<const literal_expression*>(loop->condition.get());
    ASSERT_TRUE(condition);
    EXPECT_EQ(condition->value, object {true});
}

TEST(parsing, testSyntaxErrors)
{
    const std::array tests {
        error_test {"print (1 + 2;", "expected ')' after expression, got ; instead", 1},
        error_test {"var = 1;", "expected variable name, got = instead", 1},
        error_test {"var x = 1", "expected ';' after variable declaration, got eof instead", 1},
        error_test {"print 1\n", "expected ';' after value, got eof instead", 2},
        error_test {"1 + ;", "expected expression, got ; instead", 1},
        error_test {"\n\nif x) print 1;", "expected '(' after 'if', got identifier instead", 3},
        error_test {"if (x print 1;", "expected ')' after if condition, got print instead", 1},
        error_test {"while x", "expected '(' after 'while', got identifier instead", 1},
        error_test {"while (x print 1;", "expected ')' after condition, got print instead", 1},
        error_test {"for ;;) {}", "expected '(' after 'for', got ; instead", 1},
        error_test {"for (;; i = i + 1 print 1;", "expected ')' after for clauses, got print instead", 1},
        error_test {"for (; x) print 1;", "expected ';' after loop condition, got ) instead", 1},
        error_test {"{ print 1;", "expected '}' after block, got eof instead", 1},
        error_test {"1 + 2 = 3;", "invalid assignment target", 1},
        error_test {"(a) = 3;", "invalid assignment target", 1},
        error_test {"while (true) var x = 1;",
                    "loop body must be a block, print or expression statement, got var instead",
                    1},
        error_test {"while (true) while (false) print 1;",
                    "loop body must be a block, print or expression statement, got while instead",
                    1},
        error_test {"for (;;) if (x) print 1;",
                    "loop body must be a block, print or expression statement, got if instead",
                    1},
        error_test {"for (;;) for (;;) print 1;",
                    "loop body must be a block, print or expression statement, got for instead",
                    1},
    };

    for (const auto& [input, expected_message, expected_line] : tests) {
        const auto [prgrm, prsr] = parse_with_errors(input);
        ASSERT_FALSE(prsr.errors().empty());
        EXPECT_EQ(prsr.errors()[0].message, expected_message) << "while parsing `" << input << "`";
        EXPECT_EQ(prsr.errors()[0].loc.line, expected_line) << "while parsing `" << input << "`";
    }
}

TEST(parsing, testInvalidAssignmentKeepsTheStatement)
{
    const auto [prgrm, prsr] = parse_with_errors("1 + 2 = 3; print 4;");
    ASSERT_EQ(prsr.errors().size(), 1);
    ASSERT_EQ(prgrm->statements.size(), 2);
    EXPECT_EQ(prgrm->statements[0]->string(), "(1 + 2);");
    EXPECT_EQ(prgrm->statements[1]->string(), "print 4;");
}

TEST(parsing, testRecoversAfterEachError)
{
    const auto [prgrm, prsr] = parse_with_errors("var = 1;\nprint 2 3;\nprint 4;");
    ASSERT_EQ(prsr.errors().size(), 2);
    EXPECT_EQ(prsr.errors()[0].string(), "[line 1] Error: expected variable name, got = instead");
    EXPECT_EQ(prsr.errors()[1].string(), "[line 2] Error: expected ';' after value, got number instead");
    ASSERT_EQ(prgrm->statements.size(), 1);
    EXPECT_EQ(prgrm->statements[0]->string(), "print 4;");
}

TEST(parsing, testRecoversInsideBlock)
{
    const auto [prgrm, prsr] = parse_with_errors("{ print 1 print 2; }\nprint 3;");
    ASSERT_EQ(prsr.errors().size(), 1);
    EXPECT_EQ(prsr.errors()[0].message, "expected ';' after value, got print instead");
    ASSERT_EQ(prgrm->statements.size(), 2);
    EXPECT_EQ(prgrm->statements[0]->string(), "{ print 2; }");
    EXPECT_EQ(prgrm->statements[1]->string(), "print 3;");
}

TEST(parsing, testErrorAtStatementKeywordKeepsThatStatement)
{
    const auto [prgrm, prsr] = parse_with_errors("print 1\nprint (;\nvar a = 1\nwhile (a) a = a - 1;\nvar = 2;");
    ASSERT_EQ(prsr.errors().size(), 4);
    EXPECT_EQ(prsr.errors()[0].string(), "[line 2] Error: expected ';' after value, got print instead");
    EXPECT_EQ(prsr.errors()[1].string(), "[line 2] Error: expected expression, got ; instead");
    EXPECT_EQ(prsr.errors()[2].string(), "[line 4] Error: expected ';' after variable declaration, got while instead");
    EXPECT_EQ(prsr.errors()[3].string(), "[line 5] Error: expected variable name, got = instead");
    ASSERT_EQ(prgrm->statements.size(), 1);
    EXPECT_EQ(prgrm->statements[0]->string(), "while a (a = (a - 1));");
}

TEST(parsing, testRejectedLoopBodyIsStillParsed)
{
    const auto [prgrm, prsr] = parse_with_errors("while (true) var x = 1;\nprint (;");
    ASSERT_EQ(prsr.errors().size(), 2);
    EXPECT_EQ(prsr.errors()[0].loc.line, 1);
    EXPECT_EQ(prsr.errors()[1].string(), "[line 2] Error: expected expression, got ; instead");
    ASSERT_EQ(prgrm->statements.size(), 1);
    EXPECT_EQ(prgrm->statements[0]->string(), "var x = 1;");
}

TEST(parsing, testLexerErrorsAreReportedInSourceOrder)
{
    const auto [prgrm, prsr] = parse_with_errors("print 1 @;\nprint \"x;");
    ASSERT_EQ(prsr.errors().size(), 3);
    EXPECT_EQ(prsr.errors()[0].string(), "[line 1] Error: unexpected character '@'");
    EXPECT_EQ(prsr.errors()[1].string(), "[line 2] Error: unterminated string");
    EXPECT_EQ(prsr.errors()[2].string(), "[line 2] Error: expected expression, got eof instead");
    ASSERT_EQ(prgrm->statements.size(), 1);
    EXPECT_EQ(prgrm->statements[0]->string(), "print 1;");
}
