#include <array>
#include <cstddef>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include <ast/grouping_expression.hpp>
#include <ast/literal.hpp>
#include <diagnostics/diagnostics.hpp>
#include <eval/interpreter.hpp>
#include <gtest/gtest.h>
#include <session.hpp>
#include <value/value.hpp>

#include "testutils.hpp"

// NOLINTBEGIN(*-magic-numbers)
namespace
{
struct output_test
{
    std::string_view input;
    std::string_view expected;
};

template<std::size_t N>
auto assert_outputs(const std::array<output_test, N>& tests) -> void
{
    for (const auto& [input, expected] : tests) {
        const auto result = run(input);
        EXPECT_TRUE(result.errors.empty()) << "input: " << input << ", first error: " << result.errors.front();
        EXPECT_EQ(result.output, expected) << "input: " << input;
    }
}

struct error_test
{
    std::string_view input;
    diagnostic expected;
};

template<std::size_t N>
auto assert_errors(const std::array<error_test, N>& tests) -> void
{
    for (const auto& [input, expected] : tests) {
        const auto result = run(input);
        ASSERT_EQ(result.errors.size(), 1U) << "input: " << input;
        EXPECT_EQ(result.errors[0], expected) << "input: " << input;
        EXPECT_TRUE(result.output.empty()) << "input: " << input;
    }
}
}  // namespace

TEST(eval, testLiteralAndGroupingEvaluateToTheirValue)
{
    auto out = std::ostringstream {};
    auto diag = diagnostics {};
    auto interp = interpreter {out, diag};
    const auto values = std::array {
        value {0.0},
        value {-2.5},
        value {string_value {"text"}},
        value {string_value {}},
        value {true},
        value {false},
        value {},
    };
    for (const auto& val : values) {
        const auto lit = literal {val};
        EXPECT_EQ(interp.evaluate(lit), val);
        const auto group = grouping_expression {std::make_unique<literal>(val)};
        EXPECT_EQ(interp.evaluate(group), val);
    }
    EXPECT_TRUE(diag.empty());
    EXPECT_TRUE(out.str().empty());
}

TEST(eval, testPrintRendering)
{
    const auto result = run("$< 1\n$< 2.5\n$< \"hi\"\n$< true\n$< false\n$< none\n$< -0.5\n$< 1 / 0\n");
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.output, "1\n2.5\nhi\ntrue\nfalse\nnone\n-0.5\ninf\n");
}

TEST(eval, testNumbersPrintPositionally)
{
    const auto tests = std::array {
        output_test {"$< 1000000000 * 1000000000000", "1000000000000000000000\n"},
        output_test {"$< 1 / 10000000", "0.0000001\n"},
        output_test {"$< \"n=\" + 1 / 10000000", "n=0.0000001\n"},
        output_test {"$< 0 / 0", "NaN\n"},
    };
    assert_outputs(tests);
}

TEST(eval, testOutOfRangeLiteralsSaturate)
{
    const auto input = "$< 1" + std::string(400, '0') + "\n$< 0." + std::string(330, '0') + "1\n$< 7\n";
    const auto result = run(input);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.output, "inf\n0\n7\n");
}

TEST(eval, testArithmetic)
{
    const auto tests = std::array {
        output_test {"$< 1 + 2 * 3", "7\n"},
        output_test {"$< (1 + 2) * 3", "9\n"},
        output_test {"$< 10 / 4", "2.5\n"},
        output_test {"$< 10 - 2 - 3", "5\n"},
        output_test {"$< -5 + 10", "5\n"},
        output_test {"$< - -5", "5\n"},
        output_test {"$< 2 * -(3 + 1)", "-8\n"},
        output_test {"$< 0.1 + 0.2 > 0.3", "true\n"},
    };
    assert_outputs(tests);
}

TEST(eval, testComparisonAndEquality)
{
    const auto tests = std::array {
        output_test {"$< 1 < 2", "true\n"},
        output_test {"$< 2 <= 2", "true\n"},
        output_test {"$< 3 > 4", "false\n"},
        output_test {"$< 3 >= 4", "false\n"},
        output_test {"$< 1 is 1", "true\n"},
        output_test {"$< 1 is \"1\"", "false\n"},
        output_test {"$< none is none", "true\n"},
        output_test {"$< none is false", "false\n"},
        output_test {"$< \"a\" is \"a\"", "true\n"},
        output_test {"$< 1 not 2", "true\n"},
        output_test {"$< \"a\" not \"a\"", "false\n"},
        output_test {"$< true is (1 < 2)", "true\n"},
    };
    assert_outputs(tests);
}

TEST(eval, testTruthiness)
{
    const auto tests = std::array {
        output_test {"$< not none", "true\n"},
        output_test {"$< not false", "true\n"},
        output_test {"$< not true", "false\n"},
        output_test {"$< not 0", "false\n"},
        output_test {"$< not \"\"", "false\n"},
        output_test {"$< not not 5", "true\n"},
        output_test {"if 0 {\n$< \"zero is truthy\"\n}", "zero is truthy\n"},
        output_test {"if none {\n$< 1\n} else {\n$< 2\n}", "2\n"},
    };
    assert_outputs(tests);
}

TEST(eval, testLogicalOperatorsShortCircuit)
{
    const auto tests = std::array {
        output_test {"offering x = 1\nfalse and (x = 2)\n$< x", "1\n"},
        output_test {"offering x = 1\ntrue or (x = 3)\n$< x", "1\n"},
        output_test {"offering x = 1\ntrue and (x = 4)\n$< x", "4\n"},
        output_test {"$< false and undefined", "false\n"},
        output_test {"$< \"left\" or undefined", "left\n"},
        output_test {"$< none or \"fallback\"", "fallback\n"},
        output_test {"$< 0 and 5", "5\n"},
        output_test {"$< none and 5", "none\n"},
        output_test {"$< false or none", "none\n"},
    };
    assert_outputs(tests);
}

TEST(eval, testStringConcatenation)
{
    const auto tests = std::array {
        output_test {"$< \"a\" + 1", "a1\n"},
        output_test {"$< \"n=\" + 2.5", "n=2.5\n"},
        output_test {"$< \"b\" + true", "btrue\n"},
        output_test {"$< \"c\" + none", "cnone\n"},
        output_test {"$< \"x\" + \"y\"", "xy\n"},
        output_test {"$< \"\" + 1 + 2", "12\n"},
    };
    assert_outputs(tests);
}

TEST(eval, testTypeMismatch)
{
    const auto tests = std::array {
        error_test {"$< 1 + \"a\"", {.line = 1, .message = "type mismatch: number + string"}},
        error_test {"$< true + 1", {.line = 1, .message = "type mismatch: boolean + number"}},
        error_test {"$< true - 1", {.line = 1, .message = "type mismatch: boolean - number"}},
        error_test {"$< \"a\" * 2", {.line = 1, .message = "type mismatch: string * number"}},
        error_test {"$< 4 / none", {.line = 1, .message = "type mismatch: number / none"}},
        error_test {"$< none < 1", {.line = 1, .message = "type mismatch: none < number"}},
        error_test {"$< \"a\" >= \"b\"", {.line = 1, .message = "type mismatch: string >= string"}},
        error_test {"\n$< -\"a\"", {.line = 2, .message = "type mismatch: -string"}},
    };
    assert_errors(tests);
}

TEST(eval, testVariables)
{
    const auto tests = std::array {
        output_test {"offering a = 5\n$< a", "5\n"},
        output_test {"offering a\n$< a", "none\n"},
        output_test {"offering a = 1\noffering a = 2\n$< a", "2\n"},
        output_test {"offering a = 5\noffering b = a * 2\n$< a + b", "15\n"},
        output_test {"offering a\noffering b\na = b = 3\n$< a\n$< b", "3\n3\n"},
        output_test {"offering a = 1\n$< a = 7", "7\n"},
    };
    assert_outputs(tests);
}

TEST(eval, testShadowingDoesNotLeak)
{
    const auto result = run("offering x = 1\n{\noffering x = 2\n$< x\n}\n$< x\n");
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.output, "2\n1\n");
}

TEST(eval, testAssignmentMutatesOwningScope)
{
    const auto result = run("offering x = 1\n{\n{\nx = x + 1\n}\n$< x\n}\n$< x\n");
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.output, "2\n2\n");
}

TEST(eval, testBlockBindingsAreDiscarded)
{
    const auto result = run("{\noffering inner = 1\n}\n$< inner\n");
    ASSERT_EQ(result.errors.size(), 1U);
    EXPECT_EQ(result.errors[0], (diagnostic {.line = 4, .message = "undefined variable 'inner'"}));
    EXPECT_TRUE(result.output.empty());
}

TEST(eval, testUndefinedVariableAbortsOnlyItsStatement)
{
    const auto result = run("$< missing\n$< 2\n");
    ASSERT_EQ(result.errors.size(), 1U);
    EXPECT_EQ(result.errors[0], (diagnostic {.line = 1, .message = "undefined variable 'missing'"}));
    EXPECT_EQ(result.output, "2\n");
}

TEST(eval, testAssignmentNeverDeclares)
{
    const auto result = run("y = 1\n$< y\n");
    ASSERT_EQ(result.errors.size(), 2U);
    EXPECT_EQ(result.errors[0], (diagnostic {.line = 1, .message = "undefined variable 'y'"}));
    EXPECT_EQ(result.errors[1], (diagnostic {.line = 2, .message = "undefined variable 'y'"}));
}

TEST(eval, testErrorInsideBlockRestoresScope)
{
    const auto result = run("offering x = 1\n{\noffering x = 2\n$< missing\n$< x\n}\n$< x\n");
    ASSERT_EQ(result.errors.size(), 1U);
    EXPECT_EQ(result.errors[0], (diagnostic {.line = 4, .message = "undefined variable 'missing'"}));
    EXPECT_EQ(result.output, "1\n");
}

TEST(eval, testPostfixReturnsNewValue)
{
    const auto tests = std::array {
        output_test {"offering x = 5\n$< x++", "6\n"},
        output_test {"offering x = 5\n$< x--", "4\n"},
        output_test {"offering x = 5\n$< (x++)\n$< (x++)\n$< x", "6\n7\n7\n"},
        output_test {"offering x = 0\n{\n$< (x++)\n}\n$< x", "1\n1\n"},
        output_test {"offering x = 1.5\n$< x-- * 2", "1\n"},
    };
    assert_outputs(tests);
}

TEST(eval, testPostfixErrors)
{
    const auto tests = std::array {
        error_test {"$< (1)++", {.line = 1, .message = "invalid ++ target: (group 1)"}},
        error_test {"offering s = \"a\"\n$< s--", {.line = 2, .message = "type mismatch: string--"}},
        error_test {"$< nothing++", {.line = 1, .message = "undefined variable 'nothing'"}},
    };
    assert_errors(tests);
}

TEST(eval, testCompoundAssignment)
{
    const auto result = run("offering x = 1\nx += 4\n$< x\nx -= 2\n$< x\noffering s = \"a\"\ns += 1\n$< s\n");
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.output, "5\n3\na1\n");
}

TEST(eval, testCompoundAssignmentErrors)
{
    const auto tests = std::array {
        error_test {"offering b = true\nb += 1", {.line = 2, .message = "type mismatch: boolean += number"}},
        error_test {"offering s = \"a\"\ns -= 1", {.line = 2, .message = "type mismatch: string -= number"}},
        error_test {"undeclared += 1", {.line = 1, .message = "undefined variable 'undeclared'"}},
    };
    assert_errors(tests);
}

TEST(eval, testIfStatements)
{
    const auto tests = std::array {
        output_test {"if 1 < 2 {\n$< \"yes\"\n} else {\n$< \"no\"\n}", "yes\n"},
        output_test {"if 1 > 2 {\n$< \"yes\"\n} else {\n$< \"no\"\n}", "no\n"},
        output_test {"if false {\n$< 1\n}\n$< 2", "2\n"},
        output_test {"offering x = 1\nif true {\noffering x = 2\n}\n$< x", "1\n"},
        output_test {"offering x = 1\nif true {\nx = 2\n}\n$< x", "2\n"},
        output_test {"if true {\n$< 1\n}\nelse {\n$< 2\n}", "1\n"},
    };
    assert_outputs(tests);
}

TEST(eval, testWhileStatements)
{
    const auto tests = std::array {
        output_test {"offering i = 0\noffering sum = 0\nwhile i < 5 {\nsum = sum + i\ni = i + 1\n}\n$< sum", "10\n"},
        output_test {"offering i = 3\nwhile i > 0 {\n$< i\ni -= 1\n}", "3\n2\n1\n"},
        output_test {"while false {\n$< 1\n}\n$< 2", "2\n"},
        output_test {"offering s = \"\"\nwhile s not \"aaa\" {\ns += \"a\"\n}\n$< s", "aaa\n"},
    };
    assert_outputs(tests);
}

TEST(eval, testParseErrorDoesNotStopExecution)
{
    const auto result = run("offering = 3\n$< 1\n");
    ASSERT_EQ(result.errors.size(), 1U);
    EXPECT_EQ(result.output, "1\n");
}

TEST(eval, testDeepNestingIsRejectedAndExecutionContinues)
{
    const auto deep_inputs = std::array {
        std::string(3000, '(') + "1" + std::string(3000, ')'),
        [] {
            auto text = std::string {};
            for (auto idx = 0; idx < 50000; ++idx) {
                text += "not ";
            }
            return text + "true";
        }(),
        [] {
            auto text = std::string {"1"};
            for (auto idx = 0; idx < 50000; ++idx) {
                text += " + 1";
            }
            return text;
        }(),
    };
    for (const auto& deep : deep_inputs) {
        const auto result = run("$< " + deep + "\n$< 7\n");
        ASSERT_EQ(result.errors.size(), 1U);
        EXPECT_EQ(result.errors[0].message, "Expression nested too deeply.");
        EXPECT_EQ(result.output, "7\n");
    }
}

TEST(eval, testModerateNestingStillEvaluates)
{
    auto input = std::string {"$< 1"};
    for (auto idx = 0; idx < 200; ++idx) {
        input += " + 1";
    }
    const auto result = run("$< " + std::string(100, '(') + "2" + std::string(100, ')') + "\n" + input + "\n");
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.output, "2\n201\n");
}

TEST(eval, testSessionKeepsGlobals)
{
    auto out = std::ostringstream {};
    auto diag = diagnostics {};
    auto sess = session {out, diag};
    sess.run("offering x = 41");
    sess.run("$< x + 1");
    sess.run("{\noffering hidden = 1\n}");
    EXPECT_TRUE(diag.empty());
    EXPECT_EQ(out.str(), "42\n");
    ASSERT_EQ(sess.globals().store.size(), 1U);
    EXPECT_EQ(sess.globals().store.at("x"), value {41.0});
}

TEST(eval, testSessionDebugDumpsTokensAndStatements)
{
    auto out = std::ostringstream {};
    auto diag = diagnostics {};
    auto sess = session {out, diag, true};
    sess.run("$< 1 + 2");
    const auto dumped = out.str();
    EXPECT_NE(dumped.find("Tokens:"), std::string::npos);
    EXPECT_NE(dumped.find("Statements:\n  $< (1 + 2)\n"), std::string::npos);
    EXPECT_EQ(dumped.substr(dumped.size() - 2), "3\n");
}

TEST(eval, testDiagnosticsEchoToSink)
{
    auto out = std::ostringstream {};
    auto errors = std::ostringstream {};
    auto diag = diagnostics {&errors};
    auto sess = session {out, diag};
    sess.run("$< missing");
    EXPECT_EQ(errors.str(), "undefined variable 'missing' at line 1\n");
}

// NOLINTEND(*-magic-numbers)
