#include <gtest/gtest.h>

#include <string>

#include "quadrant/fixtures.h"
#include "test_support.h"

using namespace quadrant;
using namespace quadrant::test_support;

namespace {

// Runs a program that needs no input and returns everything it printed.
std::vector<std::string> run(const char* source) {
    Interpreter interp(source);
    RecordingOutput out;
    EXPECT_EQ(TICK_FINISHED, run_until_blocked(interp, out));
    return out.lines;
}

std::string only_line(const char* source) {
    std::vector<std::string> lines = run(source);
    EXPECT_EQ(1u, lines.size());
    return lines.empty() ? std::string() : lines[0];
}

}

TEST(Interpreter, HelloFixturePrintsGreeting) {
    EXPECT_EQ("Hello, world!", only_line(fixture(0).source));
}

TEST(Interpreter, NumsFixturePrintsTwoLines) {
    std::vector<std::string> lines = run(fixture(1).source);
    ASSERT_EQ(2u, lines.size());
    EXPECT_EQ("1", lines[0]);
    EXPECT_EQ("257", lines[1]);
}

TEST(Interpreter, EachTickIsOneStatementStep) {
    Interpreter interp("x := 1\nprint(x)");
    RecordingOutput out;
    EXPECT_EQ(TICK_CONTINUING, interp.tick(out));
    EXPECT_TRUE(out.lines.empty());
    EXPECT_EQ(TICK_CONTINUING, interp.tick(out));
    ASSERT_EQ(1u, out.lines.size());
    EXPECT_EQ(TICK_FINISHED, interp.tick(out));
    EXPECT_TRUE(interp.finished());
    EXPECT_EQ(TICK_FINISHED, interp.tick(out));
}

TEST(Interpreter, ArithmeticPrecedenceAndTypes) {
    EXPECT_EQ("14", only_line("print(2 + 3 * 4)"));
    EXPECT_EQ("20", only_line("print((2 + 3) * 4)"));
    EXPECT_EQ("3", only_line("print(7 / 2)"));
    EXPECT_EQ("1", only_line("print(7 % 3)"));
    EXPECT_EQ("3.5", only_line("print(7 / 2.0)"));
    EXPECT_EQ("-4", only_line("print(-(1 + 3))"));
    EXPECT_EQ("5.0", only_line("print(2.5 * 2)"));
}

TEST(Interpreter, ComparisonsAndLogic) {
    EXPECT_EQ("true", only_line("print(1 < 2 and 2 <= 2)"));
    EXPECT_EQ("false", only_line("print(not (3 >= 1) or 1 != 1)"));
    EXPECT_EQ("true", only_line("print(1 == 1.0)"));
    EXPECT_EQ("false", only_line("print(1 == \"1\")"));
    EXPECT_EQ("true", only_line("print(\"abc\" < \"abd\")"));
}

TEST(Interpreter, StringConcatenation) {
    EXPECT_EQ("foobar", only_line("a := \"foo\"\nprint(a + \"bar\")"));
}

TEST(Interpreter, WhileAndIfElse) {
    std::vector<std::string> lines = run(
        "i := 0\n"
        "while i < 4 {\n"
        "    if i % 2 == 0 {\n"
        "        print(\"even\")\n"
        "    } else if i == 3 {\n"
        "        print(\"three\")\n"
        "    } else {\n"
        "        print(i)\n"
        "    }\n"
        "    i := i + 1\n"
        "}\n");
    ASSERT_EQ(4u, lines.size());
    EXPECT_EQ("even", lines[0]);
    EXPECT_EQ("1", lines[1]);
    EXPECT_EQ("even", lines[2]);
    EXPECT_EQ("three", lines[3]);
}

TEST(Interpreter, InputSuspendsUntilProvided) {
    Interpreter interp("n := input(\"Number:\")\nprint(n * 2)");
    RecordingOutput out;
    EXPECT_EQ(TICK_AWAIT_INPUT, run_until_blocked(interp, out));
    ASSERT_EQ(1u, out.lines.size());
    EXPECT_EQ("Number:", out.lines[0]);
    EXPECT_TRUE(interp.awaiting_input());
    EXPECT_EQ(TICK_AWAIT_INPUT, interp.tick(out));

    interp.provide_input(" 21 ");
    EXPECT_FALSE(interp.awaiting_input());
    EXPECT_EQ(TICK_FINISHED, run_until_blocked(interp, out));
    EXPECT_EQ("42", out.lines.back());
}

TEST(Interpreter, InputLinesBecomeNumbersOrStrings) {
    EXPECT_EQ(VAL_INT, Value::from_input("12").type);
    EXPECT_EQ(VAL_FLOAT, Value::from_input("1.5").type);
    Value word = Value::from_input("  quit ");
    EXPECT_EQ(VAL_STRING, word.type);
    EXPECT_STREQ("quit", word.s);
}

TEST(Interpreter, AverageFixture) {
    Interpreter interp(fixture(2).source);
    RecordingOutput out;
    const char* inputs[] = { "5", "10", "quit" };
    for (const char* line : inputs) {
        ASSERT_EQ(TICK_AWAIT_INPUT, run_until_blocked(interp, out));
        interp.provide_input(line);
    }
    ASSERT_EQ(TICK_FINISHED, run_until_blocked(interp, out));
    EXPECT_EQ("7", out.lines.back());
    EXPECT_FALSE(interp.has_error());
}

TEST(Interpreter, PiFixtureApproximatesPi) {
    Interpreter interp(fixture(3).source);
    RecordingOutput out;
    ASSERT_EQ(TICK_AWAIT_INPUT, run_until_blocked(interp, out));
    EXPECT_EQ("Num terms:", out.lines.back());
    interp.provide_input("1000");
    ASSERT_EQ(TICK_FINISHED, run_until_blocked(interp, out));
    EXPECT_EQ(0u, out.lines.back().find("3.14"));
}

TEST(Interpreter, RuntimeErrorsPrintAndFinish) {
    EXPECT_EQ("Error: division by zero", only_line("print(1 / 0)"));
    EXPECT_EQ("Error: undefined variable y", only_line("print(y)"));
    EXPECT_EQ("Error: condition must be true or false", only_line("while 1 { print(1) }"));
    EXPECT_EQ("Error: type mismatch: string and int", only_line("print(\"a\" - 1)"));
}

TEST(Interpreter, AverageWithNoNumbersDividesByZero) {
    Interpreter interp(fixture(2).source);
    RecordingOutput out;
    ASSERT_EQ(TICK_AWAIT_INPUT, run_until_blocked(interp, out));
    interp.provide_input("quit");
    ASSERT_EQ(TICK_FINISHED, run_until_blocked(interp, out));
    EXPECT_EQ("Error: division by zero", out.lines.back());
    EXPECT_TRUE(interp.has_error());
}

TEST(Interpreter, CompileErrorsReportedOnFirstTick) {
    Interpreter interp("print(1");
    EXPECT_TRUE(interp.has_error());
    RecordingOutput out;
    EXPECT_EQ(TICK_FINISHED, interp.tick(out));
    ASSERT_EQ(1u, out.lines.size());
    EXPECT_EQ("Error: expected )", out.lines[0]);
}

TEST(Interpreter, CompileLimits) {
    EXPECT_EQ("Error: literal too long: abcdefghijklmno", only_line("abcdefghijklmnopq := 1"));
    EXPECT_EQ("Error: input must be assigned to a variable", only_line("print(input(\"x\"))"));
    EXPECT_EQ("Error: bad token '$'", only_line("x := $"));

    std::string many;
    for (int i = 0; i < 11; i++) many += "v" + std::to_string(i) + " := 1\n";
    EXPECT_EQ("Error: too many variables at v10", only_line(many.c_str()));

    std::string longer;
    for (int i = 0; i < 50; i++) longer += "print(1)\n";
    EXPECT_EQ("Error: program too long", only_line(longer.c_str()));
}

TEST(Interpreter, NestingDepthIsLimited) {
    std::string deep = "x := ";
    for (int i = 0; i < 25; i++) deep += "(";
    deep += "1";
    for (int i = 0; i < 25; i++) deep += ")";
    EXPECT_EQ("Error: nesting too deep", only_line(deep.c_str()));
}

TEST(Interpreter, LoadResetsState) {
    Interpreter interp("print(1)");
    RecordingOutput out;
    run_until_blocked(interp, out);
    interp.load("print(2)");
    EXPECT_FALSE(interp.finished());
    run_until_blocked(interp, out);
    EXPECT_EQ("2", out.lines.back());
}

TEST(Value, FormatsEachType) {
    char buf[40];
    Value::make_bool(true).format(buf, sizeof(buf));
    EXPECT_STREQ("true", buf);
    Value::make_float(0.25).format(buf, sizeof(buf));
    EXPECT_STREQ("0.25", buf);
    Value::make_string("abc", 3).format(buf, sizeof(buf));
    EXPECT_STREQ("abc", buf);
    EXPECT_STREQ("float", value_type_name(VAL_FLOAT));
}
