#include "test_util.h"

#include "vm/vm.h"

#include <algorithm>
#include <string>

static std::string eval(const char* source) {
    CapturedConfig capture;
    std::string result;
    InterpretResult res = evaluate(source, capture.config, &result);
    EXPECT_EQ(res, InterpretResult::Ok) << source << "\n" << capture.err.read();
    return result;
}

TEST(Interpret, ArithmeticOverLiterals) {
    EXPECT_EQ(eval("1 + 2 * 3"), "7");
    EXPECT_EQ(eval("(-1 + 2) * 3 - -4"), "7");
    EXPECT_EQ(eval("10 / 4"), "2.5");
    EXPECT_EQ(eval("1 - 2 - 3"), "-4");
    EXPECT_EQ(eval("0.1 + 0.2"), "0.30000000000000004");
}

TEST(Interpret, TruthinessAndEquality) {
    EXPECT_EQ(eval("!nil"), "true");
    EXPECT_EQ(eval("!0"), "false");
    EXPECT_EQ(eval("!\"\""), "false");
    EXPECT_EQ(eval("nil == false"), "false");
    EXPECT_EQ(eval("\"ab\" == \"a\" + \"b\""), "true");
    EXPECT_EQ(eval("1 != 1"), "false");
    EXPECT_EQ(eval("2 >= 2"), "true");
    EXPECT_EQ(eval("3 <= 2"), "false");
}

TEST(Interpret, StringConcatenation) {
    EXPECT_EQ(eval("\"a\" + \"b\""), "ab");
    EXPECT_EQ(eval("\"\" + \"\""), "");
}

TEST(Interpret, ProgramOutput) {
    CapturedConfig capture;
    InterpretResult res = interpret(
        "var greeting = \"hello\";\n"
        "var name;\n"
        "print name;\n"
        "name = \"world\";\n"
        "print greeting + \" \" + name;\n"
        "print 1 < 2;\n",
        capture.config);
    ASSERT_EQ(res, InterpretResult::Ok);
    EXPECT_EQ(capture.out.read(), "nil\nhello world\ntrue\n");
    EXPECT_EQ(capture.err.read(), "");
}

TEST(Interpret, AssignmentIsAnExpression) {
    CapturedConfig capture;
    ASSERT_EQ(interpret("var a; var b; a = b = 3; print a + b;", capture.config), InterpretResult::Ok);
    EXPECT_EQ(capture.out.read(), "6\n");
}

TEST(Interpret, CompileErrorRunsNothing) {
    CapturedConfig capture;
    EXPECT_EQ(interpret("print 1; print ;", capture.config), InterpretResult::CompileError);
    EXPECT_EQ(capture.out.read(), "");
    EXPECT_EQ(capture.err.read(), "[line 1] Error at ';': Expect expression.\n");
}

TEST(Interpret, LexicalErrorDiagnosticIsOneLine) {
    CapturedConfig capture;
    EXPECT_EQ(interpret("print \"unterminated\nfoo", capture.config), InterpretResult::CompileError);
    std::string err = capture.err.read();
    EXPECT_EQ(err, "[line 2] Error: Unterminated string.\n");
    EXPECT_EQ(std::count(err.begin(), err.end(), '\n'), 1);
}

TEST(Interpret, NanDisplay) {
    EXPECT_EQ(eval("0 / 0"), "nan");
    EXPECT_EQ(eval("-(0 / 0)"), "nan");
}

TEST(Interpret, TooManyConstantsRunsNothing) {
    std::string source;
    for (int i = 0; i < 257; i++) {
        source += "print " + std::to_string(i) + ";";
    }
    CapturedConfig capture;
    EXPECT_EQ(interpret(source, capture.config), InterpretResult::CompileError);
    EXPECT_EQ(capture.out.read(), "");
    EXPECT_NE(capture.err.read().find("Too many constants in one chunk."), std::string::npos);
}

TEST(Interpret, RuntimeErrorIsReturned) {
    CapturedConfig capture;
    RuntimeError error;
    EXPECT_EQ(interpret("print \"a\";\nprint \"a\" + 1;", capture.config, &error),
              InterpretResult::RuntimeError);
    EXPECT_EQ(error.kind, RuntimeErrorKind::Arithmetic);
    EXPECT_EQ(error.line, 2);
    EXPECT_EQ(capture.out.read(), "a\n");
    // Runtime faults are reported by the caller, not on the diagnostic stream.
    EXPECT_EQ(capture.err.read(), "");
}

TEST(Interpret, EvaluateReportsRuntimeError) {
    CapturedConfig capture;
    std::string result = "unchanged";
    RuntimeError error;
    EXPECT_EQ(evaluate("-nil", capture.config, &result, &error), InterpretResult::RuntimeError);
    EXPECT_EQ(error.kind, RuntimeErrorKind::Negation);
    EXPECT_EQ(result, "unchanged");
}

TEST(Interpret, CallsAreIndependent) {
    CapturedConfig capture;
    ASSERT_EQ(interpret("var a = 1;", capture.config), InterpretResult::Ok);
    RuntimeError error;
    EXPECT_EQ(interpret("print a;", capture.config, &error), InterpretResult::RuntimeError);
    EXPECT_EQ(error.kind, RuntimeErrorKind::UndefinedVariable);
}

TEST(Interpret, EmptyProgram) {
    CapturedConfig capture;
    EXPECT_EQ(interpret("", capture.config), InterpretResult::Ok);
    EXPECT_EQ(interpret("// nothing here\n", capture.config), InterpretResult::Ok);
    EXPECT_EQ(capture.out.read(), "");
}
