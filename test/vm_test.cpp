#include "test_util.h"

#include "vm/compiler.h"
#include "vm/vm.h"

#include <string>

class VMTest : public ::testing::Test {
protected:
    bool compile(const std::string& source) {
        m_source = source;
        m_parser.init(m_source, m_capture.config.err);
        Compiler compiler(&m_parser, &m_chunk, &m_heap, m_capture.config);
        return compiler.compile();
    }

    std::string m_source;
    CapturedConfig m_capture;
    Heap m_heap;
    Chunk m_chunk;
    Parser m_parser;
};

TEST_F(VMTest, GlobalsAfterRun) {
    ASSERT_TRUE(compile("var a = 1; a = a + 1; print a;"));
    VM vm(m_chunk, m_heap, m_capture.config);
    ASSERT_EQ(vm.run(), InterpretResult::Ok);

    Value a;
    ASSERT_TRUE(vm.get_global("a", &a));
    ASSERT_TRUE(a.is_number());
    EXPECT_EQ(a.as_number(), 2.0);
    EXPECT_EQ(vm.global_count(), 1);
    EXPECT_EQ(vm.stack_depth(), 0);
    EXPECT_FALSE(vm.has_result());
    EXPECT_EQ(m_capture.out.read(), "2\n");
}

TEST_F(VMTest, RedefinitionOverwrites) {
    ASSERT_TRUE(compile("var a = 1; var a = \"two\";"));
    VM vm(m_chunk, m_heap, m_capture.config);
    ASSERT_EQ(vm.run(), InterpretResult::Ok);
    Value a;
    ASSERT_TRUE(vm.get_global("a", &a));
    EXPECT_EQ(value_to_string(m_heap, a), "two");
    EXPECT_EQ(vm.global_count(), 1);
}

TEST_F(VMTest, UndefinedGet) {
    ASSERT_TRUE(compile("print 1;\nprint missing;"));
    VM vm(m_chunk, m_heap, m_capture.config);
    ASSERT_EQ(vm.run(), InterpretResult::RuntimeError);
    EXPECT_EQ(vm.error().kind, RuntimeErrorKind::UndefinedVariable);
    EXPECT_EQ(vm.error().message, "Undefined variable 'missing'.");
    EXPECT_EQ(vm.error().line, 2);
    // Output produced before the fault is kept.
    EXPECT_EQ(m_capture.out.read(), "1\n");
}

TEST_F(VMTest, UndefinedSetLeavesTableUnchanged) {
    ASSERT_TRUE(compile("var a = 1; b = 2;"));
    VM vm(m_chunk, m_heap, m_capture.config);
    ASSERT_EQ(vm.run(), InterpretResult::RuntimeError);
    EXPECT_EQ(vm.error().kind, RuntimeErrorKind::UndefinedVariable);
    EXPECT_EQ(vm.error().message, "Undefined variable 'b'.");
    Value b;
    EXPECT_FALSE(vm.get_global("b", &b));
    EXPECT_EQ(vm.global_count(), 1);
}

TEST_F(VMTest, ErrorKinds) {
    struct Case {
        const char* source;
        RuntimeErrorKind kind;
        const char* message;
    };
    Case cases[] = {
        {"print \"a\" + 1;", RuntimeErrorKind::Arithmetic, "Operands of '+' must be two numbers or two strings."},
        {"print nil / 2;", RuntimeErrorKind::Arithmetic, "Operands of '/' must be numbers."},
        {"print -\"x\";", RuntimeErrorKind::Negation, "Operand of '-' must be a number."},
        {"print \"a\" < \"b\";", RuntimeErrorKind::Comparison, "Operands of '<' must be numbers."},
        {"print true >= 1;", RuntimeErrorKind::Comparison, "Operands of '<' must be numbers."},
    };
    for (const Case& c : cases) {
        Heap heap;
        Chunk chunk;
        Parser parser;
        parser.init(c.source, m_capture.config.err);
        Compiler compiler(&parser, &chunk, &heap, m_capture.config);
        ASSERT_TRUE(compiler.compile()) << c.source;

        VM vm(chunk, heap, m_capture.config);
        ASSERT_EQ(vm.run(), InterpretResult::RuntimeError) << c.source;
        EXPECT_EQ(vm.error().kind, c.kind) << c.source;
        EXPECT_EQ(vm.error().message, c.message) << c.source;
        EXPECT_EQ(vm.error().line, 1) << c.source;
    }
}

TEST_F(VMTest, ExpressionResult) {
    m_parser.init("1 + 2 * 3", m_capture.config.err);
    Compiler compiler(&m_parser, &m_chunk, &m_heap, m_capture.config);
    ASSERT_TRUE(compiler.compile_expression());

    VM vm(m_chunk, m_heap, m_capture.config);
    ASSERT_EQ(vm.run(), InterpretResult::Ok);
    ASSERT_TRUE(vm.has_result());
    EXPECT_EQ(vm.result().as_number(), 7.0);
}

TEST_F(VMTest, StackOverflow) {
    for (int i = 0; i <= VM::MaxStackSize; i++) {
        m_chunk.write(OP_NIL, 1);
    }
    m_chunk.write(OP_RETURN, 1);

    VM vm(m_chunk, m_heap, m_capture.config);
    ASSERT_EQ(vm.run(), InterpretResult::RuntimeError);
    EXPECT_EQ(vm.error().kind, RuntimeErrorKind::StackOverflow);
    EXPECT_EQ(vm.error().message, "Stack overflow.");
    EXPECT_EQ(vm.stack_depth(), VM::MaxStackSize);
}

TEST_F(VMTest, FullStackIsAllowed) {
    for (int i = 0; i < VM::MaxStackSize; i++) {
        m_chunk.write(OP_NIL, 1);
    }
    m_chunk.write(OP_RETURN, 1);

    VM vm(m_chunk, m_heap, m_capture.config);
    EXPECT_EQ(vm.run(), InterpretResult::Ok);
}

TEST_F(VMTest, UnknownOpcode) {
    m_chunk.write(OP_NIL, 1);
    m_chunk.write(99, 3);

    VM vm(m_chunk, m_heap, m_capture.config);
    ASSERT_EQ(vm.run(), InterpretResult::RuntimeError);
    EXPECT_EQ(vm.error().kind, RuntimeErrorKind::InvalidBytecode);
    EXPECT_EQ(vm.error().message, "Unknown opcode 99.");
    EXPECT_EQ(vm.error().line, 3);
}

TEST_F(VMTest, MissingReturn) {
    m_chunk.write(OP_NIL, 1);

    VM vm(m_chunk, m_heap, m_capture.config);
    ASSERT_EQ(vm.run(), InterpretResult::RuntimeError);
    EXPECT_EQ(vm.error().kind, RuntimeErrorKind::InvalidBytecode);
}

TEST_F(VMTest, EmptyChunk) {
    VM vm(m_chunk, m_heap, m_capture.config);
    ASSERT_EQ(vm.run(), InterpretResult::RuntimeError);
    EXPECT_EQ(vm.error().kind, RuntimeErrorKind::InvalidBytecode);
    EXPECT_EQ(vm.error().line, 0);
}

TEST_F(VMTest, StackUnderflow) {
    m_chunk.write(OP_ADD, 1);
    m_chunk.write(OP_RETURN, 1);

    VM vm(m_chunk, m_heap, m_capture.config);
    ASSERT_EQ(vm.run(), InterpretResult::RuntimeError);
    EXPECT_EQ(vm.error().kind, RuntimeErrorKind::InvalidBytecode);
    EXPECT_EQ(vm.error().message, "Stack underflow.");
}

TEST_F(VMTest, ConstantOperandOutOfRange) {
    m_chunk.write(OP_CONSTANT, 1, {5});
    m_chunk.write(OP_RETURN, 1);

    VM vm(m_chunk, m_heap, m_capture.config);
    ASSERT_EQ(vm.run(), InterpretResult::RuntimeError);
    EXPECT_EQ(vm.error().kind, RuntimeErrorKind::InvalidBytecode);
}

TEST_F(VMTest, GlobalNameMustBeString) {
    int32_t name = m_chunk.add_constant(Value(1.0));
    m_chunk.write(OP_NIL, 1);
    m_chunk.write(OP_DEFINE_GLOBAL, 1, {(uint8_t)name});
    m_chunk.write(OP_RETURN, 1);

    VM vm(m_chunk, m_heap, m_capture.config);
    ASSERT_EQ(vm.run(), InterpretResult::RuntimeError);
    EXPECT_EQ(vm.error().kind, RuntimeErrorKind::InvalidBytecode);
    EXPECT_EQ(vm.global_count(), 0);
}

TEST_F(VMTest, TraceExecution) {
    m_capture.config.trace_execution = true;
    ASSERT_TRUE(compile("print 1 + 2;"));
    VM vm(m_chunk, m_heap, m_capture.config);
    ASSERT_EQ(vm.run(), InterpretResult::Ok);

    std::string trace = m_capture.trace.read();
    EXPECT_NE(trace.find("OP_CONSTANT"), std::string::npos);
    EXPECT_NE(trace.find("[ 1 ][ 2 ]"), std::string::npos);
    EXPECT_NE(trace.find("OP_ADD"), std::string::npos);
    EXPECT_NE(trace.find("OP_RETURN"), std::string::npos);
    EXPECT_EQ(m_capture.out.read(), "3\n");
}

TEST_F(VMTest, NoTraceByDefault) {
    ASSERT_TRUE(compile("print 1;"));
    VM vm(m_chunk, m_heap, m_capture.config);
    ASSERT_EQ(vm.run(), InterpretResult::Ok);
    EXPECT_EQ(m_capture.trace.read(), "");
}
