#include "test_util.h"

#include "core/file.h"
#include "core/log.h"

#include <cstdlib>
#include <string>
#include <unistd.h>

static FILE* input_with(const std::string& text) {
    FILE* file = tmpfile();
    fputs(text.c_str(), file);
    rewind(file);
    return file;
}

TEST(ReadLine, StripsTerminator) {
    FILE* in = input_with("print 1;\r\nprint 2;\nlast");
    char buf[32];
    ASSERT_EQ(read_line(in, buf, sizeof(buf)), ReadLineResult::Ok);
    EXPECT_STREQ(buf, "print 1;");
    ASSERT_EQ(read_line(in, buf, sizeof(buf)), ReadLineResult::Ok);
    EXPECT_STREQ(buf, "print 2;");
    ASSERT_EQ(read_line(in, buf, sizeof(buf)), ReadLineResult::Ok);
    EXPECT_STREQ(buf, "last");
    EXPECT_EQ(read_line(in, buf, sizeof(buf)), ReadLineResult::Eof);
    fclose(in);
}

TEST(ReadLine, OverlongLineIsSkippedWhole) {
    std::string longline(100, 'x');
    FILE* in = input_with("print 1;\n" + longline + "\nprint 2;\n");
    char buf[16];
    ASSERT_EQ(read_line(in, buf, sizeof(buf)), ReadLineResult::Ok);
    EXPECT_STREQ(buf, "print 1;");
    ASSERT_EQ(read_line(in, buf, sizeof(buf)), ReadLineResult::TooLong);
    EXPECT_STREQ(buf, "");
    // The rest of the long line is not handed out as a line of its own.
    ASSERT_EQ(read_line(in, buf, sizeof(buf)), ReadLineResult::Ok);
    EXPECT_STREQ(buf, "print 2;");
    EXPECT_EQ(read_line(in, buf, sizeof(buf)), ReadLineResult::Eof);
    fclose(in);
}

TEST(ReadLine, LineFillingTheBufferFits) {
    FILE* in = input_with("0123456789abcde\n0123456789abcde");
    char buf[16];
    ASSERT_EQ(read_line(in, buf, sizeof(buf)), ReadLineResult::Ok);
    EXPECT_STREQ(buf, "0123456789abcde");
    ASSERT_EQ(read_line(in, buf, sizeof(buf)), ReadLineResult::Ok);
    EXPECT_STREQ(buf, "0123456789abcde");
    EXPECT_EQ(read_line(in, buf, sizeof(buf)), ReadLineResult::Eof);
    fclose(in);
}

TEST(ReadFile, ReadsWholeFile) {
    char path[] = "/tmp/loxvm_file_testXXXXXX";
    int fd = mkstemp(path);
    ASSERT_NE(fd, -1);
    FILE* file = fdopen(fd, "w");
    fputs("var a = 1;\nprint a;\n", file);
    fclose(file);

    std::string buf;
    EXPECT_TRUE(read_file_to_buf(path, buf));
    EXPECT_EQ(buf, "var a = 1;\nprint a;\n");
    remove(path);
}

TEST(ReadFile, MissingFileIsLoggedAsError) {
    char log_path[] = "/tmp/loxvm_log_testXXXXXX";
    int fd = mkstemp(log_path);
    ASSERT_NE(fd, -1);
    close(fd);
    ASSERT_TRUE(log_init(log_path));

    std::string buf;
    EXPECT_FALSE(read_file_to_buf("/nonexistent/dir/script.lox", buf));
    log_release();

    std::string logged;
    ASSERT_TRUE(read_file_to_buf(log_path, logged));
    EXPECT_NE(logged.find("ERROR"), std::string::npos);
    EXPECT_NE(logged.find("/nonexistent/dir/script.lox"), std::string::npos);
    remove(log_path);
}
