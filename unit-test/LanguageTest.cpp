#include "gtest/gtest.h"
#include "project/language.hpp"

using namespace std;
using namespace grader;

class LanguageTest : public ::testing::Test {
};

TEST_F(LanguageTest, DetectByExtension) {
    EXPECT_EQ(detect_language("main.adb", ""), language::ADA);
    EXPECT_EQ(detect_language("stack.ads", ""), language::ADA);
    EXPECT_EQ(detect_language("legacy.ada", ""), language::ADA);
    EXPECT_EQ(detect_language("helper.c", ""), language::C);
    EXPECT_EQ(detect_language("vector.cpp", ""), language::CPP);
    EXPECT_EQ(detect_language("vector.cc", ""), language::CPP);
    EXPECT_EQ(detect_language("vector.hpp", ""), language::CPP);
    EXPECT_EQ(detect_language("main.gpr", ""), language::MANIFEST);
    EXPECT_EQ(detect_language("main.adc", ""), language::CONFIG);
    EXPECT_EQ(detect_language("README.md", "# Lab 1"), language::UNKNOWN);
    EXPECT_EQ(detect_language("Makefile", "all:"), language::UNKNOWN);
}

TEST_F(LanguageTest, ExtensionIsCaseInsensitive) {
    EXPECT_EQ(detect_language("MAIN.ADB", ""), language::ADA);
    EXPECT_EQ(detect_language("Helper.C", ""), language::C);
}

TEST_F(LanguageTest, HeaderHeuristic) {
    EXPECT_EQ(detect_language("helper.h", "#include <stdio.h>\nint add(int a, int b);\n"), language::C);
    EXPECT_EQ(detect_language("helper.h", "#include <vector>\nint add(int a, int b);\n"), language::CPP);
    EXPECT_EQ(detect_language("point.h", "class Point {\n  int x;\n};\n"), language::CPP);
    EXPECT_EQ(detect_language("util.h", "namespace util {\n}\n"), language::CPP);
    EXPECT_EQ(detect_language("max.h", "template <typename T> T max(T a, T b);\n"), language::CPP);
    EXPECT_EQ(detect_language("struct.h", "struct classroom { int size; };\n"), language::C);
}

TEST_F(LanguageTest, ManifestNames) {
    EXPECT_STREQ(get_language_name(language::ADA), "Ada");
    EXPECT_STREQ(get_language_name(language::C), "C");
    EXPECT_STREQ(get_language_name(language::CPP), "C++");
    EXPECT_TRUE(is_compiled_language(language::CPP));
    EXPECT_FALSE(is_compiled_language(language::UNKNOWN));
    EXPECT_FALSE(is_compiled_language(language::MANIFEST));
}
