#include "gtest/gtest.h"
#include "project/source_file.hpp"

using namespace std;
using namespace grader;

class SourceFileTest : public ::testing::Test {
};

TEST_F(SourceFileTest, AdaMainProcedure) {
    source_file file("main.adb", R"(with Ada.Text_IO; use Ada.Text_IO;

procedure Main is
begin
   Put_Line ("Hello");
end Main;
)");
    EXPECT_EQ(file.lang(), language::ADA);
    EXPECT_EQ(file.stem(), "main");
    EXPECT_TRUE(file.is_entry_point());
}

TEST_F(SourceFileTest, AdaMainAfterCommentsAndPragmas) {
    source_file file("hello.adb", R"(-- Lab 2: procedure Fake is
pragma Ada_2012;
limited with Foo;
private with Bar;
with Ada.Command_Line;  -- arguments
procedure Hello is
begin
   null;
end Hello;
)");
    EXPECT_TRUE(file.is_entry_point());
}

TEST_F(SourceFileTest, AdaMainWithAspects) {
    source_file file("main.adb", "with Ada.Text_IO;\nprocedure Main with SPARK_Mode is\nbegin null; end Main;");
    EXPECT_TRUE(file.is_entry_point());

    source_file multiline("prove.adb", R"(procedure Prove
  with SPARK_Mode => On,
       Global => null
is
begin
   null;
end Prove;
)");
    EXPECT_TRUE(multiline.is_entry_point());
}

TEST_F(SourceFileTest, AdaFunctionReturningIntegerIsMain) {
    source_file file("main.adb", R"(with Ada.Text_IO;
function Main return Integer is
begin
   return 0;
end Main;
)");
    EXPECT_TRUE(file.is_entry_point());

    source_file other("fact.adb", "function Fact (N : Natural) return Integer is\nbegin return 1; end Fact;\n");
    EXPECT_FALSE(other.is_entry_point());

    source_file boolean("check.adb", "function Check return Boolean is\nbegin return True; end Check;\n");
    EXPECT_FALSE(boolean.is_entry_point());
}

TEST_F(SourceFileTest, AdaProcedureDeclarationWithAspectIsNotMain) {
    source_file file("decl.adb", "procedure Helper with Inline;\n");
    EXPECT_FALSE(file.is_entry_point());
}

TEST_F(SourceFileTest, AdaPackageBodyIsNotMain) {
    source_file file("stack.adb", R"(with Ada.Text_IO;
package body Stack is
   procedure Push (X : Integer) is
   begin
      null;
   end Push;
end Stack;
)");
    EXPECT_FALSE(file.is_entry_point());
}

TEST_F(SourceFileTest, AdaProcedureWithParametersIsNotMain) {
    source_file file("print.adb", R"(procedure Print (X : Integer) is
begin
   null;
end Print;
)");
    EXPECT_FALSE(file.is_entry_point());
}

TEST_F(SourceFileTest, AdaSpecificationIsNotMain) {
    source_file file("main.ads", "procedure Main is\n");
    EXPECT_TRUE(file.is_header());
    EXPECT_FALSE(file.is_entry_point());
}

TEST_F(SourceFileTest, CMain) {
    source_file file("main.c", "#include <stdio.h>\n\nint main (void) {\n    return 0;\n}\n");
    EXPECT_EQ(file.lang(), language::C);
    EXPECT_TRUE(file.is_entry_point());

    source_file cpp("app.cpp", "int main(int argc, char **argv) { return 0; }\n");
    EXPECT_TRUE(cpp.is_entry_point());
}

TEST_F(SourceFileTest, CMainInCommentOrStringIsIgnored) {
    source_file file("helper.c", R"(/* int main (void) */
// int main()
const char *s = "int main(";
int add(int a, int b) { return a + b; }
)");
    EXPECT_FALSE(file.is_entry_point());
}

TEST_F(SourceFileTest, HeaderIsNeverMain) {
    source_file file("main.h", "int main (void);\n");
    EXPECT_FALSE(file.is_entry_point());
}

TEST_F(SourceFileTest, UnknownFileIsNotMain) {
    source_file file("notes.txt", "procedure Main is\nint main (void)\n");
    EXPECT_EQ(file.lang(), language::UNKNOWN);
    EXPECT_FALSE(file.is_entry_point());
}
