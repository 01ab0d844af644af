#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/harness.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace arena;

class HarnessTest : public ::testing::Test {
protected:
    problem with_harness(const harness_code &harness) {
        problem prob;
        prob.id = "sum";
        prob.harness = harness;
        return prob;
    }
};

TEST_F(HarnessTest, SharedHarnessAppliesToEveryLanguage) {
    problem prob = with_harness(string("print(solve(input()))"));
    string python = compose_harness("def solve(s):\n    return s", "python", prob, test_languages());
    EXPECT_EQ(python, "def solve(s):\n    return s\n# HARNESS START\nprint(solve(input()))\n# HARNESS END");

    string js = compose_harness("function solve(s) { return s; }", "javascript", prob, test_languages());
    EXPECT_EQ(js, "function solve(s) { return s; }\n// HARNESS START\nprint(solve(input()))\n// HARNESS END");
}

TEST_F(HarnessTest, PerLanguageHarness) {
    problem prob = with_harness(map<string, string>{
        {"python", "print(solve(input()))"},
        {"cpp", "int main() { solve(); }"}});

    EXPECT_EQ(compose_harness("void solve() {}", "cpp", prob, test_languages()),
              "void solve() {}\n// HARNESS START\nint main() { solve(); }\n// HARNESS END");
    EXPECT_EQ(compose_harness("def solve(s): pass", "python", prob, test_languages()),
              "def solve(s): pass\n# HARNESS START\nprint(solve(input()))\n# HARNESS END");
}

TEST_F(HarnessTest, MissingLanguageKeyLeavesCodeUnchanged) {
    problem prob = with_harness(map<string, string>{{"python", "print(solve(input()))"}});
    string code = "class Main { public static void main(String[] args) {} }";
    EXPECT_EQ(compose_harness(code, "java", prob, test_languages()), code);
}

TEST_F(HarnessTest, EmptyHarnessIsIdentity) {
    string code = "  x = 1  \r\n\t";
    EXPECT_EQ(compose_harness(code, "python", with_harness(string()), test_languages()), code);
    EXPECT_EQ(compose_harness(code, "python", with_harness(string(" \n\t ")), test_languages()), code);
    EXPECT_EQ(compose_harness(code, "python", with_harness(map<string, string>{{"python", "\n\n"}}), test_languages()), code);
}

TEST_F(HarnessTest, HarnessIsTrimmed) {
    problem prob = with_harness(string("\n\nsolve()\n\n"));
    EXPECT_EQ(compose_harness("solve() { echo 1; }", "shell", prob, test_languages()),
              "solve() { echo 1; }\n# HARNESS START\nsolve()\n# HARNESS END");
}

TEST_F(HarnessTest, UnsupportedLanguageThrows) {
    problem prob = with_harness(string("main()"));
    EXPECT_THROW(compose_harness("code", "cobol", prob, test_languages()), unsupported_language);
}

TEST_F(HarnessTest, ResolveHarness) {
    EXPECT_EQ(resolve_harness(with_harness(string("x")), "anything"), "x");
    EXPECT_EQ(resolve_harness(with_harness(map<string, string>{{"cpp", "y"}}), "cpp"), "y");
    EXPECT_EQ(resolve_harness(with_harness(map<string, string>{{"cpp", "y"}}), "java"), "");
}
