/*
 * test_sanitizer.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file test_sanitizer.cpp
 * @brief Tests for the denylist filter applied before dispatch
 */

#include <gtest/gtest.h>
#include "sandbox/sanitizer.hpp"

#include <algorithm>

using namespace warden::sandbox;

namespace {

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

// =============================================================================
// Basic Filtering
// =============================================================================

TEST(SanitizerTest, CleanCodeIsUntouched) {
    std::string code = "x = [i * i for i in range(10)]\nreturn sum(x)";
    EXPECT_EQ(Sanitizer::sanitize(code), code);

    auto report = Sanitizer::sanitizeWithReport(code);
    EXPECT_FALSE(report.modified());
    EXPECT_TRUE(report.warnings().empty());
}

TEST(SanitizerTest, EmptyInput) {
    EXPECT_EQ(Sanitizer::sanitize(""), "");
}

TEST(SanitizerTest, RemovesEval) {
    auto result = Sanitizer::sanitize("return eval('1+1')");
    EXPECT_FALSE(contains(result, "eval("));
    EXPECT_TRUE(contains(result, Sanitizer::MARKER));
}

TEST(SanitizerTest, TextAfterMatchSurvives) {
    auto result = Sanitizer::sanitize("total = 1; eval('2'); total = 100\nreturn total");
    EXPECT_EQ(result,
              "total = 1; __REMOVED_FOR_SECURITY__('2'); total = 100\nreturn total");
}

TEST(SanitizerTest, MatchInsideStringLiteralKeepsTheLiteral) {
    auto result = Sanitizer::sanitize("print('do not call eval(x) here')\nreturn 5");
    EXPECT_EQ(result,
              "print('do not call __REMOVED_FOR_SECURITY__(x) here')\nreturn 5");
}

TEST(SanitizerTest, AttributeAccessKeepsTheDot) {
    auto result = Sanitizer::sanitize("os.system('ls')");
    EXPECT_EQ(result, "__REMOVED_FOR_SECURITY__.system('ls')");
}

TEST(SanitizerTest, RemovesEvalWithWhitespace) {
    auto result = Sanitizer::sanitize("eval   ('2')");
    EXPECT_FALSE(contains(result, "eval"));
}

TEST(SanitizerTest, RemovesExecAndImport) {
    auto result = Sanitizer::sanitize("exec('x=1')\n__import__('os')");
    EXPECT_FALSE(contains(result, "exec("));
    EXPECT_FALSE(contains(result, "__import__"));
}

TEST(SanitizerTest, RemovesHostImports) {
    auto result = Sanitizer::sanitize("import os\nfrom subprocess import run\n");
    EXPECT_FALSE(contains(result, "import os"));
    EXPECT_FALSE(contains(result, "subprocess"));
}

TEST(SanitizerTest, KeepsUnrelatedIdentifiers) {
    // Word boundaries keep names that merely contain a denied word
    std::string code = "cosine = 1\nsystem_total = 2\nreturn cosine + system_total";
    EXPECT_EQ(Sanitizer::sanitize(code), code);
}

TEST(SanitizerTest, KeepsMethodNamedCompile) {
    auto result = Sanitizer::sanitize("pattern = re.compile('a+')");
    EXPECT_TRUE(contains(result, "re.compile("));
}

TEST(SanitizerTest, RemovesBareCompileAndOpen) {
    auto result = Sanitizer::sanitize("code = compile('1', 'f', 'eval')\nf = open('/etc/passwd')");
    EXPECT_FALSE(contains(result, "compile("));
    EXPECT_FALSE(contains(result, "open("));
    EXPECT_TRUE(contains(result, "code = "));
    EXPECT_TRUE(contains(result, "f = "));
}

TEST(SanitizerTest, RemovesNetworkingModules) {
    auto result = Sanitizer::sanitize("urllib.request.urlopen('x')\nrequests.get('y')\nsocket");
    EXPECT_FALSE(contains(result, "urllib"));
    EXPECT_FALSE(contains(result, "requests."));
    EXPECT_FALSE(contains(result, "socket"));
}

TEST(SanitizerTest, RemovesIntrospectionEscapes) {
    auto result = Sanitizer::sanitize("().__class__.__bases__[0].__subclasses__()");
    EXPECT_FALSE(contains(result, "__subclasses__"));
    EXPECT_FALSE(contains(result, "__bases__"));
}

TEST(SanitizerTest, PatternsAreCaseSensitive) {
    std::string code = "EVAL = 3\nreturn EVAL";
    EXPECT_EQ(Sanitizer::sanitize(code), code);
}

// =============================================================================
// Idempotence
// =============================================================================

TEST(SanitizerTest, SanitizeIsIdempotent) {
    const std::vector<std::string> inputs = {
        "return eval('1')",
        "import os\nos.system('ls')",
        "evaleval(('x'))",
        "ex__import__ec('y')",
        "open(open('a'))",
        "safe = 1",
    };
    for (const auto& input : inputs) {
        auto once = Sanitizer::sanitize(input);
        EXPECT_EQ(Sanitizer::sanitize(once), once) << input;
    }
}

TEST(SanitizerTest, MarkerKeepsFragmentsApart) {
    // "ev" and "al(" stay separated by the marker after the inner removal
    auto result = Sanitizer::sanitize("eveval(al(");
    EXPECT_FALSE(contains(result, "eval("));
}

// =============================================================================
// Reports
// =============================================================================

TEST(SanitizerTest, ReportListsRemovals) {
    auto report = Sanitizer::sanitizeWithReport("x = 1\ny = eval('2')");
    ASSERT_TRUE(report.modified());
    ASSERT_EQ(report.removals.size(), 1u);

    const auto& removal = report.removals.front();
    EXPECT_EQ(removal.category, "dynamic-evaluation");
    EXPECT_EQ(removal.line, 2);
    ASSERT_TRUE(removal.context.has_value());
    EXPECT_EQ(*removal.context, "y = eval('2')");
    EXPECT_EQ(report.code, Sanitizer::sanitize("x = 1\ny = eval('2')"));
}

TEST(SanitizerTest, WarningsNameTheConstruct) {
    auto report = Sanitizer::sanitizeWithReport("import socket");
    auto warnings = report.warnings();
    ASSERT_FALSE(warnings.empty());
    EXPECT_TRUE(contains(warnings.front(), "line 1"));
}

TEST(SanitizerTest, CategoriesAreDistinct) {
    auto categories = Sanitizer::categories();
    EXPECT_FALSE(categories.empty());
    auto sorted = categories;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(std::adjacent_find(sorted.begin(), sorted.end()), sorted.end());
    EXPECT_NE(std::find(categories.begin(), categories.end(), "networking"),
              categories.end());
}
