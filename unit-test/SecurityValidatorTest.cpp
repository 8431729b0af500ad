#include "gtest/gtest.h"
#include "ojcore/config.hpp"
#include "ojcore/judge/security_validator.hpp"

using namespace std;
using namespace ojcore;

class SecurityValidatorTest : public ::testing::Test {
protected:
    SecurityValidatorTest()
        : config(default_config()),
          registry(language_registry::builtin()),
          validator(config.security, config.max_source_size) {}

    judge_config config;
    language_registry registry;
    security_validator validator;
};

TEST_F(SecurityValidatorTest, AcceptsOrdinaryCode) {
    auto result = validator.validate(R"(
n = int(input())
nums = list(map(int, input().split()))
print(sum(nums) + n)
)", registry.resolve("python"));
    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.reason, "");

    result = validator.validate(R"(#include <iostream>
int main() {
    int a, b;
    std::cin >> a >> b;
    std::cout << a + b << std::endl;
}
)", registry.resolve("cpp"));
    EXPECT_TRUE(result.accepted);
}

TEST_F(SecurityValidatorTest, RejectsOversizedSource) {
    security_validator small(config.security, 16);
    auto result = small.validate(string(17, 'a'), registry.resolve("cpp"));
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.reason, "Code size (17 bytes) exceeds the maximum of 16 bytes");

    EXPECT_TRUE(small.validate(string(16, 'a'), registry.resolve("cpp")).accepted);
}

TEST_F(SecurityValidatorTest, RejectsBlockedImports) {
    auto result = validator.validate("import os\nprint(os.getcwd())\n", registry.resolve("python"));
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.reason, "Blocked import: os");

    result = validator.validate("from socket import socket\n", registry.resolve("py"));
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.reason, "Blocked import: socket");
}

TEST_F(SecurityValidatorTest, ImportScanOnlyForDynamicLanguages) {
    // "import os" 在 C++ 中只是一段注释，不会触发 import 检查
    auto result = validator.validate("// import os\nint main() { return 0; }\n", registry.resolve("cpp"));
    EXPECT_TRUE(result.accepted);

    security_config security = config.security;
    security.import_scan_languages = {"c++"};
    security_validator strict(security, config.max_source_size);
    EXPECT_FALSE(strict.validate("// import os\nint main() { return 0; }\n", registry.resolve("cpp")).accepted);
}

TEST_F(SecurityValidatorTest, RejectsBlockedPatternsCaseInsensitively) {
    auto result = validator.validate("#include <cstdlib>\nint main() { SYSTEM(\"ls\"); }\n", registry.resolve("cpp"));
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.reason, "Blocked pattern: system(");

    result = validator.validate("const cp = require('child_process');\n", registry.resolve("javascript"));
    EXPECT_FALSE(result.accepted);

    result = validator.validate("print(eval('1+1'))\n", registry.resolve("python"));
    EXPECT_FALSE(result.accepted);

    result = validator.validate(R"(public class Main {
    public static void main(String[] args) throws Exception {
        Runtime.getRuntime().exec("ls");
    }
})", registry.resolve("java"));
    EXPECT_FALSE(result.accepted);
}

TEST_F(SecurityValidatorTest, RequiresPublicClass) {
    auto result = validator.validate("class Main { public static void main(String[] args) {} }", registry.resolve("java"));
    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.reason, "No public class found in Java code");

    result = validator.validate("public class Main { public static void main(String[] args) {} }", registry.resolve("java"));
    EXPECT_TRUE(result.accepted);
}
