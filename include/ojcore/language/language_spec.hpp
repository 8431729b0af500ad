#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含编程语言的描述
 * 每种语言的编译命令、运行命令、沙箱镜像都集中在 language_spec 中，
 * 执行器只根据 language_spec 来编译运行程序，不需要针对具体语言编写逻辑。
 */
namespace ojcore {

/**
 * @brief 描述一种编程语言
 * 在评测系统启动时创建，之后只读。
 *
 * 命令模板中可以使用以下占位符：
 * {file}   源代码文件的路径
 * {output} 编译产物的路径
 * {dir}    源代码所在的文件夹
 * {class}  Java 等语言的主类名
 */
struct language_spec {
    /**
     * @brief 语言的规范标识符，比如 python, cpp, java
     */
    std::string id;

    /**
     * @brief 语言的别名，比如 python 的 py，cpp 的 c++
     */
    std::vector<std::string> aliases;

    /**
     * @brief 源代码文件的扩展名，包含 '.'，比如 .py
     */
    std::string extension;

    /**
     * @brief 编译命令模板，为空表示这是一门解释型语言，不需要编译
     */
    std::vector<std::string> compile_command;

    /**
     * @brief 运行命令模板
     */
    std::vector<std::string> run_command;

    /**
     * @brief 沙箱镜像名
     */
    std::string image;

    /**
     * @brief 构建沙箱镜像的上下文文件夹名，相对于镜像上下文根目录
     * 为空时使用语言标识符
     */
    std::string image_context;

    /**
     * @brief 源代码中是否必须包含一个 public class（比如 Java）
     * 对于这类语言，源代码文件名必须和主类名一致
     */
    bool requires_public_class = false;

    /**
     * @brief 是否对源代码进行 import 语句的检查
     * 只对 Python 这类动态语言有意义
     */
    bool scan_imports = false;

    bool needs_compile() const;

    /**
     * @brief 构建沙箱镜像的上下文文件夹名
     */
    std::string context_name() const;
};

void from_json(const nlohmann::json &j, language_spec &spec);

void to_json(nlohmann::json &j, const language_spec &spec);

/**
 * @brief 命令模板占位符对应的值
 */
struct command_context {
    std::filesystem::path file;
    std::filesystem::path output;
    std::filesystem::path dir;
    std::string class_name;
};

/**
 * @brief 将命令模板中的占位符替换成实际的值
 * @throw configuration_error 如果命令模板格式不正确（比如未知的占位符）
 */
std::vector<std::string> expand_command(const std::vector<std::string> &command, const command_context &context);

/**
 * @brief 在源代码中查找 public class 的类名
 * 这是一个基于正则表达式的语法匹配，不会解析代码
 * @return 第一个 public class 的类名，找不到时返回空
 */
std::optional<std::string> find_public_class(const std::string &source);

/**
 * @brief 将源代码中的 public class 重命名，使得运行命令不依赖选手选择的类名
 * 类的声明以及代码中所有对该类名的引用（比如 new Main()、Main.helper()、构造函数）都会被修改，
 * 字符串、字符常量和注释中的内容保持不变。
 * @return 修改后的源代码，如果源代码中没有 public class 则原样返回
 */
std::string rename_public_class(const std::string &source, const std::string &new_name);

/**
 * @brief 内置支持的语言
 * python, cpp, c, java, javascript
 */
std::vector<language_spec> builtin_languages();

}  // namespace ojcore
