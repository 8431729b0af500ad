#pragma once

#include <filesystem>
#include <string>

namespace ojcore {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将内容写入文件，文件存在时覆盖
 * @throw std::system_error 如果文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 文件名会被拼接到临时目录或者容器的工作目录中，如果文件名包含 "../" 或者是绝对路径，
 * 那么最后有可能导致评测系统以外的文件被覆盖。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 独占的临时文件夹，析构时删除整个文件夹
 * 文件夹通过 mkdtemp 创建，权限为 0700，只有评测系统自己可以访问。
 * 无论评测成功、失败、超时还是抛出异常，临时文件夹都会被删除。
 */
struct scoped_temp_directory {
    /**
     * @brief 在 parent 下创建一个新的临时文件夹
     * @param prefix 文件夹名前缀
     * @param parent 父文件夹，为空时使用系统的临时文件夹
     * @throw std::system_error 如果无法创建文件夹
     */
    explicit scoped_temp_directory(const std::string &prefix, const std::filesystem::path &parent = {});
    scoped_temp_directory(scoped_temp_directory &&);
    scoped_temp_directory(const scoped_temp_directory &) = delete;
    ~scoped_temp_directory();

    scoped_temp_directory &operator=(scoped_temp_directory &&);
    scoped_temp_directory &operator=(const scoped_temp_directory &) = delete;

    const std::filesystem::path &path() const;

    void release();

private:
    std::filesystem::path dir;
    bool valid;
};

}  // namespace ojcore
