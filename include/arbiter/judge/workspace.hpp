#pragma once

#include <filesystem>
#include <string>

namespace arbiter {

/**
 * @brief 评测使用的临时工作区
 * 构造时在 RUN_DIR 下创建一个独占的临时文件夹，析构时删除整个文件夹。
 * 无论评测正常结束还是因为异常退出，工作区都会被删除。
 */
struct workspace {
    /**
     * @param prefix 文件夹名前缀，比如 "arbiter-"
     * @param root 工作区所在的目录
     * @throw workspace_error 若无法创建文件夹
     */
    explicit workspace(const std::string &prefix, const std::filesystem::path &root);

    /**
     * @brief 在 RUN_DIR 下创建工作区
     */
    explicit workspace(const std::string &prefix);

    workspace(const workspace &) = delete;
    workspace &operator=(const workspace &) = delete;

    /**
     * @brief 删除工作区，删除失败只记录日志
     */
    ~workspace();

    const std::filesystem::path &path() const;

    /**
     * @brief 工作区下的文件路径
     * @param filename 文件名，不能包含路径分隔符或者 ".."
     */
    std::filesystem::path file(const std::string &filename) const;

    /**
     * @brief 将内容写入工作区下的文件
     * @return 文件路径
     * @throw workspace_error 若文件无法写入
     */
    std::filesystem::path write(const std::string &filename, const std::string &content) const;

private:
    std::filesystem::path dir;
};

}  // namespace arbiter
