/**
 * @file file_system.hpp
 * @brief Local filesystem queries used before a transfer is dispatched.
 *
 * Strategy inference and the identity-file pre-flight go through this interface so they
 * can be exercised without touching the real filesystem.
 */

#ifndef FILE_SYSTEM_HPP
#define FILE_SYSTEM_HPP

#include <filesystem>

/**
 * @brief Interface for local filesystem queries.
 */
class FileSystem {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~FileSystem() = default;

    /**
     * @brief Checks whether a path exists.
     */
    virtual bool exists(const std::filesystem::path& path) const = 0;

    /**
     * @brief Checks whether a path is an existing directory (following symlinks).
     */
    virtual bool isDirectory(const std::filesystem::path& path) const = 0;
};

/**
 * @brief FileSystem backed by std::filesystem.
 *
 * Query errors (e.g., permission denied) are reported as "does not exist".
 */
class LocalFileSystem : public FileSystem {
public:
    bool exists(const std::filesystem::path& path) const override;
    bool isDirectory(const std::filesystem::path& path) const override;
};

#endif // FILE_SYSTEM_HPP
