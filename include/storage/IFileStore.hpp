#ifndef SLOTWATCH_STORAGE_IFILESTORE_HPP
#define SLOTWATCH_STORAGE_IFILESTORE_HPP

#include "core/Result.hpp"

#include <string>

namespace slotwatch
{
/**
 * @brief Minimal whole-file storage used for config and the location cache
 */
class IFileStore
{
public:
    virtual ~IFileStore() = default;

    [[nodiscard]] virtual bool exists(const char *path) const = 0;

    /**
     * @brief Read a whole file
     * @return Contents, or NotFound / Error
     */
    [[nodiscard]] virtual Result<std::string> readFile(const char *path) const = 0;

    /**
     * @brief Replace a file, creating parent directories as needed
     */
    [[nodiscard]] virtual Status writeFile(const char *path, const std::string &contents) = 0;
};
} // namespace slotwatch

#endif // SLOTWATCH_STORAGE_IFILESTORE_HPP
