#ifndef SLOTWATCH_STORAGE_LITTLEFSFILESTORE_HPP
#define SLOTWATCH_STORAGE_LITTLEFSFILESTORE_HPP

/**
 * @file LittleFsFileStore.hpp
 * @brief IFileStore backed by the on-board LittleFS partition
 */

#include "storage/IFileStore.hpp"

namespace slotwatch
{
class LittleFsFileStore : public IFileStore
{
public:
    LittleFsFileStore() = default;
    ~LittleFsFileStore() override = default;

    LittleFsFileStore(const LittleFsFileStore &) = delete;
    LittleFsFileStore &operator=(const LittleFsFileStore &) = delete;

    /**
     * @brief Mount the filesystem (formats on first boot)
     */
    [[nodiscard]] Status begin();

    [[nodiscard]] bool exists(const char *path) const override;
    [[nodiscard]] Result<std::string> readFile(const char *path) const override;
    [[nodiscard]] Status writeFile(const char *path, const std::string &contents) override;

private:
    bool m_mounted{false};
};
} // namespace slotwatch

#endif // SLOTWATCH_STORAGE_LITTLEFSFILESTORE_HPP
