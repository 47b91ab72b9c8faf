#include "storage/LittleFsFileStore.hpp"

#include "common/Logger.hpp"

#include <LittleFS.h>

namespace slotwatch
{
namespace
{
constexpr auto *TAG{"FileStore"};

void ensureParentDirectory(const std::string &path)
{
    const auto slash{path.find_last_of('/')};
    if (slash == std::string::npos || slash == 0)
    {
        return;
    }

    const auto dir{path.substr(0, slash)};
    if (!LittleFS.exists(dir.c_str()))
    {
        LittleFS.mkdir(dir.c_str());
    }
}
} // namespace

Status LittleFsFileStore::begin()
{
    if (!LittleFS.begin(true))
    {
        LOG_ERROR(TAG, "LittleFS mount failed");
        return Status::Error("LittleFS mount failed");
    }

    m_mounted = true;
    LOG_DEBUG(TAG, "LittleFS mounted: %u/%u bytes used",
              static_cast<unsigned>(LittleFS.usedBytes()), static_cast<unsigned>(LittleFS.totalBytes()));
    return Status::Ok();
}

bool LittleFsFileStore::exists(const char *path) const
{
    return m_mounted && LittleFS.exists(path);
}

Result<std::string> LittleFsFileStore::readFile(const char *path) const
{
    if (!m_mounted)
    {
        return Result<std::string>::Error(Status::NotReady("Filesystem not mounted"));
    }

    auto file{LittleFS.open(path, "r")};
    if (!file)
    {
        return Result<std::string>::Error(Status::NotFound("File not found"));
    }

    std::string contents;
    contents.reserve(file.size());
    while (file.available())
    {
        contents += static_cast<char>(file.read());
    }
    file.close();

    return Result<std::string>::Ok(std::move(contents));
}

Status LittleFsFileStore::writeFile(const char *path, const std::string &contents)
{
    if (!m_mounted)
    {
        return Status::NotReady("Filesystem not mounted");
    }

    ensureParentDirectory(path);

    auto file{LittleFS.open(path, "w")};
    if (!file)
    {
        LOG_ERROR(TAG, "Cannot open %s for writing", path);
        return Status::Error("File open failed");
    }

    const auto written{file.write(reinterpret_cast<const std::uint8_t *>(contents.data()), contents.size())};
    file.close();

    if (written != contents.size())
    {
        LOG_ERROR(TAG, "Short write to %s (%u/%u bytes)", path,
                  static_cast<unsigned>(written), static_cast<unsigned>(contents.size()));
        return Status::Error("File write failed");
    }
    return Status::Ok();
}
} // namespace slotwatch
