#ifndef SLOTWATCH_SERVICES_LOCATIONSERVICE_HPP
#define SLOTWATCH_SERVICES_LOCATIONSERVICE_HPP

/**
 * @file LocationService.hpp
 * @brief Startup discovery and selection of the offices to scan.
 *
 * Responsibilities:
 * - Search offices for every configured zip code
 * - Merge the results nearest first, one entry per office id
 * - Select by distance, or let the operator pick over the console
 * - Remember an interactive pick in `/cache/location.json`
 */

#include "common/Config.hpp"
#include "core/IService.hpp"
#include "core/Result.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace slotwatch
{
class IFileStore;
class SchedulerApi;

/**
 * @brief Interactive pick of locations
 */
class ILocationPrompt
{
public:
    virtual ~ILocationPrompt() = default;

    /**
     * @brief Ask the operator to choose among the discovered locations
     * @return 0-based indices into @p locations; empty if nothing was chosen
     */
    [[nodiscard]] virtual std::vector<std::size_t> choose(const std::vector<Location> &locations) = 0;
};

class LocationService : public ServiceBase
{
public:
    static constexpr auto *CACHE_PATH{"/cache/location.json"};

    LocationService(SchedulerApi &api, IFileStore &store, const LocationConfig &config, ILocationPrompt *prompt = nullptr);
    ~LocationService() override = default;

    LocationService(const LocationService &) = delete;
    LocationService &operator=(const LocationService &) = delete;
    LocationService(LocationService &&) = delete;
    LocationService &operator=(LocationService &&) = delete;

    /**
     * @brief Discover and select locations
     * @return Ok with a non-empty selection; NotFound if nothing is within
     *         range; Fatal if the operator chose nothing or a request gave up
     */
    Status begin() override;
    void loop() override;
    void end() override;

    [[nodiscard]] const std::vector<Location> &getSelected() const
    {
        return m_selected;
    }

    /// Stable sort by distance, then keep the first entry of each id
    [[nodiscard]] static std::vector<Location> mergeByDistance(std::vector<Location> locations);

    /// Locations strictly closer than @p miles, order kept
    [[nodiscard]] static std::vector<Location> withinMiles(const std::vector<Location> &locations, double miles);

    /// "<name> - <address> - <distance> miles away from <zip>!"
    [[nodiscard]] static std::string describe(const Location &location);

    /**
     * @brief Parse a comma-separated list of 1-based choices
     * @return 0-based indices, in the order given, duplicates and out-of-range entries dropped
     */
    [[nodiscard]] static std::vector<std::size_t> parseSelection(const std::string &input, std::size_t count);

    [[nodiscard]] static std::string toCacheJson(const std::vector<Location> &locations);
    [[nodiscard]] static Result<std::vector<Location>> fromCacheJson(const std::string &json);

private:
    [[nodiscard]] Result<std::vector<Location>> discover();
    [[nodiscard]] Status selectInteractive(const std::vector<Location> &discovered);
    [[nodiscard]] Status selectByDistance(const std::vector<Location> &discovered);

    SchedulerApi &m_api;
    IFileStore &m_store;
    const LocationConfig &m_config;
    ILocationPrompt *m_prompt{nullptr};

    std::vector<Location> m_selected{};
};
} // namespace slotwatch

#endif // SLOTWATCH_SERVICES_LOCATIONSERVICE_HPP
