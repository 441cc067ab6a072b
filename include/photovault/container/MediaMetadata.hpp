#ifndef INCLUDE_PHOTOVAULT_CONTAINER_MEDIAMETADATA_HPP
#define INCLUDE_PHOTOVAULT_CONTAINER_MEDIAMETADATA_HPP

#include <chrono>
#include <optional>
#include <string>

namespace photovault::container
{

struct GeoLocation final
{
    double latitude{ 0.0 };
    double longitude{ 0.0 };

    bool operator==(const GeoLocation&) const = default;
};

struct MediaMetadata final
{
    using TimePoint = std::chrono::sys_time<std::chrono::nanoseconds>;

    std::string filename;
    TimePoint creationDate{};
    std::optional<std::string> originalAssetIdentifier;
    std::optional<double> durationSeconds;
    std::optional<GeoLocation> location;
    std::optional<bool> isFavorite;

    bool operator==(const MediaMetadata&) const = default;
};

} // namespace photovault::container

#endif // INCLUDE_PHOTOVAULT_CONTAINER_MEDIAMETADATA_HPP
