#ifndef INCLUDE_PHOTOVAULT_CORE_COLLECTIONREKEYER_HPP
#define INCLUDE_PHOTOVAULT_CORE_COLLECTIONREKEYER_HPP

#include "photovault/container/ContainerCodec.hpp"
#include "photovault/container/ContainerError.hpp"
#include "photovault/crypto/ContainerKeys.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <span>
#include <stop_token>
#include <vector>

namespace photovault::core
{

// Each rotation holds one decrypted chunk plus the codec's buffers; two keeps peak memory bounded.
constexpr std::size_t g_kDefaultMaxConcurrentRotations{ 2U };

struct RotationFailure final
{
    std::filesystem::path path;
    photovault::container::ContainerError error;
};

struct RotationReport final
{
    std::vector<std::filesystem::path> succeeded;
    std::vector<RotationFailure> failed;
    // Already rotated by an earlier, interrupted run.
    std::vector<std::filesystem::path> skipped;
    bool cancelled{ false };
    // Set by PasswordService once the new credentials replaced the old ones.
    bool committed{ false };
};

class CollectionRekeyer final
{
public:
    // Both callbacks run on worker threads, serialized under one lock, and must not throw.
    using SkipPredicate = std::function<bool(const std::filesystem::path&)>;
    // Invoked once per successfully rotated container.
    using RotatedCallback = std::function<void(const std::filesystem::path&)>;

    // Throws std::invalid_argument when maxConcurrent is 0.
    explicit CollectionRekeyer(photovault::container::ContainerCodec& codec,
                               std::size_t maxConcurrent = g_kDefaultMaxConcurrentRotations);

    // Rotates every distinct path from oldKeys to newKeys. Never runs two rotations of the same path, and checks
    // `stop` before starting each container. A failing container does not stop the others.
    [[nodiscard]] RotationReport run(std::span<const std::filesystem::path> paths,
                                     const photovault::crypto::ContainerKeys& oldKeys,
                                     const photovault::crypto::ContainerKeys& newKeys,
                                     const SkipPredicate& alreadyRotated = {}, const RotatedCallback& onRotated = {},
                                     std::stop_token stop = {}) const;

private:
    photovault::container::ContainerCodec* m_codec{ nullptr };
    std::size_t m_maxConcurrent{ g_kDefaultMaxConcurrentRotations };
};

} // namespace photovault::core

#endif // INCLUDE_PHOTOVAULT_CORE_COLLECTIONREKEYER_HPP
