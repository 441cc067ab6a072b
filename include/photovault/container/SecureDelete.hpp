#ifndef INCLUDE_PHOTOVAULT_CONTAINER_SECUREDELETE_HPP
#define INCLUDE_PHOTOVAULT_CONTAINER_SECUREDELETE_HPP

#include "photovault/container/ContainerError.hpp"
#include "photovault/container/ContainerOptions.hpp"
#include <filesystem>

namespace photovault::container
{

struct SecureDeleteOutcome final
{
    // False when the file exceeded the size cap and was only unlinked.
    bool wasOverwritten{ false };
};

// Random, complement and zero passes over the whole file, then unlink. Best effort: copy-on-write
// filesystems and flash translation layers may keep old blocks.
[[nodiscard]] ContainerResult<SecureDeleteOutcome> secureDelete(const std::filesystem::path& path,
                                                                const ContainerOptions& options = {});

} // namespace photovault::container

#endif // INCLUDE_PHOTOVAULT_CONTAINER_SECUREDELETE_HPP
