#ifndef PHOTOVAULT_SRC_CONTAINER_TEMPORARYFILE_HPP
#define PHOTOVAULT_SRC_CONTAINER_TEMPORARYFILE_HPP

#include "PosixFile.hpp"
#include "photovault/container/ContainerOptions.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace photovault::container::detail
{

struct TemporaryFile final
{
    PosixFile file;
    std::filesystem::path path;
};

// Creates the owner-only temp directory if needed, then a fresh pv-decrypted-<hex>[.ext] file in it.
[[nodiscard]] TemporaryFile createTemporaryFile(const ContainerOptions& options,
                                                const std::optional<std::string>& preferredExtension);

} // namespace photovault::container::detail

#endif // PHOTOVAULT_SRC_CONTAINER_TEMPORARYFILE_HPP
