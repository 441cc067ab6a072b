#ifndef INCLUDE_PHOTOVAULT_CONTAINER_TEMPORARYFILES_HPP
#define INCLUDE_PHOTOVAULT_CONTAINER_TEMPORARYFILES_HPP

#include "photovault/container/ContainerOptions.hpp"
#include <chrono>
#include <cstddef>
#include <string_view>

namespace photovault::container
{

constexpr std::string_view g_kDecryptedTempPrefix{ "pv-decrypted-" };
constexpr std::chrono::hours g_kDefaultTempArtifactAge{ 1 };

// Removes decrypted temp files older than `olderThan` left behind by crashed sessions.
// Returns how many were removed; a missing directory counts as nothing to do.
std::size_t cleanupTemporaryArtifacts(const ContainerOptions& options,
                                      std::chrono::seconds olderThan = g_kDefaultTempArtifactAge);

} // namespace photovault::container

#endif // INCLUDE_PHOTOVAULT_CONTAINER_TEMPORARYFILES_HPP
