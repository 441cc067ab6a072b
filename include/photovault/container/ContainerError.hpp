#ifndef INCLUDE_PHOTOVAULT_CONTAINER_CONTAINERERROR_HPP
#define INCLUDE_PHOTOVAULT_CONTAINER_CONTAINERERROR_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace photovault::container
{

enum class ContainerErrc : std::uint8_t
{
    FileAlreadyExists,
    FileNotFound,
    // Magic mismatch or unsupported version: "not a container this reader understands".
    InvalidFileFormat,
    // Authentication or structural failure: tampering, truncation, or wrong keys.
    DecryptionFailed,
    IoError,
    // CSPRNG or crypto library failure other than an authentication mismatch.
    CryptoError,
};

struct ContainerError final
{
    ContainerErrc code{ ContainerErrc::IoError };
    std::string reason;
    std::filesystem::path path;
};

// Not a failure: the caller asked to stop. Partial artifacts are already removed when this is returned.
struct OperationCancelled final
{
};

template <class T> using ContainerResult = std::variant<T, ContainerError, OperationCancelled>;

// Re-wraps the failure alternative of `r` (which must not hold a value) for a caller with another value type.
template <class T, class U> [[nodiscard]] ContainerResult<T> propagateFailure(ContainerResult<U>&& r)
{
    if (auto* error{ std::get_if<ContainerError>(&r) }; error != nullptr)
    {
        return std::move(*error);
    }
    return OperationCancelled{};
}

[[nodiscard]] std::string_view toString(ContainerErrc code) noexcept;

[[nodiscard]] std::string describe(const ContainerError& error);

// Format and integrity errors may mean a wrong password or damaged storage; I/O errors point at the environment.
[[nodiscard]] constexpr bool isIntegrityError(ContainerErrc code) noexcept
{
    return code == ContainerErrc::DecryptionFailed || code == ContainerErrc::InvalidFileFormat;
}

} // namespace photovault::container

#endif // INCLUDE_PHOTOVAULT_CONTAINER_CONTAINERERROR_HPP
