#include "photovault/container/ContainerError.hpp"

namespace photovault::container
{

std::string_view toString(ContainerErrc code) noexcept
{
    switch (code)
    {
    case ContainerErrc::FileAlreadyExists:
        return "file already exists";
    case ContainerErrc::FileNotFound:
        return "file not found";
    case ContainerErrc::InvalidFileFormat:
        return "invalid file format";
    case ContainerErrc::DecryptionFailed:
        return "decryption failed";
    case ContainerErrc::IoError:
        return "I/O error";
    case ContainerErrc::CryptoError:
        return "crypto error";
    }
    return "unknown error";
}

std::string describe(const ContainerError& error)
{
    std::string out{ toString(error.code) };
    if (!error.reason.empty())
    {
        out.append(": ");
        out.append(error.reason);
    }
    if (!error.path.empty())
    {
        out.append(" (");
        out.append(error.path.string());
        out.append(")");
    }
    return out;
}

} // namespace photovault::container
