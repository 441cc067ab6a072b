#ifndef INCLUDE_PHOTOVAULT_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_PHOTOVAULT_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace photovault::storage
{

// The album has no credential database yet.
class CredentialsNotFound final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A stored row exists but does not decode: wrong blob size, out-of-range parameter, unknown status.
// Callers must not fall back to defaults; the album needs manual repair.
class CredentialsCorrupt final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace photovault::storage

#endif // INCLUDE_PHOTOVAULT_STORAGE_STORAGEERRORS_HPP
