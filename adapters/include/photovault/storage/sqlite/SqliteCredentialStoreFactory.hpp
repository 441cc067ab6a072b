#ifndef INCLUDE_PHOTOVAULT_STORAGE_SQLITE_SQLITECREDENTIALSTOREFACTORY_HPP
#define INCLUDE_PHOTOVAULT_STORAGE_SQLITE_SQLITECREDENTIALSTOREFACTORY_HPP

#include "photovault/storage/ICredentialStore.hpp"
#include <memory>

namespace photovault::storage::sqlite
{

[[nodiscard]] std::unique_ptr<photovault::storage::ICredentialStore> makeSqliteCredentialStore();

} // namespace photovault::storage::sqlite

#endif // INCLUDE_PHOTOVAULT_STORAGE_SQLITE_SQLITECREDENTIALSTOREFACTORY_HPP
