#include "photovault/core/IKeyProvider.hpp"
#include "photovault/security/SecureString.hpp"
#include <utility>

namespace photovault::core
{

PasswordKeyProvider::PasswordKeyProvider(PasswordService& service, PasswordPrompt prompt) noexcept
    : m_service(&service), m_prompt(std::move(prompt))
{
}

PasswordResult<photovault::crypto::ContainerKeys> PasswordKeyProvider::unlock()
{
    auto password{ m_prompt() };
    auto keys{ m_service->unlock(password) };
    photovault::security::secureRelease(password);
    return keys;
}

} // namespace photovault::core
