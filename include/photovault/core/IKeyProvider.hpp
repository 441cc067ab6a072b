#ifndef INCLUDE_PHOTOVAULT_CORE_IKEYPROVIDER_HPP
#define INCLUDE_PHOTOVAULT_CORE_IKEYPROVIDER_HPP

#include "photovault/core/PasswordError.hpp"
#include "photovault/core/PasswordService.hpp"
#include "photovault/crypto/ContainerKeys.hpp"
#include "photovault/security/SecureString.hpp"
#include <functional>

namespace photovault::core
{

// Source of the container key pair. The codec never learns where keys come from.
class IKeyProvider
{
public:
    IKeyProvider() = default;
    IKeyProvider(const IKeyProvider&) = delete;
    IKeyProvider& operator=(const IKeyProvider&) = delete;
    IKeyProvider(IKeyProvider&&) = delete;
    IKeyProvider& operator=(IKeyProvider&&) = delete;
    virtual ~IKeyProvider() = default;

    [[nodiscard]] virtual PasswordResult<photovault::crypto::ContainerKeys> unlock() = 0;
};

class PasswordKeyProvider final : public IKeyProvider
{
public:
    using PasswordPrompt = std::function<photovault::security::SecureString()>;

    PasswordKeyProvider(PasswordService& service, PasswordPrompt prompt) noexcept;

    // Prompts once per call; the password is wiped before returning.
    [[nodiscard]] PasswordResult<photovault::crypto::ContainerKeys> unlock() override;

private:
    PasswordService* m_service{ nullptr };
    PasswordPrompt m_prompt;
};

} // namespace photovault::core

#endif // INCLUDE_PHOTOVAULT_CORE_IKEYPROVIDER_HPP
