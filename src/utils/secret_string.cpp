#include "mctrl/utils/secret_string.hpp"

#include <openssl/crypto.h>

#include <utility>

namespace mctrl::utils {

SecretString::SecretString(std::string value)
    : m_value(std::move(value))
{
}

SecretString::~SecretString() {
    clear();
}

SecretString::SecretString(const SecretString& other)
    : m_value(other.m_value)
{
}

SecretString& SecretString::operator=(const SecretString& other) {
    if (this != &other) {
        clear();
        m_value = other.m_value;
    }
    return *this;
}

SecretString::SecretString(SecretString&& other) noexcept {
    m_value.swap(other.m_value);
}

SecretString& SecretString::operator=(SecretString&& other) noexcept {
    if (this != &other) {
        clear();
        m_value.swap(other.m_value);
    }
    return *this;
}

void SecretString::clear() {
    if (!m_value.empty()) {
        OPENSSL_cleanse(&m_value[0], m_value.size());
    }
    m_value.clear();
}

} // namespace mctrl::utils
