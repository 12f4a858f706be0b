#pragma once

#include <string>
#include <ostream>

namespace mctrl::utils {

/**
 * Secret String
 *
 * Holds a password. The value is only reachable through expose(), is
 * printed as "[REDACTED]" and is wiped with OPENSSL_cleanse when the
 * object is destroyed or overwritten.
 */
class SecretString {
public:
    SecretString() = default;
    explicit SecretString(std::string value);
    ~SecretString();

    SecretString(const SecretString& other);
    SecretString& operator=(const SecretString& other);
    SecretString(SecretString&& other) noexcept;
    SecretString& operator=(SecretString&& other) noexcept;

    const std::string& expose() const { return m_value; }
    bool empty() const { return m_value.empty(); }

    // Wipe the stored value and leave the string empty
    void clear();

private:
    std::string m_value;
};

inline std::ostream& operator<<(std::ostream& os, const SecretString&) {
    return os << "[REDACTED]";
}

} // namespace mctrl::utils
