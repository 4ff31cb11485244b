/**
 * @file secret.hpp
 * @brief Opaque holder for archive passwords.
 *
 * A Secret cannot be printed, formatted or copied implicitly. Its bytes are wiped
 * when it is cleared or destroyed.
 */

#ifndef SECRET_HPP
#define SECRET_HPP

#include <cstddef>
#include <string>

/**
 * @brief Move-only container for a password.
 */
class Secret {
public:
    Secret() = default;

    /**
     * @brief Takes ownership of the given characters and wipes the source string.
     *
     * @param plain Password characters; left empty on return.
     */
    explicit Secret(std::string&& plain);

    Secret(const Secret&) = delete;
    Secret& operator=(const Secret&) = delete;
    Secret(Secret&& other) noexcept;
    Secret& operator=(Secret&& other) noexcept;
    ~Secret();

    /**
     * @brief NUL-terminated view for handing the password to the archive library.
     */
    const char* reveal() const { return value.c_str(); }

    bool empty() const { return value.empty(); }

    /**
     * @brief Constant-time comparison of two secrets.
     */
    bool matches(const Secret& other) const;

    /**
     * @brief Overwrites and releases the stored characters.
     */
    void clear();

private:
    std::string value;
};

/**
 * @brief Overwrites a buffer with zeros in a way the optimizer keeps.
 */
void secureWipe(void* buffer, std::size_t size);

#endif // SECRET_HPP
