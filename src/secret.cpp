#include "secret.hpp"
#include <cstring>

void secureWipe(void* buffer, std::size_t size) {
    volatile unsigned char* bytes = static_cast<volatile unsigned char*>(buffer);
    while (size--) {
        *bytes++ = 0;
    }
}

Secret::Secret(std::string&& plain) : value(plain) {
    secureWipe(plain.data(), plain.size());
    plain.clear();
}

Secret::Secret(Secret&& other) noexcept : value(other.value) {
    other.clear();
}

Secret& Secret::operator=(Secret&& other) noexcept {
    if (this != &other) {
        clear();
        value = other.value;
        other.clear();
    }
    return *this;
}

Secret::~Secret() {
    clear();
}

bool Secret::matches(const Secret& other) const {
    if (value.size() != other.value.size()) {
        return false;
    }
    unsigned char diff = 0;
    for (std::size_t i = 0; i < value.size(); ++i) {
        diff |= static_cast<unsigned char>(value[i] ^ other.value[i]);
    }
    return diff == 0;
}

void Secret::clear() {
    secureWipe(value.data(), value.size());
    value.clear();
    value.shrink_to_fit();
}
