#pragma once

#include <cstddef>
#include <cstdint>

namespace xorhunt {

class Rc4 {
public:
    Rc4(const uint8_t *key, size_t keyLength);

    uint8_t next();
    // out[i] = in[i] ^ keystream; in and out may alias.
    void apply(const uint8_t *in, uint8_t *out, size_t length);

private:
    uint8_t s_[256];
    uint8_t i_{0};
    uint8_t j_{0};
};

} // namespace xorhunt
