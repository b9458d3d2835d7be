#include "xorhunt/Rc4.h"

#include <utility>

namespace xorhunt {

Rc4::Rc4(const uint8_t *key, size_t keyLength) {
    for (int i = 0; i < 256; ++i) s_[i] = static_cast<uint8_t>(i);
    uint8_t j = 0;
    for (int i = 0; i < 256; ++i) {
        j = static_cast<uint8_t>(j + s_[i] + key[static_cast<size_t>(i) % keyLength]);
        std::swap(s_[i], s_[j]);
    }
}

uint8_t Rc4::next() {
    i_ = static_cast<uint8_t>(i_ + 1);
    j_ = static_cast<uint8_t>(j_ + s_[i_]);
    std::swap(s_[i_], s_[j_]);
    return s_[static_cast<uint8_t>(s_[i_] + s_[j_])];
}

void Rc4::apply(const uint8_t *in, uint8_t *out, size_t length) {
    for (size_t n = 0; n < length; ++n) {
        out[n] = static_cast<uint8_t>(in[n] ^ next());
    }
}

} // namespace xorhunt
