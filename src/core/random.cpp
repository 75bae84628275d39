// VEIL - Secure Random Number Generation Implementation
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/core/random.h"

#include <stdexcept>

#if defined(__linux__)
    #include <sys/random.h>
    #include <cerrno>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    #include <stdlib.h>  // arc4random_buf
#else
    #include <fstream>
#endif

namespace veil {

namespace detail {

bool GetOSEntropy(Byte* buf, size_t len) {
#if defined(__linux__)
    // getrandom() may return short reads for large requests
    size_t filled = 0;
    while (filled < len) {
        ssize_t ret = getrandom(buf + filled, len - filled, 0);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        filled += static_cast<size_t>(ret);
    }
    return true;

#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    arc4random_buf(buf, len);
    return true;

#else
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom) return false;
    urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    return urandom.good();
#endif
}

} // namespace detail

void GetRandBytes(Byte* buf, size_t len) {
    if (len == 0) {
        return;
    }
    if (!detail::GetOSEntropy(buf, len)) {
        throw std::runtime_error("Failed to get random bytes from OS");
    }
}

Bytes32 GetRandBytes32() {
    Bytes32 out;
    GetRandBytes(out.data(), out.size());
    return out;
}

} // namespace veil
