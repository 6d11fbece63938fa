#include <openssl/evp.h>
#include "crypto.h"

namespace Crypto {

bytes Sha256(const bytes& data) {
    bytes result(0x20);
    unsigned int length = 0;
    EVP_Digest(data.data(), data.size(), result.data(), &length, EVP_sha256(), nullptr);
    result.resize(length);
    return result;
}
}
