#pragma once

#include "bytes.h"

namespace Crypto {

bytes Sha256(const bytes& data);
}
