#pragma once

#include <toolhub/core/types.h>

#include <string>
#include <string_view>

namespace toolhub::crypto {

// Lowercase hex SHA-256 of data
Result<std::string> sha256Hex(std::string_view data);

} // namespace toolhub::crypto
