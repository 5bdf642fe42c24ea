#pragma once

#include "uuidkey/apikey.hpp"
#include "uuidkey/config.hpp"
#include "uuidkey/constants.hpp"
#include "uuidkey/entropy.hpp"
#include "uuidkey/error.hpp"
#include "uuidkey/key.hpp"

namespace uuidkey {

// Shorthand for ApiKey::Parse.
inline Result<ApiKey> Parse(const std::string& text) {
    return ApiKey::Parse(text);
}

}  // namespace uuidkey
