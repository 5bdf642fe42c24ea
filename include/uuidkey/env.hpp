#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace uuidkey::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);
std::optional<long> GetInteger(std::string_view name);

}  // namespace uuidkey::env
