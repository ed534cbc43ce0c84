#pragma once
#include <string>

namespace wisteria::models
{

// Platform-assigned identifier, kept in the string form the API sends.
using Snowflake = std::string;

} // namespace wisteria::models
