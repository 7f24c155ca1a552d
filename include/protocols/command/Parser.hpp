#pragma once

#include "protocols/command/types.hpp"

#include <string>

namespace tw::protocols::command {

// Free text -> command. Case-insensitive, surrounding whitespace ignored.
// Never throws; anything unrecognised comes back as Unknown.
[[nodiscard]] Command parse(const std::string& line);

[[nodiscard]] std::string name(const Command& cmd);

}
