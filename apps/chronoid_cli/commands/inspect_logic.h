#pragma once

#include "chronoid/codec/bit_codec.h"

#include <ostream>
#include <string>
#include <vector>

// execute_inspect: decode each identifier and report its fields.
// Malformed identifiers are reported to err and make the result 1; the
// remaining identifiers are still inspected.
int execute_inspect(const std::vector<std::string>& identifiers, chronoid::codec::Validation validation,
                    bool json, std::ostream& out, std::ostream& err);
