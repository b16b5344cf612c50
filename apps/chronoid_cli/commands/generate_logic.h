#pragma once

#include "chronoid/generator/generator.h"

#include <cstddef>
#include <ostream>

// execute_generate: draw count identifiers from generator and write them to out.
// Plain output is one canonical identifier per line; json output is a single array.
// Takes the generator by reference so tests can drive it with a fixed clock and scripted entropy.
int execute_generate(chronoid::generator::Generator& generator, std::size_t count, bool json,
                     std::ostream& out);
