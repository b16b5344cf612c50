#pragma once

// cmd_inspect: print the embedded timestamp and counter of each identifier argument
int cmd_inspect(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
