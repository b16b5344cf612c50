#pragma once

// cmd_generate: print --count new identifiers from a fresh system generator,
// one per line or as a JSON array with --json
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
