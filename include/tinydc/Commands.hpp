#ifndef TINYDC_COMMANDS_HPP
#define TINYDC_COMMANDS_HPP

#include <ostream>
#include <string>

class FrecencyIndex;

// Non-interactive subcommands. Each returns the process exit code.

// Records a visit and flushes. An invalid path is reported but is not an index failure.
int RunPush(FrecencyIndex& index, const std::string& path, std::ostream& err);

// Prints the best match for query on one line; prints nothing and returns 1 when nothing matches.
int RunJump(const FrecencyIndex& index, const std::string& query, std::ostream& out);

// Removes records of directories that no longer exist.
int RunPrune(FrecencyIndex& index, std::ostream& err);

// Prints the wrapper functions for bash, zsh or fish. Returns 2 for an unknown shell.
int RunInit(const std::string& shell, std::ostream& out, std::ostream& err);

#endif // TINYDC_COMMANDS_HPP
