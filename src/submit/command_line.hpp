#pragma once

#include <string>
#include <vector>

struct CommandParts {
    std::string executable;  // first word, shell quoting removed
    std::string arguments;   // everything after it, as written
};

// Throw BadQuotes('"') if the line holds a double quote that would break the
// quoted Arguments value: one outside single quotes that is not doubled ("").
void check_quotes(const std::string& line);

// POSIX shell word splitting (single quotes, double quotes, backslash).
// Unterminated quotes and a dangling backslash throw BadQuotes.
std::vector<std::string> shell_split(const std::string& line);

// Split a command line into its executable and the raw argument text.
// The executable ends at the first whitespace that is neither quoted nor
// escaped, so "my\ prog arg" gives "my prog" and "arg".
CommandParts split_command_line(const std::string& line);
