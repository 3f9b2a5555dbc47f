#pragma once
#include <string>
#include <vector>

// Trim whitespace from both ends
std::string trim(const std::string& s);

// Split a command string into argv words using POSIX shell quoting rules:
// blanks separate words, '...' is literal, "..." allows \" \\ \$ \` escapes,
// a backslash outside quotes escapes the next character.
// No expansion of variables, globs or ~ is done.
// Throws DispatchFault (ERR_DISPATCH_PARSE) on an unterminated quote or a
// trailing backslash.
std::vector<std::string> splitCommandLine(const std::string& line);
