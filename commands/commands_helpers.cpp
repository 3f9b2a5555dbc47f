#include "commands/commands_helpers.hpp"
#include "faults.hpp"

// ------------------------------------------------------------
// Trim whitespace from both ends
// ------------------------------------------------------------
std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    auto end   = s.find_last_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

// ------------------------------------------------------------
// Shell-style word splitting
// ------------------------------------------------------------
std::vector<std::string> splitCommandLine(const std::string& line) {
    enum class Mode { Plain, Single, Double };

    std::vector<std::string> words;
    std::string current;
    bool inWord = false;   // "" still produces an (empty) word
    Mode mode = Mode::Plain;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];

        switch (mode) {
        case Mode::Plain:
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                if (inWord) {
                    words.push_back(current);
                    current.clear();
                    inWord = false;
                }
            } else if (c == '\'') {
                mode = Mode::Single;
                inWord = true;
            } else if (c == '"') {
                mode = Mode::Double;
                inWord = true;
            } else if (c == '\\') {
                if (i + 1 >= line.size()) {
                    throw DispatchFault("trailing backslash in: " + line, "ERR_DISPATCH_PARSE");
                }
                current.push_back(line[++i]);
                inWord = true;
            } else {
                current.push_back(c);
                inWord = true;
            }
            break;

        case Mode::Single:
            if (c == '\'') mode = Mode::Plain;
            else current.push_back(c);
            break;

        case Mode::Double:
            if (c == '"') {
                mode = Mode::Plain;
            } else if (c == '\\' && i + 1 < line.size() &&
                       (line[i + 1] == '"' || line[i + 1] == '\\' ||
                        line[i + 1] == '$' || line[i + 1] == '`')) {
                current.push_back(line[++i]);
            } else {
                current.push_back(c);
            }
            break;
        }
    }

    if (mode != Mode::Plain) {
        throw DispatchFault("unterminated quote in: " + line, "ERR_DISPATCH_PARSE");
    }
    if (inWord) {
        words.push_back(current);
    }
    return words;
}
