#include "contactbook/application/CommandParser.hpp"
#include "contactbook/utils/string_utils.h"

namespace contactbook::application {

ParsedCommand parseInput(const std::string& line) {
    ParsedCommand parsed;

    auto tokens = utils::splitWhitespace(line);
    if (tokens.empty()) {
        return parsed;
    }

    parsed.command = utils::toLower(tokens.front());
    parsed.args.assign(tokens.begin() + 1, tokens.end());
    return parsed;
}

} // namespace contactbook::application
