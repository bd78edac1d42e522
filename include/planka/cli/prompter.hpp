#pragma once

#include <iosfwd>
#include <string>

namespace planka::cli {

// Interactive questions on the terminal. Answers are read line by line
// from `in`; prompts are written to `out`.
class Prompter {
public:
    Prompter(std::istream& in, std::ostream& out);

    /// @brief Asks for a line of text. An empty answer yields default_value
    /// when one is given, otherwise the question is repeated.
    /// @throws UsageError if input ends before an answer is given.
    std::string prompt(const std::string& text,
                       const std::string& default_value = "");

    /// @brief Like prompt(), with terminal echo disabled while typing.
    std::string prompt_hidden(const std::string& text);

    /// @brief Yes/no question; an empty answer or end of input means no.
    bool confirm(const std::string& text);

private:
    bool read_line(std::string& line);

    std::istream& in_;
    std::ostream& out_;
};

}  // namespace planka::cli
