#include "planka/cli/prompter.hpp"

#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <iostream>

#include "planka/api/errors.hpp"

namespace planka::cli {

namespace {

// Turns terminal echo off for its lifetime
class EchoGuard {
public:
    EchoGuard() {
        if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved_) == 0) {
            termios silent = saved_;
            silent.c_lflag &= ~ECHO;
            active_ = tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
        }
    }
    ~EchoGuard() {
        if (active_) {
            tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
        }
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

private:
    termios saved_{};
    bool active_ = false;
};

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) {
                   return std::isspace(c);
               }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

}  // namespace

Prompter::Prompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

bool Prompter::read_line(std::string& line) {
    if (!std::getline(in_, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

std::string Prompter::prompt(const std::string& text,
                             const std::string& default_value) {
    while (true) {
        out_ << text;
        if (!default_value.empty()) {
            out_ << " [" << default_value << "]";
        }
        out_ << ": " << std::flush;

        std::string line;
        if (!read_line(line)) {
            out_ << std::endl;
            throw UsageError("No input for '" + text + "'");
        }
        line = trim(line);
        if (!line.empty()) {
            return line;
        }
        if (!default_value.empty()) {
            return default_value;
        }
    }
}

std::string Prompter::prompt_hidden(const std::string& text) {
    while (true) {
        out_ << text << ": " << std::flush;

        std::string line;
        bool got_line;
        {
            EchoGuard guard;
            got_line = read_line(line);
        }
        out_ << std::endl;
        if (!got_line) {
            throw UsageError("No input for '" + text + "'");
        }
        if (!line.empty()) {
            return line;
        }
    }
}

bool Prompter::confirm(const std::string& text) {
    while (true) {
        out_ << text << " [y/N]: " << std::flush;

        std::string line;
        if (!read_line(line)) {
            out_ << std::endl;
            return false;
        }
        line = trim(line);
        std::transform(line.begin(), line.end(), line.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (line.empty() || line == "n" || line == "no") {
            return false;
        }
        if (line == "y" || line == "yes") {
            return true;
        }
        out_ << "Error: invalid input" << std::endl;
    }
}

}  // namespace planka::cli
