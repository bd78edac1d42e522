#include "planka/cli/command.hpp"

#include <algorithm>
#include <boost/program_options.hpp>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

#include "planka/api/errors.hpp"

namespace po = boost::program_options;

namespace planka::cli {

namespace {

constexpr const char* kArgsOption = "__args";

// Long options must be spelled out; abbreviations would let a subcommand
// flag be taken for a global one.
constexpr int kParserStyle = po::command_line_style::default_style &
                             ~po::command_line_style::allow_guessing;

std::string format_double(double value) {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10)
        << value;
    return oss.str();
}

}  // namespace

Command::Command(const std::string& name, const std::string& description)
    : name_(name), description_(description) {}

void Command::add_command(std::shared_ptr<Command> cmd) {
    cmd->parent_ = this;
    subcommands_.push_back(std::move(cmd));
}

std::shared_ptr<Command> Command::find_command(const std::string& name) const {
    auto it = std::find_if(subcommands_.begin(), subcommands_.end(),
                           [&name](const std::shared_ptr<Command>& cmd) {
                               return cmd->name() == name;
                           });
    return it != subcommands_.end() ? *it : nullptr;
}

void Command::add_flag(const std::string& name, const std::string& description,
                       const std::string& default_value) {
    flags_.push_back({name, "", description, default_value, "string"});
}

void Command::add_flag_with_short(const std::string& name,
                                  const std::string& short_name,
                                  const std::string& description,
                                  const std::string& default_value) {
    flags_.push_back({name, short_name, description, default_value, "string"});
}

void Command::add_bool_flag(const std::string& name,
                            const std::string& description) {
    flags_.push_back({name, "", description, "", "bool"});
}

void Command::add_bool_flag_with_short(const std::string& name,
                                       const std::string& short_name,
                                       const std::string& description) {
    flags_.push_back({name, short_name, description, "", "bool"});
}

void Command::add_int_flag(const std::string& name,
                           const std::string& description, int default_value) {
    flags_.push_back(
        {name, "", description, std::to_string(default_value), "int"});
}

void Command::add_int_flag_with_short(const std::string& name,
                                      const std::string& short_name,
                                      const std::string& description,
                                      int default_value) {
    flags_.push_back(
        {name, short_name, description, std::to_string(default_value), "int"});
}

void Command::add_double_flag(const std::string& name,
                              const std::string& description,
                              double default_value) {
    flags_.push_back(
        {name, "", description, format_double(default_value), "double"});
}

void Command::add_double_flag_with_short(const std::string& name,
                                         const std::string& short_name,
                                         const std::string& description,
                                         double default_value) {
    flags_.push_back({name, short_name, description,
                      format_double(default_value), "double"});
}

void Command::add_argument(const std::string& name,
                           const std::string& description, bool required) {
    arguments_.push_back({name, description, required});
}

std::ostream& Command::out() const {
    if (out_) {
        return *out_;
    }
    return parent_ ? parent_->out() : std::cout;
}

std::ostream& Command::err() const {
    if (err_) {
        return *err_;
    }
    return parent_ ? parent_->err() : std::cerr;
}

std::string Command::full_name() const {
    return parent_ ? parent_->full_name() + " " + name_ : name_;
}

void Command::prepare(CommandContext&) {}

int Command::execute(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return execute(args);
}

int Command::execute(const std::vector<std::string>& args) {
    try {
        return parse_and_execute(args);
    } catch (const std::exception& e) {
        err() << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int Command::parse_and_execute(const std::vector<std::string>& args) {
    CommandContext ctx;

    // Build program options description
    po::options_description desc("Options");
    desc.add_options()("help,h", "Show help message");

    // Add command-specific flags
    for (const auto& flag : flags_) {
        std::string option_spec = flag.name;
        if (!flag.short_name.empty()) {
            option_spec += "," + flag.short_name;
        }

        if (flag.type == "bool") {
            desc.add_options()(option_spec.c_str(), flag.description.c_str());
        } else if (flag.type == "int") {
            desc.add_options()(
                option_spec.c_str(),
                po::value<int>()->default_value(std::stoi(flag.default_value)),
                flag.description.c_str());
        } else if (flag.type == "double") {
            desc.add_options()(option_spec.c_str(),
                               po::value<double>()->default_value(
                                   std::stod(flag.default_value),
                                   flag.default_value),
                               flag.description.c_str());
        } else {
            desc.add_options()(
                option_spec.c_str(),
                po::value<std::string>()->default_value(flag.default_value),
                flag.description.c_str());
        }
    }

    po::variables_map vm;
    std::vector<std::string> positional;

    try {
        if (!subcommands_.empty()) {
            // Parse known args, leave the rest to the subcommand
            po::parsed_options parsed = po::command_line_parser(args)
                                            .options(desc)
                                            .style(kParserStyle)
                                            .allow_unregistered()
                                            .run();
            po::store(parsed, vm);
            positional = po::collect_unrecognized(parsed.options,
                                                  po::include_positional);
        } else {
            po::options_description all;
            all.add(desc);
            all.add_options()(kArgsOption,
                              po::value<std::vector<std::string>>());
            po::positional_options_description pos;
            pos.add(kArgsOption, -1);

            po::store(po::command_line_parser(args)
                          .options(all)
                          .positional(pos)
                          .style(kParserStyle)
                          .run(),
                      vm);
            if (vm.count(kArgsOption)) {
                positional = vm[kArgsOption].as<std::vector<std::string>>();
            }
        }
        po::notify(vm);
    } catch (const po::error& e) {
        throw UsageError(e.what());
    }

    // Extract flag values
    for (const auto& flag : flags_) {
        if (flag.type == "bool") {
            if (vm.count(flag.name)) {
                ctx.set_user_flag(flag.name, "true");
            } else {
                ctx.set_flag(flag.name, "false");
            }
            continue;
        }

        const auto& value = vm[flag.name];
        std::string text;
        if (flag.type == "int") {
            text = std::to_string(value.as<int>());
        } else if (flag.type == "double") {
            text = format_double(value.as<double>());
        } else {
            text = value.as<std::string>();
        }

        if (value.defaulted()) {
            ctx.set_flag(flag.name, text);
        } else {
            ctx.set_user_flag(flag.name, text);
        }
    }

    // Dispatch to a subcommand
    if (!positional.empty() && !subcommands_.empty()) {
        const std::string& first = positional.front();
        if (first.size() > 1 && first[0] == '-') {
            throw UsageError("Unknown option '" + first + "'");
        }
        auto subcmd = find_command(first);
        if (!subcmd) {
            throw UsageError("Unknown command '" + first + "'. Run '" +
                             full_name() + " --help' for usage.");
        }

        std::vector<std::string> sub_args(positional.begin() + 1,
                                          positional.end());
        if (vm.count("help")) {
            sub_args.emplace_back("--help");
        }

        prepare(ctx);
        return subcmd->parse_and_execute(sub_args);
    }

    if (vm.count("help")) {
        print_help();
        return 0;
    }

    validate_arguments(positional);
    for (const auto& arg : positional) {
        ctx.add_arg(arg);
    }

    prepare(ctx);
    return run(ctx);
}

void Command::validate_arguments(const std::vector<std::string>& args) const {
    size_t required = std::count_if(
        arguments_.begin(), arguments_.end(),
        [](const Argument& argument) { return argument.required; });

    if (args.size() < required) {
        throw UsageError("Missing argument '" + arguments_[args.size()].name +
                         "'. Run '" + full_name() + " --help' for usage.");
    }
    if (args.size() > arguments_.size()) {
        throw UsageError("Unexpected argument '" + args[arguments_.size()] +
                         "'");
    }
}

void Command::print_help() const {
    std::ostream& os = out();
    os << full_name() << " - " << description_ << std::endl << std::endl;

    if (!long_description_.empty()) {
        os << long_description_ << std::endl << std::endl;
    }

    print_usage();
    os << std::endl;

    if (!arguments_.empty()) {
        os << "Arguments:" << std::endl;
        for (const auto& argument : arguments_) {
            os << "  " << std::left << std::setw(20) << argument.name
               << argument.description;
            if (!argument.required) {
                os << " (optional)";
            }
            os << std::endl;
        }
        os << std::endl;
    }

    if (!subcommands_.empty()) {
        os << "Available Commands:" << std::endl;
        for (const auto& cmd : subcommands_) {
            os << "  " << std::left << std::setw(24) << cmd->name()
               << cmd->description() << std::endl;
        }
        os << std::endl;
    }

    if (!flags_.empty()) {
        os << "Flags:" << std::endl;
        for (const auto& flag : flags_) {
            std::string spelled = "--" + flag.name;
            if (!flag.short_name.empty()) {
                spelled = "-" + flag.short_name + ", " + spelled;
            } else {
                spelled = "    " + spelled;
            }
            os << "  " << std::left << std::setw(22) << spelled
               << flag.description;
            if (!flag.default_value.empty()) {
                os << " (default: " << flag.default_value << ")";
            }
            os << std::endl;
        }
        os << std::endl;
    }

    if (!example_.empty()) {
        os << "Examples:" << std::endl << example_ << std::endl << std::endl;
    }

    if (!subcommands_.empty()) {
        os << "Use '" << full_name()
           << " <command> --help' for more information about a command."
           << std::endl;
    }
}

void Command::print_usage() const {
    std::ostream& os = out();
    if (!usage_.empty()) {
        os << "Usage: " << usage_ << std::endl;
        return;
    }

    os << "Usage: " << full_name();
    if (!flags_.empty()) {
        os << " [OPTIONS]";
    }
    for (const auto& argument : arguments_) {
        if (argument.required) {
            os << " <" << argument.name << ">";
        } else {
            os << " [" << argument.name << "]";
        }
    }
    if (!subcommands_.empty()) {
        os << " <COMMAND>";
    }
    os << std::endl;
}

// CommandContext implementation
std::string CommandContext::get_flag(const std::string& name) const {
    auto it = flags_.find(name);
    return it != flags_.end() ? it->second : "";
}

bool CommandContext::get_bool_flag(const std::string& name) const {
    std::string value = get_flag(name);
    return value == "true" || value == "1";
}

int CommandContext::get_int_flag(const std::string& name) const {
    std::string value = get_flag(name);
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return 0;
    }
}

double CommandContext::get_double_flag(const std::string& name) const {
    std::string value = get_flag(name);
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return 0.0;
    }
}

// FunctionCommand implementation
FunctionCommand::FunctionCommand(const std::string& name,
                                 const std::string& description,
                                 Handler handler)
    : Command(name, description), handler_(std::move(handler)) {}

int FunctionCommand::run(CommandContext& ctx) { return handler_(ctx); }

}  // namespace planka::cli
