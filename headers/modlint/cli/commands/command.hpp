#ifndef MODLINT_COMMAND_HPP
#define MODLINT_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Subcommand framework of the modlint executable.
 *
 * Each subcommand derives from Command, declares its options as ArgDefs and
 * registers itself with the CommandRegistry from its own translation unit.
 * main() looks the command up by name and hands it the parsed arguments.
 */

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace modlint::cli {

    /**
     * Command-line option definition.
     */
    struct ArgDef {
        std::string name;           // --name
        char short_name = 0;        // -n
        std::string description;
        bool required = false;
        bool takes_value = true;    // false for flags
        std::string default_value;
        std::string value_name = "VALUE";
    };

    class ParsedArgs {
    public:
        /**
         * Records a value given on the command line. Repeating an option
         * keeps every value for get_all(); get() returns the last one.
         */
        void set(const std::string& name, const std::string& value);
        void set_default(const std::string& name, const std::string& value);
        void set_flag(const std::string& name);
        void add_positional(const std::string& value);

        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;
        [[nodiscard]] std::string get_or(const std::string& name, const std::string& default_val) const;

        /**
         * Every value given for a repeatable option, in command-line order.
         * Defaults are not included.
         */
        [[nodiscard]] std::vector<std::string> get_all(const std::string& name) const;

        /**
         * Value as a non-negative integer; nullopt when absent or malformed.
         */
        [[nodiscard]] std::optional<unsigned int> get_unsigned(const std::string& name) const;

        [[nodiscard]] bool get_flag(const std::string& name) const;
        [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

    private:
        std::unordered_map<std::string, std::string> args_;
        std::unordered_map<std::string, std::vector<std::string>> given_;
        std::unordered_map<std::string, bool> flags_;
        std::vector<std::string> positional_;
    };

    enum class Verbosity {
        Quiet,      // errors only
        Normal,
        Verbose
    };

    enum class OutputFormat {
        Text,
        JSON
    };

    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;
        [[nodiscard]] virtual std::string usage() const;
        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * @return Process exit code.
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        /**
         * @return Error message, empty when args are acceptable.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        void print_help() const;

    protected:
        void set_verbosity(Verbosity v) { verbosity_ = v; }
        void set_output_format(OutputFormat f) { output_format_ = f; }

        void print(std::string_view msg) const;
        static void print_error(std::string_view msg);
        void print_warning(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;

        [[nodiscard]] Verbosity verbosity() const { return verbosity_; }
        [[nodiscard]] bool is_quiet() const { return verbosity_ == Verbosity::Quiet; }
        [[nodiscard]] bool is_verbose() const { return verbosity_ >= Verbosity::Verbose; }
        [[nodiscard]] bool is_json() const { return output_format_ == OutputFormat::JSON; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        OutputFormat output_format_ = OutputFormat::Text;
    };

    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        [[nodiscard]] Command* find(std::string_view name) const;
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses the arguments following the command name.
     *
     * Accepts --name value, --name=value, -n value, -nvalue, grouped short
     * flags and "--" to end options. The common flags --help, --verbose,
     * --quiet and --json are always accepted.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );

}  // namespace modlint::cli

#endif // MODLINT_COMMAND_HPP
