#include "commands.hpp"

#include <spdlog/spdlog.h>
#include <charconv>
#include <cstdint>
#include <optional>
#include <stdexcept>

namespace en {

namespace {

enum class Command : uint8_t { List, Show, Name, Key, Encode, Decode };

const EnumNameMap<Command>& command_names() {
    static const EnumNameMap<Command> names{
        {Command::List, "list"},
        {Command::Show, "show"},
        {Command::Name, "name"},
        {Command::Key, "key"},
        {Command::Encode, "encode"},
        {Command::Decode, "decode"},
    };
    return names;
}

// Not counting the command itself.
size_t argument_count(Command command) {
    switch (command) {
        case Command::List:
            return 0;
        case Command::Show:
            return 1;
        case Command::Name:
        case Command::Key:
        case Command::Encode:
        case Command::Decode:
            return 2;
    }
    return 0;
}

std::optional<int64_t> parse_key(const std::string& text) {
    int64_t key = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), key);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return key;
}

ExitCode usage_error(std::ostream& err, const std::string& problem) {
    spdlog::error("{}", problem);
    err << usage();
    return ExitCode::Usage;
}

} // namespace

std::string usage() {
    return "usage: enumnames_tool [--config <path>] <command> [args...]\n"
           "commands:\n"
           "  list                   show every table\n"
           "  show <table>           show one table\n"
           "  name <table> <key>     name registered for key\n"
           "  key <table> <name>     key registered for name\n"
           "  encode <table> <key>   JSON text of the key's name\n"
           "  decode <table> <text>  key for a JSON name text\n";
}

ExitCode run_command(const TableRegistry& registry, const std::vector<std::string>& args,
                     std::ostream& out, std::ostream& err) {
    if (args.empty()) {
        return usage_error(err, "No command given");
    }

    auto command = command_names().get_key(args[0]);
    if (!command) {
        return usage_error(err, "Unknown command '" + args[0] + "'");
    }
    if (args.size() - 1 != argument_count(*command)) {
        return usage_error(err, "Wrong number of arguments for '" + args[0] + "'");
    }

    if (*command == Command::List) {
        for (const auto& name : registry.table_names()) {
            out << name << ' ' << registry.at(name) << '\n';
        }
        return ExitCode::Ok;
    }

    const auto* table = registry.find(args[1]);
    if (table == nullptr) {
        spdlog::error("Unknown table '{}'", args[1]);
        return ExitCode::Error;
    }

    std::optional<int64_t> key;
    if (*command == Command::Name || *command == Command::Encode) {
        key = parse_key(args[2]);
        if (!key) {
            return usage_error(err, "Key '" + args[2] + "' is not an integer");
        }
    }

    try {
        switch (*command) {
            case Command::Show:
                out << *table << '\n';
                return ExitCode::Ok;
            case Command::Name: {
                auto name = table->get_name(*key);
                if (!name) {
                    spdlog::warn("No name for {} in table {}", *key, args[1]);
                    return ExitCode::NotFound;
                }
                out << *name << '\n';
                return ExitCode::Ok;
            }
            case Command::Key: {
                auto found = table->get_key(args[2]);
                if (!found) {
                    spdlog::warn("No key for '{}' in table {}", args[2], args[1]);
                    return ExitCode::NotFound;
                }
                out << *found << '\n';
                return ExitCode::Ok;
            }
            case Command::Encode:
                out << table->encode_to_name_text(*key) << '\n';
                return ExitCode::Ok;
            case Command::Decode:
                out << table->decode_from_name_text(args[2]) << '\n';
                return ExitCode::Ok;
            case Command::List:
                break;
        }
    } catch (const NameTextError& e) {
        spdlog::error("[{}] {}", kind_name(e.kind()), e.what());
        return ExitCode::Error;
    }

    return ExitCode::Ok;
}

} // namespace en
