// ============================================================
// commands.cpp -- Built-in commands
// ============================================================

#include "commands.hpp"
#include "../common/file_io.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

CommandDispatcher::CommandDispatcher(OverwritePolicy default_overwrite)
    : default_overwrite_(default_overwrite)
{
    add_builtins();
}

void CommandDispatcher::add(const std::string& name, const std::string& usage, Handler handler) {
    commands_[name] = Entry{usage, std::move(handler)};
}

std::vector<std::string> CommandDispatcher::tokenize(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    bool in_quotes = false;
    bool have = false;
    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
            have = true;
        } else if (!in_quotes && (c == ' ' || c == '\t')) {
            if (have) out.push_back(cur);
            cur.clear();
            have = false;
        } else {
            cur.push_back(c);
            have = true;
        }
    }
    if (in_quotes) throw std::invalid_argument("Unterminated quote");
    if (have) out.push_back(cur);
    return out;
}

CommandResult CommandDispatcher::dispatch(Environment& env, const std::string& line) const {
    std::vector<std::string> tokens = tokenize(line);
    if (tokens.empty()) return CommandResult{};

    std::string name = utils::to_lower(tokens[0]);
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        env.writeln("Unknown command: " + tokens[0]);
        return CommandResult{};
    }
    tokens.erase(tokens.begin());
    return it->second.handler(env, tokens);
}

// Drop a trailing separator so "/a/b/" and "/a/b" print the same
static fs::path tidy(fs::path p) {
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

void CommandDispatcher::add_builtins() {
    add("pwd", "pwd", [](Environment& env, const std::vector<std::string>&) {
        env.writeln(env.current_path().string());
        return CommandResult{};
    });

    add("cd", "cd <dir>", [](Environment& env, const std::vector<std::string>& args) {
        if (args.size() != 1) {
            env.writeln("Usage: cd <dir>");
            return CommandResult{};
        }
        fs::path target = tidy(file_io::resolve(env.current_path(), args[0]));
        std::error_code ec;
        if (!fs::is_directory(target, ec)) {
            env.writeln("Not a directory: " + target.string());
            return CommandResult{};
        }
        env.set_current_path(target);
        return CommandResult{};
    });

    add("ls", "ls [dir]", [](Environment& env, const std::vector<std::string>& args) {
        fs::path dir = args.empty() ? env.current_path()
                                    : tidy(file_io::resolve(env.current_path(), args[0]));
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            env.writeln("Cannot list " + dir.string() + ": " + ec.message());
            return CommandResult{};
        }
        std::vector<std::string> names;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            std::string n = it->path().filename().string();
            std::error_code dec;
            if (it->is_directory(dec)) n += "/";
            names.push_back(n);
        }
        std::sort(names.begin(), names.end());
        for (auto& n : names) env.writeln(n);
        return CommandResult{};
    });

    add("help", "help", [this](Environment& env, const std::vector<std::string>&) {
        for (auto& kv : commands_) env.writeln("  " + kv.second.usage);
        return CommandResult{};
    });

    add("download", "download <path>", [](Environment& env, const std::vector<std::string>& args) {
        if (args.size() != 1) {
            env.writeln("Usage: download <path>");
            return CommandResult{};
        }
        if (!env.is_connected()) {
            env.writeln("Not connected.");
            return CommandResult{};
        }
        fs::path source = file_io::resolve(env.current_path(), args[0]);
        std::error_code ec;
        if (!fs::is_regular_file(source, ec) && !fs::is_directory(source, ec)) {
            env.writeln("No such file or directory: " + source.string());
            return CommandResult{};
        }
        CommandResult r;
        r.transfer = TransferRequest{TransferDirection::DOWNLOAD, source.string(),
                                     OverwritePolicy::REFUSE};
        return r;
    });

    add("upload", "upload [-o] <path>", [this](Environment& env, const std::vector<std::string>& args) {
        OverwritePolicy policy = default_overwrite_;
        std::vector<std::string> rest;
        for (auto& a : args) {
            if (a == "-o") policy = OverwritePolicy::OVERWRITE;
            else rest.push_back(a);
        }
        if (rest.size() != 1) {
            env.writeln("Usage: upload [-o] <path>");
            return CommandResult{};
        }
        if (!env.is_connected()) {
            env.writeln("Not connected.");
            return CommandResult{};
        }
        CommandResult r;
        r.transfer = TransferRequest{TransferDirection::UPLOAD, rest[0], policy};
        return r;
    });

    add("exit", "exit", [](Environment& env, const std::vector<std::string>&) {
        env.writeln("Goodbye.");
        CommandResult r;
        r.status = CommandResult::Status::TERMINATE;
        return r;
    });
}
