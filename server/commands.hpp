#pragma once

// ============================================================
// commands.hpp -- Line -> behavior for the built-in shell commands
// ============================================================

#include "../common/environment.hpp"
#include "../common/protocol.hpp"
#include "../common/transfer.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct TransferRequest {
    TransferDirection direction{TransferDirection::DOWNLOAD};
    // DOWNLOAD: absolute host path. UPLOAD: path as the client gave it.
    std::string       path;
    OverwritePolicy   overwrite{OverwritePolicy::REFUSE};
};

struct CommandResult {
    enum class Status { CONTINUE, TERMINATE };

    Status                         status{Status::CONTINUE};
    std::optional<TransferRequest> transfer;
};

class CommandDispatcher {
public:
    using Handler = std::function<CommandResult(Environment& env,
                                                const std::vector<std::string>& args)>;

    // 'default_overwrite' applies to uploads without "-o"
    explicit CommandDispatcher(OverwritePolicy default_overwrite = OverwritePolicy::REFUSE);

    // Handlers capture 'this'
    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    // Execute one line. Exceptions from a command propagate to the caller.
    CommandResult dispatch(Environment& env, const std::string& line) const;

    void add(const std::string& name, const std::string& usage, Handler handler);

    // Whitespace separated, double quotes group words
    static std::vector<std::string> tokenize(const std::string& line);

private:
    struct Entry {
        std::string usage;
        Handler     handler;
    };

    std::map<std::string, Entry> commands_;
    OverwritePolicy default_overwrite_;

    void add_builtins();
};
