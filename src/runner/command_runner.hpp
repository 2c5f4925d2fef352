#pragma once

#include <string>
#include <optional>
#include <core/types.hpp>

// Runs one command to completion somewhere (local host, or a remote host
// through a login session) and reports its exit code and combined output.
//
// Every call is dispatched independently; implementations hold no state that
// changes between calls.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Run `command`, feeding `input` to its stdin when given. Output is
    // trimmed of surrounding whitespace unless `binary` is set.
    virtual ExecResult execute(const std::string& command,
                               const std::optional<std::string>& input = std::nullopt,
                               bool binary = false) = 0;

    virtual bool is_local() const = 0;

    // "<Shell: local machine>" or "<Shell: user@host>"
    virtual std::string describe() const = 0;
};
