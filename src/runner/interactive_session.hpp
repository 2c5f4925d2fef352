#pragma once

#include <string>
#include <optional>
#include <platform/process.hpp>

// What the operator asked for at the prompt.
enum class SessionChoice {
    INPUT,      // feed a line to the process
    OUTPUT,     // show output produced so far
    TERMINATE,  // SIGTERM
    KILL,       // SIGKILL
    HELP,       // anything unrecognised
};

// Accepts the long names and their prefixes: "i", "in", "out", "p", "term", ...
SessionChoice parse_choice(const std::string& answer);

// Console side of an interactive session. Implementations talk to a terminal
// or replay a script.
class SessionOperator {
public:
    virtual ~SessionOperator() = default;

    // Ask a question; nullopt means the operator's input is exhausted.
    virtual std::optional<std::string> ask(const std::string& prompt) = 0;

    virtual void show(const std::string& text) = 0;
};

// Terminal operator using GNU readline.
class ConsoleOperator : public SessionOperator {
public:
    std::optional<std::string> ask(const std::string& prompt) override;
    void show(const std::string& text) override;
};

// Idle → AwaitingChoice → {Feeding, Reading, Terminating, Killing} → Idle,
// until the process is seen to have exited.
class InteractiveSession {
public:
    enum class State {
        IDLE,
        AWAITING_CHOICE,
        FEEDING,
        READING,
        TERMINATING,
        KILLING,
        EXITED,
    };

    InteractiveSession(platform::ChildProcess& proc, SessionOperator& op);

    // Perform one transition and return the new state.
    State step();

    // Step until EXITED.
    void run();

    State state() const { return state_; }

    static const char* help_text();

private:
    platform::ChildProcess& proc_;
    SessionOperator& op_;
    State state_ = State::IDLE;

    State on_idle();
    State on_awaiting_choice();
    State on_feeding();
    State on_reading();
    State on_signal(bool kill);
};
