#include "interactive_session.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <cstdio>
#include <readline/readline.h>
#include <readline/history.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

// Time given to a signalled process to actually go away before re-prompting
static constexpr int SIGNAL_SETTLE_MS = 500;

SessionChoice parse_choice(const std::string& answer) {
    std::string a = answer;
    std::transform(a.begin(), a.end(), a.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    trim(a);

    if (a == "input" || a == "i" || a == "in" || a == "inp") return SessionChoice::INPUT;
    if (a == "output" || a == "o" || a == "out" || a == "print" || a == "p")
        return SessionChoice::OUTPUT;
    if (a == "terminate" || a == "term" || a == "t" || a == "te" || a == "ter")
        return SessionChoice::TERMINATE;
    if (a == "kill" || a == "k" || a == "ki" || a == "kil") return SessionChoice::KILL;
    return SessionChoice::HELP;
}

// ── ConsoleOperator ──────────────────────────────────────────

std::optional<std::string> ConsoleOperator::ask(const std::string& prompt) {
    char* raw = readline(prompt.c_str());
    if (!raw) return std::nullopt;  // Ctrl-D
    std::string line(raw);
    std::free(raw);
    if (!line.empty()) add_history(line.c_str());
    return line;
}

void ConsoleOperator::show(const std::string& text) {
    std::cout << text << std::endl;
}

// ── InteractiveSession ───────────────────────────────────────

InteractiveSession::InteractiveSession(platform::ChildProcess& proc, SessionOperator& op)
    : proc_(proc), op_(op) {}

const char* InteractiveSession::help_text() {
    return
        "The process has not finished yet.  It is either taking a while or it\n"
        "is waiting for your input.  To interact with it, choose from one of the\n"
        "following options:\n"
        "  input: Give the program some keyboard input.\n"
        "  output: Check to see if the program has said anything else since just now.\n"
        "  terminate: Finish whatever the process was doing and nicely end the job.\n"
        "  kill: Immediately end the process.  Do this if the process is being bad.\n"
        "  help: This text.";
}

InteractiveSession::State InteractiveSession::step() {
    switch (state_) {
        case State::IDLE:            state_ = on_idle(); break;
        case State::AWAITING_CHOICE: state_ = on_awaiting_choice(); break;
        case State::FEEDING:         state_ = on_feeding(); break;
        case State::READING:         state_ = on_reading(); break;
        case State::TERMINATING:     state_ = on_signal(false); break;
        case State::KILLING:         state_ = on_signal(true); break;
        case State::EXITED:          break;
    }
    return state_;
}

void InteractiveSession::run() {
    while (step() != State::EXITED) {}
}

InteractiveSession::State InteractiveSession::on_idle() {
    if (!proc_.running()) {
        std::string rest = proc_.drain(true);
        if (!rest.empty()) op_.show(rest);
        return State::EXITED;
    }
    op_.show("Process running.  What do you want to do?");
    return State::AWAITING_CHOICE;
}

InteractiveSession::State InteractiveSession::on_awaiting_choice() {
    auto answer = op_.ask("input, output, terminate, kill, help: ");
    if (!answer) {
        // No operator left to drive the process.
        cj_log(fmt::format("interactive: operator input closed, killing pid {}", proc_.pid()));
        return State::KILLING;
    }

    switch (parse_choice(*answer)) {
        case SessionChoice::INPUT:     return State::FEEDING;
        case SessionChoice::OUTPUT:    return State::READING;
        case SessionChoice::TERMINATE: return State::TERMINATING;
        case SessionChoice::KILL:      return State::KILLING;
        case SessionChoice::HELP:      break;
    }
    op_.show(help_text());
    return State::IDLE;
}

InteractiveSession::State InteractiveSession::on_feeding() {
    auto line = op_.ask("stdin: ");
    if (!line) return State::IDLE;
    try {
        proc_.write(*line + "\n");
    } catch (const ProcessDeadError& e) {
        op_.show(e.what());
    }
    return State::IDLE;
}

InteractiveSession::State InteractiveSession::on_reading() {
    std::string out = proc_.read_available();
    if (!out.empty()) op_.show(out);
    return State::IDLE;
}

InteractiveSession::State InteractiveSession::on_signal(bool kill) {
    if (kill) {
        proc_.kill();
    } else {
        proc_.terminate();
    }
    for (int waited = 0; waited < SIGNAL_SETTLE_MS && proc_.running(); waited += 10) {
        platform::sleep_ms(10);
    }
    return State::IDLE;
}
