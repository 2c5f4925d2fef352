#pragma once

#include <stdexcept>
#include <string>
#include <fmt/format.h>

// Base class for everything the library throws.
struct CondorError : public std::runtime_error {
    explicit CondorError(const std::string& s) : std::runtime_error(s) {}
};

struct InvalidUniverseError : public CondorError {
    explicit InvalidUniverseError(const std::string& universe)
        : CondorError(fmt::format("{} is not a valid Condor universe.", universe)),
          universe(universe) {}

    std::string universe;
};

// I/O against a process whose input stream is already closed.
struct ProcessDeadError : public CondorError {
    explicit ProcessDeadError(int pid)
        : CondorError(fmt::format("Unable to talk to process {} because it is dead.", pid)),
          pid(pid) {}

    int pid;
};

// An external tool's output did not match its expected contract.
struct BadFormatError : public CondorError {
    explicit BadFormatError(const std::string& program)
        : CondorError(fmt::format("Unable to parse invalid output from process '{}'.", program)),
          program(program) {}

    std::string program;
};

struct SubmissionError : public CondorError {
    explicit SubmissionError(const std::string& operation)
        : CondorError(fmt::format("Cannot call '{}' because the job has not been submitted yet.",
                                  operation)),
          operation(operation) {}

    std::string operation;
};

struct AlreadySubmittedError : public CondorError {
    explicit AlreadySubmittedError(int cluster)
        : CondorError(fmt::format("The job was already submitted as cluster {}.", cluster)),
          cluster(cluster) {}

    int cluster;
};

struct SettingError : public CondorError {
    explicit SettingError(const std::string& s) : CondorError(s) {}
};

// A mandatory attribute was read before being set.
struct RequiredSetting : public SettingError {
    explicit RequiredSetting(const std::string& setting)
        : SettingError(fmt::format("The setting {} should have been set before doing this.", setting)),
          setting(setting) {}

    std::string setting;
};

// An optional attribute was read before being set.
struct EmptySetting : public SettingError {
    explicit EmptySetting(const std::string& setting)
        : SettingError(fmt::format("The optional setting {} has not been set yet.", setting)),
          setting(setting) {}

    std::string setting;
};

struct SettingTypeError : public SettingError {
    SettingTypeError(const std::string& setting, const std::string& expected)
        : SettingError(fmt::format("The setting {} expects a {} value.", setting, expected)),
          setting(setting) {}

    std::string setting;
};

struct BadQuotes : public SettingError {
    explicit BadQuotes(char character)
        : SettingError(message_for(character)), character(character) {}

    char character;

private:
    static std::string message_for(char c) {
        if (c == '"') {
            return "The supplied string contains a double quote (\") that is not escaped "
                   "properly.  An entire argument with spaces should be surrounded by single "
                   "quotes instead ('). Otherwise, try escaping the double quote with another "
                   "double quote (\"\").";
        }
        return fmt::format("The supplied string contains an invalid {} character.  "
                           "Remove this character and try again.", c);
    }
};
