#pragma once

#include <memory>
#include <string>
#include <core/config.hpp>
#include "command_runner.hpp"
#include "identity.hpp"

// Choose where scheduler commands run for `username`:
// locally when the submit binary is on this host's PATH and `username` is
// the local identity, otherwise on the configured server through the
// configured remote transport.
std::unique_ptr<CommandRunner> make_submit_runner(const Config& config,
                                                  const std::string& username,
                                                  CommandRunner& local,
                                                  IdentityResolver& identity);
