#pragma once

#include <string>
#include <core/types.hpp>

struct MailLookup {
    std::string address;
    bool used_default = false;  // identity missing, "default" entry taken
};

// Look `identity` up in a YAML mapping of identity -> address, falling back
// to the "default" entry. Err if the text is not a mapping or neither key
// is present.
Result<MailLookup> lookup_mail_address(const std::string& yaml_text,
                                       const std::string& identity);
