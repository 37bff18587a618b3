// Severity-scaled interactive confirmation before running a risky command.
#pragma once
#include <istream>
#include <ostream>
#include <string>

namespace nl2cmd::cli {

// true when the command is safe or the user confirmed it. A declined
// confirmation only cancels this one action.
bool confirm_risky_action(const std::string& command, std::istream& in, std::ostream& out, bool color = true);

} // namespace nl2cmd::cli
