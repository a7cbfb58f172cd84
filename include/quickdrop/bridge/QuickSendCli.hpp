#pragma once

#include <quickdrop/bridge/DeviceBridge.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace QD::Bridge {

void PrintQuickSendUsage(std::ostream& out);

// Runs one quicksend command. `args` excludes the program name. Returns the process
// exit code: 0 on success, 1 when the device or transfer fails, 2 on a usage error.
int RunQuickSend(std::vector<std::string> const& args, DeviceBridge& bridge, std::ostream& out, std::ostream& err);

} // namespace QD::Bridge
