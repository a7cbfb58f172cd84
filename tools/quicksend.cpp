#include <iostream>
#include <string>
#include <vector>

#include <quickdrop/bridge/AdbBridge.hpp>
#include <quickdrop/bridge/QuickSendCli.hpp>

int main(int argc, char** argv) {
    std::vector<std::string> args;
    args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    QD::Bridge::AdbBridge bridge;
    return QD::Bridge::RunQuickSend(args, bridge, std::cout, std::cerr);
}
