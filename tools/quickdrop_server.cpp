#include <csignal>
#include <cstdlib>
#include <iostream>

#include <quickdrop/web/LocalAddress.hpp>
#include <quickdrop/web/TransferServer.hpp>

namespace {
void handle_signal(int) {
    QD::Web::RequestTransferStop();
}

void print_banner(QD::Web::TransferOptions const& options) {
    auto url = QD::Web::MakeShareUrl(QD::Web::DiscoverLocalAddress(), options.port);
    std::cout << "\n==================================================\n"
              << "  QuickDrop - File Transfer Server\n"
              << "==================================================\n\n"
              << "  Shared folder: " << options.shared_folder << "\n\n"
              << "  Open this URL on your phone:\n\n"
              << "     " << url << "\n\n"
              << "==================================================\n"
              << "  Press Ctrl+C to stop the server\n"
              << "==================================================\n\n";
}
} // namespace

int main(int argc, char** argv) {
    auto options_opt = QD::Web::ParseTransferArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        QD::Web::PrintTransferUsage();
        return EXIT_SUCCESS;
    }

    QD::Web::ResetTransferStopFlag();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    print_banner(options);
    return QD::Web::RunTransferServer(options);
}
