#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "fd_transport.h"
#include "receiver.h"
#include "sender.h"
#include "xmodem_error.h"

namespace {

void usage() {
    fprintf(stderr, "usage: xmodem send|recv <file> <device>\n");
    exit(EXIT_FAILURE);
}

void print_progress(xmodem::Progress p) {
    switch (p.kind) {
        case xmodem::Progress::Waiting:
            std::cerr << "Waiting for receiver..." << std::endl;
            break;
        case xmodem::Progress::Started:
            break;
        case xmodem::Progress::Packet:
            std::cerr << "Packet " << (int)p.packet << " done" << std::endl;
            break;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 4) usage();

    std::string mode = argv[1];
    if (mode != "send" && mode != "recv") usage();

    int fd = open(argv[3], O_RDWR | O_NOCTTY);
    if (fd < 0) {
        fprintf(stderr, "open error: %s\n", strerror(errno));
        return EXIT_FAILURE;
    }
    std::unique_ptr<xmodem::Transport> device(new xmodem::FdTransport(fd, true));

    try {
        if (mode == "send") {
            std::ifstream file(argv[2], std::ios::binary);
            if (!file) {
                fprintf(stderr, "invalid file name\n");
                return EXIT_FAILURE;
            }
            std::size_t n = xmodem::transmit(file, std::move(device), print_progress);
            std::cout << "Sent " << n << " bytes" << std::endl;
        } else {
            std::ofstream file(argv[2], std::ios::binary | std::ios::trunc);
            if (!file) {
                fprintf(stderr, "invalid file name\n");
                return EXIT_FAILURE;
            }
            std::size_t n = xmodem::receive(std::move(device), file, print_progress);
            std::cout << "Received " << n << " bytes" << std::endl;
        }
    } catch (const xmodem::XmodemError& e) {
        std::cerr << "xmodem: " << xmodem::to_string(e.kind()) << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return 0;
}
