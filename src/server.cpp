#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <boost/format.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "channeldirectory.hpp"
#include "listener.hpp"

namespace net = boost::asio;

using tcp = boost::asio::ip::tcp;

int main(int argc, char *argv[]) {
    // Check command line arguments.
    if (argc != 5) {
        std::cerr << "Usage: lobbychat-server <address> <port> <threads> "
                     "<ping duration in milliseconds>\n"
                  << "Example:\n"
                  << "    lobbychat-server 0.0.0.0 8080 1 60000\n";
        return EXIT_FAILURE;
    }
    beast::error_code ec;
    auto const address = net::ip::make_address(argv[1], ec);
    if (ec) {
        std::cerr << boost::format("address %1%: %2%\n") % argv[1] % ec.message();
        return EXIT_FAILURE;
    }
    auto const port = static_cast<unsigned short>(std::atoi(argv[2]));
    auto const threads = std::max<int>(1, std::atoi(argv[3]));
    auto const ping_duration_ms = std::max<int>(1, std::atoi(argv[4]));

    auto directory = std::make_shared<ChannelDirectory>(defaultChannels());
    std::cerr << boost::format("lobbychat: %1% channels, listening on %2%:%3% with %4% threads\n") %
                     directory->size() % address % port % threads;

    // The io_context is required for all I/O
    net::io_context ioc{threads};

    // Create and launch a listening port
    std::make_shared<Listener>(ioc, tcp::endpoint{address, port}, ping_duration_ms, std::move(directory))->run();

    // Run the I/O service on the requested number of threads
    std::vector<std::thread> v;
    v.reserve(threads - 1);
    for (auto i = threads - 1; i > 0; --i)
        v.emplace_back([&ioc] { ioc.run(); });
    ioc.run();

    return EXIT_SUCCESS;
}
