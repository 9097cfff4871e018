#include "listener.hpp"

#include <boost/asio/strand.hpp>
#include <limits>

SessionId Listener::nextSessionId(SessionId current) {
    return current >= std::numeric_limits<SessionId>::max() || current < 1 ? 1 : current + 1;
}

Listener::Listener(net::io_context &ioc, tcp::endpoint endpoint, std::int64_t ping_duration_ms,
                   std::shared_ptr<ChannelDirectory> directory)
    : ioc_(ioc), acceptor_(ioc), ping_duration_ms(ping_duration_ms), directory(std::move(directory)),
      next_session_id(1) {
    beast::error_code ec;

    // Open the acceptor
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        fail(ec, "open");
        return;
    }

    // Allow address reuse
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        fail(ec, "set_option");
        return;
    }

    // Bind to the server address
    acceptor_.bind(endpoint, ec);
    if (ec) {
        fail(ec, "bind");
        return;
    }

    // Start listening for connections
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        fail(ec, "listen");
        return;
    }
}

void Listener::do_accept() {
    // The new connection gets its own strand
    acceptor_.async_accept(net::make_strand(ioc_), beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
}

void Listener::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        fail(ec, "accept");
    } else {
        // Create the session and run it. Accepts complete one at a time, so
        // the id counter needs no lock.
        auto const id = next_session_id;
        next_session_id = nextSessionId(id);
        std::make_shared<Session>(std::move(socket), id, ping_duration_ms, directory)->run();
    }

    // Accept another connection
    do_accept();
}
