#include "session.hpp"

#include <boost/asio/post.hpp>
#include <boost/format.hpp>
#include <iostream>

#include "channelerror.hpp"
#include "packets.hpp"

Session::Session(boost::asio::ip::tcp::socket &&socket, SessionId id, int64_t pingDurationMs,
                 std::shared_ptr<ChannelDirectory> directory)
    : ws(std::move(socket)), pingTimer(ws.get_executor()), pingDurationMs(pingDurationMs),
      directory(std::move(directory)), id_(id), privileges_(Privileges::Normal), isSendingMessage(false),
      closed(false) {
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
}

Session::~Session() {
    for (auto &entry : joined) {
        auto ec = entry.second->leave(id_);
        if (ec && ec != make_error_code(ChannelError::channel_destroyed)) {
            std::cerr << boost::format("%1% leave %2%: %3%\n") % name_ % *entry.second % ec.message();
        }
    }
}

void Session::run() {
    beast::http::async_read(ws.next_layer(), receiveBuffer, req, method_handler(&Session::onReadRequest));
}

void Session::fail(beast::error_code ec, char const *what) { std::cerr << what << ": " << ec.message() << std::endl; }

void Session::onReadRequest(beast::error_code ec, std::size_t) {
    if (ec) {
        return fail(ec, "read HTTP request");
    }
    const auto target = req.target();
    if (!target.starts_with("/chat/")) {
        return send404();
    }

    name_ = target.substr(6).to_string();

    if (name_.empty() || name_.size() > maxNameLength || name_.find('/') != std::string::npos) {
        return send404();
    }

    ws.async_accept(req, method_handler(&Session::onAccept));
}

void Session::onAccept(beast::error_code ec) {
    if (ec) {
        return fail(ec, "accept");
    }

    ws.binary(true);
    sendLoginChannels();
    setupTimer();
    doRead();
}

// Auto-join channels are announced as such, the rest as plain listings.
void Session::sendLoginChannels() {
    for (auto const &channel : directory->channels()) {
        if (channel->isInstance() || !channel->canRead(privileges_)) {
            continue;
        }
        auto const info = channel->summary();
        if (channel->autoJoin()) {
            push(packets::channelAutoJoin(info.name, info.topic, info.memberCount));
        } else {
            push(packets::channelInfo(info.name, info.topic, info.memberCount));
        }
    }
    push(packets::channelInfoEnd());

    for (auto const &channel : directory->autoJoinChannels()) {
        if (channel->canRead(privileges_)) {
            joinChannel(channel->internalName());
        }
    }
}

void Session::onRead(beast::error_code ec, std::size_t) {
    pingTimer.cancel();
    setupTimer();
    if (ec) {
        {
            std::unique_lock lk(sendMsgMu);
            closed = true;
        }
        pingTimer.cancel();
        if (ec == boost::asio::error::operation_aborted || ec == boost::asio::error::eof ||
            ec == websocket::error::closed) {
            return;
        }
        return fail(ec, "read");
    }

    auto const frame = beast::buffers_to_string(receiveBuffer.data());
    receiveBuffer.consume(receiveBuffer.size());

    if (auto command = parseCommand(frame)) {
        handleCommand(*command);
    } else {
        notify("Unknown command.");
    }

    doRead();
}

void Session::handleCommand(const Command &command) {
    switch (command.kind) {
    case Command::Kind::Join:
        return joinChannel(command.channel);
    case Command::Kind::Part:
        return partChannel(command.channel);
    case Command::Kind::Message:
        return sendToChannel(command.channel, command.text);
    case Command::Kind::List:
        return sendChannelList();
    }
}

void Session::joinChannel(const std::string &channelName) {
    if (auto existing = directory->find(channelName); existing != nullptr && !existing->canRead(privileges_)) {
        return notify((boost::format("%1%: %2%") % channelName % make_error_code(ChannelError::read_denied).message())
                          .str());
    }

    beast::error_code ec;
    auto channel = directory->join(channelName, shared_from_this(), ec);
    if (ec) {
        return notify((boost::format("%1%: %2%") % channelName % ec.message()).str());
    }

    joined[channelName] = channel;
    push(packets::channelJoin(channel->displayName()));
    notifyPresence(*channel);
}

void Session::partChannel(const std::string &channelName) {
    auto it = joined.find(channelName);
    if (it == joined.end()) {
        return notify((boost::format("%1%: %2%") % channelName % make_error_code(ChannelError::not_member).message())
                          .str());
    }
    auto channel = std::move(it->second);
    joined.erase(it);

    auto ec = channel->leave(*this);
    if (ec) {
        notify((boost::format("%1%: %2%") % channelName % ec.message()).str());
    }
    push(packets::channelKick(channel->displayName()));
    if (!channel->isDestroyed()) {
        notifyPresence(*channel);
    }
}

void Session::sendToChannel(const std::string &channelName, std::string text) {
    auto it = joined.find(channelName);
    if (it == joined.end()) {
        return notify((boost::format("%1%: %2%") % channelName % make_error_code(ChannelError::not_member).message())
                          .str());
    }
    auto &channel = *it->second;
    if (!channel.canWrite(privileges_)) {
        return notify((boost::format("%1%: %2%") % channelName % make_error_code(ChannelError::write_denied).message())
                          .str());
    }

    beast::error_code ec;
    channel.send(*this, truncateMessage(std::move(text), maxMessageLength), false, ec);
    if (ec) {
        notify((boost::format("%1%: %2%") % channelName % ec.message()).str());
    }
}

void Session::sendChannelList() {
    for (auto const &channel : directory->channels()) {
        if (channel->isInstance() || !channel->canRead(privileges_)) {
            continue;
        }
        auto const info = channel->summary();
        push(packets::channelInfo(info.name, info.topic, info.memberCount));
    }
    push(packets::channelInfoEnd());
}

// Tells everyone in the channel its new member count.
void Session::notifyPresence(Channel &channel) {
    auto const info = channel.summary();
    beast::error_code ec;
    channel.enqueueRaw(packets::channelInfo(info.name, info.topic, info.memberCount), {}, ec);
    if (ec && ec != make_error_code(ChannelError::channel_destroyed)) {
        fail(ec, "presence");
    }
}

void Session::notify(const std::string &text) { push(packets::notification(text)); }

void Session::push(PacketPtr packet) {
    if (!enqueue(std::move(packet))) {
        std::cerr << boost::format("%1% push: outbound queue closed or full\n") % name_;
    }
}

bool Session::enqueue(PacketPtr packet) {
    {
        std::unique_lock lk(sendMsgMu);
        if (closed || outbox.size() >= maxQueuedPackets) {
            return false;
        }
        outbox.push_back(std::move(packet));
        if (isSendingMessage) {
            return true;
        }
        isSendingMessage = true;
    }
    net::post(ws.get_executor(), method_handler(&Session::doWrite));
    return true;
}

void Session::doWrite() {
    PacketPtr packet;
    {
        std::unique_lock lk(sendMsgMu);
        packet = outbox.front();
    }
    ws.async_write(net::buffer(*packet), method_handler(&Session::onMessageSent));
}

void Session::onMessageSent(beast::error_code ec, std::size_t) {
    if (ec) {
        {
            std::unique_lock lk(sendMsgMu);
            closed = true;
            outbox.clear();
        }
        if (ec == boost::asio::error::operation_aborted || ec == boost::asio::error::broken_pipe) {
            pingTimer.cancel();
            return;
        }
        return fail(ec, "write");
    }
    pingTimer.cancel();
    setupTimer();
    {
        std::unique_lock lk(sendMsgMu);
        outbox.pop_front();
        if (outbox.empty()) {
            isSendingMessage = false;
            return;
        }
    }
    doWrite();
}

void Session::setupTimer() {
    pingTimer.expires_after(std::chrono::milliseconds(pingDurationMs));
    pingTimer.async_wait(method_handler(&Session::onTimer));
}

void Session::onTimer(beast::error_code ec) {
    if (ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        fail(ec, "timer");
        ws.async_close(websocket::close_code::internal_error, method_handler(&Session::onClose));
        return;
    }
    setupTimer();
    ws.async_ping({}, method_handler(&Session::onPing));
}

void Session::onPing(beast::error_code ec) {
    if (ec) {
        pingTimer.cancel();
        if (ec == boost::asio::error::broken_pipe) {
            return;
        }
        fail(ec, "ping");
        ws.async_close(websocket::close_code::try_again_later, method_handler(&Session::onClose));
    }
}

void Session::send404() {
    res.version(req.version());
    res.result(beast::http::status::not_found);
    res.set(beast::http::field::content_type, "text/plain");
    res.body() = "404 Not Found";
    res.prepare_payload();

    return beast::http::async_write(ws.next_layer(), res, method_handler(&Session::on404Sent));
}

void Session::onClose(beast::error_code ec) {
    if (ec == boost::asio::error::operation_aborted) {
        return;
    }
    if (ec) {
        return fail(ec, "close");
    }
}
