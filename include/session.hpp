#ifndef LOBBYCHAT_SESSION_HPP
#define LOBBYCHAT_SESSION_HPP

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "channel.hpp"
#include "channeldirectory.hpp"
#include "command.hpp"
#include "participant.hpp"

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

constexpr std::size_t maxQueuedPackets = 256;
constexpr std::size_t maxNameLength = 32;
constexpr std::size_t maxMessageLength = 2048;

// One WebSocket client. Commands arrive as text frames; everything sent back
// is a binary bancho packet.
class Session : public Participant, public std::enable_shared_from_this<Session> {
    template <typename Method> auto method_handler(Method method) {
        return beast::bind_front_handler(method, shared_from_this());
    }

public:
    explicit Session(tcp::socket &&socket, SessionId id, int64_t pingDurationMs,
                     std::shared_ptr<ChannelDirectory> directory);

    ~Session() override;

    void run();

    SessionId id() const override { return id_; }
    const std::string &name() const override { return name_; }
    Privileges privileges() const override { return privileges_; }

    // Safe to call from any thread.
    bool enqueue(PacketPtr packet) override;

private:
    static void fail(beast::error_code ec, char const *what);

    void onReadRequest(beast::error_code ec, std::size_t);
    void onAccept(beast::error_code ec);
    void sendLoginChannels();

    void doRead() { ws.async_read(receiveBuffer, method_handler(&Session::onRead)); }

    void onRead(beast::error_code ec, std::size_t);
    void handleCommand(const Command &command);
    void joinChannel(const std::string &channelName);
    void partChannel(const std::string &channelName);
    void sendToChannel(const std::string &channelName, std::string text);
    void sendChannelList();
    void notifyPresence(Channel &channel);
    void notify(const std::string &text);
    void push(PacketPtr packet);

    void doWrite();
    void onMessageSent(beast::error_code ec, std::size_t);
    void setupTimer();
    void onTimer(beast::error_code ec);
    void onPing(beast::error_code ec);
    void send404();
    void on404Sent(beast::error_code ec, std::size_t) { onClose(ec); }
    void onClose(beast::error_code ec);

    websocket::stream<tcp::socket> ws;
    websocket::request_type req;
    beast::http::response<beast::http::string_body> res;
    net::steady_timer pingTimer;
    beast::flat_buffer receiveBuffer;
    int64_t pingDurationMs;

    std::shared_ptr<ChannelDirectory> directory;
    const SessionId id_;
    std::string name_;
    Privileges privileges_;

    // Channels this session is in, by internal name. Touched only from the
    // session's strand and the destructor.
    std::map<std::string, std::shared_ptr<Channel>> joined;

    std::mutex sendMsgMu;
    std::deque<PacketPtr> outbox;
    bool isSendingMessage;
    bool closed;
};

#endif // LOBBYCHAT_SESSION_HPP
