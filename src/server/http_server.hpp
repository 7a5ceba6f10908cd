#ifndef HTTP_SERVER_HPP
#define HTTP_SERVER_HPP

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include "../api/api_handler.hpp"
#include "../broadcast/change_broadcaster.hpp"

namespace server
{
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace websocket = beast::websocket;
    namespace asio = boost::asio;
    using tcp = asio::ip::tcp;

    // Accepts HTTP connections for the JSON API and upgrades WebSocket
    // requests into change-event subscriptions.
    class HttpServer
    {
    public:
        HttpServer(asio::io_context &ioc,
                   const std::string &ip,
                   unsigned short port,
                   api::ApiHandler &handler,
                   broadcast::ChangeBroadcaster &broadcaster);

        // Begin accepting connections.
        void run();
        void stop();

        unsigned short port() const;

    private:
        void do_accept();

        asio::io_context &ioc_;
        tcp::acceptor acceptor_;
        api::ApiHandler &handler_;
        broadcast::ChangeBroadcaster &broadcaster_;
    };

    // One HTTP connection. Handles keep-alive and the chunked file stream.
    class HttpSession : public std::enable_shared_from_this<HttpSession>
    {
    public:
        HttpSession(tcp::socket socket, api::ApiHandler &handler, broadcast::ChangeBroadcaster &broadcaster);

        void start();

    private:
        void do_read();
        void handle_request();
        void send_json(const api::ApiResponse &response);
        void start_stream(api::StreamResponse response);
        void write_next_chunk();
        void finish_stream(bool aborted);
        void on_write(bool keep_alive, beast::error_code ec);
        void do_close();

        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;
        std::unique_ptr<http::request_parser<http::string_body>> parser_;
        api::ApiHandler &handler_;
        broadcast::ChangeBroadcaster &broadcaster_;

        // Active file stream, if any.
        api::StreamResponse file_;
        std::string chunk_;
        std::shared_ptr<http::response<http::buffer_body>> stream_res_;
        std::shared_ptr<http::response_serializer<http::buffer_body>> stream_sr_;
        bool stream_keep_alive_ = false;
    };

    // Upgraded connection receiving broadcast change events.
    class WebSocketSession : public broadcast::ChangeObserver,
                             public std::enable_shared_from_this<WebSocketSession>
    {
    public:
        WebSocketSession(tcp::socket socket, broadcast::ChangeBroadcaster &broadcaster);
        ~WebSocketSession() override;

        void start(http::request<http::string_body> req);

        bool isReady() const override { return open_.load(); }
        void deliver(const std::string &payload) override;

    private:
        void do_read();
        void do_write();
        void close();

        websocket::stream<beast::tcp_stream> ws_;
        beast::flat_buffer buffer_;
        broadcast::ChangeBroadcaster &broadcaster_;
        broadcast::ChangeBroadcaster::SubscriptionId subscription_ = 0;
        std::atomic<bool> open_{false};
        std::deque<std::shared_ptr<const std::string>> outbox_;
    };
}

#endif // HTTP_SERVER_HPP
