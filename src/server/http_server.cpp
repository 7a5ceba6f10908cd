#include "http_server.hpp"
#include "../logger/Mylogger.hpp"

#include <chrono>

namespace server
{
    using namespace std::chrono_literals;

    namespace
    {
        const std::uint64_t kBodyLimit = 1024 * 1024;
        const std::size_t kMaxQueuedMessages = 1024;
    }

    // ----------------------------- HttpServer ------------------------------

    HttpServer::HttpServer(asio::io_context &ioc,
                           const std::string &ip,
                           unsigned short port,
                           api::ApiHandler &handler,
                           broadcast::ChangeBroadcaster &broadcaster)
        : ioc_(ioc),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(ip), port)),
          handler_(handler),
          broadcaster_(broadcaster)
    {
        MyLogger::info("HttpServer listening on " + ip + ":" + std::to_string(acceptor_.local_endpoint().port()));
    }

    void HttpServer::run()
    {
        do_accept();
    }

    void HttpServer::stop()
    {
        beast::error_code ec;
        acceptor_.close(ec);
        if (ec)
            MyLogger::warning("Closing acceptor failed: " + ec.message());
    }

    unsigned short HttpServer::port() const
    {
        return acceptor_.local_endpoint().port();
    }

    void HttpServer::do_accept()
    {
        acceptor_.async_accept(
            asio::make_strand(ioc_),
            [this](beast::error_code ec, tcp::socket socket)
            {
                if (ec == asio::error::operation_aborted)
                    return;
                if (!ec)
                {
                    std::make_shared<HttpSession>(std::move(socket), handler_, broadcaster_)->start();
                }
                else
                {
                    MyLogger::error("Accept error: " + ec.message());
                }
                do_accept();
            });
    }

    // ----------------------------- HttpSession -----------------------------

    HttpSession::HttpSession(tcp::socket socket, api::ApiHandler &handler, broadcast::ChangeBroadcaster &broadcaster)
        : stream_(std::move(socket)), handler_(handler), broadcaster_(broadcaster)
    {
    }

    void HttpSession::start()
    {
        asio::dispatch(stream_.get_executor(), [self = shared_from_this()]()
                       { self->do_read(); });
    }

    void HttpSession::do_read()
    {
        parser_ = std::make_unique<http::request_parser<http::string_body>>();
        parser_->body_limit(kBodyLimit);
        stream_.expires_after(30s);

        auto self = shared_from_this();
        http::async_read(stream_, buffer_, *parser_,
                         [self](beast::error_code ec, std::size_t)
                         {
                             if (ec == http::error::end_of_stream)
                             {
                                 self->do_close();
                                 return;
                             }
                             if (ec)
                             {
                                 if (ec != beast::error::timeout)
                                     MyLogger::debug("HTTP read error: " + ec.message());
                                 return;
                             }
                             self->handle_request();
                         });
    }

    void HttpSession::handle_request()
    {
        auto &req = parser_->get();
        if (websocket::is_upgrade(req))
        {
            stream_.expires_never();
            std::make_shared<WebSocketSession>(stream_.release_socket(), broadcaster_)->start(parser_->release());
            return;
        }

        std::string path;
        api::QueryParams query;
        api::parseTarget(std::string(req.target()), path, query);
        MyLogger::debug(std::string(req.method_string()) + " " + std::string(req.target()));

        if (req.method() == http::verb::get && path == "/api/file/stream")
        {
            start_stream(handler_.openFileStream(query));
            return;
        }
        send_json(handler_.handle(std::string(req.method_string()), path, query, req.body()));
    }

    void HttpSession::send_json(const api::ApiResponse &response)
    {
        auto &req = parser_->get();
        auto res = std::make_shared<http::response<http::string_body>>(
            static_cast<http::status>(response.status), req.version());
        res->set(http::field::server, "livetree");
        res->set(http::field::content_type, "application/json; charset=utf-8");
        res->keep_alive(req.keep_alive());
        res->body() = response.body.dump();
        res->prepare_payload();

        auto self = shared_from_this();
        http::async_write(stream_, *res,
                          [self, res](beast::error_code ec, std::size_t)
                          {
                              self->on_write(res->keep_alive(), ec);
                          });
    }

    void HttpSession::on_write(bool keep_alive, beast::error_code ec)
    {
        if (ec)
        {
            MyLogger::debug("HTTP write error: " + ec.message());
            return;
        }
        if (!keep_alive)
        {
            do_close();
            return;
        }
        do_read();
    }

    void HttpSession::start_stream(api::StreamResponse response)
    {
        if (response.error)
        {
            send_json(*response.error);
            return;
        }
        file_ = std::move(response);

        auto &req = parser_->get();
        stream_keep_alive_ = req.keep_alive();
        stream_res_ = std::make_shared<http::response<http::buffer_body>>(http::status::ok, req.version());
        stream_res_->set(http::field::server, "livetree");
        stream_res_->set(http::field::content_type, "text/plain; charset=utf-8");
        stream_res_->set("X-File-Path", file_.stream->path());
        stream_res_->set("X-File-Mtime", std::to_string(file_.stream->modifiedAt()));
        stream_res_->keep_alive(stream_keep_alive_);
        stream_res_->chunked(true);
        stream_res_->body().data = nullptr;
        stream_res_->body().more = true;
        stream_sr_ = std::make_shared<http::response_serializer<http::buffer_body>>(*stream_res_);

        stream_.expires_after(30s);
        auto self = shared_from_this();
        http::async_write_header(stream_, *stream_sr_,
                                 [self](beast::error_code ec, std::size_t)
                                 {
                                     if (ec)
                                     {
                                         self->finish_stream(true);
                                         return;
                                     }
                                     self->write_next_chunk();
                                 });
    }

    void HttpSession::write_next_chunk()
    {
        auto self = shared_from_this();
        auto chunk = file_.stream->nextChunk();
        stream_.expires_after(30s);

        if (!chunk)
        {
            // A superseded or failed read never gets its terminating chunk.
            if (file_.stream->cancelled() || file_.stream->failed())
            {
                finish_stream(true);
                return;
            }
            stream_res_->body().data = nullptr;
            stream_res_->body().size = 0;
            stream_res_->body().more = false;
            http::async_write(stream_, *stream_sr_,
                              [self](beast::error_code ec, std::size_t)
                              {
                                  if (ec == http::error::need_buffer)
                                      ec = {};
                                  self->finish_stream(static_cast<bool>(ec));
                              });
            return;
        }

        chunk_ = std::move(*chunk);
        stream_res_->body().data = chunk_.data();
        stream_res_->body().size = chunk_.size();
        stream_res_->body().more = true;
        http::async_write(stream_, *stream_sr_,
                          [self](beast::error_code ec, std::size_t)
                          {
                              if (ec == http::error::need_buffer)
                                  ec = {};
                              if (ec)
                              {
                                  self->finish_stream(true);
                                  return;
                              }
                              self->write_next_chunk();
                          });
    }

    void HttpSession::finish_stream(bool aborted)
    {
        handler_.finishStream(file_);
        file_ = api::StreamResponse();
        stream_sr_.reset();
        stream_res_.reset();
        chunk_.clear();

        if (aborted)
        {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
            stream_.socket().close(ec);
            return;
        }
        on_write(stream_keep_alive_, {});
    }

    void HttpSession::do_close()
    {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    // --------------------------- WebSocketSession --------------------------

    WebSocketSession::WebSocketSession(tcp::socket socket, broadcast::ChangeBroadcaster &broadcaster)
        : ws_(std::move(socket)), broadcaster_(broadcaster)
    {
    }

    WebSocketSession::~WebSocketSession()
    {
        MyLogger::debug("WebSocket session closed");
    }

    void WebSocketSession::start(http::request<http::string_body> req)
    {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type &res)
            {
                res.set(http::field::server, "livetree");
            }));

        auto self = shared_from_this();
        ws_.async_accept(req,
                         [self](beast::error_code ec)
                         {
                             if (ec)
                             {
                                 MyLogger::warning("WebSocket handshake failed: " + ec.message());
                                 return;
                             }
                             self->open_ = true;
                             self->subscription_ = self->broadcaster_.subscribe(self);
                             MyLogger::info("WebSocket client subscribed");
                             self->do_read();
                         });
    }

    void WebSocketSession::do_read()
    {
        auto self = shared_from_this();
        ws_.async_read(buffer_,
                       [self](beast::error_code ec, std::size_t)
                       {
                           if (ec)
                           {
                               self->close();
                               return;
                           }
                           // Client messages carry nothing we act on.
                           self->buffer_.consume(self->buffer_.size());
                           self->do_read();
                       });
    }

    void WebSocketSession::deliver(const std::string &payload)
    {
        auto message = std::make_shared<const std::string>(payload);
        asio::post(ws_.get_executor(),
                   [self = shared_from_this(), message]()
                   {
                       if (!self->open_)
                           return;
                       if (self->outbox_.size() >= kMaxQueuedMessages)
                       {
                           MyLogger::warning("WebSocket client is not keeping up; dropping connection");
                           self->close();
                           beast::error_code ec;
                           beast::get_lowest_layer(self->ws_).socket().close(ec);
                           return;
                       }
                       self->outbox_.push_back(message);
                       if (self->outbox_.size() > 1)
                           return;
                       self->do_write();
                   });
    }

    void WebSocketSession::do_write()
    {
        auto self = shared_from_this();
        ws_.text(true);
        ws_.async_write(asio::buffer(*outbox_.front()),
                        [self](beast::error_code ec, std::size_t)
                        {
                            if (ec)
                            {
                                self->close();
                                return;
                            }
                            self->outbox_.pop_front();
                            if (!self->outbox_.empty())
                                self->do_write();
                        });
    }

    void WebSocketSession::close()
    {
        if (open_.exchange(false))
            broadcaster_.unsubscribe(subscription_);
    }
}
