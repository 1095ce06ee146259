#pragma once
#include <asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "hub_service.hpp"
#include "log.hpp"

// One accepted client. Reads newline-delimited requests and queues the
// responses in arrival order.
class HubConnection : public std::enable_shared_from_this<HubConnection> {
public:
    using ClosedHandler = std::function<void()>;

    static std::shared_ptr<HubConnection> create(asio::ip::tcp::socket sock,
                                                 std::shared_ptr<HubService> service,
                                                 std::shared_ptr<Logger> logger,
                                                 ClosedHandler on_closed = nullptr);

    ~HubConnection();

    void start();
    void async_send_json(const nlohmann::json& j);
    void close();

    const std::string& remote() const { return remote_; }

private:
    HubConnection(asio::ip::tcp::socket sock,
                  std::shared_ptr<HubService> service,
                  std::shared_ptr<Logger> logger,
                  ClosedHandler on_closed);
    void do_read();
    void handle_line(const std::string& line);
    void do_write();

    asio::ip::tcp::socket socket_;
    std::shared_ptr<HubService> service_;
    std::shared_ptr<Logger> logger_;
    ClosedHandler on_closed_;
    asio::streambuf read_buf_;
    std::deque<std::string> write_queue_;
    std::string remote_;
    bool closed_ = false;
};
