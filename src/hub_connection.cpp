#include "hub_connection.hpp"

#include <istream>

#include "protocol.hpp"

std::shared_ptr<HubConnection> HubConnection::create(asio::ip::tcp::socket sock,
                                                     std::shared_ptr<HubService> service,
                                                     std::shared_ptr<Logger> logger,
                                                     ClosedHandler on_closed)
{
    auto c = std::shared_ptr<HubConnection>(
        new HubConnection(std::move(sock), std::move(service), std::move(logger), std::move(on_closed)));
    c->start();
    return c;
}

HubConnection::HubConnection(asio::ip::tcp::socket sock,
                             std::shared_ptr<HubService> service,
                             std::shared_ptr<Logger> logger,
                             ClosedHandler on_closed)
: socket_(std::move(sock)),
  service_(std::move(service)),
  logger_(std::move(logger)),
  on_closed_(std::move(on_closed))
{
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
}

HubConnection::~HubConnection(){
    std::error_code ec;
    socket_.close(ec);
}

void HubConnection::start(){
    do_read();
}

void HubConnection::do_read(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\n",
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                if(ec != asio::error::eof && ec != asio::error::operation_aborted){
                    logger_->info("Connection {} read error: {}", remote_, ec.message());
                }
                close();
                return;
            }
            std::istream is(&read_buf_);
            std::string line;
            std::getline(is, line);
            if(!line.empty() && line.back() == '\r') line.pop_back();
            if(!line.empty()){
                handle_line(line);
            }
            do_read();
        });
}

void HubConnection::handle_line(const std::string& line){
    json request;
    try{
        request = json::parse(line);
    } catch(const json::exception& ex){
        logger_->warn("Failed to parse JSON from {}: {}  raw: {}", remote_, ex.what(), line);
        async_send_json(make_error(0, std::string("Malformed request: ") + ex.what()));
        return;
    }
    if(!request.is_object()){
        async_send_json(make_error(0, "Request must be a JSON object"));
        return;
    }
    async_send_json(service_->handle(request));
}

void HubConnection::async_send_json(const nlohmann::json& j){
    if(closed_) return;
    bool start_write = write_queue_.empty();
    write_queue_.push_back(j.dump() + "\n");
    if(start_write){
        do_write();
    }
}

void HubConnection::do_write(){
    if(write_queue_.empty()) return;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front()),
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                logger_->info("Connection {} write error: {}", remote_, ec.message());
                close();
                return;
            }
            write_queue_.pop_front();
            if(!closed_ && !write_queue_.empty()){
                do_write();
            }
        });
}

void HubConnection::close(){
    if(closed_) return;
    closed_ = true;
    std::error_code ec;
    socket_.close(ec);
    logger_->debug("Connection {} closed", remote_);
    if(on_closed_) on_closed_();
}
