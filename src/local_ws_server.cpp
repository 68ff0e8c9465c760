// local_ws_server.cpp
#include "local_ws_server.hpp"
#include "thread_pool.hpp"
#include "tool_dispatcher.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/error.hpp>
#include <iostream>
#include <future>
#include <thread>
#include <chrono>
#include <algorithm>

using tcp = boost::asio::ip::tcp;
namespace websocket = boost::beast::websocket;
namespace beast = boost::beast;
namespace ssl = boost::asio::ssl;

LocalWSServer::LocalWSServer(ToolDispatcher& tools, int threads)
    : tools_(tools), threads_(std::max(1, threads)) {
    thread_pool = std::make_unique<ThreadPool>(threads_, "local-ws");
}
LocalWSServer::~LocalWSServer(){ stop(); }

LocalWSServer::json LocalWSServer::process_request(const json& req) {
    if(req.is_discarded() || !req.is_object() || !req.contains("tool") || !req["tool"].is_string()){
        return json{{"ok", false}, {"error", "invalid request"}};
    }

    const std::string tool = req["tool"].get<std::string>();
    const json arguments = req.value("arguments", json::object());

    auto done = std::make_shared<std::promise<json>>();
    auto fut = done->get_future();
    tools_.call(tool, arguments, [done](json payload, bool is_error){
        if(is_error){
            done->set_value(json{{"ok", false}, {"error", payload.value("error", std::string("unknown error"))}});
        } else {
            done->set_value(json{{"ok", true}, {"result", std::move(payload)}});
        }
    });
    return fut.get();
}

bool LocalWSServer::start(const std::string& address, unsigned short port,
                          const std::string& cert_file, const std::string& key_file){
    if(running) return false;
    running=true;
    th = std::thread(&LocalWSServer::run, this, address, port, cert_file, key_file);
    return true;
}

void LocalWSServer::stop(){
    running=false;
    if(th.joinable()) th.join();
}

// Helper: treat these errors as normal client disconnects (not server fatal)
static bool is_normal_disconnect(const boost::system::error_code& ec){
    if(!ec) return false;
    return ec == boost::asio::error::eof
        || ec == boost::asio::error::connection_reset
        || ec == boost::asio::error::connection_aborted
        || ec == boost::asio::ssl::error::stream_truncated
        || ec == websocket::error::closed;
}

static void log_ws_error(const char* stage, const boost::system::error_code& ec, bool running){
    if(is_normal_disconnect(ec)){
        if(running) std::cerr << "[local-ws] client disconnected (" << stage << "): " << ec.message() << std::endl;
    } else {
        std::cerr << "[local-ws] WebSocket " << stage << " error: " << ec.message() << std::endl;
    }
}

// Accept, read one request, answer it, close. Works over plain and TLS streams.
template<class WsStream, class Handler>
static void serve_one(WsStream& ws, Handler&& process, const std::atomic<bool>& running){
    boost::system::error_code ec;
    ws.accept(ec);
    if(ec){ log_ws_error("accept", ec, running); return; }

    beast::flat_buffer buffer;
    ws.read(buffer, ec);
    if(ec){ log_ws_error("read", ec, running); return; }

    std::string s = beast::buffers_to_string(buffer.data());
    buffer.clear();

    nlohmann::json req = nlohmann::json::parse(s, nullptr, false);
    auto resp = process(req);

    auto out = resp.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    ws.text(true);
    ws.write(boost::asio::buffer(out), ec);
    if(ec){ log_ws_error("write", ec, running); return; }

    ws.close(websocket::close_code::normal, ec);
    if(ec && !is_normal_disconnect(ec)){
        std::cerr << "[local-ws] WebSocket close error: " << ec.message() << std::endl;
    }
}

// Binds a non-blocking listener; the accept loop polls it so stop() is
// honoured without a pending connection.
static bool open_acceptor(tcp::acceptor& acceptor, const std::string& address, unsigned short port){
    boost::system::error_code ec;
    const auto ip = boost::asio::ip::make_address(address, ec);
    if(ec){
        std::cerr << "[local-ws] bad listen address '" << address << "': " << ec.message() << std::endl;
        return false;
    }
    const tcp::endpoint endpoint{ip, port};
    const char* stage = "open";
    acceptor.open(endpoint.protocol(), ec);
    if(!ec){
        boost::system::error_code opt_ec;
        acceptor.set_option(boost::asio::socket_base::reuse_address(true), opt_ec);
        if(opt_ec) std::cerr << "[local-ws] reuse_address not set: " << opt_ec.message() << std::endl;
        stage = "bind";
        acceptor.bind(endpoint, ec);
    }
    if(!ec){
        stage = "listen";
        acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if(!ec){
        stage = "non_blocking";
        acceptor.non_blocking(true, ec);
    }
    if(ec){
        std::cerr << "[local-ws] cannot listen on " << address << ":" << port
                  << " (" << stage << "): " << ec.message() << std::endl;
        return false;
    }
    return true;
}

void LocalWSServer::run(const std::string& address, unsigned short port,
                        const std::string& cert_file, const std::string& key_file){
    const bool use_ssl = !cert_file.empty();
    try{
        std::shared_ptr<ssl::context> ctx;
        if(use_ssl){
            ctx = std::make_shared<ssl::context>(ssl::context::tlsv12_server);
            ctx->use_certificate_chain_file(cert_file);
            ctx->use_private_key_file(key_file.empty() ? cert_file : key_file, ssl::context::pem);
        }

        tcp::acceptor acceptor{ioc};
        if(!open_acceptor(acceptor, address, port)){
            running = false;
            return;
        }

        std::cerr << "[local-ws] listening on " << (use_ssl ? "wss://" : "ws://") << address << ":" << port
                  << " with " << threads_ << " threads" << std::endl;

        auto process = [this](const json& req){ return process_request(req); };

        while(running){
            tcp::socket socket{ioc};
            boost::system::error_code accept_ec;
            acceptor.accept(socket, accept_ec);
            if(accept_ec == boost::asio::error::would_block || accept_ec == boost::asio::error::try_again){
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }
            if(accept_ec){
                if(running) std::cerr << "[local-ws] accept error: " << accept_ec.message() << std::endl;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                continue;
            }
            socket.non_blocking(false, accept_ec);

            bool queued = thread_pool->post([this, socket = std::make_shared<tcp::socket>(std::move(socket)), ctx, process]() {
                active_requests++;
                std::cerr << "[local-ws] Active requests: " << active_requests.load() << "/" << threads_ << std::endl;
                try{
                    if(ctx){
                        ssl::stream<tcp::socket> ssl_socket{std::move(*socket), *ctx};
                        boost::system::error_code hs_ec;
                        ssl_socket.handshake(ssl::stream_base::server, hs_ec);
                        if(hs_ec){
                            log_ws_error("TLS handshake", hs_ec, running);
                        } else {
                            websocket::stream<ssl::stream<tcp::socket>&> ws{ssl_socket};
                            serve_one(ws, process, running);
                            boost::system::error_code shutdown_ec;
                            ssl_socket.shutdown(shutdown_ec);
                        }
                        boost::system::error_code close_ec;
                        ssl_socket.lowest_layer().close(close_ec);
                    } else {
                        websocket::stream<tcp::socket> ws{std::move(*socket)};
                        serve_one(ws, process, running);
                        boost::system::error_code close_ec;
                        ws.next_layer().close(close_ec);
                    }
                }catch(std::exception const& e){
                    if(running) std::cerr << "[local-ws] connection handler exception: " << e.what() << std::endl;
                }
                active_requests--;
            });
            if(!queued) break;
        }

    }catch(std::exception const& e){
        std::cerr << "[local-ws] server fatal error: " << e.what() << std::endl;
        running = false;
    }
}
