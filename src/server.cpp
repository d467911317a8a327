#include "huginn/server.h"
#include "huginn/block_queue.h"
#include "huginn/session_event.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <chrono>
#include <cstring>
#include <deque>
#include <future>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <thread>

namespace huginn {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

using Params = std::map<std::string, std::string>;

// ═══════════════════════════════════════════════════════════════════════════
// Request helpers
// ═══════════════════════════════════════════════════════════════════════════

std::string url_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size() &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

Params parse_query(const std::string& target, std::string* path) {
    Params params;
    auto question = target.find('?');
    if (path) {
        *path = target.substr(0, question);
    }
    if (question == std::string::npos) {
        return params;
    }

    std::string query = target.substr(question + 1);
    size_t start = 0;
    while (start <= query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) end = query.size();
        std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            if (eq == std::string::npos) {
                params[url_decode(pair)] = "";
            } else {
                params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        start = end + 1;
    }
    return params;
}

namespace {

std::string param(const Params& params, const std::string& key, const std::string& fallback = "") {
    auto it = params.find(key);
    return it == params.end() || it->second.empty() ? fallback : it->second;
}

bool parse_flag(const std::string& key, const std::string& value) {
    if (value.empty() || value == "false" || value == "0" || value == "no") return false;
    if (value == "true" || value == "1" || value == "yes") return true;
    throw std::invalid_argument("Invalid value for " + key + ": " + value);
}

} // anonymous namespace

SessionOptions parse_stream_params(const Params& params, const Config& config, const ModelManager& models) {
    SessionOptions options;
    options.model = param(params, "model", config.recognition.default_model);
    if (!models.is_known(options.model)) {
        throw std::invalid_argument("Unknown model: " + options.model);
    }

    std::string vad = param(params, "vad", "3");
    size_t consumed = 0;
    try {
        options.vad_level = std::stoi(vad, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid vad level: " + vad);
    }
    if (consumed != vad.size() || options.vad_level < MIN_VAD_LEVEL || options.vad_level > MAX_VAD_LEVEL) {
        throw std::invalid_argument("vad must be between 1 and 5, got " + vad);
    }

    options.instant = parse_flag("instant", param(params, "instant"));
    options.language = config.recognition.decoding.language;
    options.target_language = param(params, "target_language");
    options.translation_model = param(params, "translation_model");
    return options;
}

bool decode_samples(const void* data, std::size_t bytes, std::vector<float>& out) {
    if (bytes % sizeof(float) != 0) {
        return false;
    }
    // Wire format is little-endian float32, the host order on supported platforms
    out.resize(bytes / sizeof(float));
    if (bytes > 0) {
        std::memcpy(out.data(), data, bytes);
    }
    return true;
}

namespace {

// ═══════════════════════════════════════════════════════════════════════════
// Shared server state
// ═══════════════════════════════════════════════════════════════════════════

struct Shared {
    Shared(const Config& cfg, ModelManager& m, TranscriptionDispatcher& d,
           TranslationDispatcher* t, net::thread_pool& pool)
        : config(cfg), settings(session_settings(cfg)), models(m), dispatcher(d),
          translation(t), blocking(pool) {}

    Config config;
    SessionSettings settings;
    ModelManager& models;
    TranscriptionDispatcher& dispatcher;
    TranslationDispatcher* translation;
    net::thread_pool& blocking;         // Handlers that wait (load-model, translate)
    std::atomic<std::uint64_t> next_session{1};
};

void fail(beast::error_code ec, const char* what) {
    if (ec == net::error::operation_aborted || ec == websocket::error::closed || ec == net::error::eof) {
        return;
    }
    std::cerr << "[Server] " << what << ": " << ec.message() << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Endpoints
// ═══════════════════════════════════════════════════════════════════════════

struct Reply {
    http::status status = http::status::ok;
    json body = json::object();
};

Reply error_reply(http::status status, const std::string& message) {
    Reply reply;
    reply.status = status;
    reply.body = {{"status", "error"}, {"message", message}};
    return reply;
}

json progress_json(const DownloadProgress& progress) {
    return {
        {"downloaded", progress.bytes_done},
        {"total", progress.bytes_total},
        {"percentage", progress.percentage()},
    };
}

json snapshot_json(const ModelSnapshot& snapshot) {
    return {
        {"model", snapshot.name},
        {"status", to_string(snapshot.status)},
        {"is_loaded", snapshot.status == ModelStatus::Ready},
        {"is_downloading", snapshot.status == ModelStatus::Downloading},
        {"progress", progress_json(snapshot.progress)},
        {"sessions", snapshot.sessions},
        {"error", snapshot.error},
    };
}

Reply check_model(Shared& shared, const Params& params) {
    std::string model = param(params, "model", shared.config.recognition.default_model);
    ModelAvailability availability = shared.models.check_exists(model);
    Reply reply;
    reply.body = {{"exists", availability.exists}, {"model", model}, {"size", availability.size}};
    return reply;
}

Reply model_status(Shared& shared, const Params& params) {
    std::string model = param(params, "model", shared.config.recognition.default_model);
    Reply reply;
    reply.body = snapshot_json(shared.models.status(model));
    return reply;
}

Reply download_progress(Shared& shared) {
    Reply reply;
    auto downloads = shared.models.downloads();
    if (downloads.empty()) {
        return reply;
    }
    const ModelSnapshot& first = downloads.front();
    reply.body = snapshot_json(first);
    reply.body["message"] = "Downloading " + first.name + " model (" +
                            shared.models.check_exists(first.name).size + ")...";
    return reply;
}

Reply translation_models(Shared& shared) {
    Reply reply;
    if (!shared.translation) {
        reply.body = {{"status", "error"}, {"message", "Translation is not configured"}, {"models", json::array()}};
        return reply;
    }
    reply.body = {{"status", "success"}, {"models", shared.translation->list_models()}};
    return reply;
}

// Blocking: waits for a cached model to finish loading
Reply load_model(Shared& shared, const Params& params) {
    std::string model = param(params, "model", shared.config.recognition.default_model);
    std::cout << "[Server] Request to load model: " << model << "\n";

    ModelAvailability availability = shared.models.check_exists(model);
    std::shared_future<ModelSnapshot> pending = shared.models.request_load(model);

    Reply reply;
    if (!availability.exists && shared.models.status(model).status != ModelStatus::Ready) {
        reply.body = {{"status", "downloading"}, {"model", model}};
        return reply;
    }

    if (pending.wait_for(shared.config.server.load_model_wait) != std::future_status::ready) {
        reply.body = {{"status", "loading"}, {"model", model}, {"message", "Model loading in progress"}};
        return reply;
    }

    ModelSnapshot snapshot = pending.get();
    if (snapshot.status == ModelStatus::Ready) {
        reply.body = {{"status", "success"}, {"model", model}};
    } else {
        reply.body = {{"status", "error"}, {"model", model}, {"message", snapshot.error}};
    }
    return reply;
}

// Blocking: runs a translation on the calling thread
Reply translate(Shared& shared, const Params& params) {
    if (!shared.translation) {
        return error_reply(http::status::ok, "Translation is not configured");
    }
    std::string text = param(params, "text");
    std::string target = param(params, "target_language");
    std::string model = param(params, "model", shared.config.translation.default_model);
    if (text.empty() || target.empty()) {
        return error_reply(http::status::bad_request, "text and target_language are required");
    }
    if (model.empty()) {
        return error_reply(http::status::ok, "No translation model selected");
    }

    try {
        Reply reply;
        reply.body = {
            {"status", "success"},
            {"translation", shared.translation->translate(text, shared.config.recognition.decoding.language,
                                                          target, model)},
        };
        return reply;
    } catch (const std::exception& e) {
        std::cerr << "[Server] Translation error: " << e.what() << "\n";
        return error_reply(http::status::ok, e.what());
    }
}

Reply route(Shared& shared, http::verb method, const std::string& path, const Params& params) {
    if (path == "/" && method == http::verb::get) {
        Reply reply;
        reply.body = {{"status", "Huginn live subtitles backend running"}};
        return reply;
    }
    if (path == "/check-model" && method == http::verb::get) return check_model(shared, params);
    if (path == "/model-status" && method == http::verb::get) return model_status(shared, params);
    if (path == "/download-progress" && method == http::verb::get) return download_progress(shared);
    if (path == "/translation-models" && method == http::verb::get) return translation_models(shared);
    if (path == "/load-model" && method == http::verb::post) return load_model(shared, params);
    if (path == "/translate" && method == http::verb::post) return translate(shared, params);
    return error_reply(http::status::not_found, "No such endpoint: " + path);
}

// Endpoint errors become JSON replies, never dropped connections
Reply route_guarded(Shared& shared, http::verb method, const std::string& path, const Params& params) {
    try {
        return route(shared, method, path, params);
    } catch (const std::invalid_argument& e) {
        return error_reply(http::status::bad_request, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[Server] " << path << " failed: " << e.what() << "\n";
        return error_reply(http::status::internal_server_error, e.what());
    }
}

bool is_blocking_endpoint(http::verb method, const std::string& path) {
    return method == http::verb::post && (path == "/load-model" || path == "/translate");
}

// ═══════════════════════════════════════════════════════════════════════════
// WebSocket streaming session
// ═══════════════════════════════════════════════════════════════════════════

struct StreamCommand {
    enum class Kind { Audio, ReloadModel };
    Kind kind = Kind::Audio;
    std::vector<float> samples;
};

class StreamSession : public std::enable_shared_from_this<StreamSession> {
public:
    StreamSession(tcp::socket&& socket, Shared& shared)
        : ws_(std::move(socket))
        , shared_(shared)
        , commands_(shared.config.server.max_pending_blocks,
                    [](const StreamCommand& command) { return command.kind == StreamCommand::Kind::Audio; })
        , id_(std::to_string(shared.next_session++))
    {
    }

    ~StreamSession() {
        commands_.stop();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    void run(http::request<http::string_body> req, Params params) {
        params_ = std::move(params);
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
            res.set(http::field::server, "huginn");
        }));
        ws_.read_message_max(shared_.config.server.max_message_bytes);
        ws_.async_accept(req, beast::bind_front_handler(&StreamSession::on_accept, shared_from_this()));
    }

private:
    void on_accept(beast::error_code ec) {
        if (ec) return fail(ec, "accept");

        try {
            SessionOptions options = parse_stream_params(params_, shared_.config, shared_.models);
            session_ = std::make_unique<Session>(
                id_, options, shared_.settings, shared_.models, shared_.dispatcher, shared_.translation,
                [this](const SessionEvent& event) { send_text(to_json(event)); });
        } catch (const std::invalid_argument& e) {
            std::cerr << "[Server] Rejecting stream " << id_ << ": " << e.what() << "\n";
            return close_with(websocket::close_code::policy_error, e.what());
        }

        worker_ = std::thread([this] { worker_loop(); });
        do_read();
    }

    // Session thread: recognition blocks here, never on the io_context
    void worker_loop() {
        try {
            session_->open();
            StreamCommand command;
            while (commands_.pop(command)) {
                if (command.kind == StreamCommand::Kind::Audio) {
                    session_->ingest(command.samples);
                } else {
                    session_->retry_model();
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[Session " << id_ << "] Failed: " << e.what() << "\n";
            if (auto self = weak_from_this().lock()) {
                net::post(ws_.get_executor(), [self] {
                    self->close_with(websocket::close_code::internal_error, "Session failed");
                });
            }
        }
        session_->close();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&StreamSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            fail(ec, "read");
            return finish();
        }
        if (closing_) return;

        if (ws_.got_binary()) {
            StreamCommand command;
            auto data = buffer_.data();
            bool valid = decode_samples(data.data(), data.size(), command.samples);
            buffer_.consume(buffer_.size());
            if (!valid) {
                return close_with(websocket::close_code::policy_error,
                                  "Audio payload length must be a multiple of 4 bytes");
            }
            if (!commands_.push(std::move(command))) return;
            report_drops();
        } else {
            std::string text = beast::buffers_to_string(buffer_.data());
            buffer_.consume(buffer_.size());
            json message = json::parse(text, nullptr, false);
            if (!message.is_object() || message.value("type", "") != "reload_model") {
                return close_with(websocket::close_code::policy_error, "Unsupported message");
            }
            StreamCommand command;
            command.kind = StreamCommand::Kind::ReloadModel;
            if (!commands_.push(std::move(command))) return;
        }

        do_read();
    }

    void report_drops() {
        std::size_t dropped = commands_.dropped_count();
        if (dropped != reported_drops_) {
            std::cerr << "[Session " << id_ << "] Recognition behind real time, dropped "
                      << (dropped - reported_drops_) << " audio block(s)\n";
            reported_drops_ = dropped;
        }
    }

    // Any thread
    void send_text(std::string text) {
        // Events raised while the connection is being torn down are dropped
        auto self = weak_from_this().lock();
        if (!self) return;
        net::post(ws_.get_executor(), [self, text = std::move(text)]() mutable {
            self->on_send(std::move(text));
        });
    }

    void on_send(std::string text) {
        if (closing_) return;
        outbox_.push_back(std::move(text));
        if (outbox_.size() > 1) return;     // A write is already in progress
        do_write();
    }

    void do_write() {
        ws_.text(true);
        ws_.async_write(net::buffer(outbox_.front()),
                        beast::bind_front_handler(&StreamSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            fail(ec, "write");
            outbox_.clear();
            return;
        }
        outbox_.pop_front();
        if (!outbox_.empty() && !closing_) {
            do_write();
        }
    }

    void close_with(websocket::close_code code, const std::string& reason) {
        if (closing_) return;
        closing_ = true;
        commands_.stop();

        // Close frame reasons are limited to 123 bytes
        websocket::close_reason close_reason(code, reason.substr(0, 120));
        ws_.async_close(close_reason, [self = shared_from_this()](beast::error_code ec) {
            fail(ec, "close");
            self->finish();
        });
    }

    // Stop the worker and join it off the io_context
    void finish() {
        if (finished_) return;
        finished_ = true;
        closing_ = true;
        commands_.stop();
        net::post(shared_.blocking, [self = shared_from_this()] {
            if (self->worker_.joinable()) {
                self->worker_.join();
            }
        });
    }

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    Shared& shared_;
    BlockQueue<StreamCommand> commands_;
    std::string id_;
    Params params_;
    std::unique_ptr<Session> session_;
    std::thread worker_;
    std::deque<std::string> outbox_;
    bool closing_ = false;
    bool finished_ = false;
    std::size_t reported_drops_ = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// HTTP session
// ═══════════════════════════════════════════════════════════════════════════

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, Shared& shared)
        : stream_(std::move(socket)), shared_(shared) {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

private:
    using Response = http::response<http::string_body>;

    void do_read() {
        parser_.emplace();
        parser_->body_limit(64 * 1024);
        stream_.expires_after(std::chrono::seconds(30));
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) return do_close();
        if (ec) return fail(ec, "read");

        std::string path;
        Params params = parse_query(std::string(parser_->get().target()), &path);

        if (websocket::is_upgrade(parser_->get())) {
            if (path != "/ws/transcribe") {
                return send(make_response(parser_->get().version(), false,
                                          error_reply(http::status::not_found, "No such stream: " + path)));
            }
            stream_.expires_never();
            std::make_shared<StreamSession>(stream_.release_socket(), shared_)
                ->run(parser_->release(), std::move(params));
            return;
        }

        http::request<http::string_body> req = parser_->release();
        const unsigned version = req.version();
        const bool keep_alive = req.keep_alive();
        const http::verb method = req.method();

        if (method == http::verb::options) {
            Response res{http::status::no_content, version};
            add_headers(res);
            res.keep_alive(keep_alive);
            res.prepare_payload();
            return send(std::move(res));
        }

        if (is_blocking_endpoint(method, path)) {
            auto self = shared_from_this();
            net::post(shared_.blocking, [self, method, path, params, version, keep_alive] {
                Reply reply = route_guarded(self->shared_, method, path, params);
                net::post(self->stream_.get_executor(), [self, reply, version, keep_alive] {
                    self->send(self->make_response(version, keep_alive, reply));
                });
            });
            return;
        }

        send(make_response(version, keep_alive, route_guarded(shared_, method, path, params)));
    }

    void add_headers(Response& res) const {
        res.set(http::field::server, "huginn");
        res.set(http::field::access_control_allow_origin, shared_.config.server.allowed_origin);
        res.set(http::field::access_control_allow_credentials, "true");
        res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        res.set(http::field::access_control_allow_headers, "*");
    }

    Response make_response(unsigned version, bool keep_alive, const Reply& reply) const {
        Response res{reply.status, version};
        add_headers(res);
        res.set(http::field::content_type, "application/json");
        res.keep_alive(keep_alive);
        res.body() = reply.body.dump();
        res.prepare_payload();
        return res;
    }

    void send(Response&& res) {
        auto response = std::make_shared<Response>(std::move(res));
        http::async_write(stream_, *response,
                          [self = shared_from_this(), response](beast::error_code ec, std::size_t) {
                              self->on_write(response->need_eof(), ec);
                          });
    }

    void on_write(bool close, beast::error_code ec) {
        if (ec) return fail(ec, "write");
        if (close) return do_close();
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    Shared& shared_;
};

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════
// Server
// ═══════════════════════════════════════════════════════════════════════════

class Server::Impl {
public:
    Impl(const Config& config, ModelManager& models, TranscriptionDispatcher& dispatcher,
         TranslationDispatcher* translation)
        : blocking_(2)
        , shared_(config, models, dispatcher, translation, blocking_)
        , ioc_(config.server.io_threads)
        , acceptor_(ioc_)
        , signals_(ioc_, SIGINT, SIGTERM)
    {
        beast::error_code ec;
        auto address = net::ip::make_address(config.server.address, ec);
        if (ec) {
            throw std::runtime_error("Invalid listen address " + config.server.address + ": " + ec.message());
        }
        tcp::endpoint endpoint{address, static_cast<unsigned short>(config.server.port)};

        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (!ec) acceptor_.bind(endpoint, ec);
        if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Cannot listen on " + config.server.address + ":" +
                                     std::to_string(config.server.port) + ": " + ec.message());
        }
    }

    ~Impl() {
        ioc_.stop();
        // Pool tasks post back into ioc_, so they finish before it goes away
        blocking_.join();
    }

    void do_accept() {
        acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
            if (ec == net::error::operation_aborted) return;
            if (ec) {
                fail(ec, "accept");
            } else {
                std::make_shared<HttpSession>(std::move(socket), shared_)->run();
            }
            if (acceptor_.is_open()) do_accept();
        });
    }

    void run_io() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            std::cerr << "[Server] io_context thread failed: " << e.what() << "\n";
        }
    }

    net::thread_pool blocking_;
    Shared shared_;
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    net::signal_set signals_;
};

Server::Server(const Config& config,
               ModelManager& models,
               TranscriptionDispatcher& dispatcher,
               TranslationDispatcher* translation)
    : pimpl_(std::make_unique<Impl>(config, models, dispatcher, translation))
{
}

Server::~Server() = default;

void Server::run() {
    Impl& impl = *pimpl_;

    impl.signals_.async_wait([&impl](beast::error_code const& ec, int signal_number) {
        if (ec) return;
        std::cout << "\n[Server] Received signal " << signal_number << ", shutting down...\n";
        impl.ioc_.stop();
    });
    impl.do_accept();

    const int threads = std::max(1, impl.shared_.config.server.io_threads);
    std::cout << "[Server] Listening on " << impl.shared_.config.server.address << ":" << port()
              << " (" << threads << " I/O threads)\n";

    std::vector<std::thread> pool;
    pool.reserve(threads - 1);
    for (int i = 1; i < threads; ++i) {
        pool.emplace_back([&impl] { impl.run_io(); });
    }
    impl.run_io();
    for (auto& t : pool) {
        t.join();
    }

    beast::error_code ec;
    impl.acceptor_.close(ec);
    std::cout << "[Server] Stopped\n";
}

void Server::stop() {
    pimpl_->ioc_.stop();
}

unsigned short Server::port() const {
    beast::error_code ec;
    auto endpoint = pimpl_->acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

} // namespace huginn
