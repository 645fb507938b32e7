#include <drogon/drogon.h>
#include <json/json.h>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include "LogTailController.hpp"

std::unique_ptr<LogTailController> controller;

namespace {

FileQuery queryFrom(const drogon::HttpRequestPtr& req) {
    FileQuery query;
    query.filepath = req->getOptionalParameter<std::string>("filepath");
    query.entries = req->getOptionalParameter<std::string>("entries");
    query.search = req->getOptionalParameter<std::string>("search");
    return query;
}

drogon::HttpResponsePtr errorResponse(int status, const std::string& message) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(controller->createError(message));
    resp->setStatusCode(static_cast<drogon::HttpStatusCode>(status));
    return resp;
}

// Runs one reader step per event loop task and forwards its text, so other
// connections on the loop are served between blocks.
class StreamPump : public std::enable_shared_from_this<StreamPump> {
public:
    StreamPump(std::shared_ptr<LineStreamAdapter> stream,
               drogon::ResponseStreamPtr out,
               trantor::EventLoop* loop,
               std::weak_ptr<trantor::TcpConnection> connection)
        : stream_(std::move(stream)), out_(std::move(out)), loop_(loop), connection_(std::move(connection)) {}

    void schedule() {
        auto self = shared_from_this();
        loop_->queueInLoop([self]() { self->run(); });
    }

private:
    void run() {
        auto conn = connection_.lock();
        if (!conn || !conn->connected()) {
            stream_->cancel();
            out_.reset();
            return;
        }
        std::string chunk;
        bool more = stream_->pull(chunk);
        if (stream_->outcome() == LineStreamAdapter::Outcome::Failed) {
            // The abort handler already dropped the connection.
            out_.reset();
            return;
        }
        if (!chunk.empty() && !out_->send(chunk)) {
            stream_->cancel();
            out_.reset();
            return;
        }
        if (more) {
            schedule();
        } else {
            out_->close();
            out_.reset();
        }
    }

    std::shared_ptr<LineStreamAdapter> stream_;
    drogon::ResponseStreamPtr out_;
    trantor::EventLoop* loop_;
    std::weak_ptr<trantor::TcpConnection> connection_;
};

} // namespace

// GET /file?filepath=...&entries=...&search=...
void handleFileRequest(const drogon::HttpRequestPtr& req,
                       std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    const trantor::Date started = trantor::Date::now();
    FileQuery query = queryFrom(req);

    std::shared_ptr<LineStreamAdapter> stream;
    try {
        stream = controller->openStream(query);
    } catch (const std::exception& e) {
        int status = LogTailController::statusFor(std::current_exception());
        if (status >= 500) {
            LOG_ERROR << "GET /file " << query.filepath.value_or("") << " failed: " << e.what();
        } else {
            LOG_DEBUG << "GET /file rejected: " << e.what();
        }
        callback(errorResponse(status, e.what()));
        return;
    }

    // Headers are committed from here on; a failure can only drop the connection.
    std::weak_ptr<trantor::TcpConnection> connection = req->getConnectionPtr();
    stream->setAbortHandler([connection](const std::string&) {
        if (auto conn = connection.lock()) {
            conn->forceClose();
        }
    });
    std::string path = stream->reader().session().path();
    std::weak_ptr<LineStreamAdapter> weakStream = stream;
    stream->setFinishHandler([path, started, weakStream](LineStreamAdapter::Outcome outcome) {
        double elapsedMs = (trantor::Date::now().microSecondsSinceEpoch() - started.microSecondsSinceEpoch()) / 1000.0;
        auto s = weakStream.lock();
        uint64_t bytes = s ? s->bytesDelivered() : 0;
        switch (outcome) {
        case LineStreamAdapter::Outcome::Completed:
            LOG_INFO << "Request for " << path << " took " << elapsedMs << " ms (" << bytes << " bytes)";
            break;
        case LineStreamAdapter::Outcome::Cancelled:
            LOG_INFO << "Client disconnected from " << path << " after " << elapsedMs << " ms";
            break;
        default:
            LOG_WARN << "Request for " << path << " aborted after " << elapsedMs << " ms";
            break;
        }
    });

    auto resp = drogon::HttpResponse::newAsyncStreamResponse(
        [stream, connection](drogon::ResponseStreamPtr out) {
            auto conn = connection.lock();
            if (!conn) {
                stream->cancel();
                return;
            }
            std::make_shared<StreamPump>(stream, std::move(out), conn->getLoop(), connection)->schedule();
        });
    resp->setContentTypeCode(drogon::CT_TEXT_PLAIN);
    resp->addHeader("Cache-Control", "no-cache");
    resp->addHeader("X-Accel-Buffering", "no");
    callback(resp);
}

int main(int argc, char* argv[]) {
    using namespace drogon;

    std::string configPath = argc > 1 ? argv[1] : "config.json";
    bool haveConfigFile = std::filesystem::exists(configPath);
    if (haveConfigFile) {
        app().loadConfigFile(configPath);
    }

    try {
        controller = std::make_unique<LogTailController>(loadServerConfig(configPath));
    } catch (const std::exception& e) {
        LOG_FATAL << "Invalid configuration: " << e.what();
        return 1;
    }

    if (!haveConfigFile) {
        uint16_t port = 3001;
        if (const char* env = std::getenv("PORT")) {
            auto parsed = parsePort(env);
            if (!parsed) {
                LOG_FATAL << "Invalid PORT value: " << env;
                return 1;
            }
            port = *parsed;
        }
        app().addListener("0.0.0.0", port);
    }

    app().registerHandler("/file",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleFileRequest(req, std::move(callback));
        },
        {Get});

    const std::string corsOrigin = controller->config().corsOrigin;

    // CORS support
    app().registerSyncAdvice([corsOrigin](const HttpRequestPtr& req) -> HttpResponsePtr {
        if (req->method() == Options) {
            auto resp = HttpResponse::newHttpResponse();
            resp->addHeader("Access-Control-Allow-Origin", corsOrigin);
            resp->addHeader("Access-Control-Allow-Methods", "GET, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Origin, X-Requested-With, Content-Type, Accept, Authorization");
            return resp;
        }
        return nullptr;
    });

    app().registerPostHandlingAdvice([corsOrigin](const HttpRequestPtr&, const HttpResponsePtr& resp) {
        resp->addHeader("Access-Control-Allow-Origin", corsOrigin);
    });

    LOG_INFO << "logtail server serving files under " << controller->config().baseDir;
    app().run();

    return 0;
}
