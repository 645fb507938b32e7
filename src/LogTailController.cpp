#include "LogTailController.hpp"
#include "LogTailErrors.hpp"
#include <utility>

LogTailController::LogTailController(ServerConfig config)
    : config_(std::move(config)),
      baseDir_(config_.baseDir),
      validator_(config_.limits) {
}

Json::Value LogTailController::createError(const std::string& message) const {
    Json::Value response;
    response["message"] = message;
    return response;
}

int LogTailController::statusFor(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const ValidationError&) {
        return 400;
    } catch (const FileChangedError&) {
        return 409;
    } catch (const std::exception&) {
        return 500;
    }
}

std::unique_ptr<LineStreamAdapter> LogTailController::openStream(const FileQuery& query) const {
    validator_.validate(query);
    std::string path = baseDir_.resolve(*query.filepath);
    auto entries = FileQueryValidator::parseEntries(query.entries);

    auto session = std::make_unique<FileSession>(path);
    auto reader = std::make_unique<ReverseBlockReader>(std::move(session), entries, query.search, config_.reader);
    auto stream = std::make_unique<LineStreamAdapter>(std::move(reader));
    stream->prime();
    return stream;
}
