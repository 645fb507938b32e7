#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <trantor/utils/Logger.h>
#include "FileQueryValidator.hpp"
#include "LineStreamAdapter.hpp"
#include "LogTailErrors.hpp"
#include "ServerConfig.hpp"

namespace {

void printUsage() {
    std::cerr << "usage: logtail [--entries N] [--search TERM] [--block-size B] [--ceiling C] FILE" << std::endl;
}

bool parseSize(const std::string& text, size_t& out) {
    auto value = parseByteSize(text);
    if (!value) return false;
    out = *value;
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    trantor::Logger::setLogLevel(trantor::Logger::kWarn);

    FileQuery query;
    ReaderOptions options;
    std::vector<std::string> args(argv + 1, argv + argc);
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool hasValue = i + 1 < args.size();
        if (arg == "--entries" && hasValue) {
            query.entries = args[++i];
        } else if (arg == "--search" && hasValue) {
            query.search = args[++i];
        } else if (arg == "--block-size" && hasValue) {
            if (!parseSize(args[++i], options.blockSize)) { printUsage(); return 2; }
        } else if (arg == "--ceiling" && hasValue) {
            if (!parseSize(args[++i], options.leftoverCeiling)) { printUsage(); return 2; }
        } else if (!arg.empty() && arg[0] != '-' && !query.filepath) {
            query.filepath = arg;
        } else {
            printUsage();
            return 2;
        }
    }

    FileQueryValidator validator;
    ValidationResult checked = validator.check(query);
    if (!checked.ok) {
        std::cerr << checked.reason << std::endl;
        printUsage();
        return 2;
    }

    std::unique_ptr<LineStreamAdapter> stream;
    try {
        auto session = std::make_unique<FileSession>(*query.filepath);
        auto reader = std::make_unique<ReverseBlockReader>(std::move(session),
            FileQueryValidator::parseEntries(query.entries), query.search, options);
        stream = std::make_unique<LineStreamAdapter>(std::move(reader));
        stream->prime();
    } catch (const ReaderConfigError& e) {
        std::cerr << "logtail: " << e.what() << std::endl;
        printUsage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "logtail: " << *query.filepath << ": " << e.what() << std::endl;
        return 1;
    }

    std::string chunk;
    bool more = true;
    while (more) {
        chunk.clear();
        more = stream->pull(chunk);
        std::cout << chunk;
    }
    std::cout.flush();

    if (stream->outcome() == LineStreamAdapter::Outcome::Failed) {
        std::cerr << "logtail: " << *query.filepath << ": " << stream->errorMessage() << std::endl;
        return 1;
    }
    return 0;
}
