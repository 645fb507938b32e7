#include <iostream>
#include <fstream>
#include <filesystem>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "../src/ReverseBlockReader.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

// Reference implementation: split the whole file on '\n', walk the lines from
// last to first, keep non-empty ones (or the ones containing the term), cap.
static std::string reference_tail(const std::string& content, std::optional<uint64_t> entries, const std::optional<std::string>& search) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, nl - start));
        start = nl + 1;
    }
    std::string out;
    uint64_t kept = 0;
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (entries && kept >= *entries) break;
        bool keep = search ? it->find(*search) != std::string::npos : !it->empty();
        if (keep) {
            out += *it + "\n";
            ++kept;
        }
    }
    return out;
}

int main() {
    auto tmpFile = std::filesystem::temp_directory_path() / "logtail_reader_fuzz.txt";
    try {
        // Repeatable RNG
        std::mt19937 rng(123456);
        const std::vector<std::string> alphabet = {
            "a", "b", "c", " ", "\n", "\n", "\r", "\xC3\xA9", "\xE2\x82\xAC", "\xF0\x9F\x98\x80"
        };
        const std::vector<std::string> terms = {"a", "ab", "c a", "\xC3\xA9", "b\xE2\x82\xAC", "aaaa"};
        std::uniform_int_distribution<int> len_d(0, 400);
        std::uniform_int_distribution<size_t> sym_d(0, alphabet.size() - 1);
        std::uniform_int_distribution<int> pct_d(0, 99);

        for (int iter = 0; iter < 400; ++iter) {
            std::string content;
            int symbols = len_d(rng);
            for (int i = 0; i < symbols; ++i) {
                if (pct_d(rng) < 2) {
                    // occasional long run to push lines past the ceiling
                    content.append(static_cast<size_t>(pct_d(rng)) * 3, 'a');
                } else {
                    content += alphabet[sym_d(rng)];
                }
            }
            {
                std::ofstream ofs(tmpFile, std::ios::binary | std::ios::trunc);
                ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
            }

            for (int trial = 0; trial < 6; ++trial) {
                ReaderOptions options;
                options.blockSize = 1 + rng() % 48;
                options.leftoverCeiling = options.blockSize + 1 + rng() % 96;
                std::optional<uint64_t> entries;
                if (pct_d(rng) < 50) entries = rng() % 8;
                std::optional<std::string> search;
                if (pct_d(rng) < 50) search = terms[rng() % terms.size()];

                ReverseBlockReader reader(std::make_unique<FileSession>(tmpFile.string()), entries, search, options);
                std::string got;
                while (auto chunk = reader.next()) {
                    got += *chunk;
                }
                std::string expected = reference_tail(content, entries, search);
                if (got != expected) {
                    std::cerr << "Mismatch at iter=" << iter << " block=" << options.blockSize
                              << " ceiling=" << options.leftoverCeiling
                              << " entries=" << (entries ? std::to_string(*entries) : "none")
                              << " search=" << search.value_or("<none>") << "\n";
                    std::cerr << "expected " << expected.size() << " bytes, got " << got.size() << " bytes\n";
                    return 1;
                }
                ASSERT_TRUE(!reader.session().isOpen());
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        std::filesystem::remove(tmpFile);
        return 1;
    }
    std::filesystem::remove(tmpFile);
    std::cout << "All reverse block reader fuzz tests passed" << std::endl;
    return 0;
}
