#include <iostream>
#include <string>
#include "../src/FileQueryValidator.hpp"
#include "../src/LogTailErrors.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

static FileQuery query(std::optional<std::string> filepath, std::optional<std::string> entries = std::nullopt,
                       std::optional<std::string> search = std::nullopt) {
    FileQuery q;
    q.filepath = std::move(filepath);
    q.entries = std::move(entries);
    q.search = std::move(search);
    return q;
}

int main() {
    try {
        FileQueryValidator validator;

        // 1) Rules run in a fixed order: filepath, entries, search
        ASSERT_TRUE(validator.rules().size() == 3);
        ASSERT_TRUE(validator.rules()[0].field == QueryField::Filepath);
        ASSERT_TRUE(validator.rules()[1].field == QueryField::Entries);
        ASSERT_TRUE(validator.rules()[2].field == QueryField::Search);

        // 2) filepath
        ASSERT_TRUE(validator.check(query(std::string("file-basic.log"))).ok);
        ASSERT_TRUE(validator.check(query(std::nullopt)).reason == "Filepath is required");
        ASSERT_TRUE(!validator.check(query(std::string(""))).ok);
        ASSERT_TRUE(!validator.check(query(std::string("   "))).ok);
        ASSERT_TRUE(!validator.check(query(std::string("file\0.log", 9))).ok);
        ASSERT_TRUE(!validator.check(query(std::string(4097, 'a'))).ok);

        // 3) entries
        ASSERT_TRUE(validator.check(query(std::string("f"), std::string("0"))).ok);
        ASSERT_TRUE(validator.check(query(std::string("f"), std::string("10"))).ok);
        ASSERT_TRUE(validator.check(query(std::string("f"), std::string("9007199254740991"))).ok);
        ASSERT_TRUE(!validator.check(query(std::string("f"), std::string("9007199254740992"))).ok);
        ASSERT_TRUE(!validator.check(query(std::string("f"), std::string("-5"))).ok);
        ASSERT_TRUE(!validator.check(query(std::string("f"), std::string("abc"))).ok);
        ASSERT_TRUE(!validator.check(query(std::string("f"), std::string("NaN"))).ok);
        ASSERT_TRUE(!validator.check(query(std::string("f"), std::string(""))).ok);
        ASSERT_TRUE(!validator.check(query(std::string("f"), std::string("1.5"))).ok);

        // 4) search
        ASSERT_TRUE(validator.check(query(std::string("f"), std::nullopt, std::string("test"))).ok);
        ASSERT_TRUE(validator.check(query(std::string("f"), std::nullopt, std::string(10000, 'a'))).ok);
        ASSERT_TRUE(!validator.check(query(std::string("f"), std::nullopt, std::string(10001, 'a'))).ok);
        ASSERT_TRUE(!validator.check(query(std::string("f"), std::nullopt, std::string(""))).ok);
        ASSERT_TRUE(validator.check(query(std::string("f"), std::nullopt, std::string("caf\xC3\xA9\ttab"))).ok);
        // length counts characters, not bytes
        std::string accents;
        for (int i = 0; i < 10000; ++i) accents += "\xC3\xA9";
        ASSERT_TRUE(validator.check(query(std::string("f"), std::nullopt, accents)).ok);
        ASSERT_TRUE(!validator.check(query(std::string("f"), std::nullopt, std::string("zero\xE2\x80\x8Bwidth"))).ok);
        ASSERT_TRUE(!validator.check(query(std::string("f"), std::nullopt, std::string("rtl\xE2\x80\xAEoverride"))).ok);
        ASSERT_TRUE(!validator.check(query(std::string("f"), std::nullopt, std::string("\xEF\xBB\xBF" "bom"))).ok);
        ASSERT_TRUE(!validator.check(query(std::string("f"), std::nullopt, std::string("bell\x07"))).ok);
        ASSERT_TRUE(!validator.check(query(std::string("f"), std::nullopt, std::string("bad\xFF"))).ok);

        // 5) every rule runs; the first failure wins
        ValidationResult both = validator.check(query(std::string(""), std::string("NaN")));
        ASSERT_TRUE(!both.ok);
        ASSERT_TRUE(both.reason == "Filepath is required");
        ValidationResult second = validator.check(query(std::string("f"), std::string("x"), std::string("")));
        ASSERT_TRUE(second.reason == "Entries must be a valid non-negative integer.");

        // 6) validate() raises ValidationError
        bool threw = false;
        try {
            validator.validate(query(std::string("f"), std::string("-1")));
        } catch (const ValidationError&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        // 7) configured limits
        ValidationLimits limits;
        limits.maxSearchLength = 3;
        limits.maxFilepathLength = 5;
        FileQueryValidator strict(limits);
        ASSERT_TRUE(!strict.check(query(std::string("f"), std::nullopt, std::string("abcd"))).ok);
        ASSERT_TRUE(!strict.check(query(std::string("abcdef"))).ok);

        // 8) parseEntries
        ASSERT_TRUE(!FileQueryValidator::parseEntries(std::nullopt).has_value());
        ASSERT_TRUE(*FileQueryValidator::parseEntries(std::string("42")) == 42);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All file query validator tests passed" << std::endl;
    return 0;
}
