#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "unicsv/dialect.h"

using namespace unicsv;

// ============================================================================
// DIALECT DETECTION TESTS
// ============================================================================

class DialectDetectionTest : public ::testing::Test {
protected:
    // Tokens as a compact string, e.g. "CDCR"
    static std::string pattern(const std::vector<Token>& tokens) {
        std::string out;
        for (Token t : tokens) out += DialectDetector::token_to_string(t);
        return out;
    }

    std::string abstract(std::u32string_view csv, char32_t delimiter = U',') const {
        return pattern(detector.make_abstraction(csv, delimiter).tokens);
    }

    double score(std::u32string_view csv, char32_t delimiter) const {
        return detector.pattern_score(detector.make_abstraction(csv, delimiter).tokens);
    }

    DialectDetector detector;
};

// ============================================================================
// Delimiter Detection Tests
// ============================================================================

TEST_F(DialectDetectionTest, DetectCommaInFreeText) {
    // Adapted from the CPython csv.Sniffer test data
    const std::u32string csv =
        U"Harry's, Arlington Heights, IL, 2/1/03, Kimi Hayes\n"
        U"Shark City, Glendale Heights, IL, 12/28/02, Prezence\n"
        U"Tommy's Place, Blue Island, IL, 12/28/02, Blue Sunday/White Crow\n"
        U"Stonecutters Seafood and Chop House, Lemont, IL, 12/19/02, Week Back";

    auto result = detector.detect(csv);

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.dialect.delimiter, U',') << "Should detect comma delimiter";
}

TEST_F(DialectDetectionTest, DetectSemicolonDelimiter) {
    auto result = detector.detect(U"a;b;c\nd;e;f\n");

    EXPECT_EQ(result.dialect.delimiter, U';') << "Should detect semicolon delimiter";
    EXPECT_DOUBLE_EQ(result.score, 4.0 / 3.0);
    ASSERT_EQ(result.candidates.size(), 4);
    EXPECT_DOUBLE_EQ(result.candidates[0].pattern_score, 0.002) << "Comma yields one-cell rows";
}

TEST_F(DialectDetectionTest, DetectTabDelimiter) {
    auto result = detector.detect(U"id\tname\n1\tAnn\n2\tBea\n");
    EXPECT_EQ(result.dialect.delimiter, U'\t') << "Should detect tab delimiter";
}

TEST_F(DialectDetectionTest, DetectPipeDelimiter) {
    auto result = detector.detect(U"id|name|city\n1|Ann|Oslo\n2|Bea|Lima\n");
    EXPECT_EQ(result.dialect.delimiter, U'|') << "Should detect pipe delimiter";
}

TEST_F(DialectDetectionTest, DetectFromUtf8Bytes) {
    const std::string csv = "größe;farbe\n1;grün\n2;blau\n";
    auto result = detector.detect(reinterpret_cast<const uint8_t*>(csv.data()), csv.size());
    EXPECT_EQ(result.dialect.delimiter, U';');
}

TEST_F(DialectDetectionTest, EmptySampleFallsBackToComma) {
    auto result = detector.detect(U"");
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.dialect, Dialect::csv());
}

TEST_F(DialectDetectionTest, CustomCandidates) {
    DetectionOptions options;
    options.delimiters = {U':', U','};
    DialectDetector custom(options);

    auto result = custom.detect(U"a:b:c\n1:2:3\n");
    EXPECT_EQ(result.dialect.delimiter, U':');
    EXPECT_EQ(result.candidates.size(), 2);
}

TEST_F(DialectDetectionTest, EscapingDisabledTreatsQuotesAsText) {
    const std::u32string csv = U"5\" pipe;10\n3\" bolt;20\n";

    // As an escaping scalar the quotes swallow the first line break
    auto quoted = detector.detect(csv);
    EXPECT_EQ(quoted.dialect.delimiter, U';');
    EXPECT_DOUBLE_EQ(quoted.score, 0.5);
    EXPECT_FALSE(quoted.candidates[1].errors.empty());

    DetectionOptions options;
    options.escaping = false;
    DialectDetector plain(options);

    EXPECT_EQ(pattern(plain.make_abstraction(csv, U';').tokens), "CDCRCDCR");
    auto result = plain.detect(csv);
    EXPECT_EQ(result.dialect.delimiter, U';');
    EXPECT_DOUBLE_EQ(result.score, 1.0);
    EXPECT_TRUE(result.candidates[1].errors.empty());
}

// ============================================================================
// Embedded Separator Tests (should not be fooled by quoted delimiters)
// ============================================================================

TEST_F(DialectDetectionTest, NotFooledByQuotedCommas) {
    auto result = detector.detect(U"\"a,b\";\"c,d\"\n\"e,f\";\"g,h\"\n");
    EXPECT_EQ(result.dialect.delimiter, U';');
}

// ============================================================================
// Pattern Score Tests
// ============================================================================

TEST_F(DialectDetectionTest, PatternScore) {
    // Adapted from the CleverCSV pattern score tests
    const std::u32string csv =
        U"7,5; Mon, Jan 12;6,40\n"
        U"100; Fri, Mar 21;8,23\n"
        U"8,2; Thu, Sep 17;2,71\n"
        U"538,0;;7,26\n"
        U"\"NA\"; Wed, Oct 4;6,93";

    EXPECT_DOUBLE_EQ(score(csv, U','), 7.0 / 4.0);
    EXPECT_DOUBLE_EQ(score(csv, U';'), 10.0 / 3.0);
}

TEST_F(DialectDetectionTest, PatternScoreTieBreaking) {
    // Both delimiters score 1.0 but only the comma reads the sample cleanly
    const std::u32string csv = U"foo;,bar\nbaz;,\"boo\"";

    auto comma = detector.make_abstraction(csv, U',');
    auto semicolon = detector.make_abstraction(csv, U';');

    EXPECT_DOUBLE_EQ(detector.pattern_score(comma.tokens), 1.0);
    EXPECT_DOUBLE_EQ(detector.pattern_score(semicolon.tokens), 1.0);
    EXPECT_EQ(pattern(comma.tokens), "CDCRCDC");
    EXPECT_EQ(pattern(semicolon.tokens), "CDCRCDC");
    EXPECT_TRUE(comma.errors.empty());
    EXPECT_EQ(semicolon.errors,
              (std::vector<AbstractionError>{AbstractionError::INVALID_ESCAPE_CHARACTER_POSITION}));

    // Equal scores keep the earlier candidate
    auto result = detector.detect(csv);
    EXPECT_EQ(result.dialect.delimiter, U',');
}

TEST_F(DialectDetectionTest, PatternScoreOfEmptyAbstraction) {
    EXPECT_DOUBLE_EQ(detector.pattern_score({}), 0.0);
    EXPECT_DOUBLE_EQ(score(U"\n\n", U','), 0.002) << "Two single-cell rows";
}

// ============================================================================
// Abstraction Tests
// ============================================================================

TEST_F(DialectDetectionTest, Abstraction) {
    EXPECT_EQ(abstract(U""), "");
    EXPECT_EQ(abstract(U"foo"), "C");
    EXPECT_EQ(abstract(U","), "CDC");
    EXPECT_EQ(abstract(U",,"), "CDCDC");
    EXPECT_EQ(abstract(U"\n"), "CR");
    EXPECT_EQ(abstract(U"\n\n"), "CRCR");
    EXPECT_EQ(abstract(U",\n,"), "CDCRCDC");
    EXPECT_EQ(abstract(U",foo\n,bar"), "CDCRCDC");
}

TEST_F(DialectDetectionTest, AbstractionHandlesEscaping) {
    EXPECT_EQ(abstract(U"\"foo\",bar"), "CDC");
    EXPECT_EQ(abstract(UR"("foo ""quoted"" \n ,bar",baz)"), "CDC");
    EXPECT_EQ(abstract(UR"(a,"bc""d""e""f""a",\n)"), "CDCDC");
}

TEST_F(DialectDetectionTest, AbstractionHandlesInvalidEscaping) {
    auto early = detector.make_abstraction(U"foo,x\"bar\"", U',');
    EXPECT_EQ(pattern(early.tokens), "CDC");
    EXPECT_EQ(early.errors,
              (std::vector<AbstractionError>{AbstractionError::INVALID_ESCAPE_CHARACTER_POSITION}));

    auto late = detector.make_abstraction(U"foo,\"bar\"x", U',');
    EXPECT_EQ(pattern(late.tokens), "CDC");
    EXPECT_EQ(late.errors,
              (std::vector<AbstractionError>{AbstractionError::INVALID_ESCAPE_CHARACTER_POSITION}));

    auto unbalanced = detector.make_abstraction(U"foo,\"bar", U',');
    EXPECT_EQ(pattern(unbalanced.tokens), "CDC");
    EXPECT_EQ(unbalanced.errors,
              (std::vector<AbstractionError>{AbstractionError::UNBALANCED_ESCAPE_CHARACTERS}));

    EXPECT_EQ(abstract(U"foo,bar\n\n"), "CDCRCR") << "Rows of different widths";
}

// ============================================================================
// Dialect Tests
// ============================================================================

TEST_F(DialectDetectionTest, DialectFactories) {
    EXPECT_EQ(Dialect::csv().delimiter, U',');
    EXPECT_EQ(Dialect::tsv().delimiter, U'\t');
    EXPECT_EQ(Dialect::semicolon().delimiter, U';');
    EXPECT_EQ(Dialect::pipe().delimiter, U'|');
    EXPECT_NE(Dialect::csv(), Dialect::tsv());
    EXPECT_EQ(Dialect::tsv().to_string(), "delimiter='\\t' row_delimiter='\\n' quote='\"'");
}
