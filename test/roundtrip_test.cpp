/**
 * @file roundtrip_test.cpp
 * @brief Tables written by Writer and read back by Reader across dialects and encodings.
 */

#include <gtest/gtest.h>
#include "unicsv/reader.h"
#include "unicsv/utf8.h"
#include "unicsv/writer.h"
#include "test_helpers.h"

#include <string>
#include <vector>

using namespace unicsv;

class RoundTripTest : public ::testing::Test {
protected:
    const std::vector<std::string> headers = {"seq", "Name", "Country", "Number Pair"};

    const std::vector<Row> rows = {
        {"1", "Marcos", "Spain", "99"},
        {"2", "Kina", "Papua New Guinea", "88"},
        {"3", "Marine-Anaïs", "France", "77"},
        {"4", "Alex \"Al\"", "Ger,many", "6,6"},
        {"5", "Line\nBreak", "Sp\r\nain", ""},
        {"6", "", "東京", "😀"},
    };

    std::vector<uint8_t> write(const WriterOptions& base) {
        WriterOptions options = base;
        options.headers = headers;
        auto writer = Writer::to_memory(options);
        for (const auto& row : rows) {
            writer.write_row(row);
        }
        writer.end_file();
        return writer.data();
    }

    void expect_table(const std::vector<uint8_t>& bytes, ReaderOptions options) {
        options.header_strategy = HeaderStrategy::FIRST_LINE;
        Document doc = Reader::decode_bytes(bytes, options);
        EXPECT_EQ(doc.headers(), headers);
        EXPECT_EQ(doc.rows(), rows);
    }
};

// ============================================================================
// Delimiters
// ============================================================================

TEST_F(RoundTripTest, DelimiterCombinations) {
    const std::vector<std::u32string> field_delimiters = {U",", U";", U"\t", U"|", U"||", U"|-|"};
    const std::vector<std::u32string> row_delimiters = {U"\n", U"\r", U"\r\n", U"**~**"};

    for (const auto& field : field_delimiters) {
        for (const auto& row : row_delimiters) {
            SCOPED_TRACE("field '" + to_utf8(field) + "' row '" + to_utf8(row) + "'");

            WriterOptions writer_options;
            writer_options.field_delimiter = field;
            writer_options.row_delimiter = row;

            ReaderOptions reader_options;
            reader_options.field_delimiter = field;
            reader_options.row_delimiters = {row};

            expect_table(write(writer_options), reader_options);
        }
    }
}

TEST_F(RoundTripTest, InferredDelimiter) {
    for (const std::u32string field : {U",", U";", U"\t", U"|"}) {
        SCOPED_TRACE("field '" + to_utf8(field) + "'");

        WriterOptions writer_options;
        writer_options.field_delimiter = field;

        ReaderOptions reader_options;
        reader_options.field_delimiter = U"";

        expect_table(write(writer_options), reader_options);
    }
}

TEST_F(RoundTripTest, EscapeAllFields) {
    WriterOptions options;
    options.escape_all_fields = true;
    expect_table(write(options), ReaderOptions());
}

TEST_F(RoundTripTest, CustomEscapingScalar) {
    WriterOptions writer_options;
    writer_options.escaping = U'\'';
    ReaderOptions reader_options;
    reader_options.escaping = U'\'';
    expect_table(write(writer_options), reader_options);
}

TEST_F(RoundTripTest, WriteEncodeMatchesStreaming) {
    std::vector<Row> table = {headers};
    table.insert(table.end(), rows.begin(), rows.end());

    std::string encoded = Writer::encode(table);
    EXPECT_EQ(to_bytes(encoded), write(WriterOptions()));
}

TEST_F(RoundTripTest, EscapeScalarsAtFieldBoundaries) {
    const std::vector<Row> table = {
        {"\"", "\"\"", "x"},
        {"\"a", "a\"", "\"\"\"\""},
        {"", "\"x\"", "a\"\"b"},
        {"\",", ",\"", ""},
    };

    for (bool escape_all : {false, true}) {
        SCOPED_TRACE(escape_all ? "escape all fields" : "escape when needed");
        WriterOptions options;
        options.escape_all_fields = escape_all;

        std::string encoded = Writer::encode(table, options);
        Document doc = Reader::decode(encoded);
        EXPECT_EQ(doc.rows(), table);

        // Writing what was read gives the same bytes again
        EXPECT_EQ(Writer::encode(doc.rows(), options), encoded);
    }
}

TEST_F(RoundTripTest, SingleColumnWithEmptyFields) {
    const std::vector<Row> table = {{""}, {"x"}, {""}, {""}, {"y"}};
    EXPECT_EQ(Reader::decode(Writer::encode(table)).rows(), table);
}

TEST_F(RoundTripTest, EscapingDisabled) {
    const std::vector<std::u32string> field_delimiters = {U",", U";", U"|", U"||", U"|-|"};
    const std::vector<std::u32string> row_delimiters = {U"\n", U"\r\n", U"**~**"};

    // Fields ending in, starting with or holding parts of the delimiters
    const std::vector<std::string> candidates = {
        "plain", "a|", "a|-", "-|b", "|-", "a*", "a**", "a**~", "~**b",
        "\"q\"", "x\"", "a,b", "x;", "\r", "a\r", "Marine-Anaïs"};

    for (const auto& field : field_delimiters) {
        for (const auto& row : row_delimiters) {
            SCOPED_TRACE("field '" + to_utf8(field) + "' row '" + to_utf8(row) + "'");

            WriterOptions writer_options;
            writer_options.escaping = std::nullopt;
            writer_options.field_delimiter = field;
            writer_options.row_delimiter = row;

            // Each candidate is either rejected up front or read back unchanged
            auto writer = Writer::to_memory(writer_options);
            std::vector<Row> accepted;
            for (const auto& candidate : candidates) {
                for (const Row& r : {Row{candidate, "z"}, Row{"z", candidate}}) {
                    try {
                        writer.write_row(r);
                        accepted.push_back(r);
                    } catch (const CsvException& e) {
                        EXPECT_EQ(e.code(), ErrorCode::INVALID_PRIVILEGE_CHARACTER) << e.what();
                        EXPECT_EQ(writer.field_index(), 0);
                    }
                }
            }
            writer.end_file();
            ASSERT_FALSE(accepted.empty());

            ReaderOptions reader_options;
            reader_options.escaping = std::nullopt;
            reader_options.field_delimiter = field;
            reader_options.row_delimiters = {row};

            EXPECT_EQ(Reader::decode_bytes(writer.data(), reader_options).rows(), accepted);
        }
    }
}

TEST_F(RoundTripTest, EscapingDisabledRejectsEarlySplit) {
    WriterOptions writer_options;
    writer_options.escaping = std::nullopt;
    writer_options.field_delimiter = U"|-|";

    try {
        Writer::encode({{"a|-", "b"}}, writer_options);
        FAIL() << "Expected INVALID_PRIVILEGE_CHARACTER";
    } catch (const CsvException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_PRIVILEGE_CHARACTER);
        EXPECT_EQ(e.error().field, 1);
    }
}

// ============================================================================
// Encodings
// ============================================================================

TEST_F(RoundTripTest, EncodingsAndBomStrategies) {
    const std::vector<TextEncoding> encodings = {
        TextEncoding::UTF8,     TextEncoding::UTF16,    TextEncoding::UTF16_LE,
        TextEncoding::UTF16_BE, TextEncoding::UTF32,    TextEncoding::UTF32_LE,
        TextEncoding::UTF32_BE};
    const std::vector<BomStrategy> strategies = {
        BomStrategy::CONVENTION, BomStrategy::ALWAYS, BomStrategy::NEVER};

    for (TextEncoding encoding : encodings) {
        for (BomStrategy strategy : strategies) {
            SCOPED_TRACE(std::string(encoding_to_string(encoding)) + " strategy " +
                         std::to_string(static_cast<int>(strategy)));

            WriterOptions writer_options;
            writer_options.encoding = encoding;
            writer_options.bom_strategy = strategy;

            ReaderOptions reader_options;
            reader_options.encoding = encoding;

            expect_table(write(writer_options), reader_options);
        }
    }
}

TEST_F(RoundTripTest, BomSelectsEncodingWhenUndeclared) {
    for (TextEncoding encoding : {TextEncoding::UTF8, TextEncoding::UTF16_LE, TextEncoding::UTF16_BE,
                                  TextEncoding::UTF32_LE, TextEncoding::UTF32_BE}) {
        SCOPED_TRACE(encoding_to_string(encoding));

        WriterOptions writer_options;
        writer_options.encoding = encoding;
        writer_options.bom_strategy = BomStrategy::ALWAYS;

        auto bytes = write(writer_options);
        auto reader = Reader::from_bytes(bytes);
        EXPECT_EQ(reader.encoding(), encoding);
        expect_table(bytes, ReaderOptions());
    }
}

TEST_F(RoundTripTest, GenericUtf16ReadsBackAsBigEndian) {
    WriterOptions writer_options;
    writer_options.encoding = TextEncoding::UTF16;

    auto bytes = write(writer_options);
    ASSERT_GE(bytes.size(), 2);
    EXPECT_EQ(bytes[0], 0xFE);
    EXPECT_EQ(bytes[1], 0xFF);

    auto reader = Reader::from_bytes(bytes);
    EXPECT_EQ(reader.encoding(), TextEncoding::UTF16_BE);
}

TEST_F(RoundTripTest, Ascii) {
    WriterOptions writer_options;
    writer_options.encoding = TextEncoding::ASCII;
    ReaderOptions reader_options;
    reader_options.encoding = TextEncoding::ASCII;
    reader_options.header_strategy = HeaderStrategy::FIRST_LINE;

    std::vector<Row> table = {{"id", "note"}, {"1", "plain"}, {"2", "with, comma"}};
    auto bytes = Writer::encode_bytes(table, writer_options);

    Document doc = Reader::decode_bytes(bytes, reader_options);
    EXPECT_EQ(doc.headers(), table[0]);
    ASSERT_EQ(doc.row_count(), 2);
    EXPECT_EQ(doc.row(1), table[2]);
}

// ============================================================================
// Files
// ============================================================================

TEST_F(RoundTripTest, FileRoundTrip) {
    TempFile file("roundtrip.csv");
    WriterOptions writer_options;
    writer_options.headers = headers;
    writer_options.encoding = TextEncoding::UTF16_LE;
    writer_options.bom_strategy = BomStrategy::ALWAYS;

    {
        auto writer = Writer::to_file(file.path, writer_options);
        for (const auto& row : rows) {
            writer.write_row(row);
        }
    }

    ReaderOptions reader_options;
    reader_options.header_strategy = HeaderStrategy::FIRST_LINE;
    Document doc = Reader::decode_file(file.path, reader_options);
    EXPECT_EQ(doc.headers(), headers);
    EXPECT_EQ(doc.rows(), rows);
}
