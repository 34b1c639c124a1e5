#include <benchmark/benchmark.h>
#include "benchmark_data.h"
#include "unicsv/dialect.h"
#include "unicsv/reader.h"
#include "unicsv/writer.h"

// Row-by-row parsing of generated UTF-8 data
static void BM_ReadRows(benchmark::State& state, bool quoted) {
  const size_t n_rows = static_cast<size_t>(state.range(0));
  std::string data = generate_csv(n_rows, 8, quoted);

  for (auto _ : state) {
    auto reader = unicsv::Reader::from_string(data);
    size_t rows = 0;
    while (auto row = reader.read_row()) {
      benchmark::DoNotOptimize(row->data());
      ++rows;
    }
    benchmark::DoNotOptimize(rows);
  }

  state.SetBytesProcessed(static_cast<int64_t>(data.size() * state.iterations()));
  state.counters["Rows"] = static_cast<double>(n_rows);
}

static void BM_ReadPlain(benchmark::State& state) {
  BM_ReadRows(state, false);
}
BENCHMARK(BM_ReadPlain)->RangeMultiplier(10)->Range(100, 100000)->Unit(benchmark::kMillisecond);

static void BM_ReadEscaped(benchmark::State& state) {
  BM_ReadRows(state, true);
}
BENCHMARK(BM_ReadEscaped)->RangeMultiplier(10)->Range(100, 100000)->Unit(benchmark::kMillisecond);

// Multi-scalar delimiters go through the lookahead path on every candidate
static void BM_ReadMultiScalarDelimiters(benchmark::State& state) {
  unicsv::WriterOptions writer_options;
  writer_options.field_delimiter = U"||";
  writer_options.row_delimiter = U"**~**";
  std::string data = unicsv::Writer::encode(generate_table(10000, 8, true), writer_options);

  unicsv::ReaderOptions reader_options;
  reader_options.field_delimiter = U"||";
  reader_options.row_delimiters = {U"**~**"};

  for (auto _ : state) {
    auto doc = unicsv::Reader::decode(data, reader_options);
    benchmark::DoNotOptimize(doc.row_count());
  }

  state.SetBytesProcessed(static_cast<int64_t>(data.size() * state.iterations()));
}
BENCHMARK(BM_ReadMultiScalarDelimiters)->Unit(benchmark::kMillisecond);

// Decoding cost per encoding for the same table
static void BM_ReadEncoding(benchmark::State& state) {
  auto encoding = static_cast<unicsv::TextEncoding>(state.range(0));
  unicsv::WriterOptions writer_options;
  writer_options.encoding = encoding;
  auto bytes = unicsv::Writer::encode_bytes(generate_table(10000, 8, false), writer_options);

  unicsv::ReaderOptions reader_options;
  reader_options.encoding = encoding;

  for (auto _ : state) {
    auto doc = unicsv::Reader::decode_bytes(bytes, reader_options);
    benchmark::DoNotOptimize(doc.row_count());
  }

  state.SetBytesProcessed(static_cast<int64_t>(bytes.size() * state.iterations()));
  state.SetLabel(unicsv::encoding_to_string(encoding));
}
BENCHMARK(BM_ReadEncoding)
  ->Arg(static_cast<int>(unicsv::TextEncoding::UTF8))
  ->Arg(static_cast<int>(unicsv::TextEncoding::UTF16_LE))
  ->Arg(static_cast<int>(unicsv::TextEncoding::UTF32_BE))
  ->Unit(benchmark::kMillisecond);

// Field delimiter inference over the default sample size
static void BM_DetectDialect(benchmark::State& state) {
  unicsv::WriterOptions writer_options;
  writer_options.field_delimiter = U";";
  std::string data = unicsv::Writer::encode(generate_table(500, 6, true), writer_options);

  unicsv::DialectDetector detector;
  for (auto _ : state) {
    auto result = detector.detect(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    benchmark::DoNotOptimize(result);
  }

  state.SetBytesProcessed(static_cast<int64_t>(data.size() * state.iterations()));
}
BENCHMARK(BM_DetectDialect)->Unit(benchmark::kMicrosecond);
