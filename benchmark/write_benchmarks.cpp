#include <benchmark/benchmark.h>
#include "benchmark_data.h"
#include "unicsv/writer.h"

// Streaming a whole table into memory
static void BM_WriteRows(benchmark::State& state, bool quoted) {
  const size_t n_rows = static_cast<size_t>(state.range(0));
  auto table = generate_table(n_rows, 8, quoted);

  size_t bytes = 0;
  for (auto _ : state) {
    auto writer = unicsv::Writer::to_memory();
    for (const auto& row : table) {
      writer.write_row(row);
    }
    writer.end_file();
    bytes = writer.data().size();
    benchmark::DoNotOptimize(bytes);
  }

  state.SetBytesProcessed(static_cast<int64_t>(bytes * state.iterations()));
  state.counters["Rows"] = static_cast<double>(n_rows);
}

static void BM_WritePlain(benchmark::State& state) {
  BM_WriteRows(state, false);
}
BENCHMARK(BM_WritePlain)->RangeMultiplier(10)->Range(100, 100000)->Unit(benchmark::kMillisecond);

static void BM_WriteEscaped(benchmark::State& state) {
  BM_WriteRows(state, true);
}
BENCHMARK(BM_WriteEscaped)->RangeMultiplier(10)->Range(100, 100000)->Unit(benchmark::kMillisecond);

// Long fields stress the escape prescan
static void BM_WriteLongFields(benchmark::State& state) {
  const size_t field_size = static_cast<size_t>(state.range(0));
  std::vector<unicsv::Row> table(1000, unicsv::Row(4, std::string(field_size, 'x')));

  for (auto _ : state) {
    std::string out = unicsv::Writer::encode(table);
    benchmark::DoNotOptimize(out.data());
  }

  state.SetBytesProcessed(static_cast<int64_t>(table.size() * 4 * field_size * state.iterations()));
}
BENCHMARK(BM_WriteLongFields)->RangeMultiplier(4)->Range(16, 4096)->Unit(benchmark::kMillisecond);

static void BM_WriteEncoding(benchmark::State& state) {
  auto encoding = static_cast<unicsv::TextEncoding>(state.range(0));
  unicsv::WriterOptions options;
  options.encoding = encoding;
  auto table = generate_table(10000, 8, false);

  size_t bytes = 0;
  for (auto _ : state) {
    auto out = unicsv::Writer::encode_bytes(table, options);
    bytes = out.size();
    benchmark::DoNotOptimize(out.data());
  }

  state.SetBytesProcessed(static_cast<int64_t>(bytes * state.iterations()));
  state.SetLabel(unicsv::encoding_to_string(encoding));
}
BENCHMARK(BM_WriteEncoding)
  ->Arg(static_cast<int>(unicsv::TextEncoding::UTF8))
  ->Arg(static_cast<int>(unicsv::TextEncoding::UTF16_LE))
  ->Arg(static_cast<int>(unicsv::TextEncoding::UTF32_BE))
  ->Unit(benchmark::kMillisecond);
