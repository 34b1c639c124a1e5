#include <benchmark/benchmark.h>
#include "benchmark_data.h"
#include "unicsv/log.h"
#include "unicsv/writer.h"

std::vector<unicsv::Row> generate_table(size_t rows, size_t cols, bool quoted) {
  static const char* words[] = {"alpha", "Müller", "42", "3.14159", "東京", "", "zeta"};
  static const char* tricky[] = {"a,b", "say \"hi\"", "two\nlines", "x\r\ny"};

  std::vector<unicsv::Row> table;
  table.reserve(rows);
  for (size_t r = 0; r < rows; ++r) {
    unicsv::Row row;
    row.reserve(cols);
    for (size_t c = 0; c < cols; ++c) {
      size_t k = r * cols + c;
      if (quoted && k % 4 == 0) {
        row.emplace_back(tricky[(k / 4) % 4]);
      } else {
        row.emplace_back(words[k % 7]);
      }
    }
    table.push_back(std::move(row));
  }
  return table;
}

std::string generate_csv(size_t rows, size_t cols, bool quoted) {
  return unicsv::Writer::encode(generate_table(rows, cols, quoted));
}

// Keep library warnings out of the benchmark output
static const bool quiet_logs = [] {
  unicsv::set_log_level(spdlog::level::err);
  return true;
}();

BENCHMARK_MAIN();
