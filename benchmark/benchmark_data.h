#ifndef UNICSV_BENCHMARK_DATA_H
#define UNICSV_BENCHMARK_DATA_H

#include "unicsv/record.h"

#include <string>
#include <vector>

// Deterministic table of rows x cols fields. When quoted is set, every
// fourth field carries a delimiter, an escape or a newline.
std::vector<unicsv::Row> generate_table(size_t rows, size_t cols, bool quoted);

// The same table rendered as comma-separated UTF-8 text.
std::string generate_csv(size_t rows, size_t cols, bool quoted);

#endif  // UNICSV_BENCHMARK_DATA_H
