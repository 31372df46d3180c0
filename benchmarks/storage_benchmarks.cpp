#include "quarry/storage/column_block.hpp"
#include "quarry/storage/partitioned_batch_store.hpp"
#include "quarry/storage/record_batch.hpp"
#include "quarry/storage/table_schema.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace qs = quarry::storage;

namespace {

struct BenchmarkOptions final {
    std::size_t samples = 5U;
    std::size_t block_iterations = 64U;
    std::size_t partitions = 8U;
    std::size_t batches = 64U;
    std::size_t rows_per_batch = 1024U;
    std::size_t lookups = 4096U;
};

struct OptionSpec final {
    std::string_view flag;
    std::size_t BenchmarkOptions::*field;
};

constexpr std::array<OptionSpec, 6> kOptionSpecs{{
    {"--samples", &BenchmarkOptions::samples},
    {"--block-iterations", &BenchmarkOptions::block_iterations},
    {"--partitions", &BenchmarkOptions::partitions},
    {"--batches", &BenchmarkOptions::batches},
    {"--rows-per-batch", &BenchmarkOptions::rows_per_batch},
    {"--lookups", &BenchmarkOptions::lookups},
}};

struct BenchmarkResult final {
    std::string name{};
    std::vector<double> samples_ms{};
    std::size_t work_units = 0U;
};

// Every option is `--flag=N`; anything else is rejected.
BenchmarkOptions parse_options(int argc, char** argv)
{
    BenchmarkOptions options{};
    for (int index = 1; index < argc; ++index) {
        const std::string_view argument{argv[index]};
        const auto equals = argument.find('=');
        const auto flag = argument.substr(0, equals);
        const auto spec = std::find_if(kOptionSpecs.begin(), kOptionSpecs.end(), [flag](const OptionSpec& candidate) {
            return candidate.flag == flag;
        });
        if (equals == std::string_view::npos || spec == kOptionSpecs.end()) {
            throw std::invalid_argument("unknown option " + std::string{argument});
        }

        const auto value = argument.substr(equals + 1U);
        auto& field = options.*(spec->field);
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), field);
        if (ec != std::errc{} || ptr != value.data() + value.size()) {
            throw std::invalid_argument("invalid value for " + std::string{flag});
        }
    }
    if (options.partitions == 0U || options.samples == 0U) {
        throw std::invalid_argument("--partitions and --samples must be positive");
    }
    return options;
}

void throw_if_error(const std::error_code& ec, std::string_view context)
{
    if (ec) {
        throw std::runtime_error(std::string(context) + ": " + ec.message());
    }
}

std::shared_ptr<const qs::TableSchema> make_schema()
{
    return std::make_shared<const qs::TableSchema>(qs::TableSchema{
        {qs::ColumnDefinition{"id", 8U, false}, qs::ColumnDefinition{"quantity", 4U}, qs::ColumnDefinition{"status", 1U}},
        "id"});
}

qs::PartitionBatches build_partitions(const BenchmarkOptions& options,
                                      const std::shared_ptr<const qs::TableSchema>& schema)
{
    std::vector<qs::RecordBatch> batches;
    batches.reserve(options.batches);
    qs::PrimaryKey next_key = 0;
    for (std::size_t batch = 0; batch < options.batches; ++batch) {
        qs::RecordBatchBuilder builder{schema};
        for (std::size_t row = 0; row < options.rows_per_batch; ++row) {
            const std::array<qs::ColumnValue, 3> values{qs::encode_integer(next_key, 8U),
                                                        qs::encode_integer(next_key % 1000, 4U),
                                                        qs::encode_integer(next_key % 3, 1U)};
            throw_if_error(builder.append_row(values), "append_row");
            ++next_key;
        }
        batches.push_back(builder.finish());
    }
    return qs::distribute_round_robin(std::move(batches), options.partitions);
}

std::unique_ptr<qs::PartitionedBatchStore> build_store(const BenchmarkOptions& options)
{
    const auto schema = make_schema();
    std::unique_ptr<qs::PartitionedBatchStore> store;
    throw_if_error(qs::PartitionedBatchStore::create(schema, build_partitions(options, schema), {}, store),
                   "create store");
    return store;
}

BenchmarkResult benchmark_block_insert_read(const BenchmarkOptions& options)
{
    BenchmarkResult result{};
    result.name = "block_insert_read";
    result.work_units = qs::kSlotsPerBlock * options.block_iterations;

    const std::vector<qs::ColumnId> ids{0U, 1U, 2U};
    const auto rows = qs::kSlotsPerBlock;

    for (std::size_t sample = 0; sample < options.samples; ++sample) {
        const auto start = std::chrono::steady_clock::now();

        std::size_t visible = 0U;
        for (std::size_t iteration = 0; iteration < options.block_iterations; ++iteration) {
            qs::ColumnBlock block{{8U, 4U, 1U}};
            for (std::size_t row = 0; row < rows; ++row) {
                const auto key = static_cast<std::int64_t>(row);
                qs::ProjectedRow values{ids,
                                        {qs::encode_integer(key, 8U),
                                         qs::encode_integer(key * 3, 4U),
                                         row % 5U == 0U ? qs::ColumnValue{} : qs::ColumnValue{qs::encode_integer(1, 1U)}}};
                throw_if_error(block.insert(values), "block insert");
            }
            for (std::size_t row = 0; row < rows; ++row) {
                if (block.row_at_index(row, ids)) {
                    ++visible;
                }
            }
        }

        const auto end = std::chrono::steady_clock::now();
        if (visible != rows * options.block_iterations) {
            throw std::runtime_error("block read returned fewer rows than inserted");
        }
        result.samples_ms.push_back(std::chrono::duration<double, std::milli>(end - start).count());
    }

    return result;
}

BenchmarkResult benchmark_point_lookup(const BenchmarkOptions& options)
{
    BenchmarkResult result{};
    result.name = "point_lookup";
    result.work_units = options.lookups;

    const auto store = build_store(options);
    const auto total_rows = static_cast<qs::PrimaryKey>(options.batches * options.rows_per_batch);

    for (std::size_t sample = 0; sample < options.samples; ++sample) {
        const auto start = std::chrono::steady_clock::now();

        std::size_t hits = 0U;
        for (std::size_t lookup = 0; lookup < options.lookups; ++lookup) {
            const auto key = total_rows == 0 ? qs::PrimaryKey{0}
                                             : static_cast<qs::PrimaryKey>((lookup * 7919U) % static_cast<std::size_t>(total_rows));
            qs::PartitionedBatchStore::ScanRequest request{};
            request.filters.push_back(qs::ScanExpression::binary(qs::ScanExpression::column_ref("id"),
                                                                 qs::BinaryOperator::Eq,
                                                                 qs::ScanExpression::literal_value(key)));
            qs::PartitionedBatchStore::ScanResult scan{};
            throw_if_error(store->scan(request, scan), "point lookup");
            hits += scan.row_count();
        }

        const auto end = std::chrono::steady_clock::now();
        if (total_rows > 0 && hits != options.lookups) {
            throw std::runtime_error("point lookup missed an indexed key");
        }
        result.samples_ms.push_back(std::chrono::duration<double, std::milli>(end - start).count());
    }

    return result;
}

BenchmarkResult benchmark_full_scan(const BenchmarkOptions& options)
{
    BenchmarkResult result{};
    result.name = "full_scan";
    result.work_units = options.batches * options.rows_per_batch;

    const auto store = build_store(options);
    qs::PartitionedBatchStore::ScanRequest request{};
    request.projection = std::vector<std::size_t>{0U, 2U};

    for (std::size_t sample = 0; sample < options.samples; ++sample) {
        const auto start = std::chrono::steady_clock::now();

        qs::PartitionedBatchStore::ScanResult scan{};
        throw_if_error(store->scan(request, scan), "full scan");

        const auto end = std::chrono::steady_clock::now();
        if (scan.row_count() != result.work_units) {
            throw std::runtime_error("full scan row count mismatch");
        }
        result.samples_ms.push_back(std::chrono::duration<double, std::milli>(end - start).count());
    }

    return result;
}

BenchmarkResult benchmark_append_write(const BenchmarkOptions& options)
{
    BenchmarkResult result{};
    result.name = "append_write";
    result.work_units = options.batches * options.rows_per_batch;

    const auto schema = make_schema();
    for (std::size_t sample = 0; sample < options.samples; ++sample) {
        std::unique_ptr<qs::PartitionedBatchStore> store;
        throw_if_error(qs::PartitionedBatchStore::create(schema, qs::PartitionBatches(options.partitions), {}, store),
                       "create store");

        std::vector<qs::RecordBatch> groups;
        for (auto& partition : build_partitions(options, schema)) {
            for (auto& batch : partition) {
                groups.push_back(std::move(batch));
            }
        }

        const auto start = std::chrono::steady_clock::now();
        std::uint64_t rows = 0U;
        throw_if_error(store->write(std::move(groups), qs::PartitionedBatchStore::WriteMode::Append, rows), "write");
        const auto end = std::chrono::steady_clock::now();

        if (rows != result.work_units) {
            throw std::runtime_error("append write row count mismatch");
        }
        result.samples_ms.push_back(std::chrono::duration<double, std::milli>(end - start).count());
    }

    return result;
}

void report(const BenchmarkResult& result)
{
    const auto& samples = result.samples_ms;
    const auto mean = std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(samples.size());
    const auto best = *std::min_element(samples.begin(), samples.end());
    const auto per_unit_ns = result.work_units == 0U ? 0.0 : best * 1.0e6 / static_cast<double>(result.work_units);

    std::cout << std::left << std::setw(20) << result.name << std::right << std::fixed << std::setprecision(3)
              << " mean " << std::setw(10) << mean << " ms"
              << "  best " << std::setw(10) << best << " ms"
              << "  " << std::setw(10) << per_unit_ns << " ns/unit"
              << "  (" << result.work_units << " units)\n";
}

}  // namespace

int main(int argc, char** argv)
{
    try {
        const auto options = parse_options(argc, argv);
        report(benchmark_block_insert_read(options));
        report(benchmark_point_lookup(options));
        report(benchmark_full_scan(options));
        report(benchmark_append_write(options));
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "quarry_benchmarks: " << ex.what() << '\n';
        return 1;
    }
}
