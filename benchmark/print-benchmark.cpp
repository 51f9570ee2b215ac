#include <benchmark/benchmark.h>
#include <fmt/format.h>
#include <cstdio>
#include <freeformat/freeformat.hpp>

static void BM_shortest_sprintf(benchmark::State& state) {
    int64_t i = 0;
    for(auto _ : state) {
        char buf[100];
        snprintf(buf, sizeof(buf), "%.17g", 143213413.00012345);
        ++i;
    }
    state.SetItemsProcessed(i);
}

static void BM_shortest_libfmt(benchmark::State& state) {
    int64_t i = 0;
    for(auto _ : state) {
        char buf[100];
        benchmark::DoNotOptimize(fmt::format_to(buf, "{}", 143213413.00012345));
        ++i;
    }
    state.SetItemsProcessed(i);
}

static void BM_shortest_freeformat(benchmark::State& state) {
    int64_t i = 0;
    for(auto _ : state) {
        char buf[100];
        benchmark::DoNotOptimize(freeformat::print_to(buf, 143213413.00012345));
        ++i;
    }
    state.SetItemsProcessed(i);
}

static void BM_fixed_sprintf(benchmark::State& state) {
    int64_t i = 0;
    for(auto _ : state) {
        char buf[100];
        snprintf(buf, sizeof(buf), "%0.10f", 0.0000012345);
        ++i;
    }
    state.SetItemsProcessed(i);
}

static void BM_fixed_libfmt(benchmark::State& state) {
    int64_t i = 0;
    for(auto _ : state) {
        char buf[100];
        benchmark::DoNotOptimize(fmt::format_to(buf, "{:.10f}", 0.0000012345));
        ++i;
    }
    state.SetItemsProcessed(i);
}

static void BM_fixed_freeformat(benchmark::State& state) {
    freeformat::print_options options;
    options.decimals = 10;
    options.compact = false;
    int64_t i = 0;
    for(auto _ : state) {
        char buf[100];
        benchmark::DoNotOptimize(
            freeformat::print_to(buf, 0.0000012345, options));
        ++i;
    }
    state.SetItemsProcessed(i);
}

static void BM_tiny_sprintf(benchmark::State& state) {
    int64_t i = 0;
    for(auto _ : state) {
        char buf[100];
        snprintf(buf, sizeof(buf), "%.17e", 4.9406564584124654e-324);
        ++i;
    }
    state.SetItemsProcessed(i);
}

static void BM_tiny_libfmt(benchmark::State& state) {
    int64_t i = 0;
    for(auto _ : state) {
        char buf[100];
        benchmark::DoNotOptimize(
            fmt::format_to(buf, "{:e}", 4.9406564584124654e-324));
        ++i;
    }
    state.SetItemsProcessed(i);
}

static void BM_tiny_freeformat(benchmark::State& state) {
    freeformat::print_options options;
    options.style = freeformat::notation::scientific;
    int64_t i = 0;
    for(auto _ : state) {
        char buf[100];
        benchmark::DoNotOptimize(
            freeformat::print_to(buf, 4.9406564584124654e-324, options));
        ++i;
    }
    state.SetItemsProcessed(i);
}

static void BM_digits_of(benchmark::State& state) {
    int64_t i = 0;
    double value = 0.1;
    for(auto _ : state) {
        benchmark::DoNotOptimize(freeformat::digits_of(value));
        value += 0.1;
        ++i;
    }
    state.SetItemsProcessed(i);
}

BENCHMARK(BM_shortest_sprintf);
BENCHMARK(BM_shortest_libfmt);
BENCHMARK(BM_shortest_freeformat);
BENCHMARK(BM_fixed_sprintf);
BENCHMARK(BM_fixed_libfmt);
BENCHMARK(BM_fixed_freeformat);
BENCHMARK(BM_tiny_sprintf);
BENCHMARK(BM_tiny_libfmt);
BENCHMARK(BM_tiny_freeformat);
BENCHMARK(BM_digits_of);

BENCHMARK_MAIN();
