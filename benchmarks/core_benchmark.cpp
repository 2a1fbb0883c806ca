#include <benchmark/benchmark.h>

#include <string>

#include "core/config.hpp"
#include "core/domain.hpp"
#include "core/image_url.hpp"
#include "core/sanitize.hpp"
#include "core/wide_integer.hpp"

namespace {

void BM_SplitDomain(benchmark::State& state) {
  const std::string domain = "deep.nested.sub.example.com";
  for (auto _ : state) {
    auto parts = mr::core::split_domain(domain);
    benchmark::DoNotOptimize(parts);
  }
}
BENCHMARK(BM_SplitDomain);

void BM_ComposeWideInteger(benchmark::State& state) {
  const std::string low = "0x123456789abcdef0fedcba9876543210";
  const std::string high = "0x0000000000000000000000000000abcd";
  for (auto _ : state) {
    auto value = mr::core::compose_wide_integer(low, high);
    if (!value) {
      state.SkipWithError(value.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(value);
  }
}
BENCHMARK(BM_ComposeWideInteger);

void BM_WideIntegerToDecimal(benchmark::State& state) {
  const auto value = mr::core::WideInteger::from_halves(
      mr::core::U128{~0ULL, ~0ULL}, mr::core::U128{~0ULL, ~0ULL});
  for (auto _ : state) {
    auto text = value.to_decimal();
    benchmark::DoNotOptimize(text);
  }
}
BENCHMARK(BM_WideIntegerToDecimal);

void BM_CleanString(benchmark::State& state) {
  std::string input(static_cast<std::size_t>(state.range(0)), 'a');
  for (std::size_t i = 0; i < input.size(); i += 7) {
    input[i] = '\0';
  }
  for (auto _ : state) {
    auto cleaned = mr::core::clean_string(input);
    benchmark::DoNotOptimize(cleaned);
  }
  state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_CleanString)->Arg(64)->Arg(4096);

void BM_ParseImageUrl(benchmark::State& state) {
  const mr::core::Config config;
  const std::string url = "ipfs://bafybeigdyrzt5sfp7udm7hu76uh7y26nf3efuylqabf3oclgtqy55fbzdi";
  for (auto _ : state) {
    auto resolved = mr::core::parse_image_url(config, url);
    benchmark::DoNotOptimize(resolved);
  }
}
BENCHMARK(BM_ParseImageUrl);

}  // namespace

BENCHMARK_MAIN();
