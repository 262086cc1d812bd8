#include <benchmark/benchmark.h>

#include <string>
#include <vector>

#include "zw/tui/editor.hpp"
#include "zw/tui/editor_buffer.hpp"
#include "zw/tui/editor_search.hpp"
#include "../common/test_helpers.hpp"

using namespace zw::tui;
using namespace zw::test;

// Benchmark appending characters at the gap, including capacity growth
static void BM_GapBufferInsert(benchmark::State& state) {
  const auto count = static_cast<size_t>(state.range(0));

  for (auto _ : state) {
    GapBuffer buffer(GapBuffer::kMinCapacity);
    for (size_t i = 0; i < count; ++i) {
      buffer.insertChar(U'x');
    }
    benchmark::DoNotOptimize(buffer.size());
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_GapBufferInsert)->Range(64, 64 << 10);

// Benchmark moving the gap between both ends of a line
static void BM_GapBufferMoveGap(benchmark::State& state) {
  const auto length = static_cast<size_t>(state.range(0));
  GapBuffer buffer(std::u32string(length, U'a'), 16);

  bool at_end = true;
  for (auto _ : state) {
    auto result = buffer.moveGapTo(at_end ? 0 : length);
    benchmark::DoNotOptimize(result);
    at_end = !at_end;
  }
}
BENCHMARK(BM_GapBufferMoveGap)->Range(64, 64 << 10);

// Benchmark KMP search on a long line with many overlapping matches
static void BM_GapBufferFindAll(benchmark::State& state) {
  const auto length = static_cast<size_t>(state.range(0));
  GapBuffer buffer(std::u32string(length, U'a'), 16);
  auto moved = buffer.moveGapTo(length / 2);
  benchmark::DoNotOptimize(moved);

  for (auto _ : state) {
    auto matches = buffer.findAll(std::u32string_view(U"aaab"));
    benchmark::DoNotOptimize(matches);
  }
  state.SetBytesProcessed(state.iterations() * state.range(0) * sizeof(char32_t));
}
BENCHMARK(BM_GapBufferFindAll)->Range(1 << 10, 1 << 20);

// Benchmark loading a document
static void BM_EditorSetContent(benchmark::State& state) {
  auto lines = randomLines(static_cast<size_t>(state.range(0)), 42);

  for (auto _ : state) {
    Editor editor;
    editor.setContent(lines);
    benchmark::DoNotOptimize(editor.lineCount());
  }
}
BENCHMARK(BM_EditorSetContent)->Range(100, 10000);

// Benchmark typing a line and breaking it, in the middle of a document
static void BM_EditorTyping(benchmark::State& state) {
  Editor editor;
  editor.setContent(randomLines(1000, 7));
  if (!editor.setViewportSize(80, 24)) {
    state.SkipWithError("viewport size rejected");
    return;
  }
  editor.moveTo(500, 0);

  const std::u32string word = U"typing ";
  for (auto _ : state) {
    for (char32_t ch : word) {
      editor.insertChar(ch);
    }
    editor.splitLine();
  }
}
BENCHMARK(BM_EditorTyping);

// Benchmark searching a whole document
static void BM_EditorSearch(benchmark::State& state) {
  Editor editor;
  editor.setContent(randomLines(static_cast<size_t>(state.range(0)), 3));
  EditorSearch search(editor);

  for (auto _ : state) {
    auto count = search.startSearch("ab");
    benchmark::DoNotOptimize(count);
  }
}
BENCHMARK(BM_EditorSearch)->Range(100, 10000);

BENCHMARK_MAIN();
