#include "diffarena/adapter.hpp"

#include <iostream>
#include <regex>
#include <string>
#include <vector>

using namespace diffarena;

namespace {

const char *kDiff = "diff --git a/src/app.ts b/src/app.ts\n"
                    "index 1111111..2222222 100644\n"
                    "--- a/src/app.ts\n"
                    "+++ b/src/app.ts\n"
                    "@@ -1,3 +1,4 @@\n"
                    " import x from 'x';\n"
                    "-const a = 1;\n"
                    "+const a = 2;\n"
                    "+const b = 3;\n"
                    " export default a;\n"
                    "@@ -20,2 +21,2 @@ function f()\n"
                    "-  return 1;\n"
                    "+  return 2;\n"
                    " }\n"
                    "diff --git a/lib/util.ts b/lib/helpers.ts\n"
                    "similarity index 80%\n"
                    "rename from lib/util.ts\n"
                    "rename to lib/helpers.ts\n"
                    "--- a/lib/util.ts\n"
                    "+++ b/lib/helpers.ts\n"
                    "@@ -5 +5,2 @@\n"
                    " keep();\n"
                    "+added();\n";

} // namespace

int main() {
  StringInternPool pool;
  const auto res = parse_diff_string(kDiff, ParserOptions{.pool = &pool});
  if (res.stats.anomalies.total() != 0) {
    std::cerr << "fixture should parse cleanly\n";
    return 1;
  }

  // Eager records
  const auto eager = adapter::to_file_diffs(res);
  if (eager.size() != 2) {
    std::cerr << "expected 2 files\n";
    return 1;
  }
  const auto &app = eager[0];
  if (app.path != "src/app.ts" || app.status != FileStatus::Modified || app.old_path ||
      app.hunks.size() != 2) {
    std::cerr << "first file wrong\n";
    return 1;
  }
  const adapter::Hunk &h0 = app.hunks[0];
  if (h0.old_start != 1 || h0.old_lines != 3 || h0.new_start != 1 || h0.new_lines != 4 ||
      h0.content != "@@ -1,3 +1,4 @@" ||
      h0.additions != std::vector<std::string>{"const a = 2;", "const b = 3;"} ||
      h0.deletions != std::vector<std::string>{"const a = 1;"}) {
    std::cerr << "first hunk wrong\n";
    return 1;
  }
  const auto &helpers = eager[1];
  if (helpers.path != "lib/helpers.ts" || helpers.status != FileStatus::Renamed ||
      helpers.old_path != std::optional<std::string>{"lib/util.ts"}) {
    std::cerr << "renamed file wrong\n";
    return 1;
  }

  // Lazy records decode on access and agree with eager ones
  const auto lazy = adapter::to_lazy_file_diffs(res);
  if (lazy.size() != eager.size()) {
    std::cerr << "lazy/eager size mismatch\n";
    return 1;
  }
  if (lazy[0].hunks_decoded() || lazy[0].index() != 0 || lazy[0].is_stale()) {
    std::cerr << "lazy view decoded early\n";
    return 1;
  }
  const std::string &p1 = lazy[0].path();
  const std::string &p2 = lazy[0].path();
  if (&p1 != &p2 || &p1 != &pool.intern("src/app.ts")) {
    std::cerr << "lazy path not memoized in the pool\n";
    return 1;
  }
  for (std::size_t i = 0; i < lazy.size(); ++i) {
    if (lazy[i].materialize() != eager[i]) {
      std::cerr << "lazy file " << i << " differs from eager\n";
      return 1;
    }
  }
  if (!lazy[0].hunks_decoded() || lazy[1].old_path() != std::optional<std::string_view>{"lib/util.ts"}) {
    std::cerr << "lazy accessors wrong\n";
    return 1;
  }

  // Summary projections
  const auto changes = adapter::to_file_changes(res);
  if (changes.size() != 2 || changes[0].path != "src/app.ts" ||
      changes[1].status != FileStatus::Renamed || changes[1].old_path != "lib/util.ts") {
    std::cerr << "file changes wrong\n";
    return 1;
  }
  const std::vector<std::string> paths = {"src/app.ts", "lib/helpers.ts"};
  if (adapter::extract_file_paths(res) != paths || adapter::extract_file_paths(res) != paths) {
    std::cerr << "extract_file_paths wrong or not restartable\n";
    return 1;
  }

  if (!adapter::has_file_matching(res, std::regex(R"(\.ts$)")) ||
      !adapter::has_file_matching(res, std::regex("^lib/")) ||
      adapter::has_file_matching(res, std::regex(R"(\.py$)"))) {
    std::cerr << "has_file_matching wrong\n";
    return 1;
  }
  int calls = 0;
  const bool found = adapter::has_file_where(res, [&calls](std::string_view p) {
    ++calls;
    return p.starts_with("src/");
  });
  if (!found || calls != 1) {
    std::cerr << "has_file_where did not stop at the first match\n";
    return 1;
  }

  // Additions in file order then line order; fresh range each call
  struct Want {
    std::string path;
    std::string content;
    std::uint32_t line;
  };
  const std::vector<Want> want_adds = {
      {"src/app.ts", "const a = 2;", 2},
      {"src/app.ts", "const b = 3;", 3},
      {"src/app.ts", "  return 2;", 21},
      {"lib/helpers.ts", "added();", 6},
  };
  for (int pass = 0; pass < 2; ++pass) {
    std::size_t n = 0;
    for (const auto &line : adapter::iterate_additions(res)) {
      if (n >= want_adds.size() || line.path != want_adds[n].path ||
          line.content != want_adds[n].content || line.line_number != want_adds[n].line) {
        std::cerr << "addition " << n << " wrong: " << line.path << " '" << line.content << "' "
                  << line.line_number << "\n";
        return 1;
      }
      ++n;
    }
    if (n != want_adds.size()) {
      std::cerr << "addition count " << n << "\n";
      return 1;
    }
  }

  std::vector<std::uint32_t> del_lines;
  for (const auto &line : adapter::iterate_deletions(res)) {
    del_lines.push_back(line.line_number);
  }
  if (del_lines != std::vector<std::uint32_t>{2, 20}) {
    std::cerr << "deletions should carry old line numbers\n";
    return 1;
  }

  // Per-path counts
  const auto stats = adapter::get_change_stats(res);
  if (stats.size() != 2 || stats.at("src/app.ts") != adapter::ChangeStats{.additions = 3, .deletions = 2} ||
      stats.at("lib/helpers.ts") != adapter::ChangeStats{.additions = 1, .deletions = 0}) {
    std::cerr << "change stats wrong\n";
    return 1;
  }

  // Idempotence: a second parse into a fresh arena gives the same output
  const auto again = parse_diff_string(kDiff, ParserOptions{.pool = &pool});
  if (adapter::to_file_diffs(again) != eager || adapter::get_change_stats(again) != stats ||
      again.stats.lines_found != res.stats.lines_found ||
      again.stats.anomalies != res.stats.anomalies) {
    std::cerr << "second parse differs\n";
    return 1;
  }

  if (to_string(LineType::Addition) != "add" || to_string(LineType::Deletion) != "del" ||
      to_string(LineType::Context) != "ctx" || to_string(FileStatus::Deleted) != "deleted") {
    std::cerr << "to_string labels wrong\n";
    return 1;
  }

  std::cout << "adapter views test OK\n";
  return 0;
}
