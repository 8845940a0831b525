#include "diffarena/scanner.hpp"

#include <iostream>
#include <string>
#include <vector>

using diffarena::DiffScanner;
using diffarena::SourceBuffer;
using diffarena::TokenKind;

static std::vector<TokenKind> kinds_of(std::string_view text) {
  DiffScanner sc{SourceBuffer::from_string(text)};
  std::vector<TokenKind> out;
  while (auto tok = sc.scan_line())
    out.push_back(tok->kind);
  return out;
}

int main() {
  const std::string diff = "diff --git a/src/x.ts b/src/x.ts\n"
                           "index 1111111..2222222 100644\n"
                           "--- a/src/x.ts\n"
                           "+++ b/src/x.ts\n"
                           "@@ -1,3 +1,4 @@ function f() {\n"
                           " ctx\n"
                           "+add\n"
                           "-del\n"
                           "\\ No newline at end of file\n"
                           "@@ -5 +6 @@\n"
                           "-only";

  // 1) Token kinds in order, final line without newline included
  {
    const std::vector<TokenKind> want = {
        TokenKind::DiffHeader, TokenKind::Metadata,   TokenKind::OldFilePath,
        TokenKind::NewFilePath, TokenKind::HunkHeader, TokenKind::Context,
        TokenKind::Addition,   TokenKind::Deletion,   TokenKind::Metadata,
        TokenKind::HunkHeader, TokenKind::Deletion};
    if (kinds_of(diff) != want) {
      std::cerr << "unexpected token sequence\n";
      return 1;
    }
  }

  DiffScanner sc{SourceBuffer::from_string(diff)};

  // 2) Diff header paths
  auto header = sc.scan_line();
  auto paths = sc.extract_diff_path(header->content);
  if (!paths || sc.view(paths->old_path) != "src/x.ts" || sc.view(paths->new_path) != "src/x.ts") {
    std::cerr << "diff header paths wrong\n";
    return 1;
  }

  sc.skip_line(); // index line
  auto old_tok = sc.scan_line();
  auto old_path = sc.extract_file_path(old_tok->content);
  if (!old_path || sc.view(*old_path) != "src/x.ts") {
    std::cerr << "--- path wrong\n";
    return 1;
  }
  sc.skip_line(); // +++

  // 3) Hunk header numbers
  auto hunk = sc.scan_line();
  if (hunk->kind != TokenKind::HunkHeader || !hunk->hunk.well_formed ||
      hunk->hunk.old_start != 1 || hunk->hunk.old_lines != 3 || hunk->hunk.new_start != 1 ||
      hunk->hunk.new_lines != 4) {
    std::cerr << "hunk header parse wrong\n";
    return 1;
  }
  if (sc.view(hunk->line) != "@@ -1,3 +1,4 @@ function f() {") {
    std::cerr << "hunk header range wrong\n";
    return 1;
  }

  // 4) Content ranges exclude the marker
  auto ctx = sc.scan_line();
  auto add = sc.scan_line();
  auto del = sc.scan_line();
  if (sc.view(ctx->content) != "ctx" || sc.view(add->content) != "add" ||
      sc.view(del->content) != "del" || sc.view(add->line) != "+add") {
    std::cerr << "content ranges wrong\n";
    return 1;
  }

  // 5) Omitted counts default to 1
  sc.skip_line();
  auto single = sc.scan_line();
  if (single->hunk.old_start != 5 || single->hunk.old_lines != 1 || single->hunk.new_start != 6 ||
      single->hunk.new_lines != 1 || !single->hunk.well_formed) {
    std::cerr << "single-count hunk header wrong\n";
    return 1;
  }
  auto last = sc.scan_line();
  if (!last || sc.view(last->content) != "only" || sc.has_more() || sc.scan_line()) {
    std::cerr << "unterminated last line not handled\n";
    return 1;
  }

  // 6) reset / position / scan_until
  sc.reset();
  if (sc.get_position() != 0 || !sc.has_more()) {
    std::cerr << "reset failed\n";
    return 1;
  }
  auto at = sc.scan_until("@@ -5");
  if (!at || diff.compare(*at, 5, "@@ -5") != 0) {
    std::cerr << "scan_until failed\n";
    return 1;
  }
  if (sc.scan_until("nope")) {
    std::cerr << "scan_until found missing pattern\n";
    return 1;
  }

  // 7) /dev/null, rename header, malformed hunk header
  {
    DiffScanner s2{SourceBuffer::from_string("--- /dev/null\n"
                                             "diff --git a/old name.txt b/docs/new.txt\n"
                                             "@@ -a,b +c,d @@\n"
                                             "--- a/file with space.txt\t\n")};
    auto t = s2.scan_line();
    auto p = s2.extract_file_path(t->content);
    if (!p || !s2.is_dev_null(*p)) {
      std::cerr << "/dev/null not detected\n";
      return 1;
    }
    t = s2.scan_line();
    auto rp = s2.extract_diff_path(t->content);
    if (!rp || s2.view(rp->old_path) != "old name.txt" || s2.view(rp->new_path) != "docs/new.txt") {
      std::cerr << "rename header split wrong\n";
      return 1;
    }
    t = s2.scan_line();
    if (t->kind != TokenKind::HunkHeader || t->hunk.well_formed) {
      std::cerr << "malformed hunk header not flagged\n";
      return 1;
    }
    t = s2.scan_line();
    p = s2.extract_file_path(t->content);
    if (!p || s2.view(*p) != "file with space.txt") {
      std::cerr << "trailing tab not stripped\n";
      return 1;
    }
  }

  // 8) Lookalikes: "----" is a deletion, "@@@" is metadata, empty line is context
  {
    const auto k = kinds_of("----\n@@@ x\n\n+++\n");
    const std::vector<TokenKind> want = {TokenKind::Deletion, TokenKind::Metadata,
                                         TokenKind::Context, TokenKind::NewFilePath};
    if (k != want) {
      std::cerr << "lookalike classification wrong\n";
      return 1;
    }
  }

  std::cout << "scanner test OK\n";
  return 0;
}
