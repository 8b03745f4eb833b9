#include "tabjson/chunk_reader.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static int failures = 0;
static void check(bool cond, const std::string& what) {
  if (cond) std::cout << "[PASS] " << what << "\n";
  else { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

struct Seen {
  std::string text;
  std::uint64_t number;
  std::uint64_t offset;
  bool oversize;
};

static std::vector<Seen> collect(const std::string& data, tj::ChunkReader::Config cfg,
                                 std::uint64_t* bytes = nullptr) {
  tj::ChunkReader r(std::make_unique<tj::MemorySource>(data), cfg);
  std::vector<Seen> out;
  r.for_each_line([&](const tj::ChunkReader::Line& l) {
    out.push_back(Seen{std::string(l.text), l.number, l.offset, l.oversize});
    return true;
  });
  if (bytes) *bytes = r.bytes_read();
  return out;
}

int main() {
  // tiny chunks force lines across chunk boundaries
  tj::ChunkReader::Config small;
  small.chunk_bytes = 2;

  std::uint64_t bytes = 0;
  auto lines = collect("a\nbb\r\n\nccc", small, &bytes);
  check(lines.size() == 4, "four lines incl. blank and unterminated last");
  if (lines.size() == 4) {
    check(lines[0].text == "a" && lines[0].number == 1 && lines[0].offset == 0, "line 1");
    check(lines[1].text == "bb" && lines[1].number == 2 && lines[1].offset == 2, "line 2 CR stripped");
    check(lines[2].text.empty() && lines[2].offset == 6, "blank line 3");
    check(lines[3].text == "ccc" && lines[3].number == 4 && lines[3].offset == 7, "last line without newline");
  }
  check(bytes == 10, "bytes_read counts every byte");

  tj::ChunkReader::Config keep_cr = small;
  keep_cr.strip_cr = false;
  auto raw = collect("x\r\n", keep_cr);
  check(raw.size() == 1 && raw[0].text == "x\r", "strip_cr=false keeps CR");

  // oversize guard: the long line is reported, its neighbours survive
  tj::ChunkReader::Config guard;
  guard.chunk_bytes = 3;
  guard.max_record_bytes = 4;
  auto g = collect("ab\nxxxxxxxxxx\ncd\n", guard);
  check(g.size() == 3, "oversize line counted once");
  if (g.size() == 3) {
    check(g[0].text == "ab" && !g[0].oversize, "line before oversize");
    check(g[1].oversize && g[1].number == 2 && g[1].offset == 3 && g[1].text.empty(), "oversize line position");
    check(g[2].text == "cd" && g[2].number == 3 && g[2].offset == 14, "line after oversize");
  }

  // early stop
  tj::ChunkReader r(std::make_unique<tj::MemorySource>(std::string("1\n2\n3\n")));
  int n = 0;
  bool ok = r.for_each_line([&](const tj::ChunkReader::Line&) { return ++n < 2; });
  check(ok && n == 2, "callback can stop early");

  // missing source is an I/O failure
  tj::ChunkReader none(nullptr);
  tj::ChunkReader::Line l;
  check(!none.next_line(l) && none.failed() && none.error().kind == tj::ErrorKind::IOFailure,
        "null source fails with IOFailure");

  if (failures) { std::cerr << failures << " failure(s)\n"; return 1; }
  return 0;
}
