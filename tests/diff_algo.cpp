#include "redline/diff.hpp"

#include <iostream>
#include <string>
#include <vector>

using redline::diff::DiffSegment;
using redline::diff::Granularity;
using redline::diff::SegmentKind;

static int failures = 0;

static void check(bool ok, const std::string &what) {
  if (!ok) {
    std::cerr << "FAIL: " << what << "\n";
    ++failures;
  }
}

static std::string join_original(const std::vector<DiffSegment> &segs) {
  std::string out;
  for (const auto &s : segs)
    out += s.original;
  return out;
}

static std::string join_modified(const std::vector<DiffSegment> &segs) {
  std::string out;
  for (const auto &s : segs)
    out += s.modified;
  return out;
}

static void check_reconstructs(const std::string &a, const std::string &b, Granularity g) {
  const auto segs = redline::diff::compare(a, b, g);
  const std::string tag = "[" + a + "] vs [" + b + "]";
  check(join_original(segs) == a, "original reconstructs " + tag);
  check(join_modified(segs) == b, "modified reconstructs " + tag);
  // contiguous over A
  std::size_t pos = 0;
  for (const auto &s : segs) {
    check(s.start_pos == pos, "segments contiguous over A " + tag);
    pos = s.end_pos;
  }
}

int main() {
  // kitten -> sitting: replace k/s, equal itt, replace e/i, equal n, insert g
  {
    const auto segs = redline::diff::compare("kitten", "sitting");
    const std::vector<DiffSegment> want = {
        {SegmentKind::Replace, "k", "s", 0, 1},   {SegmentKind::Equal, "itt", "itt", 1, 4},
        {SegmentKind::Replace, "e", "i", 4, 5},   {SegmentKind::Equal, "n", "n", 5, 6},
        {SegmentKind::Insert, "", "g", 6, 6},
    };
    check(segs == want, "kitten/sitting segments");
  }

  // Earliest match in B wins the tie.
  {
    const auto segs = redline::diff::compare("ab", "abab");
    check(segs.size() == 2, "ab/abab has two segments");
    if (segs.size() == 2) {
      check(segs[0].kind == SegmentKind::Equal && segs[0].original == "ab", "ab/abab equal first");
      check(segs[1].kind == SegmentKind::Insert && segs[1].modified == "ab" &&
                segs[1].start_pos == 2 && segs[1].end_pos == 2,
            "ab/abab trailing insert at 2");
    }
  }

  // Delete, replace and insert in one alignment.
  {
    const auto segs = redline::diff::compare("qabxcd", "abycdf");
    std::vector<SegmentKind> kinds;
    for (const auto &s : segs)
      kinds.push_back(s.kind);
    const std::vector<SegmentKind> want = {SegmentKind::Delete, SegmentKind::Equal,
                                           SegmentKind::Replace, SegmentKind::Equal,
                                           SegmentKind::Insert};
    check(kinds == want, "qabxcd/abycdf opcode kinds");
    if (segs.size() == 5) {
      check(segs[0].modified.empty() && segs[0].original == "q", "delete carries no modified text");
      check(segs[4].original.empty() && segs[4].start_pos == 6, "insert is zero width at end");
    }
  }

  // Identical and empty inputs.
  {
    const auto same = redline::diff::compare("same text\n", "same text\n");
    check(same.size() == 1 && same[0].kind == SegmentKind::Equal && same[0].start_pos == 0 &&
              same[0].end_pos == 10,
          "identical inputs give one equal segment");

    check(redline::diff::compare("", "").empty(), "both empty gives no segments");

    const auto ins = redline::diff::compare("", "new");
    check(ins.size() == 1 && ins[0].kind == SegmentKind::Insert && ins[0].modified == "new",
          "empty A gives one insert");

    const auto del = redline::diff::compare("old", "");
    check(del.size() == 1 && del[0].kind == SegmentKind::Delete && del[0].end_pos == 3,
          "empty B gives one delete");
  }

  // Positions count characters, not bytes.
  {
    const auto segs = redline::diff::compare("caf\xC3\xA9 noir", "cafe noir");
    check(segs.size() == 3, "cafe has three segments");
    if (segs.size() == 3) {
      check(segs[1].kind == SegmentKind::Replace && segs[1].original == "\xC3\xA9" &&
                segs[1].modified == "e",
            "accented char replaced whole");
      check(segs[1].start_pos == 3 && segs[1].end_pos == 4, "replace spans one character");
      check(segs[2].end_pos == 9, "end offset counts characters");
    }
  }

  // Line granularity keeps terminators and reports character offsets.
  {
    const std::string a = "line1\nline2\nline3\n";
    const std::string b = "line1\nlineZ\nline3\nline4\n";
    const auto segs = redline::diff::compare(a, b, Granularity::Line);
    check(segs.size() == 4, "line diff has four segments");
    if (segs.size() == 4) {
      check(segs[0].kind == SegmentKind::Equal && segs[0].original == "line1\n", "line1 equal");
      check(segs[1].kind == SegmentKind::Replace && segs[1].original == "line2\n" &&
                segs[1].modified == "lineZ\n",
            "line2 replaced");
      check(segs[1].start_pos == 6 && segs[1].end_pos == 12, "line2 offsets");
      check(segs[3].kind == SegmentKind::Insert && segs[3].modified == "line4\n" &&
                segs[3].start_pos == 18 && segs[3].end_pos == 18,
            "line4 inserted at end");
    }
  }

  // Mixed terminators and a missing final newline still reconstruct exactly.
  {
    const std::string a = "alpha\r\nbeta\rgamma\ndelta";
    const std::string b = "alpha\r\nBETA\rgamma\ndelta\n";
    const auto segs = redline::diff::compare(a, b, Granularity::Line);
    check(!segs.empty() && segs.front().original == "alpha\r\n", "CRLF stays with its line");
    check_reconstructs(a, b, Granularity::Line);
  }

  const std::vector<std::pair<std::string, std::string>> pairs = {
      {"kitten", "sitting"},
      {"", "abc"},
      {"abc", ""},
      {"The quick brown fox", "The quick red fox jumped"},
      {"aaaaabbbbb", "bbbbbaaaaa"},
      {"x\ny\nz\n", "x\nz\ny\n"},
      {"\xE4\xBD\xA0\xE5\xA5\xBD\xE4\xB8\x96\xE7\x95\x8C", "\xE4\xBD\xA0\xE5\xA5\xBD"},
      {"bad \xFF byte", "bad byte \xC3"},
  };
  for (const auto &[a, b] : pairs) {
    check_reconstructs(a, b, Granularity::Char);
    check_reconstructs(a, b, Granularity::Line);
  }

  if (failures) {
    std::cerr << failures << " diff check(s) failed\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
