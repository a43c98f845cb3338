#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace redline::diff {

// a[a .. a+size) == b[b .. b+size)
struct Match {
  std::size_t a;
  std::size_t b;
  std::size_t size;
};

enum class OpTag : std::uint8_t { Equal, Replace, Delete, Insert };

// One opcode over the index space: a[a1..a2) relates to b[b1..b2)
struct Opcode {
  OpTag tag;
  std::size_t a1, a2;
  std::size_t b1, b2;
};

/**
 * Ratcliff/Obershelp matcher over two unit sequences.
 *
 * Finds the longest contiguous matching block, then recurses on the
 * unmatched pieces to its left and right. Among equally long blocks the one
 * starting earliest in `a` wins, then earliest in `b`.
 *
 * With `autojunk`, a unit that occurs more than len(b)/100 + 1 times in a
 * `b` of at least 200 units is "popular": it never seeds a match, though a
 * match may grow across it.
 *
 * The matcher views `a` and `b`; both must outlive it.
 */
class SequenceMatcher {
public:
  SequenceMatcher(std::span<const std::uint32_t> a, std::span<const std::uint32_t> b,
                  bool autojunk = true);

  // Longest matching block inside a[alo..ahi) x b[blo..bhi); size 0 if none.
  [[nodiscard]] Match find_longest_match(std::size_t alo, std::size_t ahi, std::size_t blo,
                                         std::size_t bhi) const;

  // Non-adjacent matching blocks in increasing order, closed by {len(a), len(b), 0}.
  [[nodiscard]] const std::vector<Match> &matching_blocks() const { return blocks_; }

  [[nodiscard]] std::vector<Opcode> opcodes() const;

  // Total size of all matching blocks.
  [[nodiscard]] std::size_t matched_units() const;

  // 2*M / (len(a)+len(b)); 1.0 when both are empty. Not rounded.
  [[nodiscard]] double ratio() const;

private:
  void index_b(bool autojunk);
  void compute_blocks();

  std::span<const std::uint32_t> a_;
  std::span<const std::uint32_t> b_;
  std::unordered_map<std::uint32_t, std::vector<std::size_t>> b2j_;
  std::vector<Match> blocks_;
};

} // namespace redline::diff
