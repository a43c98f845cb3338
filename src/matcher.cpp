#include "redline/matcher.hpp"

#include "redline/consts.hpp"

#include <algorithm>
#include <tuple>

namespace redline::diff {

SequenceMatcher::SequenceMatcher(std::span<const std::uint32_t> a,
                                 std::span<const std::uint32_t> b, bool autojunk)
    : a_(a), b_(b) {
  index_b(autojunk);
  compute_blocks();
}

void SequenceMatcher::index_b(bool autojunk) {
  for (std::size_t j = 0; j < b_.size(); ++j) {
    b2j_[b_[j]].push_back(j);
  }
  const std::size_t n = b_.size();
  if (!autojunk || n < consts::kAutojunkMinLen)
    return;
  const std::size_t ntest = n / 100 + 1;
  std::erase_if(b2j_, [ntest](const auto &kv) { return kv.second.size() > ntest; });
}

Match SequenceMatcher::find_longest_match(std::size_t alo, std::size_t ahi, std::size_t blo,
                                          std::size_t bhi) const {
  std::size_t besti = alo;
  std::size_t bestj = blo;
  std::size_t bestsize = 0;

  // j2len[j] = length of the longest match ending with a[i-1] and b[j]
  std::unordered_map<std::size_t, std::size_t> j2len;
  std::unordered_map<std::size_t, std::size_t> newj2len;
  for (std::size_t i = alo; i < ahi; ++i) {
    newj2len.clear();
    const auto it = b2j_.find(a_[i]);
    if (it != b2j_.end()) {
      for (const std::size_t j : it->second) {
        if (j < blo)
          continue;
        if (j >= bhi)
          break;
        std::size_t k = 1;
        if (j > 0) {
          if (const auto prev = j2len.find(j - 1); prev != j2len.end())
            k = prev->second + 1;
        }
        newj2len[j] = k;
        if (k > bestsize) {
          besti = i + 1 - k;
          bestj = j + 1 - k;
          bestsize = k;
        }
      }
    }
    std::swap(j2len, newj2len);
  }

  // Popular units never seed a match, but a match may still run across them.
  while (besti > alo && bestj > blo && a_[besti - 1] == b_[bestj - 1]) {
    --besti;
    --bestj;
    ++bestsize;
  }
  while (besti + bestsize < ahi && bestj + bestsize < bhi &&
         a_[besti + bestsize] == b_[bestj + bestsize]) {
    ++bestsize;
  }
  return Match{.a = besti, .b = bestj, .size = bestsize};
}

void SequenceMatcher::compute_blocks() {
  const std::size_t la = a_.size();
  const std::size_t lb = b_.size();

  std::vector<std::tuple<std::size_t, std::size_t, std::size_t, std::size_t>> queue;
  queue.emplace_back(0, la, 0, lb);
  std::vector<Match> found;
  while (!queue.empty()) {
    const auto [alo, ahi, blo, bhi] = queue.back();
    queue.pop_back();
    const Match m = find_longest_match(alo, ahi, blo, bhi);
    if (m.size == 0)
      continue;
    found.push_back(m);
    if (alo < m.a && blo < m.b)
      queue.emplace_back(alo, m.a, blo, m.b);
    if (m.a + m.size < ahi && m.b + m.size < bhi)
      queue.emplace_back(m.a + m.size, ahi, m.b + m.size, bhi);
  }
  std::ranges::sort(found, [](const Match &x, const Match &y) {
    return std::tie(x.a, x.b, x.size) < std::tie(y.a, y.b, y.size);
  });

  // Collapse blocks that touch in both sequences.
  Match cur{0, 0, 0};
  for (const Match &m : found) {
    if (cur.a + cur.size == m.a && cur.b + cur.size == m.b) {
      cur.size += m.size;
    } else {
      if (cur.size)
        blocks_.push_back(cur);
      cur = m;
    }
  }
  if (cur.size)
    blocks_.push_back(cur);
  blocks_.push_back(Match{.a = la, .b = lb, .size = 0});
}

std::vector<Opcode> SequenceMatcher::opcodes() const {
  std::vector<Opcode> out;
  out.reserve(blocks_.size() * 2);
  std::size_t i = 0;
  std::size_t j = 0;
  for (const Match &m : blocks_) {
    if (i < m.a && j < m.b) {
      out.push_back(Opcode{OpTag::Replace, i, m.a, j, m.b});
    } else if (i < m.a) {
      out.push_back(Opcode{OpTag::Delete, i, m.a, j, m.b});
    } else if (j < m.b) {
      out.push_back(Opcode{OpTag::Insert, i, m.a, j, m.b});
    }
    i = m.a + m.size;
    j = m.b + m.size;
    if (m.size)
      out.push_back(Opcode{OpTag::Equal, m.a, i, m.b, j});
  }
  return out;
}

std::size_t SequenceMatcher::matched_units() const {
  std::size_t total = 0;
  for (const Match &m : blocks_)
    total += m.size;
  return total;
}

double SequenceMatcher::ratio() const {
  const std::size_t total = a_.size() + b_.size();
  if (total == 0)
    return 1.0;
  return 2.0 * static_cast<double>(matched_units()) / static_cast<double>(total);
}

} // namespace redline::diff
