#include "gitpane/textdiff.hpp"

#include "gitpane/consts.hpp"
#include "gitpane/log.hpp"

#include <algorithm>
#include <span>
#include <sstream>

namespace gitpane::diff {

namespace {

struct Line {
  std::string_view text;
  bool eol = true; // false only for a final line without '\n'

  bool operator==(const Line &) const = default;
};

std::vector<Line> to_lines(std::string_view text) {
  std::vector<Line> out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t nl = text.find(consts::kLF, pos);
    if (nl == std::string_view::npos) {
      out.push_back({text.substr(pos), false});
      break;
    }
    out.push_back({text.substr(pos, nl - pos), true});
    pos = nl + 1;
  }
  return out;
}

// Edit distances beyond this are reported as one replacement instead of being traced.
constexpr int kMaxEditDistance = 2000;

// Furthest x reached on diagonal k in a saved layer; layer d holds diagonals [-d, d].
int furthest(const std::vector<int> &layer, int d, int k) {
  if (k < -d || k > d)
    return 0;
  return layer[static_cast<std::size_t>(k + d)];
}

// Myers O(ND) diff of a against b appended to ops: '=' keep, '-' del, '+' add.
// Keeping only 2d+1 diagonals per layer bounds the trace to O(D^2). Returns false (ops
// untouched) when the edit distance exceeds kMaxEditDistance.
bool myers_diff(std::span<const Line> a, std::span<const Line> b, std::vector<char> &ops) {
  const int N = static_cast<int>(a.size());
  const int M = static_cast<int>(b.size());
  const int MAX = std::min(N + M, kMaxEditDistance);
  const int OFFSET = MAX + 1;
  std::vector<int> v(2 * static_cast<std::size_t>(MAX) + 3, 0);
  std::vector<std::vector<int>> trace;

  for (int d = 0; d <= MAX; ++d) {
    // snapshot of layer d - 1 before exploring layer d
    trace.emplace_back(v.begin() + (OFFSET - d), v.begin() + (OFFSET + d + 1));
    for (int k = -d; k <= d; k += 2) {
      int x;
      if (k == -d || (k != d && v[OFFSET + k - 1] < v[OFFSET + k + 1])) {
        x = v[OFFSET + k + 1]; // down (insertion)
      } else {
        x = v[OFFSET + k - 1] + 1; // right (deletion)
      }
      int y = x - k;
      while (x < N && y < M && a[x] == b[y]) {
        ++x;
        ++y;
      }
      v[OFFSET + k] = x;
      if (x >= N && y >= M) {
        std::vector<char> rev_ops;
        int cx = N;
        int cy = M;
        for (int dd = d; dd >= 0; --dd) {
          const auto &vv = trace[static_cast<std::size_t>(dd)];
          const int kk = cx - cy;
          int prev_k;
          bool down;
          if (kk == -dd || (kk != dd && furthest(vv, dd, kk - 1) < furthest(vv, dd, kk + 1))) {
            prev_k = kk + 1;
            down = true;
          } else {
            prev_k = kk - 1;
            down = false;
          }
          int px = furthest(vv, dd, prev_k);
          int py = px - prev_k;
          if (!down)
            ++px;
          while (cx > px && cy > py) {
            rev_ops.push_back('=');
            --cx;
            --cy;
          }
          if (dd > 0)
            rev_ops.push_back(down ? '+' : '-');
          cx = px;
          cy = py;
        }
        ops.insert(ops.end(), rev_ops.rbegin(), rev_ops.rend());
        return true;
      }
    }
  }
  return false;
}

// Line ops for a -> b. The common head and tail are matched directly; an oversized middle
// becomes all deletions followed by all additions.
std::vector<char> line_ops(const std::vector<Line> &a, const std::vector<Line> &b) {
  std::size_t head = 0;
  while (head < a.size() && head < b.size() && a[head] == b[head])
    ++head;
  std::size_t tail = 0;
  while (tail < a.size() - head && tail < b.size() - head &&
         a[a.size() - 1 - tail] == b[b.size() - 1 - tail])
    ++tail;

  std::vector<char> ops(head, '=');
  const std::span<const Line> mid_a(a.data() + head, a.size() - head - tail);
  const std::span<const Line> mid_b(b.data() + head, b.size() - head - tail);
  if (!myers_diff(mid_a, mid_b, ops)) {
    log::debug("textdiff: edit distance over " + std::to_string(kMaxEditDistance) +
               " lines; showing a full replacement");
    ops.insert(ops.end(), mid_a.size(), '-');
    ops.insert(ops.end(), mid_b.size(), '+');
  }
  ops.insert(ops.end(), tail, '=');
  return ops;
}

// "start,count" the way git prints it: ",1" is omitted
void write_range(std::ostream &out, std::size_t start, std::size_t count) {
  out << start;
  if (count != 1)
    out << ',' << count;
}

} // namespace

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  for (const auto &l : to_lines(text))
    out.emplace_back(l.text);
  return out;
}

std::string unified_diff(std::string_view old_text, std::string_view new_text,
                         const Labels &labels, int context) {
  if (old_text == new_text)
    return {};
  const auto a = to_lines(old_text);
  const auto b = to_lines(new_text);
  const std::vector<char> ops = line_ops(a, b);

  // a/b positions consumed before each op
  std::vector<std::size_t> pa(ops.size() + 1, 0);
  std::vector<std::size_t> pb(ops.size() + 1, 0);
  for (std::size_t k = 0; k < ops.size(); ++k) {
    pa[k + 1] = pa[k] + (ops[k] != '+' ? 1 : 0);
    pb[k + 1] = pb[k] + (ops[k] != '-' ? 1 : 0);
  }

  const auto ctx = static_cast<std::size_t>(std::max(context, 0));
  std::ostringstream out;
  out << consts::kOldFilePrefix << ' ' << labels.old_label << '\n';
  out << consts::kNewFilePrefix << ' ' << labels.new_label << '\n';

  auto no_newline = [&](const std::vector<Line> &side, std::size_t idx) {
    if (idx + 1 == side.size() && !side[idx].eol)
      out << consts::kNoNewlineMarker << " No newline at end of file\n";
  };

  std::size_t i = 0;
  while (i < ops.size()) {
    std::size_t first = i;
    while (first < ops.size() && ops[first] == '=')
      ++first;
    if (first == ops.size())
      break;

    // extend while the gap between changes stays within 2 * context
    std::size_t last = first;
    for (std::size_t j = first + 1; j < ops.size(); ++j) {
      if (ops[j] != '=')
        last = j;
      else if (j - last > 2 * ctx)
        break;
    }
    const std::size_t begin = first - std::min(first - i, ctx);
    const std::size_t end = std::min(ops.size(), last + ctx + 1);

    const std::size_t old_count = pa[end] - pa[begin];
    const std::size_t new_count = pb[end] - pb[begin];
    out << consts::kHunkPrefix << " -";
    write_range(out, pa[begin] + (old_count ? 1 : 0), old_count);
    out << " +";
    write_range(out, pb[begin] + (new_count ? 1 : 0), new_count);
    out << ' ' << consts::kHunkPrefix << '\n';

    for (std::size_t k = begin; k < end; ++k) {
      if (ops[k] == '=') {
        out << consts::kContextMarker << a[pa[k]].text << '\n';
        no_newline(a, pa[k]);
      } else if (ops[k] == '-') {
        out << consts::kRemoveMarker << a[pa[k]].text << '\n';
        no_newline(a, pa[k]);
      } else {
        out << consts::kAddMarker << b[pb[k]].text << '\n';
        no_newline(b, pb[k]);
      }
    }
    i = end;
  }
  return out.str();
}

} // namespace gitpane::diff
