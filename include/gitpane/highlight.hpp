#pragma once
#include <cstddef>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gitpane {

struct Token {
  std::string text;
  std::string color; // "#RRGGBB"

  bool operator==(const Token &) const = default;
};

inline constexpr std::string_view kPlainTokenColor = "#CCCCCC";

// Turns one line of code into colored tokens. Implementations live outside the engine.
class Highlighter {
public:
  virtual ~Highlighter() = default;
  virtual std::vector<Token> highlight(std::string_view code, std::string_view language) = 0;
};

// Fallback: the whole line as a single plain token.
class PlainHighlighter final : public Highlighter {
public:
  std::vector<Token> highlight(std::string_view code, std::string_view language) override;
};

// Language id for a file path, by extension ("javascript" when unknown).
auto language_from_path(std::string_view path) -> std::string_view;

// Bounded memo of highlighter output keyed by "<language>:<code>". When full, the older
// half of the entries (by insertion order) is evicted before inserting.
class TokenCache {
public:
  explicit TokenCache(std::size_t capacity);

  std::vector<Token> tokens(Highlighter &hl, std::string_view code, std::string_view language);

  void clear();
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] bool contains(std::string_view code, std::string_view language) const;

private:
  static std::string make_key(std::string_view code, std::string_view language);
  void evict_older_half();

  std::size_t capacity_;
  std::unordered_map<std::string, std::vector<Token>> entries_;
  std::deque<std::string> order_; // insertion order, oldest first
};

} // namespace gitpane
