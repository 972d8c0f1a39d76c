#include "gitpane/highlight.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace gitpane {

std::vector<Token> PlainHighlighter::highlight(std::string_view code, std::string_view) {
  return {Token{.text = std::string(code), .color = std::string(kPlainTokenColor)}};
}

std::string_view language_from_path(std::string_view path) {
  static constexpr std::pair<std::string_view, std::string_view> kMap[] = {
      {"js", "javascript"}, {"jsx", "jsx"},  {"ts", "typescript"}, {"tsx", "tsx"},
      {"py", "python"},     {"go", "go"},    {"rs", "rust"},       {"c", "c"},
      {"cpp", "cpp"},       {"cc", "cpp"},   {"cxx", "cpp"},       {"h", "c"},
      {"hpp", "cpp"},
  };
  const std::size_t slash = path.find_last_of('/');
  const std::string_view base = slash == std::string_view::npos ? path : path.substr(slash + 1);
  const std::size_t dot = base.find_last_of('.');
  if (dot == std::string_view::npos)
    return "javascript";

  std::string ext;
  for (const char c : base.substr(dot + 1))
    ext.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  for (const auto &[e, lang] : kMap)
    if (e == ext)
      return lang;
  return "javascript";
}

TokenCache::TokenCache(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0)
    throw std::invalid_argument("token cache: capacity must be positive");
}

std::string TokenCache::make_key(std::string_view code, std::string_view language) {
  std::string key;
  key.reserve(language.size() + 1 + code.size());
  key.append(language);
  key.push_back(':');
  key.append(code);
  return key;
}

bool TokenCache::contains(std::string_view code, std::string_view language) const {
  return entries_.contains(make_key(code, language));
}

std::vector<Token> TokenCache::tokens(Highlighter &hl, std::string_view code,
                                      std::string_view language) {
  if (code.empty())
    return {Token{.text = {}, .color = std::string(kPlainTokenColor)}};

  std::string key = make_key(code, language);
  if (auto it = entries_.find(key); it != entries_.end())
    return it->second;

  auto toks = hl.highlight(code, language);
  if (entries_.size() >= capacity_)
    evict_older_half();
  entries_.emplace(key, toks);
  order_.push_back(std::move(key));
  return toks;
}

void TokenCache::evict_older_half() {
  const std::size_t drop = std::max<std::size_t>(1, order_.size() / 2);
  for (std::size_t i = 0; i < drop && !order_.empty(); ++i) {
    entries_.erase(order_.front());
    order_.pop_front();
  }
}

void TokenCache::clear() {
  entries_.clear();
  order_.clear();
}

} // namespace gitpane
