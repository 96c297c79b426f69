#pragma once

// chsexpr: a small, header-only C++17 s-expression codec.
// Goals: lossless enough for EDA file formats (KiCad and friends), readable output,
// high-quality errors.

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace chsexpr {

// Config: floating-point parsing backend.
// Override by defining CHSEXPR_USE_FROM_CHARS_DOUBLE to 0/1 before including this header.
#ifndef CHSEXPR_USE_FROM_CHARS_DOUBLE
  #define CHSEXPR_USE_FROM_CHARS_DOUBLE 0
#endif

enum class error_code {
  ok = 0,
  not_a_node,
  expected_name,
  expected_close_paren,
  unexpected_token,
  nesting_too_deep,
  trailing_tokens
};

struct error {
  error_code code{error_code::ok};
  std::size_t offset{0};
  std::size_t line{1};
  std::size_t column{1};
  // Kind of the offending token ("symbol", "')'", "end of input", ...).
  const char* found{""};

  constexpr explicit operator bool() const noexcept { return code != error_code::ok; }
};

namespace detail {

inline void update_line_col(std::string_view s, std::size_t pos, std::size_t& line, std::size_t& col) {
  line = 1;
  col = 1;
  for (std::size_t i = 0; i < pos && i < s.size(); ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
}

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

// Wider than is_ws: anything a reader could mistake for a separator gets quoted.
inline bool is_space(char c) noexcept {
  return is_ws(c) || c == '\f' || c == '\v';
}

inline bool is_delimiter(char c) noexcept {
  return is_ws(c) || c == '(' || c == ')';
}

inline void skip_ws(std::string_view s, std::size_t& i) noexcept {
  while (i < s.size() && is_ws(s[i])) ++i;
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

// Arithmetic types stored as numbers. Character types are excluded so 'x' never becomes 120.
template <class T>
struct is_number_type
    : std::integral_constant<bool, std::is_arithmetic<T>::value && !std::is_same<T, bool>::value &&
                                       !std::is_same<T, char>::value && !std::is_same<T, signed char>::value &&
                                       !std::is_same<T, unsigned char>::value && !std::is_same<T, wchar_t>::value &&
                                       !std::is_same<T, char16_t>::value && !std::is_same<T, char32_t>::value> {};

// -?[0-9]+(\.[0-9]+)?
inline bool looks_like_number(std::string_view s) noexcept {
  std::size_t i = 0;
  const std::size_t n = s.size();
  if (i < n && s[i] == '-') ++i;

  const std::size_t int_begin = i;
  while (i < n && is_digit(s[i])) ++i;
  if (i == int_begin) return false;
  if (i == n) return true;

  if (s[i] != '.') return false;
  ++i;
  const std::size_t frac_begin = i;
  while (i < n && is_digit(s[i])) ++i;
  return i != frac_begin && i == n;
}

inline double parse_double(std::string_view token) {
  // Backend choice:
  // - strtod: robust everywhere, but honours the C locale's decimal point.
  // - from_chars: locale-free and allocation-free, but performance varies by STL.
#if defined(CHSEXPR_USE_FROM_CHARS_DOUBLE) && CHSEXPR_USE_FROM_CHARS_DOUBLE
#if defined(__cpp_lib_to_chars)
  {
    double v = 0.0;
    const char* first = token.data();
    const char* last = token.data() + token.size();
    auto r = std::from_chars(first, last, v, std::chars_format::fixed);
    if (r.ec == std::errc{} && r.ptr == last) return v;
  }
#endif
#endif

  // Fallback: token is not NUL-terminated; avoid heap alloc for typical short numbers.
  constexpr std::size_t kStackCap = 128;
  if (token.size() < kStackCap) {
    char buf[kStackCap];
    if (!token.empty()) std::memcpy(buf, token.data(), token.size());
    buf[token.size()] = '\0';
    return std::strtod(buf, nullptr);
  }
  return std::strtod(std::string(token).c_str(), nullptr);
}

} // namespace detail

// -----------------------------
// Value model
// -----------------------------

class value;
class node;
struct serialize_options;

// Bare symbolic text; quoted on output only when the text requires it.
class atom {
public:
  explicit atom(std::string text) : text_(std::move(text)) {}

  const std::string& text() const noexcept { return text_; }

private:
  std::string text_;
};

// Text that is always written with surrounding quotes.
class quoted_string {
public:
  explicit quoted_string(std::string text) : text_(std::move(text)) {}

  const std::string& text() const noexcept { return text_; }

private:
  std::string text_;
};

inline bool operator==(const atom& a, const atom& b) noexcept { return a.text() == b.text(); }
inline bool operator!=(const atom& a, const atom& b) noexcept { return !(a == b); }
inline bool operator==(const quoted_string& a, const quoted_string& b) noexcept { return a.text() == b.text(); }
inline bool operator!=(const quoted_string& a, const quoted_string& b) noexcept { return !(a == b); }

struct serialize_options {
  bool pretty{true};
  std::string indent{"  "};
  // Preferred line width; a node wider than this is broken over several lines.
  std::size_t max_width{80};
  // Quote atoms and legacy strings even when the text does not need it.
  // The eeschema preview only forced quotes on legacy strings; here atoms are quoted too.
  bool quote_all{false};
  // Keep any node that fits in max_width on one line, not only the trivial ones.
  bool compact{true};
};

// `(name value...)`. Owns its children; a node is never shared between parents.
//
// Members that touch the children are defined after `value` is complete.
class node {
public:
  using values_type = std::vector<value>;

  // Unnamed node; only used as the placeholder result of a failed parse.
  node() = default;

  template <class... Ts>
  explicit node(std::string name, Ts&&... vals);

  const std::string& name() const noexcept { return name_; }

  // Live view of the children.
  const values_type& values() const noexcept { return values_; }
  values_type& values() noexcept { return values_; }

  std::size_t size() const noexcept;
  bool empty() const noexcept;

  // Text of a raw string, atom or quoted string child; nullptr otherwise.
  const std::string* get_string(std::size_t index) const noexcept;

  template <class... Ts>
  node& add(Ts&&... vals);

  // Drops every child for which pred(value, index) holds. Survivors keep their order.
  template <class Pred>
  node& remove_if(Pred pred);

  // Appends a new child node and returns it, not `*this`.
  // The reference is invalidated by the next insertion into this node.
  template <class... Ts>
  node& child(std::string name, Ts&&... vals);

  // Direct children only; grandchildren are never searched.
  const node* find_child(std::string_view name) const noexcept;
  node* find_child(std::string_view name) noexcept;
  std::vector<const node*> find_children(std::string_view name) const;
  std::vector<node*> find_children(std::string_view name);

  std::string to_string(const serialize_options& opt = {}) const;

  // Throws parse_error.
  static node parse(std::string_view text);

private:
  std::string name_;
  values_type values_;
};

inline bool operator==(const node& a, const node& b);
inline bool operator!=(const node& a, const node& b);

class value {
public:
  // Inline run of values: written space separated, without parentheses or a name.
  using sequence = std::vector<value>;

  enum class kind { nil, number, atom, quoted, node, raw_string, sequence };

  value() noexcept : data_(std::monostate{}) {}
  value(std::nullptr_t) noexcept : data_(std::monostate{}) {}

  template <class T, std::enable_if_t<detail::is_number_type<T>::value, int> = 0>
  value(T n) : data_(static_cast<double>(n)) {}

  value(atom a) : data_(std::move(a)) {}
  value(quoted_string q) : data_(std::move(q)) {}
  value(node n) : data_(std::move(n)) {}
  // Legacy call sites pass bare strings; they behave like atoms.
  value(std::string s) : data_(std::move(s)) {}
  value(const char* s) : data_(std::string(s)) {}
  value(sequence s) : data_(std::move(s)) {}

  kind type() const noexcept {
    switch (data_.index()) {
      case 0: return kind::nil;
      case 1: return kind::number;
      case 2: return kind::atom;
      case 3: return kind::quoted;
      case 4: return kind::node;
      case 5: return kind::raw_string;
      case 6: return kind::sequence;
      default: return kind::nil;
    }
  }

  bool is_nil() const noexcept { return std::holds_alternative<std::monostate>(data_); }
  bool is_number() const noexcept { return std::holds_alternative<double>(data_); }
  bool is_atom() const noexcept { return std::holds_alternative<atom>(data_); }
  bool is_quoted() const noexcept { return std::holds_alternative<quoted_string>(data_); }
  bool is_node() const noexcept { return std::holds_alternative<node>(data_); }
  bool is_raw_string() const noexcept { return std::holds_alternative<std::string>(data_); }
  bool is_sequence() const noexcept { return std::holds_alternative<sequence>(data_); }

  double as_number() const { return std::get<double>(data_); }
  const atom& as_atom() const { return std::get<atom>(data_); }
  const quoted_string& as_quoted() const { return std::get<quoted_string>(data_); }
  const node& as_node() const { return std::get<node>(data_); }
  const std::string& as_raw_string() const { return std::get<std::string>(data_); }
  const sequence& as_sequence() const { return std::get<sequence>(data_); }

  node& as_node() { return std::get<node>(data_); }
  sequence& as_sequence() { return std::get<sequence>(data_); }

  // Text of a raw string, atom or quoted string; nullptr for every other kind.
  const std::string* text() const noexcept {
    if (const auto* s = std::get_if<std::string>(&data_)) return s;
    if (const auto* a = std::get_if<atom>(&data_)) return &a->text();
    if (const auto* q = std::get_if<quoted_string>(&data_)) return &q->text();
    return nullptr;
  }

  friend bool operator==(const value& a, const value& b) { return a.data_ == b.data_; }
  friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
  // index: 0 nil, 1 number, 2 atom, 3 quoted, 4 node, 5 raw string, 6 sequence
  std::variant<std::monostate, double, atom, quoted_string, node, std::string, sequence> data_;
};

template <class... Ts>
node::node(std::string name, Ts&&... vals) : name_(std::move(name)) {
  values_.reserve(sizeof...(Ts));
  (values_.emplace_back(std::forward<Ts>(vals)), ...);
}

inline std::size_t node::size() const noexcept { return values_.size(); }
inline bool node::empty() const noexcept { return values_.empty(); }

inline const std::string* node::get_string(std::size_t index) const noexcept {
  if (index >= values_.size()) return nullptr;
  return values_[index].text();
}

template <class... Ts>
node& node::add(Ts&&... vals) {
  values_.reserve(values_.size() + sizeof...(Ts));
  (values_.emplace_back(std::forward<Ts>(vals)), ...);
  return *this;
}

template <class Pred>
node& node::remove_if(Pred pred) {
  // Every predicate call sees the untouched children; a throwing predicate leaves the node as it was.
  std::vector<char> keep(values_.size(), 0);
  for (std::size_t i = 0; i < values_.size(); ++i) keep[i] = pred(static_cast<const value&>(values_[i]), i) ? 0 : 1;

  std::size_t out = 0;
  for (std::size_t i = 0; i < values_.size(); ++i) {
    if (!keep[i]) continue;
    if (out != i) values_[out] = std::move(values_[i]);
    ++out;
  }
  values_.erase(values_.begin() + static_cast<std::ptrdiff_t>(out), values_.end());
  return *this;
}

template <class... Ts>
node& node::child(std::string name, Ts&&... vals) {
  values_.emplace_back(node(std::move(name), std::forward<Ts>(vals)...));
  return values_.back().as_node();
}

inline const node* node::find_child(std::string_view name) const noexcept {
  for (const auto& v : values_) {
    if (v.is_node() && v.as_node().name() == name) return &v.as_node();
  }
  return nullptr;
}

inline node* node::find_child(std::string_view name) noexcept {
  for (auto& v : values_) {
    if (v.is_node() && v.as_node().name() == name) return &v.as_node();
  }
  return nullptr;
}

inline std::vector<const node*> node::find_children(std::string_view name) const {
  std::vector<const node*> out;
  for (const auto& v : values_) {
    if (v.is_node() && v.as_node().name() == name) out.push_back(&v.as_node());
  }
  return out;
}

inline std::vector<node*> node::find_children(std::string_view name) {
  std::vector<node*> out;
  for (auto& v : values_) {
    if (v.is_node() && v.as_node().name() == name) out.push_back(&v.as_node());
  }
  return out;
}

inline bool operator==(const node& a, const node& b) {
  return a.name() == b.name() && a.values() == b.values();
}

inline bool operator!=(const node& a, const node& b) { return !(a == b); }

// -----------------------------
// Tokenizer
// -----------------------------

namespace detail {

enum class token_kind { open_paren, close_paren, string, number, symbol, end };

inline const char* token_kind_name(token_kind k) noexcept {
  switch (k) {
    case token_kind::open_paren: return "'('";
    case token_kind::close_paren: return "')'";
    case token_kind::string: return "string";
    case token_kind::number: return "number";
    case token_kind::symbol: return "symbol";
    case token_kind::end: return "end of input";
  }
  return "token";
}

struct token {
  token_kind kind{token_kind::end};
  // Unescaped contents for strings, verbatim text otherwise.
  std::string text{};
  std::size_t offset{0};
};

inline char unescape(char c) noexcept {
  switch (c) {
    case 'n': return '\n';
    case 'r': return '\r';
    case 't': return '\t';
    default: return c; // covers \\ and \" as well as unknown escapes
  }
}

// Total: malformed input turns into odd symbols for the parser to reject.
// Always ends with exactly one `end` token.
inline std::vector<token> tokenize(std::string_view s) {
  std::vector<token> out;
  const char* base = s.data();
  const std::size_t n = s.size();
  std::size_t i = 0;

  while (true) {
    skip_ws(s, i);
    if (i >= n) break;

    const char c = base[i];
    if (c == '(') {
      out.push_back(token{token_kind::open_paren, "(", i});
      ++i;
      continue;
    }
    if (c == ')') {
      out.push_back(token{token_kind::close_paren, ")", i});
      ++i;
      continue;
    }

    if (c == '"') {
      const std::size_t quote_pos = i;
      ++i;
      std::string text;
      std::size_t chunk_begin = i;
      while (i < n && base[i] != '"') {
        if (base[i] != '\\') {
          ++i;
          continue;
        }
        if (i > chunk_begin) text.append(base + chunk_begin, i - chunk_begin);
        ++i;
        // A lone backslash at end of input is dropped.
        if (i < n) text.push_back(unescape(base[i++]));
        chunk_begin = i;
      }
      if (i > chunk_begin) text.append(base + chunk_begin, i - chunk_begin);
      if (i < n) ++i; // closing quote; unterminated literals run to end of input
      out.push_back(token{token_kind::string, std::move(text), quote_pos});
      continue;
    }

    const std::size_t start = i;
    while (i < n && !is_delimiter(base[i])) ++i;
    const std::string_view word = s.substr(start, i - start);
    out.push_back(token{looks_like_number(word) ? token_kind::number : token_kind::symbol, std::string(word), start});
  }

  out.push_back(token{token_kind::end, std::string(), n});
  return out;
}

} // namespace detail

// -----------------------------
// Parser
// -----------------------------

struct parse_options {
  std::size_t max_depth{256};
  // Reject tokens after the top-level node. Off by default: trailing input has
  // always been ignored.
  bool require_eof{false};
};

struct parse_result {
  node val;
  error err;
};

inline std::string error_message(const error& e) {
  std::string msg;
  switch (e.code) {
    case error_code::ok:
      return "ok";
    case error_code::not_a_node:
      msg = "input does not contain a valid s-expression";
      break;
    case error_code::expected_name:
      msg = "expected symbol or string for s-expression name, got ";
      msg += e.found;
      break;
    case error_code::expected_close_paren:
      msg = "expected closing parenthesis, got ";
      msg += e.found;
      break;
    case error_code::unexpected_token:
      msg = "unexpected token ";
      msg += e.found;
      break;
    case error_code::nesting_too_deep:
      msg = "nesting too deep";
      break;
    case error_code::trailing_tokens:
      msg = "unexpected ";
      msg += e.found;
      msg += " after s-expression";
      break;
  }
  msg += " at " + std::to_string(e.line) + ":" + std::to_string(e.column);
  return msg;
}

class parse_error : public std::runtime_error {
public:
  explicit parse_error(const error& e) : std::runtime_error("chsexpr: " + error_message(e)), err_(e) {}

  const error& err() const noexcept { return err_; }

private:
  error err_;
};

struct parser {
  std::string_view s;
  std::vector<detail::token> toks;
  std::size_t i{0};
  parse_options opt;

  parse_result run() {
    parse_result r;
    toks = detail::tokenize(s);
    i = 0;

    value v = parse_value(0, r.err);
    if (r.err) return r;

    if (!v.is_node()) {
      set_error(r.err, error_code::not_a_node, toks.front());
      return r;
    }
    if (opt.require_eof && peek().kind != detail::token_kind::end) {
      set_error(r.err, error_code::trailing_tokens, peek());
      return r;
    }
    r.val = std::move(v.as_node());
    return r;
  }

  // The trailing `end` token is never consumed, so this stays in range.
  detail::token& peek() noexcept { return toks[i]; }

  void set_error(error& e, error_code code, const detail::token& at) {
    if (e) return;
    e.code = code;
    e.offset = at.offset;
    e.found = detail::token_kind_name(at.kind);
    detail::update_line_col(s, e.offset, e.line, e.column);
  }

  value parse_value(std::size_t depth, error& e) {
    detail::token& t = peek();
    switch (t.kind) {
      case detail::token_kind::open_paren:
        return parse_node(depth + 1, e);
      case detail::token_kind::string:
        ++i;
        return value(quoted_string(std::move(t.text)));
      case detail::token_kind::number:
        ++i;
        return value(detail::parse_double(t.text));
      case detail::token_kind::symbol:
        ++i;
        // `nil` reads back as an empty legacy string, not as an absent value.
        if (t.text == "nil") return value(std::string());
        return value(atom(std::move(t.text)));
      default:
        set_error(e, error_code::unexpected_token, t);
        return nullptr;
    }
  }

  // `depth` counts enclosing nodes, this one included.
  value parse_node(std::size_t depth, error& e) {
    if (depth > opt.max_depth) {
      set_error(e, error_code::nesting_too_deep, peek());
      return nullptr;
    }
    ++i; // '('

    if (peek().kind == detail::token_kind::close_paren) {
      ++i;
      return value(node("list"));
    }

    // A quoted name loses its quotes; names are always written bare.
    detail::token& name_tok = peek();
    if (name_tok.kind != detail::token_kind::symbol && name_tok.kind != detail::token_kind::string) {
      set_error(e, error_code::expected_name, name_tok);
      return nullptr;
    }
    ++i;

    node n(std::move(name_tok.text));
    while (peek().kind != detail::token_kind::close_paren && peek().kind != detail::token_kind::end) {
      value v = parse_value(depth, e);
      if (e) return nullptr;
      n.values().push_back(std::move(v));
    }

    if (peek().kind != detail::token_kind::close_paren) {
      set_error(e, error_code::expected_close_paren, peek());
      return nullptr;
    }
    ++i;
    return value(std::move(n));
  }
};

inline parse_result parse(std::string_view text, parse_options opt = {}) {
  parser p;
  p.s = text;
  p.opt = opt;
  return p.run();
}

inline node parse_or_throw(std::string_view text, parse_options opt = {}) {
  auto r = parse(text, opt);
  if (r.err) throw parse_error(r.err);
  return std::move(r.val);
}

// -----------------------------
// Serializer
// -----------------------------

// True when bare text would not read back as the same single symbol.
inline bool needs_quoting(std::string_view s) noexcept {
  if (s.empty()) return true;
  for (char c : s) {
    if (detail::is_space(c) || c == '(' || c == ')' || c == '"' || c == '\\') return true;
  }
  // Would re-read as a number.
  return detail::looks_like_number(s);
}

namespace detail {

inline const char* escape_for(char c) noexcept {
  switch (c) {
    case '"': return "\\\"";
    case '\\': return "\\\\";
    case '\n': return "\\n";
    case '\r': return "\\r";
    case '\t': return "\\t";
    default: return nullptr;
  }
}

inline std::size_t quoted_length(std::string_view s) noexcept {
  std::size_t n = 2 + s.size();
  for (char c : s) {
    if (escape_for(c) != nullptr) ++n;
  }
  return n;
}

inline void dump_quoted(std::string& out, std::string_view s) {
  const char* data = s.data();
  const std::size_t n = s.size();

  out.push_back('"');
  std::size_t chunk_begin = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const char* esc = escape_for(data[i]);
    if (esc == nullptr) continue;
    if (i > chunk_begin) out.append(data + chunk_begin, i - chunk_begin);
    out.append(esc, 2);
    chunk_begin = i + 1;
  }
  if (n > chunk_begin) out.append(data + chunk_begin, n - chunk_begin);
  out.push_back('"');
}

inline bool quote_bare(std::string_view s, const serialize_options& opt) noexcept {
  return opt.quote_all || needs_quoting(s);
}

inline void dump_bare(std::string& out, std::string_view s, const serialize_options& opt) {
  if (quote_bare(s, opt)) dump_quoted(out, s);
  else out.append(s.data(), s.size());
}

inline std::size_t bare_length(std::string_view s, const serialize_options& opt) noexcept {
  return quote_bare(s, opt) ? quoted_length(s) : s.size();
}

// Integral values print without a fraction; anything else gets six fraction
// digits with trailing zeros (and a bare '.') stripped.
inline void dump_number(std::string& out, double d) {
  if (std::isnan(d)) {
    out.append("NaN", 3);
    return;
  }
  if (std::isinf(d)) {
    if (d < 0) out.append("-Infinity", 9);
    else out.append("Infinity", 8);
    return;
  }
  if (d == 0.0) {
    out.push_back('0');
    return;
  }

  const bool integral = (d == std::trunc(d));
  // %.0f of DBL_MAX is 309 digits.
  char buf[384];
  std::size_t len = 0;
  auto r = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::fixed, integral ? 0 : 6);
  if (r.ec == std::errc{}) {
    len = static_cast<std::size_t>(r.ptr - buf);
  } else {
    // Fallback: should be rare (e.g., implementation limitations).
    const int n = std::snprintf(buf, sizeof(buf), integral ? "%.0f" : "%.6f", d);
    if (n <= 0) {
      out.push_back('0');
      return;
    }
    len = static_cast<std::size_t>(n) < sizeof(buf) ? static_cast<std::size_t>(n) : sizeof(buf) - 1;
  }

  if (!integral) {
    while (len > 0 && buf[len - 1] == '0') --len;
    if (len > 0 && buf[len - 1] == '.') --len;
  }
  out.append(buf, len);
}

inline std::size_t single_line_length(const node& n, const serialize_options& opt);

inline std::size_t single_line_length(const value& v, const serialize_options& opt) {
  switch (v.type()) {
    case value::kind::nil:
      return 3;
    case value::kind::number: {
      std::string tmp;
      dump_number(tmp, v.as_number());
      return tmp.size();
    }
    case value::kind::atom:
      return bare_length(v.as_atom().text(), opt);
    case value::kind::raw_string:
      return bare_length(v.as_raw_string(), opt);
    case value::kind::quoted:
      return quoted_length(v.as_quoted().text());
    case value::kind::node:
      return single_line_length(v.as_node(), opt);
    case value::kind::sequence: {
      const auto& seq = v.as_sequence();
      std::size_t sum = seq.empty() ? 0 : seq.size() - 1; // separators
      for (const auto& e : seq) sum += single_line_length(e, opt);
      return sum;
    }
  }
  return 0;
}

// "(name " + children separated by spaces + ")"
inline std::size_t single_line_length(const node& n, const serialize_options& opt) {
  std::size_t len = 1 + n.name().size() + 1;
  const auto& vals = n.values();
  for (std::size_t i = 0; i < vals.size(); ++i) {
    if (i > 0) len += 1;
    len += single_line_length(vals[i], opt);
  }
  return len + 1;
}

// No direct child is itself a node.
inline bool is_simple(const node& n) noexcept {
  for (const auto& v : n.values()) {
    if (v.is_node()) return false;
  }
  return true;
}

inline bool use_single_line(const node& n, const serialize_options& opt) {
  if (!opt.pretty) return true;
  if (single_line_length(n, opt) > opt.max_width) return false;
  // Short leaves like (unit 1) or (xy 0 0) always stay on one line.
  if (is_simple(n) && n.size() <= 2) return true;
  return opt.compact;
}

inline void dump_indent(std::string& out, const std::string& unit, std::size_t depth) {
  for (std::size_t i = 0; i < depth; ++i) out += unit;
}

inline void dump_node(std::string& out, const node& n, const serialize_options& opt, std::size_t depth);

inline void dump_value(std::string& out, const value& v, const serialize_options& opt, std::size_t depth) {
  switch (v.type()) {
    case value::kind::nil:
      out.append("nil", 3);
      return;
    case value::kind::number:
      dump_number(out, v.as_number());
      return;
    case value::kind::atom:
      dump_bare(out, v.as_atom().text(), opt);
      return;
    case value::kind::raw_string:
      dump_bare(out, v.as_raw_string(), opt);
      return;
    case value::kind::quoted:
      dump_quoted(out, v.as_quoted().text());
      return;
    case value::kind::node:
      dump_node(out, v.as_node(), opt, depth);
      return;
    case value::kind::sequence: {
      const auto& seq = v.as_sequence();
      for (std::size_t idx = 0; idx < seq.size(); ++idx) {
        if (idx > 0) out.push_back(' ');
        dump_value(out, seq[idx], opt, depth);
      }
      return;
    }
  }
}

inline void dump_node(std::string& out, const node& n, const serialize_options& opt, std::size_t depth) {
  const auto& vals = n.values();
  out.push_back('(');
  out += n.name();

  if (use_single_line(n, opt)) {
    for (const auto& v : vals) {
      out.push_back(' ');
      dump_value(out, v, opt, depth + 1);
    }
    out.push_back(')');
    return;
  }

  // The closing paren hugs the last child; it never gets a line of its own.
  for (const auto& v : vals) {
    out.push_back('\n');
    dump_indent(out, opt.indent, depth + 1);
    dump_value(out, v, opt, depth + 1);
  }
  out.push_back(')');
}

} // namespace detail

inline void dump_to(std::string& out, const value& v, const serialize_options& opt = {}) {
  detail::dump_value(out, v, opt, 0);
}

inline void dump_to(std::string& out, const node& n, const serialize_options& opt = {}) {
  detail::dump_node(out, n, opt, 0);
}

inline std::string dump(const value& v, const serialize_options& opt = {}) {
  std::string out;
  out.reserve(256);
  dump_to(out, v, opt);
  return out;
}

inline std::string dump(const node& n, const serialize_options& opt = {}) {
  std::string out;
  out.reserve(256);
  dump_to(out, n, opt);
  return out;
}

inline std::string node::to_string(const serialize_options& opt) const {
  return dump(*this, opt);
}

inline node node::parse(std::string_view text) {
  return parse_or_throw(text);
}

// -----------------------------
// Construction helpers
// -----------------------------

inline quoted_string quoted(std::string text) {
  return quoted_string(std::move(text));
}

// (xy x y)
inline node xy(double x, double y) {
  return node("xy", x, y);
}

// (at x y) / (at x y angle)
inline node at(double x, double y) {
  return node("at", x, y);
}

inline node at(double x, double y, double angle) {
  return node("at", x, y, angle);
}

// (property "key" "value" attrs...); key and value are always quoted.
template <class... Ts>
inline node property(std::string key, std::string val, Ts&&... attrs) {
  return node("property", quoted(std::move(key)), quoted(std::move(val)), std::forward<Ts>(attrs)...);
}

// (uuid "text"), quoted even when the text would not need it.
inline node uuid(std::string text) {
  return node("uuid", quoted(std::move(text)));
}

} // namespace chsexpr
