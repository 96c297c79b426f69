#include "test_common.hpp"

#include <string>
#include <vector>

using namespace chsexpr;
using detail::token;
using detail::token_kind;
using detail::tokenize;

static void test_token_kinds() {
  const auto toks = tokenize("(wire \"a b\" 12 -3.5 R1 )");
  CHSEXPR_CHECK(toks.size() == 8);
  CHSEXPR_CHECK(toks[0].kind == token_kind::open_paren);
  CHSEXPR_CHECK(toks[1].kind == token_kind::symbol && toks[1].text == "wire");
  CHSEXPR_CHECK(toks[2].kind == token_kind::string && toks[2].text == "a b");
  CHSEXPR_CHECK(toks[3].kind == token_kind::number && toks[3].text == "12");
  CHSEXPR_CHECK(toks[4].kind == token_kind::number && toks[4].text == "-3.5");
  CHSEXPR_CHECK(toks[5].kind == token_kind::symbol && toks[5].text == "R1");
  CHSEXPR_CHECK(toks[6].kind == token_kind::close_paren);
  CHSEXPR_CHECK(toks[7].kind == token_kind::end);
}

static void test_whitespace_and_offsets() {
  {
    const auto toks = tokenize(" \t\r\n ");
    CHSEXPR_CHECK(toks.size() == 1);
    CHSEXPR_CHECK(toks[0].kind == token_kind::end);
  }
  {
    const auto toks = tokenize("");
    CHSEXPR_CHECK(toks.size() == 1);
    CHSEXPR_CHECK(toks[0].kind == token_kind::end);
    CHSEXPR_CHECK(toks[0].offset == 0);
  }
  {
    const std::string src = "(a\n  b)";
    const auto toks = tokenize(src);
    CHSEXPR_CHECK(toks.size() == 5);
    CHSEXPR_CHECK(toks[0].offset == 0);
    CHSEXPR_CHECK(toks[1].offset == 1);
    CHSEXPR_CHECK(toks[2].offset == 5);
    CHSEXPR_CHECK(toks[3].offset == 6);
    CHSEXPR_CHECK(toks[4].offset == src.size());
  }
}

static void test_parens_split_words() {
  const auto toks = tokenize("a(b)c");
  CHSEXPR_CHECK(toks.size() == 6);
  CHSEXPR_CHECK(toks[0].kind == token_kind::symbol && toks[0].text == "a");
  CHSEXPR_CHECK(toks[1].kind == token_kind::open_paren);
  CHSEXPR_CHECK(toks[2].kind == token_kind::symbol && toks[2].text == "b");
  CHSEXPR_CHECK(toks[3].kind == token_kind::close_paren);
  CHSEXPR_CHECK(toks[4].kind == token_kind::symbol && toks[4].text == "c");
}

static void test_number_classification() {
  const char* numbers[] = {"0", "42", "-7", "1.27", "-0.5", "007"};
  for (const char* s : numbers) {
    const auto toks = tokenize(s);
    CHSEXPR_CHECK(toks.size() == 2);
    CHSEXPR_CHECK(toks[0].kind == token_kind::number);
  }

  const char* symbols[] = {"-", "1.", ".5", "+1", "1e5", "1.2.3", "0x10", "--1", "3V3", "1.5mm"};
  for (const char* s : symbols) {
    const auto toks = tokenize(s);
    CHSEXPR_CHECK(toks.size() == 2);
    CHSEXPR_CHECK(toks[0].kind == token_kind::symbol);
    CHSEXPR_CHECK(toks[0].text == s);
  }
}

static void test_string_escapes() {
  {
    const auto toks = tokenize(R"("a\nb\rc\td\\e\"f")");
    CHSEXPR_CHECK(toks.size() == 2);
    CHSEXPR_CHECK(toks[0].kind == token_kind::string);
    CHSEXPR_CHECK(toks[0].text == std::string("a\nb\rc\td\\e\"f"));
  }
  {
    // Unknown escapes keep the character and drop the backslash.
    const auto toks = tokenize(R"("\q\(")");
    CHSEXPR_CHECK(toks[0].kind == token_kind::string);
    CHSEXPR_CHECK(toks[0].text == "q(");
  }
  {
    // Parentheses and whitespace are plain characters inside a literal.
    const auto toks = tokenize("\"(not a list)\"");
    CHSEXPR_CHECK(toks.size() == 2);
    CHSEXPR_CHECK(toks[0].text == "(not a list)");
  }
  {
    const auto toks = tokenize("\"\"");
    CHSEXPR_CHECK(toks.size() == 2);
    CHSEXPR_CHECK(toks[0].kind == token_kind::string);
    CHSEXPR_CHECK(toks[0].text.empty());
  }
}

static void test_unterminated_string_is_lenient() {
  {
    const auto toks = tokenize("(a \"runs off");
    CHSEXPR_CHECK(toks.size() == 4);
    CHSEXPR_CHECK(toks[2].kind == token_kind::string);
    CHSEXPR_CHECK(toks[2].text == "runs off");
    CHSEXPR_CHECK(toks[3].kind == token_kind::end);
  }
  {
    // Trailing lone backslash is dropped.
    const auto toks = tokenize("\"ab\\");
    CHSEXPR_CHECK(toks.size() == 2);
    CHSEXPR_CHECK(toks[0].text == "ab");
  }
}

static void test_quote_inside_word_stays_symbol() {
  const auto toks = tokenize("a\"b c");
  CHSEXPR_CHECK(toks.size() == 3);
  CHSEXPR_CHECK(toks[0].kind == token_kind::symbol);
  CHSEXPR_CHECK(toks[0].text == "a\"b");
  CHSEXPR_CHECK(toks[1].text == "c");
}

void test_tokenizer() {
  test_token_kinds();
  test_whitespace_and_offsets();
  test_parens_split_words();
  test_number_classification();
  test_string_escapes();
  test_unterminated_string_is_lenient();
  test_quote_inside_word_stays_symbol();
}
