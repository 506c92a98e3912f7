#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include <csrfblock/core/result.hpp>
#include <csrfblock/security/token_generator.hpp>

using namespace csrfblock;

static bool is_lower_hex(const std::string &s)
{
  for (char c : s)
  {
    const bool digit = c >= '0' && c <= '9';
    const bool alpha = c >= 'a' && c <= 'f';
    if (!digit && !alpha)
      return false;
  }
  return true;
}

static void test_all_lengths()
{
  for (std::size_t len = 1; len <= security::kMaxTokenLength; ++len)
  {
    security::TokenGenerator gen(len);
    assert(gen.length() == len);

    const std::string token = gen.generate();
    assert(token.size() == len);
    assert(is_lower_hex(token));
  }

  std::cout << "[OK] token lengths 1..40, hex alphabet\n";
}

static void test_default_and_distinct()
{
  security::TokenGenerator gen;
  assert(gen.length() == 16);

  std::set<std::string> seen;
  for (int i = 0; i < 64; ++i)
    seen.insert(gen());

  assert(seen.size() == 64);

  std::cout << "[OK] successive tokens differ\n";
}

static void test_bad_lengths()
{
  for (std::size_t len : {std::size_t{0}, std::size_t{41}, std::size_t{1000}})
  {
    bool thrown = false;
    try
    {
      security::TokenGenerator gen(len);
      (void)gen;
    }
    catch (const ConfigurationError &)
    {
      thrown = true;
    }
    assert(thrown);
  }

  std::cout << "[OK] token length out of range rejected\n";
}

static void test_as_strategy()
{
  security::TokenGeneratorFn fn = security::TokenGenerator(8);
  assert(fn().size() == 8);

  int n = 0;
  security::TokenGeneratorFn fixed = [&]()
  { return "fixed" + std::to_string(++n); };
  assert(fixed() == "fixed1");

  std::cout << "[OK] generator as injectable strategy\n";
}

int main()
{
  test_all_lengths();
  test_default_and_distinct();
  test_bad_lengths();
  test_as_strategy();

  std::cout << "OK: token generator smoke tests passed\n";
  return 0;
}
