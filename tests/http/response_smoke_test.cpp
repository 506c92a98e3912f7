#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include <boost/beast/http.hpp>

#include <csrfblock/http/response.hpp>

using namespace csrfblock;

static void test_send_sets_length()
{
  http::Response res;
  res.status(201).text("hello");

  assert(res.status_code() == 201);
  assert(res.header("Content-Type") == "text/plain; charset=utf-8");
  assert(res.header("Content-Length") == "5");
  assert(res.has_body());

  auto first = res.next_chunk();
  assert(first && *first == "hello");
  assert(!res.next_chunk());
  assert(!res.has_body());

  std::cout << "[OK] response send\n";
}

static void test_stream_keeps_chunking()
{
  http::Response res;
  res.ok().header("Content-Type", "application/json").header("Content-Length", "99");
  res.stream(http::chunks({"{\"a\":", "1}"}));

  assert(!res.has_header("Content-Length"));

  std::vector<std::string> seen;
  while (auto c = res.next_chunk())
    seen.push_back(*c);

  assert(seen.size() == 2);
  assert(seen[0] == "{\"a\":");
  assert(seen[1] == "1}");

  std::cout << "[OK] response stream\n";
}

static void test_take_body_and_wrap()
{
  http::Response res;
  res.html("<p>x</p>");

  auto inner = res.take_body();
  assert(!res.has_body());

  res.stream([inner]() mutable -> std::optional<std::string>
             {
    auto c = inner();
    if (!c)
      return std::nullopt;
    return "[" + *c + "]"; });

  assert(res.collect() == "[<p>x</p>]");

  std::cout << "[OK] response take_body\n";
}

static void test_headers_and_beast()
{
  namespace bhttp = boost::beast::http;

  http::Response res;
  res.status(404).append("Set-Cookie", "a=1").append("Set-Cookie", "b=2").text("missing");
  res.erase("X-Nothing");

  // header names are case-insensitive for every accessor
  res.header("X-Frame-Options", "DENY");
  assert(res.has_header("x-frame-options"));
  assert(res.header("X-FRAME-OPTIONS") == "DENY");
  res.header("x-frame-options", "SAMEORIGIN");
  assert(res.header("X-Frame-Options") == "SAMEORIGIN");
  res.erase("X-Frame-Options");
  assert(!res.has_header("X-Frame-Options"));

  auto msg = res.to_beast();
  assert(msg.result_int() == 404);
  assert(msg.body() == "missing");

  int cookies = 0;
  for (const auto &f : msg.base())
  {
    if (f.name() == bhttp::field::set_cookie)
      ++cookies;
  }
  assert(cookies == 2);

  std::cout << "[OK] response to_beast\n";
}

int main()
{
  test_send_sets_length();
  test_stream_keeps_chunking();
  test_take_body_and_wrap();
  test_headers_and_beast();

  std::cout << "OK: http response smoke tests passed\n";
  return 0;
}
