#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include <boost/beast/http.hpp>

#include <csrfblock/auth/session.hpp>
#include <csrfblock/http/request.hpp>

using namespace csrfblock;

static http::RawRequest make_req(boost::beast::http::verb method,
                                 std::string target,
                                 std::string body = {},
                                 std::string content_type = {})
{
  namespace bhttp = boost::beast::http;
  http::RawRequest req{method, target, 11};
  req.set(bhttp::field::host, "localhost");
  if (!content_type.empty())
    req.set(bhttp::field::content_type, content_type);
  req.body() = std::move(body);
  req.prepare_payload();
  return req;
}

static void test_basics()
{
  namespace bhttp = boost::beast::http;

  auto raw = make_req(bhttp::verb::get, "/items?id=7&q=a+b");
  raw.set("X-CSRF-Token", "abc");

  http::Request req(raw, "app.local");

  assert(req.method() == "GET");
  assert(req.target() == "/items?id=7&q=a+b");
  assert(req.path() == "/items");
  assert(req.server_name() == "app.local");

  assert(req.has_header("x-csrf-token"));
  assert(req.header("X-Csrf-Token") == "abc");
  assert(req.header("missing").empty());

  assert(req.query().at("id") == "7");
  assert(req.query().at("q") == "a b");
  assert(req.body_params().empty());

  std::cout << "[OK] request basics\n";
}

static void test_param_body_first_then_query()
{
  namespace bhttp = boost::beast::http;

  auto raw = make_req(bhttp::verb::post, "/save?SEC=from-query&only=q",
                      "SEC=from-body&x=1",
                      "application/x-www-form-urlencoded; charset=UTF-8");
  http::Request req(raw);

  auto sec = req.param("SEC");
  assert(sec && *sec == "from-body");

  auto only = req.param("only");
  assert(only && *only == "q");

  assert(!req.param("nope"));

  std::cout << "[OK] request merged params\n";
}

static void test_multipart_params()
{
  namespace bhttp = boost::beast::http;

  const std::string body =
      "--XyZ\r\n"
      "Content-Disposition: form-data; name=\"SEC\"\r\n"
      "\r\n"
      "tok123\r\n"
      "--XyZ--\r\n";

  auto raw = make_req(bhttp::verb::post, "/upload", body, "multipart/form-data; boundary=XyZ");
  http::Request req(raw);

  auto sec = req.param("SEC");
  assert(sec && *sec == "tok123");

  auto upper = make_req(bhttp::verb::post, "/upload", body, "multipart/form-data; Boundary=XyZ");
  http::Request upper_req(upper);
  assert(upper_req.param("SEC") == std::optional<std::string>("tok123"));

  std::cout << "[OK] request multipart params\n";
}

static void test_other_content_types_have_no_body_params()
{
  namespace bhttp = boost::beast::http;

  auto raw = make_req(bhttp::verb::post, "/api?SEC=q", "{\"SEC\":\"json\"}", "application/json");
  http::Request req(raw);

  assert(req.body_params().empty());
  auto sec = req.param("SEC");
  assert(sec && *sec == "q");

  std::cout << "[OK] request ignores unsupported bodies\n";
}

static void test_session_slot()
{
  namespace bhttp = boost::beast::http;

  auto raw = make_req(bhttp::verb::get, "/");
  http::Request req(raw);
  assert(req.session() == nullptr);

  auto s = std::make_shared<auth::Session>();
  s->id = "abc";
  req.set_session(s);

  assert(req.session() == s.get());
  assert(req.session()->id == "abc");

  std::cout << "[OK] request session slot\n";
}

int main()
{
  test_basics();
  test_param_body_first_then_query();
  test_multipart_params();
  test_other_content_types_have_no_body_params();
  test_session_slot();

  std::cout << "OK: http request smoke tests passed\n";
  return 0;
}
