#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include <boost/beast/http.hpp>

#include <csrfblock/auth/session.hpp>
#include <csrfblock/pipeline.hpp>

using namespace csrfblock;
namespace bhttp = boost::beast::http;

static void test_session_data()
{
  auth::Session s;
  assert(!s.get("k"));
  assert(!s.modified);

  s.erase("k");
  assert(!s.modified);

  s.set("k", "v");
  assert(s.get("k") == std::optional<std::string>("v"));
  assert(s.modified);

  s.modified = false;
  s.erase("k");
  assert(!s.get("k"));
  assert(s.modified);

  std::cout << "[OK] session data\n";
}

static void test_attach_and_save()
{
  // sessions keyed by an "X-Client" header, copied in and out like a real store
  std::map<std::string, auth::Session> store;
  store["alice"] = auth::Session{"s-alice", {{"theme", "dark"}}, false};
  int saves = 0;

  HttpPipeline p;
  p.use(auth::attach_session(
      [&](const http::Request &req) -> std::shared_ptr<auth::Session>
      {
        auto it = store.find(req.header("X-Client"));
        if (it == store.end())
          return nullptr;
        return std::make_shared<auth::Session>(it->second);
      },
      [&](const http::Request &req, auth::Session &s)
      {
        ++saves;
        store[req.header("X-Client")] = s;
      }));

  auto run = [&](const std::string &client, const Handler &app)
  {
    http::RawRequest raw{bhttp::verb::get, "/", 11};
    raw.set("X-Client", client);
    Request req(raw);
    Response res;
    p.run(req, res, app);
  };

  run("alice", [](Request &req, Response &)
      {
    assert(req.session());
    assert(req.session()->get("theme") == std::optional<std::string>("dark")); });
  assert(saves == 0);

  run("alice", [](Request &req, Response &)
      { req.session()->set("theme", "light"); });
  assert(saves == 1);
  assert(store["alice"].get("theme") == std::optional<std::string>("light"));
  assert(!store["alice"].modified);

  bool seen_none = false;
  run("mallory", [&](Request &req, Response &)
      { seen_none = req.session() == nullptr; });
  assert(seen_none);
  assert(saves == 1);

  std::cout << "[OK] attach_session loads and saves\n";
}

static void test_loader_required()
{
  bool thrown = false;
  try
  {
    (void)auth::attach_session(nullptr);
  }
  catch (const ConfigurationError &)
  {
    thrown = true;
  }
  assert(thrown);

  std::cout << "[OK] attach_session requires a loader\n";
}

int main()
{
  test_session_data();
  test_attach_and_save();
  test_loader_required();

  std::cout << "OK: session smoke tests passed\n";
  return 0;
}
