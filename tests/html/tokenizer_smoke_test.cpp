/**
 *
 *  @file tokenizer_smoke_test.cpp
 *
 *  CsrfBlock
 */
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include <csrfblock/html/tokenizer.hpp>

using namespace csrfblock;

struct Recorder final : html::TokenHandler
{
  std::string out;
  std::vector<html::StartTag> tags;
  std::vector<std::string> raws;

  void on_text(std::string_view raw) override
  {
    out.append(raw.data(), raw.size());
  }

  void on_start_tag(const html::StartTag &tag, std::string_view raw) override
  {
    out.append(raw.data(), raw.size());
    tags.push_back(tag);
    raws.emplace_back(raw);
  }
};

static Recorder run_whole(const std::string &doc)
{
  Recorder r;
  html::Tokenizer t;
  t.feed(doc, r);
  t.finish(r);
  return r;
}

static Recorder run_bytewise(const std::string &doc)
{
  Recorder r;
  html::Tokenizer t;
  for (char c : doc)
    t.feed(std::string_view(&c, 1), r);
  t.finish(r);
  return r;
}

static void test_attributes_and_quoting()
{
  const std::string doc =
      "<FORM Method=\"POST\" action='/save?a=1&amp;b=2' data-x=un>quoted>"
      "<input disabled name=q value=\"a > b\"/>";

  auto r = run_whole(doc);
  assert(r.out == doc);
  assert(r.tags.size() == 2);

  const auto &form = r.tags[0];
  assert(form.is("form"));
  assert(form.name == "form");
  assert(form.attribute("METHOD") == std::optional<std::string>("POST"));
  assert(form.attribute("action") == std::optional<std::string>("/save?a=1&b=2"));
  assert(form.attribute("data-x") == std::optional<std::string>("un"));
  assert(!form.attribute("missing"));
  assert(r.raws[0] == "<FORM Method=\"POST\" action='/save?a=1&amp;b=2' data-x=un>");

  const auto &input = r.tags[1];
  assert(input.is("input"));
  assert(input.self_closing);
  assert(input.attributes.size() == 3);
  assert(input.attributes[0].name == "disabled");
  assert(input.attributes[0].value.empty());
  assert(input.attribute("value") == std::optional<std::string>("a > b"));

  std::cout << "[OK] tokenizer attributes + quoting\n";
}

static void test_markup_passthrough()
{
  const std::string doc =
      "<!DOCTYPE html><!-- <form method=post> --><?xml version=\"1.0\"?>"
      "</div><p>1 < 2 and <3</p><!---->";

  auto r = run_whole(doc);
  assert(r.out == doc);
  assert(r.tags.size() == 1);
  assert(r.tags[0].is("p"));

  std::cout << "[OK] tokenizer comments/declarations/end tags\n";
}

static void test_script_is_raw_text()
{
  const std::string doc =
      "<script>if (a<b) document.write('<form method=post>');</scriptx></SCRIPT >"
      "<style>p<form{}</style><form method=post>";

  auto r = run_whole(doc);
  assert(r.out == doc);
  assert(r.tags.size() == 3);
  assert(r.tags[0].is("script"));
  assert(r.tags[1].is("style"));
  assert(r.tags[2].is("form"));

  std::cout << "[OK] tokenizer script/style raw text\n";
}

static void test_chunking_invariance()
{
  const std::string doc =
      "<html><head><title>x</title></head><body>"
      "<form method=\"post\" action=\"/x\"><input name=\"a\"></form>"
      "<script>var s='<form method=post>';</script>"
      "<!-- c --><p class='a>b'>t &amp; u</p></body></html>";

  auto whole = run_whole(doc);
  auto bytes = run_bytewise(doc);

  assert(whole.out == doc);
  assert(bytes.out == doc);
  assert(whole.raws == bytes.raws);

  std::cout << "[OK] tokenizer 1-byte chunking\n";
}

static void test_malformed_tail_flushed()
{
  Recorder r;
  html::Tokenizer t;

  t.feed("text <form method=\"po", r);
  assert(r.out == "text ");
  assert(t.pending() == std::string("<form method=\"po").size());

  t.finish(r);
  assert(r.out == "text <form method=\"po");
  assert(r.tags.empty());
  assert(t.pending() == 0);

  // reusable after finish
  t.feed("<b>", r);
  assert(r.tags.size() == 1);

  std::cout << "[OK] tokenizer malformed tail\n";
}

static void test_decode_entities()
{
  assert(html::decode_entities("a&amp;b&lt;&gt;&quot;&apos;") == "a&b<>\"'");
  assert(html::decode_entities("&#65;&#x42;") == "AB");
  assert(html::decode_entities("&#xE9;") == "\xC3\xA9");
  assert(html::decode_entities("&unknown; & &#xZZ;") == "&unknown; & &#xZZ;");

  std::cout << "[OK] decode_entities\n";
}

int main()
{
  test_attributes_and_quoting();
  test_markup_passthrough();
  test_script_is_raw_text();
  test_chunking_invariance();
  test_malformed_tail_flushed();
  test_decode_entities();

  std::cout << "OK: html tokenizer smoke tests passed\n";
  return 0;
}
