#include <csrfblock/http/response.hpp>

#include <cstddef>
#include <memory>
#include <utility>

namespace csrfblock::http
{
  namespace
  {
    boost::beast::string_view to_bsv(std::string_view s)
    {
      return {s.data(), s.size()};
    }
  } // namespace

  BodyProducer chunks(std::vector<std::string> parts)
  {
    auto state = std::make_shared<std::vector<std::string>>(std::move(parts));
    auto idx = std::make_shared<std::size_t>(0);

    return [state, idx]() -> std::optional<std::string>
    {
      if (*idx >= state->size())
        return std::nullopt;
      return std::move((*state)[(*idx)++]);
    };
  }

  Response &Response::header(std::string_view name, std::string_view value)
  {
    fields_.set(to_bsv(name), to_bsv(value));
    return *this;
  }

  Response &Response::append(std::string_view name, std::string_view value)
  {
    fields_.insert(to_bsv(name), to_bsv(value));
    return *this;
  }

  Response &Response::erase(std::string_view name)
  {
    fields_.erase(to_bsv(name));
    return *this;
  }

  std::string Response::header(std::string_view name) const
  {
    auto it = fields_.find(to_bsv(name));
    if (it == fields_.end())
      return {};
    return std::string(it->value().data(), it->value().size());
  }

  bool Response::has_header(std::string_view name) const
  {
    return fields_.find(to_bsv(name)) != fields_.end();
  }

  Response &Response::send(std::string body)
  {
    fields_.set(boost::beast::http::field::content_length, std::to_string(body.size()));

    auto pending = std::make_shared<std::optional<std::string>>(std::move(body));
    body_ = [pending]() -> std::optional<std::string>
    {
      std::optional<std::string> out;
      out.swap(*pending);
      return out;
    };
    return *this;
  }

  Response &Response::text(std::string_view body)
  {
    header("Content-Type", "text/plain; charset=utf-8");
    return send(std::string(body));
  }

  Response &Response::html(std::string_view body)
  {
    header("Content-Type", "text/html; charset=utf-8");
    return send(std::string(body));
  }

  Response &Response::stream(BodyProducer producer)
  {
    fields_.erase(boost::beast::http::field::content_length);
    body_ = std::move(producer);
    return *this;
  }

  BodyProducer Response::take_body()
  {
    BodyProducer out = std::move(body_);
    body_ = nullptr;
    return out;
  }

  std::optional<std::string> Response::next_chunk()
  {
    if (!body_)
      return std::nullopt;

    auto chunk = body_();
    if (!chunk)
      body_ = nullptr;
    return chunk;
  }

  std::string Response::collect()
  {
    std::string out;
    while (auto chunk = next_chunk())
      out += *chunk;
    return out;
  }

  boost::beast::http::response<boost::beast::http::string_body> Response::to_beast(unsigned version)
  {
    namespace bhttp = boost::beast::http;

    bhttp::response<bhttp::string_body> res{static_cast<bhttp::status>(status_), version};
    for (const auto &f : fields_)
      res.insert(f.name_string(), f.value());

    res.body() = collect();
    res.prepare_payload();
    return res;
  }

} // namespace csrfblock::http
