#ifndef CSRFBLOCK_AUTH_SESSION_HPP
#define CSRFBLOCK_AUTH_SESSION_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include <csrfblock/middleware.hpp>

namespace csrfblock::auth
{
  /**
   * @brief Per-client key/value state, owned by the application's session layer.
   *
   * `modified` tells the owner the data changed during the request.
   */
  struct Session
  {
    std::string id;
    std::unordered_map<std::string, std::string> data;
    bool modified{false};

    std::optional<std::string> get(const std::string &key) const
    {
      auto it = data.find(key);
      if (it == data.end())
        return std::nullopt;
      return it->second;
    }

    void set(std::string key, std::string value)
    {
      data[std::move(key)] = std::move(value);
      modified = true;
    }

    void erase(const std::string &key)
    {
      if (data.erase(key) > 0)
        modified = true;
    }
  };

  /** @brief Session for a request, or nullptr when the client has none. */
  using SessionLoader = std::function<std::shared_ptr<Session>(const http::Request &)>;

  /** @brief Persist a session modified while handling the request. */
  using SessionSaver = std::function<void(const http::Request &, Session &)>;

  /**
   * @brief Attach the application's session to each request.
   *
   * The loaded session is visible through Request::session() to everything
   * after this middleware. Once the chain has run, a modified session has
   * its flag reset and is handed to `save` (when one is given).
   */
  inline MiddlewareFn attach_session(SessionLoader load, SessionSaver save = {})
  {
    if (!load)
      throw ConfigurationError("session: a loader is required");

    return [load = std::move(load), save = std::move(save)](Context &ctx, Next next)
    {
      std::shared_ptr<Session> s = load(ctx.req());
      ctx.req().set_session(s);

      next();

      if (s && s->modified && save)
      {
        s->modified = false;
        save(ctx.req(), *s);
      }
    };
  }

} // namespace csrfblock::auth

#endif // CSRFBLOCK_AUTH_SESSION_HPP
