/**
 *
 *  @file csrf_block.cpp
 *
 *  CsrfBlock
 */
#include <csrfblock/security/csrf_block.hpp>

#include <csrfblock/auth/session.hpp>
#include <csrfblock/basics/logger.hpp>
#include <csrfblock/core/result.hpp>
#include <csrfblock/security/form_injector.hpp>
#include <csrfblock/security/request_validator.hpp>
#include <csrfblock/security/token_store.hpp>

#include <memory>
#include <utility>

namespace csrfblock::security
{
  namespace
  {
    template <class T>
    void read_key(const nlohmann::json &j, const char *key, T &out)
    {
      auto it = j.find(key);
      if (it != j.end())
        out = it->get<T>();
    }

    struct CsrfState
    {
      CsrfBlockOptions opt;
      TokenGeneratorFn generate;
      TokenStore store;
      RequestValidator validator;
      InjectorOptions injector;
    };

    std::shared_ptr<const CsrfState> make_state(CsrfBlockOptions opt)
    {
      if (opt.parameter_name.empty())
        throw ConfigurationError("csrf: parameter_name must not be empty");
      if (transport_header_name(opt.header_name).empty())
        throw ConfigurationError("csrf: header_name must not be empty");
      if (opt.session_key.empty())
        throw ConfigurationError("csrf: session_key must not be empty");
      if (opt.add_meta && opt.meta_name.empty())
        throw ConfigurationError("csrf: meta_name must not be empty");

      // validates token_length even when a custom generator is supplied
      TokenGenerator builtin(opt.token_length);

      TokenGeneratorFn generate = opt.token_generator
                                      ? opt.token_generator
                                      : TokenGeneratorFn(builtin);

      TokenStore store(opt.session_key);

      ValidatorOptions vopt;
      vopt.parameter_name = opt.parameter_name;
      vopt.header_name = opt.header_name;
      vopt.onetime = opt.onetime;

      InjectorOptions iopt;
      iopt.parameter_name = opt.parameter_name;
      iopt.add_meta = opt.add_meta;
      iopt.meta_name = opt.meta_name;

      RequestValidator validator(std::move(vopt), store);

      return std::make_shared<const CsrfState>(CsrfState{
          std::move(opt),
          std::move(generate),
          std::move(store),
          std::move(validator),
          std::move(iopt)});
    }
  } // namespace

  CsrfBlockOptions csrf_block_options_from_json(const nlohmann::json &j)
  {
    if (!j.is_object())
      throw ConfigurationError("csrf: options must be a JSON object");

    CsrfBlockOptions opt;

    try
    {
      read_key(j, "parameter_name", opt.parameter_name);
      read_key(j, "header_name", opt.header_name);
      read_key(j, "session_key", opt.session_key);
      read_key(j, "add_meta", opt.add_meta);
      read_key(j, "meta_name", opt.meta_name);
      read_key(j, "onetime", opt.onetime);

      auto it = j.find("token_length");
      if (it != j.end())
      {
        if (!it->is_number_integer())
          throw ConfigurationError("csrf: token_length must be an integer");

        const auto n = it->get<long long>();
        if (n < 1 || n > static_cast<long long>(kMaxTokenLength))
          throw ConfigurationError("csrf: token_length must be between 1 and 40");

        opt.token_length = static_cast<std::size_t>(n);
      }
    }
    catch (const nlohmann::json::exception &e)
    {
      throw ConfigurationError(std::string("csrf: invalid options: ") + e.what());
    }

    return opt;
  }

  void send_csrf_detected(http::Response &res)
  {
    res.status(403)
        .header("Content-Type", "text/plain")
        .send("CSRF detected");
  }

  MiddlewareFn csrf_block(CsrfBlockOptions opt)
  {
    auto st = make_state(std::move(opt));

    return [st](Context &ctx, Next next)
    {
      auto &req = ctx.req();
      auth::Session *session = req.session();
      if (!session)
        throw ConfigurationError("csrf: no session on the request (install attach_session first)");

      auto log = ctx.services().get<basics::ILogger>();

      if (st->validator.validate(req, *session) == Verdict::Rejected)
      {
        if (log)
        {
          const char *reason = st->store.get(*session) ? "token mismatch" : "no token in session";
          log->warn("csrf: rejected " + req.method() + " " + req.path() + ": " + reason);
        }

        if (st->opt.blocked)
          st->opt.blocked(req, ctx.res());
        else
          send_csrf_detected(ctx.res());
        return;
      }

      next();

      auto &res = ctx.res();
      if (!res.has_body() || !is_html_content_type(res.header("Content-Type")))
        return;

      // resolved before streaming so the session layer persists it with this response
      const bool issued = !st->store.get(*session);
      const std::string token = st->store.ensure(*session, st->generate);
      if (issued && log)
        log->info("csrf: issued token on " + req.method() + " " + req.path());

      auto injector = std::make_shared<FormInjector>(
          st->injector,
          effective_host(req),
          [token]()
          { return token; });

      res.stream(inject_forms(res.take_body(), std::move(injector)));
    };
  }

} // namespace csrfblock::security
