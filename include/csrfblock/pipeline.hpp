/**
 *
 *  @file pipeline.hpp
 *
 *  CsrfBlock
 */
#ifndef CSRFBLOCK_PIPELINE_HPP
#define CSRFBLOCK_PIPELINE_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include <csrfblock/middleware.hpp>

namespace csrfblock
{
  /**
   * @brief Ordered middleware chain in front of an application handler.
   *
   * Each middleware decides whether the rest of the chain runs by calling
   * (or not calling) its Next. Exceptions propagate to the caller of run().
   */
  class HttpPipeline
  {
  public:
    Services &services() noexcept { return services_; }

    HttpPipeline &use(MiddlewareFn mw)
    {
      chain_.push_back(std::move(mw));
      return *this;
    }

    std::size_t size() const noexcept { return chain_.size(); }

    void run(Request &req, Response &res, const Handler &app = {})
    {
      Context ctx(req, res, services_);
      dispatch(0, ctx, app);
    }

  private:
    void dispatch(std::size_t i, Context &ctx, const Handler &app) const
    {
      if (i == chain_.size())
      {
        if (app)
          app(ctx.req(), ctx.res());
        return;
      }

      chain_[i](ctx, Next([this, i, &ctx, &app]()
                          { dispatch(i + 1, ctx, app); }));
    }

    Services services_;
    std::vector<MiddlewareFn> chain_;
  };

} // namespace csrfblock

#endif // CSRFBLOCK_PIPELINE_HPP
