#ifndef CSRFBLOCK_CORE_CONTEXT_HPP
#define CSRFBLOCK_CORE_CONTEXT_HPP

#include <csrfblock/http/request.hpp>
#include <csrfblock/http/response.hpp>

namespace csrfblock
{
  class Services;

  using Request = csrfblock::http::Request;
  using Response = csrfblock::http::Response;

  /**
   * @brief Per-request view handed to every middleware.
   *
   * Holds references only; the request, response and services outlive it.
   */
  class Context final
  {
  public:
    Context(Request &req, Response &res, Services &services) noexcept
        : req_(&req), res_(&res), services_(&services)
    {
    }

    Request &req() noexcept { return *req_; }
    const Request &req() const noexcept { return *req_; }
    Response &res() noexcept { return *res_; }
    const Response &res() const noexcept { return *res_; }
    Services &services() noexcept { return *services_; }
    const Services &services() const noexcept { return *services_; }

  private:
    Request *req_;
    Response *res_;
    Services *services_;
  };

} // namespace csrfblock

#endif // CSRFBLOCK_CORE_CONTEXT_HPP
