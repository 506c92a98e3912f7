#ifndef CSRFBLOCK_MIDDLEWARE_HPP
#define CSRFBLOCK_MIDDLEWARE_HPP

#include <functional>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <utility>

#include <csrfblock/core/context.hpp>
#include <csrfblock/core/next.hpp>
#include <csrfblock/core/result.hpp>

namespace csrfblock
{
  /**
   * @brief Shared objects (the logger, for one) looked up by type from any middleware.
   */
  class Services final
  {
  public:
    template <typename T>
    void provide(std::shared_ptr<T> svc)
    {
      entries_[std::type_index(typeid(T))] = std::move(svc);
    }

    /** @brief The registered instance, or nullptr. */
    template <typename T>
    std::shared_ptr<T> get() const
    {
      auto it = entries_.find(std::type_index(typeid(T)));
      if (it == entries_.end())
        return nullptr;
      return std::static_pointer_cast<T>(it->second);
    }

  private:
    std::unordered_map<std::type_index, std::shared_ptr<void>> entries_;
  };

  using MiddlewareFn = std::function<void(Context &, Next)>;

  /**
   * @brief Terminal handler: the wrapped application, or a blocked handler.
   */
  using Handler = std::function<void(Request &, Response &)>;

} // namespace csrfblock

#endif // CSRFBLOCK_MIDDLEWARE_HPP
