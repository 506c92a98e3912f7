#ifndef CSRFBLOCK_CORE_NEXT_HPP
#define CSRFBLOCK_CORE_NEXT_HPP

#include <functional>
#include <utility>

namespace csrfblock
{
  /**
   * @brief Continuation handed to a middleware; runs the rest of the chain at most once.
   */
  class Next final
  {
  public:
    explicit Next(std::function<void()> rest)
        : rest_(std::move(rest))
    {
    }

    void operator()()
    {
      if (called_)
        return;
      called_ = true;
      if (rest_)
        rest_();
    }

    bool called() const noexcept { return called_; }

  private:
    std::function<void()> rest_;
    bool called_{false};
  };

} // namespace csrfblock

#endif // CSRFBLOCK_CORE_NEXT_HPP
