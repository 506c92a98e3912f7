#ifndef CSRFBLOCK_CORE_RESULT_HPP
#define CSRFBLOCK_CORE_RESULT_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace csrfblock
{
  /**
   * @brief Deployment error (missing session layer, invalid options).
   *
   * Never converted into an HTTP response by this library.
   */
  class ConfigurationError : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  /** @brief Why a request body could not be read. */
  struct Error final
  {
    std::string code;
    std::string message;
  };

  /**
   * @brief Parsed value or the Error explaining why there is none.
   */
  template <class T>
  class Result final
  {
  public:
    Result(T value)
        : data_(std::in_place_index<0>, std::move(value))
    {
    }

    Result(Error err)
        : data_(std::in_place_index<1>, std::move(err))
    {
    }

    bool is_ok() const noexcept { return data_.index() == 0; }
    bool is_err() const noexcept { return !is_ok(); }
    explicit operator bool() const noexcept { return is_ok(); }

    T &value() { return std::get<0>(data_); }
    const T &value() const { return std::get<0>(data_); }

    const Error &error() const { return std::get<1>(data_); }

  private:
    std::variant<T, Error> data_;
  };

} // namespace csrfblock

#endif // CSRFBLOCK_CORE_RESULT_HPP
