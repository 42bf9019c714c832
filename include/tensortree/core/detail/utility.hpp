#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/compile.h>
#include <exception>
#include <iterator>
#include <string>
#include <string_view>

namespace tt::detail {
  /**
   * Message class which stores a keyed list of strings, which
   * are output line-by-line in a formatted manner, in the order
   * in which they were provided.
   */
  class Message {
    std::string _buffer;

  public:
    void put(std::string_view key, std::string_view message) {
      fmt::format_to(std::back_inserter(_buffer),
                     FMT_COMPILE("  {:<8} : {}\n"),
                     key,
                     message);
    }

    std::string get() const {
      return _buffer;
    }
  };

  /**
   * Exception class which stores a keyed list of strings, which
   * are output line-by-line in a formatted manner, in the order
   * in which they were provided. Subclasses override name() so
   * the first line identifies the failure category.
   */
  class Exception : public std::exception, public Message {
    mutable std::string _what;

  public:
    virtual ~Exception() = default;

    virtual std::string_view name() const noexcept {
      return "tt::detail::Exception";
    }

    const char * what() const noexcept override {
      _what = fmt::format("{} thrown\n{}", name(), get());
      return _what.c_str();
    }
  };
} // namespace tt::detail
