#pragma once

#include <tensortree/core/detail/utility.hpp>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace tt {
  // Malformed top-level structure; missing brace, unknown character, bad literal, trailing data
  class FormatError : public detail::Exception {
  public:
    std::string_view name() const noexcept override { return "tt::FormatError"; }
  };

  // Token stream ran dry before a structure was closed
  class UnexpectedEndOfInput : public detail::Exception {
  public:
    std::string_view name() const noexcept override { return "tt::UnexpectedEndOfInput"; }
  };

  // Branch without children; its depth is undefined
  class EmptyBranchError : public detail::Exception {
  public:
    std::string_view name() const noexcept override { return "tt::EmptyBranchError"; }
  };

  // A fixed-size index table cannot be satisfied by the node it is applied to
  class StructuralMismatch : public detail::Exception {
  public:
    std::string_view name() const noexcept override { return "tt::StructuralMismatch"; }
  };

  // Construct an exception of type E with source, message and optional
  // attached key/value lines, and throw it
  template <typename E>
  [[noreturn]] inline
  void throw_error(std::string_view src,
                   std::string_view msg,
                   std::initializer_list<std::pair<std::string_view, std::string>> attached = {}) {
    E e;
    e.put("src", src);
    e.put("message", msg);
    for (const auto &[key, value] : attached)
      e.put(key, value);
    throw e;
  }
} // namespace tt
