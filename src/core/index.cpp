#include <tensortree/core/exception.hpp>
#include <tensortree/core/index.hpp>
#include <string>

namespace tt {
  TreeVariant variant_from_string(std::string_view str) {
    if (str == "4" || str == "TensorTree4")
      return TreeVariant::eAnisotropic;
    if (str == "3" || str == "TensorTree3")
      return TreeVariant::eIsotropic;
    throw_error<FormatError>("tt::variant_from_string", "unknown tensor tree data format", {
      { "format", std::string(str) } });
  }

  std::string_view to_string(TreeVariant variant) {
    return variant == TreeVariant::eAnisotropic ? "TensorTree4" : "TensorTree3";
  }
} // namespace tt
