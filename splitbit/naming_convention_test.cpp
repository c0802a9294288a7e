#include "naming_convention.hpp"

#include "bee/testing.hpp"

#include <cassert>

using bee::print_line;

namespace splitbit {
namespace {

TEST(default_names)
{
  auto naming = NamingConvention::default_convention();
  print_line(naming->feature_flag_name_for("ICheckout"));
  print_line(naming->variant_flag_name_for("ICheckout"));
  print_line(naming->configuration_key_for("ICheckout"));

  assert(naming->feature_flag_name_for("ICheckout") == "ICheckout");
  assert(naming->configuration_key_for("ICheckout") == "Experiments:ICheckout");
}

TEST(kebab_case)
{
  auto run = [](const std::string& name) {
    print_line("$ -> $", name, NamingConvention::to_kebab_case(name));
  };
  run("IMyService");
  run("PaymentProcessor");
  run("Iterator");
  run("I");
  run("");

  assert(NamingConvention::to_kebab_case("IMyService") == "my-service");
  assert(NamingConvention::to_kebab_case("Iterator") == "iterator");
}

} // namespace
} // namespace splitbit
