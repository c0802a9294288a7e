#include "naming_convention.hpp"

#include <cctype>

using std::string;

namespace splitbit {
namespace {

struct DefaultNamingConvention : public NamingConvention {
 public:
  virtual ~DefaultNamingConvention() {}

  virtual string feature_flag_name_for(
    const string& service_name) const override
  {
    return service_name;
  }

  virtual string variant_flag_name_for(
    const string& service_name) const override
  {
    return service_name;
  }

  virtual string configuration_key_for(
    const string& service_name) const override
  {
    return "Experiments:" + service_name;
  }
};

} // namespace

NamingConvention::~NamingConvention() {}

string NamingConvention::to_kebab_case(const string& service_name)
{
  string name = service_name;
  if (
    name.size() > 1 && name[0] == 'I' &&
    std::isupper(static_cast<unsigned char>(name[1]))) {
    name = name.substr(1);
  }

  string out;
  for (char c : name) {
    if (std::isupper(static_cast<unsigned char>(c))) {
      if (!out.empty()) { out += '-'; }
      out += char(std::tolower(static_cast<unsigned char>(c)));
    } else {
      out += c;
    }
  }
  return out;
}

NamingConvention::ptr NamingConvention::default_convention()
{
  return std::make_shared<DefaultNamingConvention>();
}

} // namespace splitbit
