#include <prsync/errors.hpp>
#include <prsync/process.hpp>
#include <prsync/types.hpp>

namespace prsync {

Identity parse_identity(const std::string &value, const std::string &param) {
  std::string v = trim(value);
  if (v.empty())
    throw ConfigurationError(param, "identity cannot be empty");

  auto lt = v.rfind('<');
  auto gt = v.rfind('>');
  if (lt == std::string::npos || gt == std::string::npos || gt < lt ||
      gt != v.size() - 1)
    throw ConfigurationError(
        param, "expected 'Display Name <email@address.com>', got '" + v + "'");

  Identity id{trim(v.substr(0, lt)), trim(v.substr(lt + 1, gt - lt - 1))};
  if (!id.complete())
    throw ConfigurationError(param, "name and email are both required: '" +
                                        v + "'");
  return id;
}

const char *to_string(SyncAction a) {
  switch (a) {
  case SyncAction::Created:
    return "created";
  case SyncAction::Updated:
    return "updated";
  case SyncAction::NotUpdated:
    return "not-updated";
  case SyncAction::Closed:
    return "closed";
  }
  return "unknown";
}

} // namespace prsync
