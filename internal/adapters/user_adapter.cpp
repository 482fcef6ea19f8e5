#include "internal/adapters/user_adapter.hpp"

#include "internal/adapters/common.hpp"

namespace aoef::adapters {

namespace {

UserKey KeyOf(const data::User& user) {
  return UserKey{user.uuid, user.username, user.email, user.name, user.institution};
}

template <typename Setter>
void SetIfPresent(const std::optional<std::string>& value, Setter setter) {
  if (value) setter(*value);
}

} // namespace

UserAdapter::UserAdapter()
    : DataAdapter(KeyOf, [](const data::User&, std::size_t seen) { return static_cast<std::uint32_t>(seen); },
                  [](const v1::UserRecord& record) { return record.id(); }) {
}

v1::UserRecord UserAdapter::AssembleExchange(const data::User& obj, const std::uint32_t& id) {
  v1::UserRecord record;
  record.set_id(id);
  record.set_uuid(util::ToString(obj.uuid));
  SetIfPresent(obj.username, [&](const std::string& v) { record.set_username(v); });
  SetIfPresent(obj.email, [&](const std::string& v) { record.set_email(v); });
  SetIfPresent(obj.name, [&](const std::string& v) { record.set_name(v); });
  SetIfPresent(obj.institution, [&](const std::string& v) { record.set_institution(v); });
  return record;
}

data::User UserAdapter::AssembleDomain(const v1::UserRecord& record) {
  data::User user;
  user.uuid = ParseUuid(record.uuid(), "user " + IdToString(record.id()));
  if (record.has_username()) user.username = record.username();
  if (record.has_email()) user.email = record.email();
  if (record.has_name()) user.name = record.name();
  if (record.has_institution()) user.institution = record.institution();
  return user;
}

} // namespace aoef::adapters
