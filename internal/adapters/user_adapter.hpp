#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

#include "aoef/v1/records.pb.h"
#include "internal/adapters/data_adapter.hpp"
#include "internal/data/values.hpp"

namespace aoef::adapters {

using UserKey = std::tuple<util::UUID, std::optional<std::string>, std::optional<std::string>,
                           std::optional<std::string>, std::optional<std::string>>;

// Users are deduplicated on their full content and referenced by small ints.
class UserAdapter : public DataAdapter<data::User, v1::UserRecord, UserKey, std::uint32_t> {
 public:
  UserAdapter();

 protected:
  v1::UserRecord AssembleExchange(const data::User& obj, const std::uint32_t& id) override;
  data::User     AssembleDomain(const v1::UserRecord& record) override;
};

} // namespace aoef::adapters
