#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "aoef/v1/records.pb.h"
#include "internal/adapters/data_adapter.hpp"
#include "internal/data/values.hpp"

namespace aoef::adapters {

using TagKey = std::pair<std::string, std::string>;

/*
  Tags are deduplicated on (key, value) and numbered 0, 1, 2, ... in the
  order they are first seen.
*/
class TagAdapter : public DataAdapter<data::Tag, v1::TagRecord, TagKey, std::uint32_t> {
 public:
  TagAdapter();

 protected:
  v1::TagRecord AssembleExchange(const data::Tag& obj, const std::uint32_t& id) override;
  data::Tag     AssembleDomain(const v1::TagRecord& record) override;
};

} // namespace aoef::adapters
