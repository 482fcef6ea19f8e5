#include "internal/adapters/tag_adapter.hpp"

namespace aoef::adapters {

TagAdapter::TagAdapter()
    : DataAdapter([](const data::Tag& tag) { return TagKey{tag.key, tag.value}; },
                  [](const data::Tag&, std::size_t seen) { return static_cast<std::uint32_t>(seen); },
                  [](const v1::TagRecord& record) { return record.id(); }) {
}

v1::TagRecord TagAdapter::AssembleExchange(const data::Tag& obj, const std::uint32_t& id) {
  v1::TagRecord record;
  record.set_id(id);
  record.set_key(obj.key);
  record.set_value(obj.value);
  return record;
}

data::Tag TagAdapter::AssembleDomain(const v1::TagRecord& record) {
  return data::Tag{record.key(), record.value()};
}

} // namespace aoef::adapters
