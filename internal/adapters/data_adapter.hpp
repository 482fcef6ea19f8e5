#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <string>

#include "internal/adapters/identity_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace aoef::adapters {

/*
  Base for every entity adapter.

  The public conversions are fixed; subclasses only say how a single object
  is assembled in each direction, resolving references through the child
  adapters they were constructed with.
*/
template <typename Object, typename Record, typename Key, typename Id>
class DataAdapter {
 public:
  using Store = IdentityStore<Object, Record, Key, Id>;

  virtual ~DataAdapter() = default;

  DataAdapter(const DataAdapter&)            = delete;
  DataAdapter& operator=(const DataAdapter&) = delete;

  const Record& ToExchange(const Object& obj) {
    return store_.ToExchange(obj, [this](const Object& o, const Id& id) { return AssembleExchange(o, id); });
  }

  const Object& ToDomain(const Record& record) {
    return store_.ToDomain(record, [this](const Record& r) { return AssembleDomain(r); });
  }

  const Object* FromId(const Id& id) const {
    return store_.FromId(id);
  }

  bool HasRecord(const Id& id) const {
    return store_.HasRecord(id);
  }

  const std::deque<Record>& Values() const {
    return store_.Values();
  }

 protected:
  DataAdapter(typename Store::KeyFn key_fn, typename Store::NewIdFn new_id_fn,
              typename Store::RecordIdFn record_id_fn)
      : store_(std::move(key_fn), std::move(new_id_fn), std::move(record_id_fn)) {
  }

  virtual Record AssembleExchange(const Object& obj, const Id& id) = 0;
  virtual Object AssembleDomain(const Record& record)               = 0;

 private:
  Store store_;
};

/*
  Adapter for UUID-identified entities held by shared_ptr.

  Identity key and exchange id are both the entity's own UUID.
*/
template <typename T, typename Record>
class UuidAdapter : public DataAdapter<std::shared_ptr<const T>, Record, util::UUID, util::UUID> {
 public:
  using Ptr  = std::shared_ptr<const T>;
  using Base = DataAdapter<Ptr, Record, util::UUID, util::UUID>;

 protected:
  explicit UuidAdapter(std::string kind)
      : Base([kind](const Ptr& obj) { return KeyOf(obj, kind); },
             [](const Ptr& obj, std::size_t) { return obj->uuid; },
             [kind](const Record& record) {
               auto id = util::TryFromString(record.uuid());
               if (!id) {
                 throw util::MalformedDocumentError(kind + " record has invalid uuid '" + record.uuid() + "'");
               }
               return *id;
             }) {
  }

 private:
  static util::UUID KeyOf(const Ptr& obj, const std::string& kind) {
    if (!obj) {
      throw util::InvalidArgument("null " + kind + " reference in domain graph");
    }
    return obj->uuid;
  }
};

} // namespace aoef::adapters
