#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <utility>

namespace aoef::adapters {

/*
  Memoizing two-way map between domain objects and exchange records.

  Domain objects are keyed by a caller-supplied identity function (UUID for
  most entities, content for tags and users) and each distinct key is bound
  to exactly one exchange id. Records are kept in first-completed order: a
  record is appended once its assembly returns, so anything it references
  through the same store is listed before it.

  One store lives for exactly one save or load call.
*/
template <typename Object, typename Record, typename Key, typename Id>
class IdentityStore {
 public:
  using KeyFn            = std::function<Key(const Object&)>;
  using NewIdFn          = std::function<Id(const Object&, std::size_t seen)>;
  using RecordIdFn       = std::function<Id(const Record&)>;
  using AssembleRecordFn = std::function<Record(const Object&, const Id&)>;
  using AssembleObjectFn = std::function<Object(const Record&)>;

  IdentityStore(KeyFn key_fn, NewIdFn new_id_fn, RecordIdFn record_id_fn)
      : key_fn_(std::move(key_fn)), new_id_fn_(std::move(new_id_fn)), record_id_fn_(std::move(record_id_fn)) {
  }

  // ------------------------------------------------------------
  // Domain -> exchange
  // ------------------------------------------------------------

  const Record& ToExchange(const Object& obj, const AssembleRecordFn& assemble) {
    const Id id = IdFor(obj);

    if (auto it = record_index_.find(id); it != record_index_.end()) {
      return records_[it->second];
    }

    Record record = assemble(obj, id);

    // assembly may have recursed back into this store and finished the record
    if (auto it = record_index_.find(id); it != record_index_.end()) {
      return records_[it->second];
    }

    return Append(id, std::move(record));
  }

  // ------------------------------------------------------------
  // Exchange -> domain
  // ------------------------------------------------------------

  const Object& ToDomain(const Record& record, const AssembleObjectFn& assemble) {
    const Id id = record_id_fn_(record);

    if (auto it = objects_.find(id); it != objects_.end()) {
      return it->second;
    }

    auto [it, inserted] = objects_.emplace(id, assemble(record));
    ids_.try_emplace(key_fn_(it->second), id);

    if (!record_index_.count(id)) {
      Append(id, record);
    }

    return it->second;
  }

  // ------------------------------------------------------------
  // Lookup
  // ------------------------------------------------------------

  const Object* FromId(const Id& id) const {
    auto it = objects_.find(id);
    if (it == objects_.end()) return nullptr;
    return &it->second;
  }

  bool HasRecord(const Id& id) const {
    return record_index_.count(id) > 0;
  }

  const std::deque<Record>& Values() const {
    return records_;
  }

  std::size_t size() const {
    return ids_.size();
  }

 private:
  Id IdFor(const Object& obj) {
    const Key key = key_fn_(obj);

    auto it = ids_.find(key);
    if (it == ids_.end()) {
      it = ids_.emplace(key, new_id_fn_(obj, ids_.size())).first;
    }

    objects_.try_emplace(it->second, obj);
    return it->second;
  }

  const Record& Append(const Id& id, Record record) {
    records_.push_back(std::move(record));
    record_index_.emplace(id, records_.size() - 1);
    return records_.back();
  }

  KeyFn      key_fn_;
  NewIdFn    new_id_fn_;
  RecordIdFn record_id_fn_;

  std::map<Key, Id>         ids_;
  std::map<Id, Object>      objects_;
  std::map<Id, std::size_t> record_index_;
  std::deque<Record>        records_;  // stable references
};

} // namespace aoef::adapters
