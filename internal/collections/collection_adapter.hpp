#pragma once

#include <memory>

#include "aoef/v1/document.pb.h"
#include "internal/collections/collection_kind.hpp"
#include "internal/data/collections.hpp"
#include "internal/factory.hpp"

namespace aoef::collections {

// Groups of record lists a collection kind carries in its document.
enum RecordLists : unsigned {
  kRecordingLists  = 1u << 0,  // users, tags, recordings
  kEntityLists     = 1u << 1,  // clips, sound events, sequences
  kAnnotationLists = 1u << 2,
  kPredictionLists = 1u << 3,
  kTaskList        = 1u << 4,
  kEvaluationLists = 1u << 5,  // matches, clip evaluations
};

/*
  CollectionAdapter

  Converts one collection kind. Every Export or Import call starts from a
  fresh adapter tree, so ids and identity maps never carry over between
  calls on the same instance.
*/
class CollectionAdapter {
 public:
  virtual ~CollectionAdapter() = default;

  CollectionAdapter(const CollectionAdapter&)            = delete;
  CollectionAdapter& operator=(const CollectionAdapter&) = delete;

  CollectionKind Kind() const {
    return kind_;
  }

  // Throws UnsupportedTypeError when `obj` is not of this adapter's kind.
  v1::CollectionRecord Export(const data::Collection& obj);

  std::shared_ptr<data::Collection> Import(const v1::CollectionRecord& record);

 protected:
  CollectionAdapter(CollectionKind kind, unsigned lists, const factory::AdapterOptions& options);

  // Register the root's reachable objects and fill the kind's own fields.
  virtual void ExportRoot(const data::Collection& obj, v1::CollectionRecord* record) = 0;

  // Build the root once every record list has been hydrated.
  virtual std::shared_ptr<data::Collection> ImportRoot(const v1::CollectionRecord& record) = 0;

  factory::AdapterTree& tree() {
    return *tree_;
  }

 private:
  void EmitLists(v1::CollectionRecord* record) const;
  void HydrateLists(const v1::CollectionRecord& record);

  CollectionKind                        kind_;
  unsigned                              lists_;
  factory::AdapterOptions               options_;
  std::unique_ptr<factory::AdapterTree> tree_;
};

std::unique_ptr<CollectionAdapter> MakeCollectionAdapter(CollectionKind                 kind,
                                                         const factory::AdapterOptions& options = {});

} // namespace aoef::collections
