#include "internal/adapters/identity_store.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <string>

namespace {

struct Word {
  std::string text;
  std::string lang;
};

struct WordRecord {
  int         id = 0;
  std::string text;
};

using Store = aoef::adapters::IdentityStore<Word, WordRecord, std::string, int>;

Store MakeStore() {
  return Store([](const Word& w) { return w.text; }, [](const Word&, std::size_t seen) { return static_cast<int>(seen); },
               [](const WordRecord& r) { return r.id; });
}

WordRecord Assemble(const Word& w, const int& id) {
  return WordRecord{id, w.text};
}

void TestEqualKeysShareOneRecord() {
  auto store = MakeStore();
  int  calls = 0;

  auto assemble = [&](const Word& w, const int& id) {
    ++calls;
    return Assemble(w, id);
  };

  const auto& a = store.ToExchange(Word{"bark", "en"}, assemble);
  const auto& b = store.ToExchange(Word{"bark", "de"}, assemble);
  const auto& c = store.ToExchange(Word{"howl", "en"}, assemble);

  assert(a.id == 0);
  assert(b.id == 0);
  assert(c.id == 1);
  assert(calls == 2);
  assert(store.Values().size() == 2);
  assert(store.size() == 2);
}

void TestValuesInFirstCompletedOrder() {
  auto store = MakeStore();

  // Assembling "outer" pulls "inner" through the same store first.
  std::function<WordRecord(const Word&, const int&)> assemble = [&](const Word& w, const int& id) {
    if (w.text == "outer") {
      store.ToExchange(Word{"inner", ""}, assemble);
    }
    return Assemble(w, id);
  };

  store.ToExchange(Word{"outer", ""}, assemble);

  const auto& values = store.Values();
  assert(values.size() == 2);
  assert(values[0].text == "inner");
  assert(values[1].text == "outer");
  // ids follow first sight, order follows completion
  assert(values[0].id == 1);
  assert(values[1].id == 0);
}

void TestRecordReferencesStayValid() {
  auto        store = MakeStore();
  const auto& first = store.ToExchange(Word{"w0", ""}, Assemble);
  for (int i = 1; i < 1000; ++i) {
    store.ToExchange(Word{"w" + std::to_string(i), ""}, Assemble);
  }
  assert(first.text == "w0");
  assert(&first == &store.Values().front());
}

void TestToDomainMemoizesById() {
  auto store = MakeStore();
  int  calls = 0;

  auto assemble = [&](const WordRecord& r) {
    ++calls;
    return Word{r.text, "en"};
  };

  const auto& a = store.ToDomain(WordRecord{7, "bark"}, assemble);
  const auto& b = store.ToDomain(WordRecord{7, "bark"}, assemble);

  assert(&a == &b);
  assert(calls == 1);
  assert(store.FromId(7) == &a);
  assert(store.FromId(8) == nullptr);
  assert(store.HasRecord(7));
  assert(store.Values().size() == 1);
}

void TestExportRegistersObjectForLookup() {
  auto store = MakeStore();
  store.ToExchange(Word{"bark", "en"}, Assemble);
  const auto* found = store.FromId(0);
  assert(found != nullptr);
  assert(found->lang == "en");
}

} // namespace

int main() {
  TestEqualKeysShareOneRecord();
  TestValuesInFirstCompletedOrder();
  TestRecordReferencesStayValid();
  TestToDomainMemoizesById();
  TestExportRegistersObjectForLookup();

  std::cout << "aoef_unit_identity_store: pass\n";
  return 0;
}
