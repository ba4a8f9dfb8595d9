#include "internal/backup/set_algebra.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using backupmeta::backup::Difference;
using backupmeta::backup::Union;
using Tables = std::vector<std::string>;

void TestUnionKeepsExistingOrderAndAppendsNew() {
  assert((Union({"t1", "t2"}, {"t2", "t3"}) == Tables{"t1", "t2", "t3"}));
  assert((Union({}, {"b", "a"}) == Tables{"b", "a"}));
  assert((Union({"a"}, {}) == Tables{"a"}));
}

void TestUnionCollapsesDuplicates() {
  assert((Union({"a"}, {"b", "b", "a", "c", "b"}) == Tables{"a", "b", "c"}));
}

void TestUnionIsIdempotent() {
  const Tables existing = {"x", "y"};
  const Tables incoming = {"z", "x"};

  const auto once  = Union(existing, incoming);
  const auto twice = Union(once, incoming);
  assert(once == twice);
  assert(Union(once, once) == once);
}

void TestDifferencePreservesOrder() {
  assert((Difference({"t1", "t2", "t3"}, {"t2"}) == Tables{"t1", "t3"}));
  assert((Difference({"t3", "t1", "t2"}, {"t1", "missing"}) == Tables{"t3", "t2"}));
  assert(Difference({"t1"}, {"t1"}).empty());
  assert(Difference({}, {"t1"}).empty());
}

void TestDifferenceWithNothingToRemove() {
  const Tables existing = {"a", "b"};
  assert(Difference(existing, {}) == existing);
  assert(Difference(existing, {"c"}).size() == existing.size());
}

} // namespace

int main() {
  TestUnionKeepsExistingOrderAndAppendsNew();
  TestUnionCollapsesDuplicates();
  TestUnionIsIdempotent();
  TestDifferencePreservesOrder();
  TestDifferenceWithNothingToRemove();

  std::cout << "backupmeta_unit_set_algebra: pass\n";
  return 0;
}
