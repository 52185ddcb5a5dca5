#include <cassert>
#include <iostream>
#include <string>

#include "internal/observability/logging.hpp"

namespace {

using sealer::observability::BoolField;
using sealer::observability::FormatLine;
using sealer::observability::IntField;
using sealer::observability::StringField;

void TestFieldsFollowTheMessage() {
  assert(FormatLine("bundle sealed", {}) == "bundle sealed");
  assert(FormatLine("bundle sealed", {StringField("tenant_id", "acme"), IntField("chain_seq", 3), BoolField("include_archive", true)}) ==
         "bundle sealed tenant_id=acme chain_seq=3 include_archive=true");
  assert(FormatLine("x", {BoolField("chain_checked", false)}) == "x chain_checked=false");
}

void TestAwkwardValuesAreQuoted() {
  assert(FormatLine("m", {StringField("error", "connection refused")}) == R"(m error="connection refused")");
  assert(FormatLine("m", {StringField("detail", "a=b")}) == R"(m detail="a=b")");
  assert(FormatLine("m", {StringField("detail", R"(say "hi")")}) == R"(m detail="say \"hi\"")");
  assert(FormatLine("m", {StringField("empty", "")}) == R"(m empty="")");
}

} // namespace

int main() {
  TestFieldsFollowTheMessage();
  TestAwkwardValuesAreQuoted();

  std::cout << "export_sealer_unit_logging: pass\n";
  return 0;
}
