//
// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//


#include "gqlengine/execution/collect_fields.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "gqlengine/base/status_macros.h"
#include "gqlengine/base/testing/status_matchers.h"
#include "gqlengine/execution/build_field_plan.h"
#include "gqlengine/language/ast.h"
#include "gqlengine/language/parser.h"
#include "gqlengine/public/resolve_info.h"
#include "gqlengine/public/value.h"
#include "gqlengine/testing/test_schemas.h"

namespace gqlengine {
namespace {

using ::gqlengine::testing::MakeHeroSchema;
using ::gqlengine::testing::TestSchema;
using ::gqlengine_base::testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::SizeIs;

std::vector<std::string> Keys(const ResponseKeyMap<FieldDetailsList>& fields) {
  std::vector<std::string> keys;
  for (const auto& [key, details] : fields) keys.push_back(key);
  return keys;
}

std::vector<std::string> Keys(const GroupedFieldSet& fields) {
  std::vector<std::string> keys;
  for (const auto& [key, group] : fields) keys.push_back(key);
  return keys;
}

class CollectFieldsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    GQLENGINE_ASSERT_OK_AND_ASSIGN(
        hero_, MakeHeroSchema({.enable_defer_stream = true}));
  }

  absl::StatusOr<CollectedFields> Collect(absl::string_view query) {
    GQLENGINE_ASSIGN_OR_RETURN(parsed_, Parse(query));
    const OperationDefinitionNode* operation = nullptr;
    fragments_.clear();
    for (const DefinitionNode* definition : parsed_->document()->definitions()) {
      if (const auto* fragment =
              definition->GetAsOrNull<FragmentDefinitionNode>()) {
        fragments_[fragment->name()] = fragment;
      } else if (operation == nullptr) {
        operation = definition->GetAsOrNull<OperationDefinitionNode>();
      }
    }
    operation_ = operation;
    return CollectFields(*hero_.schema, fragments_, variables_,
                         hero_.schema->GetRootType(operation->operation()),
                         *operation);
  }

  TestSchema hero_;
  VariableValues variables_;
  FragmentMap fragments_;
  std::unique_ptr<ParserOutput> parsed_;
  const OperationDefinitionNode* operation_ = nullptr;
};

TEST_F(CollectFieldsTest, GroupsFieldsByResponseKey) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      CollectedFields collected,
      Collect("{ hero { id } ...F list: scalarList hero { name } } "
              "fragment F on Query { scalarList }"));
  EXPECT_THAT(Keys(collected.fields), ElementsAre("hero", "scalarList",
                                                  "list"));
  EXPECT_THAT(*collected.fields.Find("hero"), SizeIs(2));
  EXPECT_TRUE(collected.new_defer_usages.empty());
}

TEST_F(CollectFieldsTest, HonorsSkipAndInclude) {
  variables_["skip"] = Value::Bool(true);
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      CollectedFields collected,
      Collect("query ($skip: Boolean) { hero @skip(if: $skip) { id } "
              "a: scalarList @include(if: false) "
              "b: scalarList @skip(if: false) @include(if: true) "
              "c: scalarList @skip(if: true) @include(if: true) }"));
  EXPECT_THAT(Keys(collected.fields), ElementsAre("b"));
}

TEST_F(CollectFieldsTest, SkipsFragmentsForOtherTypes) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      CollectedFields collected,
      Collect("{ ... on Hero { id } ... on Query { scalarList } "
              "...Unknown }"));
  EXPECT_THAT(Keys(collected.fields), ElementsAre("scalarList"));
}

TEST_F(CollectFieldsTest, VisitsFragmentSpreadOnce) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      CollectedFields collected,
      Collect("{ ...F ...F } fragment F on Query { scalarList }"));
  EXPECT_THAT(*collected.fields.Find("scalarList"), SizeIs(1));
}

TEST_F(CollectFieldsTest, RecordsNestedDeferUsages) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      CollectedFields collected,
      Collect(R"({ ... @defer(label: "outer") { hero { id } )"
              R"(... @defer { scalarList } } })"));
  ASSERT_THAT(collected.new_defer_usages, SizeIs(2));
  const DeferUsagePtr& outer = collected.new_defer_usages[0];
  const DeferUsagePtr& inner = collected.new_defer_usages[1];
  EXPECT_EQ(outer->label(), "outer");
  EXPECT_EQ(inner->label(), std::nullopt);
  EXPECT_EQ(inner->parent(), outer);
  EXPECT_THAT(inner->Ancestors(), ElementsAre(outer.get()));

  EXPECT_EQ((*collected.fields.Find("hero"))[0].defer_usage, outer);
  EXPECT_EQ((*collected.fields.Find("scalarList"))[0].defer_usage, inner);
}

TEST_F(CollectFieldsTest, DisabledDeferIsIgnored) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      CollectedFields collected,
      Collect("{ ... @defer(if: false) { scalarList } }"));
  EXPECT_TRUE(collected.new_defer_usages.empty());
  EXPECT_EQ((*collected.fields.Find("scalarList"))[0].defer_usage, nullptr);
}

TEST_F(CollectFieldsTest, CollectsSubfieldsOfAFieldGroup) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      CollectedFields collected,
      Collect("{ hero { id } hero { name ... @defer { friends { id } } } }"));
  const FieldDetailsList& hero = *collected.fields.Find("hero");
  const ObjectType* hero_type =
      hero_.schema->GetType("Hero")->AsObject();
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      CollectedFields subfields,
      CollectSubfields(*hero_.schema, fragments_, variables_, *operation_,
                       hero_type, hero));
  EXPECT_THAT(Keys(subfields.fields), ElementsAre("id", "name", "friends"));
  EXPECT_THAT(subfields.new_defer_usages, SizeIs(1));
}

TEST_F(CollectFieldsTest, RejectsDeferInSubscription) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(TestSchema hero,
                                 MakeHeroSchema({.enable_defer_stream = true}));
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      std::unique_ptr<ParserOutput> parsed,
      Parse("subscription { ... @defer { hero { id } } }"));
  const auto* operation = parsed->document()
                              ->definitions()[0]
                              ->GetAsOrDie<OperationDefinitionNode>();
  EXPECT_THAT(
      CollectFields(*hero.schema, fragments_, variables_,
                    hero.schema->GetRootType(OperationType::kQuery),
                    *operation),
      StatusIs(absl::StatusCode::kInvalidArgument,
               HasSubstr("`@defer` directive not supported on subscription "
                         "operations.")));
}

TEST_F(CollectFieldsTest, PlanKeepsFieldsThatAreAlsoNotDeferred) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      CollectedFields collected,
      Collect("{ scalarList ... @defer { scalarList hero { id } } }"));
  FieldPlan plan = BuildFieldPlan(collected.fields, DeferUsageSet());
  EXPECT_THAT(Keys(plan.grouped_field_set), ElementsAre("scalarList"));
  ASSERT_THAT(plan.new_grouped_field_sets, SizeIs(1));
  const NewGroupedFieldSet& deferred = plan.new_grouped_field_sets[0];
  EXPECT_THAT(Keys(deferred.grouped_field_set), ElementsAre("hero"));
  EXPECT_TRUE(deferred.should_initiate_defer);
  EXPECT_TRUE(deferred.defer_usages.contains(
      collected.new_defer_usages[0].get()));
}

TEST_F(CollectFieldsTest, PlanDeliversNestedDuplicatesWithOuterFragment) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      CollectedFields collected,
      Collect("{ ... @defer { scalarList ... @defer { scalarList "
              "hero { id } } } }"));
  ASSERT_THAT(collected.new_defer_usages, SizeIs(2));
  const DeferUsage* outer = collected.new_defer_usages[0].get();
  const DeferUsage* inner = collected.new_defer_usages[1].get();

  FieldPlan plan = BuildFieldPlan(collected.fields, DeferUsageSet());
  EXPECT_TRUE(plan.grouped_field_set.empty());
  ASSERT_THAT(plan.new_grouped_field_sets, SizeIs(2));
  EXPECT_THAT(Keys(plan.new_grouped_field_sets[0].grouped_field_set),
              ElementsAre("scalarList"));
  EXPECT_TRUE(plan.new_grouped_field_sets[0].defer_usages.contains(outer));
  EXPECT_EQ(plan.new_grouped_field_sets[0].defer_usages.size(), 1u);
  EXPECT_THAT(Keys(plan.new_grouped_field_sets[1].grouped_field_set),
              ElementsAre("hero"));
  EXPECT_TRUE(plan.new_grouped_field_sets[1].defer_usages.contains(inner));
}

TEST_F(CollectFieldsTest, PlanDoesNotReinitiateParentDefer) {
  GQLENGINE_ASSERT_OK_AND_ASSIGN(
      CollectedFields collected,
      Collect("{ ... @defer { scalarList } }"));
  DeferUsageSet parent;
  parent.insert(collected.new_defer_usages[0]);
  FieldPlan plan = BuildFieldPlan(collected.fields, parent);
  EXPECT_THAT(Keys(plan.grouped_field_set), ElementsAre("scalarList"));
  EXPECT_TRUE(plan.new_grouped_field_sets.empty());
}

}  // namespace
}  // namespace gqlengine
