/**
 * @file Check_uTest.cpp
 * @brief Unit tests for kcheck::engine check model construction and queries.
 */

#include "src/engine/inc/Check.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <utility>
#include <vector>

using kcheck::engine::Check;
using kcheck::engine::Checklist;
using kcheck::engine::clearResults;
using kcheck::engine::collectLeafNames;
using kcheck::engine::Combinator;
using kcheck::engine::Comparison;
using kcheck::engine::DataSource;
using kcheck::engine::EvaluationResult;
using kcheck::engine::LeafCheck;
using kcheck::engine::makeCombinator;
using kcheck::engine::makeLeaf;
using kcheck::engine::makeThreshold;
using kcheck::engine::makeVersion;
using kcheck::engine::makeVersionGated;
using kcheck::engine::primaryLeaf;
using kcheck::engine::Tag;
using kcheck::engine::validate;
using kcheck::engine::Verdict;
using kcheck::engine::VersionGatedCheck;
using kcheck::input::KernelVersion;

namespace {

const Tag KSPP{"self_protection", "kspp"};

} // namespace

/* ----------------------------- Enum Tests ----------------------------- */

/** @test Enum string tokens match report output. */
TEST(CheckEnumTest, ToStringTokens) {
  EXPECT_STREQ(toString(DataSource::KCONFIG), "kconfig");
  EXPECT_STREQ(toString(DataSource::CMDLINE), "cmdline");
  EXPECT_STREQ(toString(DataSource::VERSION), "version");
  EXPECT_STREQ(toString(Verdict::OK), "OK");
  EXPECT_STREQ(toString(Verdict::FAIL), "FAIL");
  EXPECT_STREQ(toString(Verdict::UNKNOWN), "UNKNOWN");
  EXPECT_STREQ(toString(Combinator::AND), "AND");
  EXPECT_STREQ(toString(Combinator::OR), "OR");
}

/** @test EvaluationResult renders as "VERDICT: reason". */
TEST(CheckEnumTest, ResultToString) {
  const EvaluationResult R{Verdict::FAIL, "CONFIG_BUG is not found", std::nullopt};
  EXPECT_EQ(R.toString(), "FAIL: CONFIG_BUG is not found");
}

/* ----------------------------- Factory Tests ----------------------------- */

/** @test Expected-value tokens select the comparison mode. */
TEST(CheckFactoryTest, LeafTokensSelectComparison) {
  const Check EQ = makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_BUG", "y");
  const Check OFF = makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_KEXEC", "is not set");
  const Check ON = makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_LSM", "is not off");
  const Check HAS = makeLeaf(DataSource::CMDLINE, KSPP, "debugfs", "is present");

  EXPECT_EQ(std::get<LeafCheck>(EQ.node).comparison, Comparison::EQUALS);
  EXPECT_EQ(std::get<LeafCheck>(EQ.node).expected, "y");
  EXPECT_EQ(std::get<LeafCheck>(OFF.node).comparison, Comparison::NOT_SET);
  EXPECT_EQ(std::get<LeafCheck>(ON.node).comparison, Comparison::NOT_OFF);
  EXPECT_EQ(std::get<LeafCheck>(HAS.node).comparison, Comparison::PRESENT);
  EXPECT_EQ(std::get<LeafCheck>(HAS.node).source, DataSource::CMDLINE);
  EXPECT_FALSE(EQ.result.has_value());
}

/** @test expectedText reproduces the report's desired value column. */
TEST(CheckFactoryTest, ExpectedText) {
  EXPECT_EQ(std::get<LeafCheck>(makeLeaf(DataSource::KCONFIG, KSPP, "A", "y").node).expectedText(),
            "y");
  EXPECT_EQ(std::get<LeafCheck>(makeLeaf(DataSource::KCONFIG, KSPP, "A", "is not set").node)
                .expectedText(),
            "is not set");
  EXPECT_EQ(std::get<LeafCheck>(makeThreshold(DataSource::KCONFIG, KSPP, "A",
                                              Comparison::AT_LEAST, "32")
                                    .node)
                .expectedText(),
            ">= 32");
  EXPECT_EQ(std::get<LeafCheck>(makeVersion(KernelVersion{5, 9}).node).expectedText(), ">= 5.9");
}

/** @test Version leaf carries the threshold text. */
TEST(CheckFactoryTest, VersionLeaf) {
  const Check V = makeVersion(KernelVersion{4, 18});
  const auto& LEAF = std::get<LeafCheck>(V.node);
  EXPECT_EQ(LEAF.name, "kernel version");
  EXPECT_EQ(LEAF.source, DataSource::VERSION);
  EXPECT_EQ(LEAF.expected, "4.18");
}

/* ----------------------------- Query Tests ----------------------------- */

/** @test Primary leaf follows the first child and the AFTER branch. */
TEST(CheckQueryTest, PrimaryLeaf) {
  Check gated = makeVersionGated(KernelVersion{4, 18},
                                 makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_OLD", "y"),
                                 makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_NEW", "y"));
  Check comb = makeCombinator(Combinator::OR, {});
  std::get<kcheck::engine::CombinatorCheck>(comb.node).children.push_back(std::move(gated));
  std::get<kcheck::engine::CombinatorCheck>(comb.node)
      .children.push_back(makeVersion(KernelVersion{5, 0}));

  EXPECT_EQ(primaryLeaf(comb).name, "CONFIG_NEW");
}

/** @test Leaf names include both version branches and skip version leaves. */
TEST(CheckQueryTest, CollectLeafNames) {
  std::vector<Check> kids;
  kids.push_back(makeVersionGated(KernelVersion{4, 18},
                                  makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_OLD", "y"),
                                  makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_NEW", "y")));
  kids.push_back(makeVersion(KernelVersion{5, 0}));
  const Check C = makeCombinator(Combinator::OR, std::move(kids));

  std::set<std::string, std::less<>> names;
  collectLeafNames(C, names);
  EXPECT_EQ(names.size(), 2U);
  EXPECT_EQ(names.count("CONFIG_OLD"), 1U);
  EXPECT_EQ(names.count("CONFIG_NEW"), 1U);
}

/** @test Empty combinators are rejected. */
TEST(CheckQueryTest, ValidateRejectsEmptyCombinator) {
  Checklist list;
  list.push_back(makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_BUG", "y"));
  list.push_back(makeCombinator(Combinator::AND, {}));

  std::string error;
  EXPECT_FALSE(validate(list, error));
  EXPECT_NE(error.find("AND check without children"), std::string::npos);
}

/** @test A version leaf cannot be the primary leaf. */
TEST(CheckQueryTest, ValidateRejectsVersionPrimary) {
  std::vector<Check> kids;
  kids.push_back(makeVersion(KernelVersion{5, 0}));
  kids.push_back(makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_BUG", "y"));
  Checklist list;
  list.push_back(makeCombinator(Combinator::OR, std::move(kids)));

  std::string error;
  EXPECT_FALSE(validate(list, error));
  EXPECT_FALSE(error.empty());
}

/** @test Well-formed checklists pass validation. */
TEST(CheckQueryTest, ValidateAcceptsWellFormed) {
  std::vector<Check> kids;
  kids.push_back(makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_REFCOUNT_FULL", "y"));
  kids.push_back(makeVersion(KernelVersion{5, 5}));
  Checklist list;
  list.push_back(makeCombinator(Combinator::OR, std::move(kids)));

  std::string error;
  EXPECT_TRUE(validate(list, error)) << error;
}

/** @test Version leaves may appear at any depth below a top-level check. */
TEST(CheckQueryTest, ValidateAcceptsNestedVersionLeaves) {
  std::vector<Check> alternatives;
  alternatives.push_back(makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_X86_SMAP", "y"));
  alternatives.push_back(makeVersion(KernelVersion{5, 19}));
  std::vector<Check> all;
  all.push_back(makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_X86_64", "y"));
  all.push_back(makeCombinator(Combinator::OR, std::move(alternatives)));

  std::vector<Check> newer;
  newer.push_back(makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_REFCOUNT_FULL", "y"));
  newer.push_back(makeVersion(KernelVersion{5, 5}));

  Checklist list;
  list.push_back(makeCombinator(Combinator::AND, std::move(all)));
  list.push_back(makeVersionGated(KernelVersion{5, 0},
                                  makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_REFCOUNT_FULL", "y"),
                                  makeCombinator(Combinator::OR, std::move(newer))));

  std::string error;
  EXPECT_TRUE(validate(list, error)) << error;
}

/** @test A bare version leaf is not a check. */
TEST(CheckQueryTest, ValidateRejectsTopLevelVersionLeaf) {
  Checklist list;
  list.push_back(makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_BUG", "y"));
  list.push_back(makeVersion(KernelVersion{5, 5}));

  std::string error;
  EXPECT_FALSE(validate(list, error));
  EXPECT_EQ(error, "malformed check kernel version: a check can't be about the kernel version alone");
}

/** @test clearResults drops results on every node. */
TEST(CheckQueryTest, ClearResults) {
  std::vector<Check> kids;
  kids.push_back(makeLeaf(DataSource::KCONFIG, KSPP, "CONFIG_A", "y"));
  Check c = makeCombinator(Combinator::AND, std::move(kids));
  c.result = EvaluationResult{Verdict::OK, "x", std::nullopt};
  std::get<kcheck::engine::CombinatorCheck>(c.node).children[0].result = c.result;

  clearResults(c);
  EXPECT_FALSE(c.result.has_value());
  EXPECT_FALSE(std::get<kcheck::engine::CombinatorCheck>(c.node).children[0].result.has_value());
}
