/**
 * @file Populate_uTest.cpp
 * @brief Unit tests for kcheck::engine population and unknown-option listing.
 */

#include "src/engine/inc/Populate.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using kcheck::engine::Check;
using kcheck::engine::Checklist;
using kcheck::engine::collectUnknownOptions;
using kcheck::engine::Combinator;
using kcheck::engine::DataSource;
using kcheck::engine::LeafCheck;
using kcheck::engine::makeCombinator;
using kcheck::engine::makeLeaf;
using kcheck::engine::makeVersion;
using kcheck::engine::makeVersionGated;
using kcheck::engine::populate;
using kcheck::engine::Tag;
using kcheck::engine::VersionGatedCheck;
using kcheck::input::KernelVersion;
using kcheck::input::ParsedOptions;

class PopulateTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(kconfig_.insert("CONFIG_BUG", "y"));
    ASSERT_TRUE(kconfig_.insert("CONFIG_OLD", "is not set"));
    ASSERT_TRUE(kconfig_.insert("CONFIG_EXTRA", "m"));
    ASSERT_TRUE(cmdline_.insert("init_on_alloc", "1"));
    ASSERT_TRUE(cmdline_.insert("quiet", ""));

    const Tag T{"self_protection", "kspp"};
    list_.push_back(makeLeaf(DataSource::KCONFIG, T, "CONFIG_BUG", "y"));
    list_.push_back(makeLeaf(DataSource::CMDLINE, T, "init_on_alloc", "1"));

    std::vector<Check> kids;
    kids.push_back(makeVersionGated(KernelVersion{5, 0},
                                    makeLeaf(DataSource::KCONFIG, T, "CONFIG_OLD", "y"),
                                    makeLeaf(DataSource::KCONFIG, T, "CONFIG_NEW", "y")));
    kids.push_back(makeVersion(KernelVersion{5, 5}));
    list_.push_back(makeCombinator(Combinator::OR, std::move(kids)));
  }

  const LeafCheck& leafAt(std::size_t i) const { return std::get<LeafCheck>(list_[i].node); }

  const Check& orChild(std::size_t i) const {
    return std::get<kcheck::engine::CombinatorCheck>(list_[2].node).children[i];
  }

  const VersionGatedCheck& gate() const { return std::get<VersionGatedCheck>(orChild(0).node); }

  ParsedOptions kconfig_;
  ParsedOptions cmdline_;
  Checklist list_;
};

/** @test Only leaves of the matching source are populated. */
TEST_F(PopulateTest, SourceFiltering) {
  populate(list_, kconfig_, DataSource::KCONFIG);

  EXPECT_EQ(leafAt(0).found, std::optional<std::string>{"y"});
  EXPECT_FALSE(leafAt(1).found.has_value());

  populate(list_, cmdline_, DataSource::CMDLINE);
  EXPECT_EQ(leafAt(1).found, std::optional<std::string>{"1"});
}

/** @test Both version branches are populated. */
TEST_F(PopulateTest, BothBranches) {
  populate(list_, kconfig_, DataSource::KCONFIG);

  const auto& BEFORE = std::get<LeafCheck>(gate().branches[VersionGatedCheck::BEFORE].node);
  const auto& AFTER = std::get<LeafCheck>(gate().branches[VersionGatedCheck::AFTER].node);
  EXPECT_EQ(BEFORE.found, std::optional<std::string>{"is not set"});
  EXPECT_FALSE(AFTER.found.has_value());
}

/** @test Version reaches version leaves and version gates. */
TEST_F(PopulateTest, KernelVersion) {
  populate(list_, KernelVersion{6, 1});

  EXPECT_EQ(gate().kernelVersion, std::optional<KernelVersion>(KernelVersion{6, 1}));
  const auto& VLEAF = std::get<LeafCheck>(orChild(1).node);
  EXPECT_EQ(VLEAF.kernelVersion, std::optional<KernelVersion>(KernelVersion{6, 1}));
  EXPECT_FALSE(leafAt(0).kernelVersion.has_value());
}

/** @test Population produces no verdicts. */
TEST_F(PopulateTest, NoResults) {
  populate(list_, kconfig_, DataSource::KCONFIG);
  populate(list_, KernelVersion{6, 1});
  for (const Check& C : list_) {
    EXPECT_FALSE(C.result.has_value());
  }
}

/** @test Unknown options are those no leaf refers to, in parse order. */
TEST_F(PopulateTest, UnknownOptions) {
  const auto KUNKNOWN = collectUnknownOptions(list_, kconfig_);
  ASSERT_EQ(KUNKNOWN.size(), 1U);
  EXPECT_EQ(KUNKNOWN[0].name, "CONFIG_EXTRA");
  EXPECT_EQ(KUNKNOWN[0].value, "m");

  const auto CUNKNOWN = collectUnknownOptions(list_, cmdline_);
  ASSERT_EQ(CUNKNOWN.size(), 1U);
  EXPECT_EQ(CUNKNOWN[0].name, "quiet");
}
