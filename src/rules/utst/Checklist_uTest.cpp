/**
 * @file Checklist_uTest.cpp
 * @brief Unit tests for kcheck::rules checklist construction and end-to-end
 *        evaluation of representative rules.
 */

#include "src/engine/inc/Evaluate.hpp"
#include "src/engine/inc/Populate.hpp"
#include "src/engine/inc/Refine.hpp"
#include "src/input/inc/Kconfig.hpp"
#include "src/rules/inc/Checklist.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <set>
#include <string>

using kcheck::engine::Check;
using kcheck::engine::Checklist;
using kcheck::engine::collectLeafNames;
using kcheck::engine::Comparison;
using kcheck::engine::DataSource;
using kcheck::engine::evaluate;
using kcheck::engine::LeafCheck;
using kcheck::engine::populate;
using kcheck::engine::primaryLeaf;
using kcheck::engine::refine;
using kcheck::engine::validate;
using kcheck::engine::Verdict;
using kcheck::input::Arch;
using kcheck::input::KernelVersion;
using kcheck::input::parseKconfigText;
using kcheck::input::ParsedOptions;
using kcheck::input::SUPPORTED_ARCHS;
using kcheck::rules::buildChecklist;
using kcheck::rules::RuleSelection;

namespace {

/// First top-level check whose primary leaf is @p name, or nullptr.
const Check* findCheck(const Checklist& list, const std::string& name) {
  for (const Check& C : list) {
    if (primaryLeaf(C).name == name) {
      return &C;
    }
  }
  return nullptr;
}

/// The result points into the list, so the list must outlive it.
const Check* findCheck(Checklist&& list, const std::string& name) = delete;

/// True if any leaf in the tree reads from @p source.
bool usesSource(const Check& check, DataSource source) {
  if (const auto* leaf = std::get_if<LeafCheck>(&check.node)) {
    return leaf->source == source;
  }
  const auto& KIDS = std::holds_alternative<kcheck::engine::CombinatorCheck>(check.node)
                         ? std::get<kcheck::engine::CombinatorCheck>(check.node).children
                         : std::get<kcheck::engine::VersionGatedCheck>(check.node).branches;
  for (const Check& KID : KIDS) {
    if (usesSource(KID, source)) {
      return true;
    }
  }
  return false;
}

} // namespace

/* ----------------------------- Structure Tests ----------------------------- */

/** @test Every architecture yields a well-formed, non-empty checklist. */
TEST(ChecklistTest, WellFormedForAllArchs) {
  for (const Arch A : SUPPORTED_ARCHS) {
    const Checklist LIST = buildChecklist(A, RuleSelection{true, true});
    std::string error;
    EXPECT_TRUE(validate(LIST, error)) << toString(A) << ": " << error;
    EXPECT_GT(LIST.size(), 50U) << toString(A);
  }
}

/** @test Kconfig rules never read the cmdline. */
TEST(ChecklistTest, KconfigRulesHaveNoCmdlineLeaves) {
  for (const Arch A : SUPPORTED_ARCHS) {
    const Checklist LIST = buildChecklist(A, RuleSelection{true, false});
    for (const Check& C : LIST) {
      EXPECT_FALSE(usesSource(C, DataSource::CMDLINE)) << primaryLeaf(C).name;
    }
  }
}

/** @test Cmdline rules are appended after the Kconfig rules. */
TEST(ChecklistTest, CmdlineSelectionAppends) {
  const Checklist KCONFIG_ONLY = buildChecklist(Arch::X86_64, RuleSelection{true, false});
  const Checklist BOTH = buildChecklist(Arch::X86_64, RuleSelection{true, true});
  ASSERT_GT(BOTH.size(), KCONFIG_ONLY.size());
  EXPECT_EQ(primaryLeaf(BOTH[KCONFIG_ONLY.size()]).source, DataSource::CMDLINE);

  const Checklist NONE = buildChecklist(Arch::X86_64, RuleSelection{false, false});
  EXPECT_TRUE(NONE.empty());
}

/** @test Architecture-specific rules follow the selected arch. */
TEST(ChecklistTest, ArchSpecificRules) {
  const Checklist X86 = buildChecklist(Arch::X86_64, RuleSelection{});
  const Checklist ARM64 = buildChecklist(Arch::ARM64, RuleSelection{});
  EXPECT_NE(findCheck(X86, "CONFIG_PAGE_TABLE_ISOLATION"), nullptr);
  EXPECT_EQ(findCheck(ARM64, "CONFIG_PAGE_TABLE_ISOLATION"), nullptr);
  EXPECT_NE(findCheck(ARM64, "CONFIG_ARM64_PAN"), nullptr);
  EXPECT_EQ(findCheck(X86, "CONFIG_ARM64_PAN"), nullptr);
}

/** @test Random mmap bits threshold depends on address width. */
TEST(ChecklistTest, MmapRndBitsThreshold) {
  const Checklist X86 = buildChecklist(Arch::X86_64, RuleSelection{});
  const Check* WIDE = findCheck(X86, "CONFIG_ARCH_MMAP_RND_BITS");
  ASSERT_NE(WIDE, nullptr);
  EXPECT_EQ(primaryLeaf(*WIDE).comparison, Comparison::AT_LEAST);
  EXPECT_EQ(primaryLeaf(*WIDE).expected, "32");

  const Checklist ARM = buildChecklist(Arch::ARM, RuleSelection{});
  const Check* NARROW = findCheck(ARM, "CONFIG_ARCH_MMAP_RND_BITS");
  ASSERT_NE(NARROW, nullptr);
  EXPECT_EQ(primaryLeaf(*NARROW).expected, "16");
}

/** @test Renamed options are reachable through both version branches. */
TEST(ChecklistTest, RenamedOptionsKnown) {
  const Checklist LIST = buildChecklist(Arch::X86_64, RuleSelection{});
  std::set<std::string, std::less<>> names;
  for (const Check& C : LIST) {
    collectLeafNames(C, names);
  }
  EXPECT_EQ(names.count("CONFIG_CC_STACKPROTECTOR_STRONG"), 1U);
  EXPECT_EQ(names.count("CONFIG_STACKPROTECTOR_STRONG"), 1U);
  EXPECT_EQ(names.count("CONFIG_GCC_PLUGIN_RANDSTRUCT"), 1U);
  EXPECT_EQ(names.count("CONFIG_RANDSTRUCT_FULL"), 1U);
}

/* ----------------------------- Scenario Tests ----------------------------- */

class ChecklistScenarioTest : public ::testing::Test {
protected:
  /// Parse, populate (kernel 6.1), refine and evaluate an X86_64 checklist.
  void run(const char* text) {
    std::string error;
    ASSERT_TRUE(parseKconfigText(text, kconfig_, error)) << error;
    list_ = buildChecklist(Arch::X86_64, RuleSelection{});
    populate(list_, kconfig_, DataSource::KCONFIG);
    populate(list_, KernelVersion{6, 1});
    (void)refine(list_, kconfig_);
    ASSERT_TRUE(evaluate(list_, error)) << error;
  }

  const Check& check(const std::string& name) const {
    const Check* c = findCheck(list_, name);
    EXPECT_NE(c, nullptr) << name;
    return *c;
  }

  ParsedOptions kconfig_;
  Checklist list_;
};

/** @test Enabled strong stack protector passes and cites the value. */
TEST_F(ChecklistScenarioTest, StackProtectorStrong) {
  run("CONFIG_X86_64=y\nCONFIG_STACKPROTECTOR_STRONG=y\n");
  const Check& C = check("CONFIG_STACKPROTECTOR_STRONG");
  ASSERT_TRUE(C.result.has_value());
  EXPECT_EQ(C.result->verdict, Verdict::OK);
  EXPECT_EQ(C.result->reason, "CONFIG_STACKPROTECTOR_STRONG is \"y\"");
}

/** @test A missing option yields UNKNOWN. */
TEST_F(ChecklistScenarioTest, MissingFreelistRandom) {
  run("CONFIG_X86_64=y\n");
  const Check& C = check("CONFIG_SLAB_FREELIST_RANDOM");
  ASSERT_TRUE(C.result.has_value());
  EXPECT_EQ(C.result->verdict, Verdict::UNKNOWN);
}

/** @test The companion maximum raises the mmap bits threshold. */
TEST_F(ChecklistScenarioTest, MmapRndBitsRefined) {
  run("CONFIG_X86_64=y\nCONFIG_ARCH_MMAP_RND_BITS=16\nCONFIG_ARCH_MMAP_RND_BITS_MAX=24\n");
  const Check& C = check("CONFIG_ARCH_MMAP_RND_BITS");
  EXPECT_EQ(primaryLeaf(C).expected, "24");
  EXPECT_EQ(C.result->verdict, Verdict::FAIL);
  EXPECT_EQ(C.result->reason, "CONFIG_ARCH_MMAP_RND_BITS is 16, expected >= 24");
}

/** @test Defaults enabled since a kernel version pass on newer kernels. */
TEST_F(ChecklistScenarioTest, VersionDefaults) {
  run("CONFIG_X86_64=y\n");
  const Check& C = check("CONFIG_REFCOUNT_FULL");
  EXPECT_EQ(C.result->verdict, Verdict::OK);
  EXPECT_EQ(C.result->reason, "kernel version 6.1 >= 5.5");
}

/** @test Disabled modules satisfy module signing rules. */
TEST_F(ChecklistScenarioTest, ModulesDisabled) {
  run("CONFIG_X86_64=y\n# CONFIG_MODULES is not set\n");
  EXPECT_EQ(check("CONFIG_MODULE_SIG").result->verdict, Verdict::OK);
  EXPECT_EQ(check("CONFIG_MODULES").result->verdict, Verdict::OK);
}
