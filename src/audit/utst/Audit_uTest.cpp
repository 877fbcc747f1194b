/**
 * @file Audit_uTest.cpp
 * @brief Unit tests for kcheck::audit command resolution and the check pipeline.
 *
 * Notes:
 *  - Pipeline tests run the same sequence the CLI runs, on the full rule
 *    database, so a malformed rule table fails here.
 *  - File tests write fixtures under ::testing::TempDir().
 */

#include "src/audit/inc/Audit.hpp"
#include "src/engine/inc/Populate.hpp"
#include "src/input/inc/Cmdline.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

using kcheck::audit::Action;
using kcheck::audit::Audit;
using kcheck::audit::auditFiles;
using kcheck::audit::Flags;
using kcheck::audit::recommendations;
using kcheck::audit::Request;
using kcheck::audit::resolveRequest;
using kcheck::audit::runAudit;
using kcheck::engine::Check;
using kcheck::engine::Checklist;
using kcheck::engine::collectUnknownOptions;
using kcheck::engine::DataSource;
using kcheck::engine::primaryLeaf;
using kcheck::engine::Verdict;
using kcheck::input::Arch;
using kcheck::input::Compiler;
using kcheck::input::KernelVersion;
using kcheck::input::ParsedOptions;
using kcheck::report::Mode;

namespace {

constexpr const char* CONFIG = "#\n"
                               "# Automatically generated file; DO NOT EDIT.\n"
                               "# Linux/x86 6.1.0 Kernel Configuration\n"
                               "#\n"
                               "CONFIG_CC_VERSION_TEXT=\"gcc (GCC) 12.2.0\"\n"
                               "CONFIG_CC_IS_GCC=y\n"
                               "CONFIG_GCC_VERSION=120200\n"
                               "CONFIG_CLANG_VERSION=0\n"
                               "CONFIG_X86_64=y\n"
                               "CONFIG_STACKPROTECTOR_STRONG=y\n"
                               "CONFIG_ARCH_MMAP_RND_BITS=28\n"
                               "CONFIG_ARCH_MMAP_RND_BITS_MAX=32\n"
                               "CONFIG_INIT_ON_ALLOC_DEFAULT_ON=y\n"
                               "# CONFIG_DEVMEM is not set\n"
                               "CONFIG_VENDOR_WIDGET=m\n";

constexpr const char* CMDLINE = "root=/dev/sda1 ro nosmt mitigations=auto,nosmt\n";

std::string tempPath(const char* name) { return ::testing::TempDir() + name; }

void writeFile(const std::string& path, const char* text) {
  std::FILE* f = std::fopen(path.c_str(), "w");
  ASSERT_NE(f, nullptr);
  std::fputs(text, f);
  std::fclose(f);
}

/// First top-level check whose primary leaf is @p name, or nullptr.
const Check* findCheck(const Checklist& list, const std::string& name) {
  for (const Check& C : list) {
    if (primaryLeaf(C).name == name) {
      return &C;
    }
  }
  return nullptr;
}

ParsedOptions parseCmdline(const char* text) {
  ParsedOptions out;
  std::string error;
  EXPECT_TRUE(kcheck::input::parseCmdlineText(text, "cmdline", out, error)) << error;
  return out;
}

} // namespace

/* ----------------------------- Request Tests ----------------------------- */

/** @test Each action is selected by its flag. */
TEST(AuditRequestTest, Actions) {
  Request req;
  std::string error;

  Flags check;
  check.config = "/boot/config";
  check.cmdline = "/proc/cmdline";
  check.mode = "verbose";
  ASSERT_TRUE(resolveRequest(check, req, error)) << error;
  EXPECT_EQ(req.action, Action::CHECK);
  EXPECT_EQ(req.configPath, "/boot/config");
  EXPECT_EQ(req.cmdlinePath, std::optional<std::string_view>{"/proc/cmdline"});
  EXPECT_EQ(req.mode, Mode::VERBOSE);
  EXPECT_TRUE(req.modeGiven);

  Flags print;
  print.print = "ARM64";
  print.mode = "json";
  ASSERT_TRUE(resolveRequest(print, req, error)) << error;
  EXPECT_EQ(req.action, Action::PRINT);
  EXPECT_EQ(req.arch, Arch::ARM64);

  Flags generate;
  generate.generate = "X86_32";
  ASSERT_TRUE(resolveRequest(generate, req, error)) << error;
  EXPECT_EQ(req.action, Action::GENERATE);
  EXPECT_EQ(req.arch, Arch::X86_32);
  EXPECT_FALSE(req.modeGiven);

  ASSERT_TRUE(resolveRequest(Flags{}, req, error)) << error;
  EXPECT_EQ(req.action, Action::NONE);
}

/** @test Conflicting actions are rejected. */
TEST(AuditRequestTest, ConflictingActions) {
  Request req;
  std::string error;

  Flags f;
  f.config = "c";
  f.print = "X86_64";
  EXPECT_FALSE(resolveRequest(f, req, error));
  EXPECT_EQ(error, "--config and --print can't be used together");

  f = Flags{};
  f.config = "c";
  f.generate = "X86_64";
  EXPECT_FALSE(resolveRequest(f, req, error));
  EXPECT_EQ(error, "--config and --generate can't be used together");

  f = Flags{};
  f.print = "X86_64";
  f.generate = "X86_64";
  EXPECT_FALSE(resolveRequest(f, req, error));
  EXPECT_EQ(error, "--print and --generate can't be used together");

  f = Flags{};
  f.cmdline = "l";
  EXPECT_FALSE(resolveRequest(f, req, error));
  EXPECT_EQ(error, "checking cmdline depends on checking Kconfig");
}

/** @test Unknown tokens and modes that don't fit the action are rejected. */
TEST(AuditRequestTest, BadTokensAndModes) {
  Request req;
  std::string error;

  Flags f;
  f.config = "c";
  f.mode = "quiet";
  EXPECT_FALSE(resolveRequest(f, req, error));
  EXPECT_EQ(error, "invalid mode \"quiet\" (choose from verbose, json, show_ok, show_fail)");

  f = Flags{};
  f.print = "RISCV";
  EXPECT_FALSE(resolveRequest(f, req, error));
  EXPECT_EQ(error, "invalid microarchitecture \"RISCV\" (choose from X86_64, X86_32, ARM64, ARM)");

  f = Flags{};
  f.print = "ARM";
  f.mode = "show_ok";
  EXPECT_FALSE(resolveRequest(f, req, error));
  EXPECT_EQ(error, "wrong mode \"show_ok\" for --print");

  f = Flags{};
  f.generate = "ARM";
  f.mode = "json";
  EXPECT_FALSE(resolveRequest(f, req, error));
  EXPECT_EQ(error, "wrong mode \"json\" for --generate");
}

/* ----------------------------- Pipeline Tests ----------------------------- */

/** @test The full rule database validates for every architecture. */
TEST(AuditPipelineTest, RecommendationsForAllArchs) {
  for (const Arch A : kcheck::input::SUPPORTED_ARCHS) {
    Checklist list;
    std::string error;
    EXPECT_TRUE(recommendations(A, list, error)) << toString(A) << ": " << error;
    EXPECT_FALSE(list.empty());
  }
}

/** @test A Kconfig-only run detects, populates, refines and evaluates. */
TEST(AuditPipelineTest, KconfigOnly) {
  Audit audit;
  std::string error;
  ASSERT_TRUE(runAudit(CONFIG, std::nullopt, audit, error)) << error;

  EXPECT_EQ(audit.arch, Arch::X86_64);
  EXPECT_EQ(audit.kernelVersion, (KernelVersion{6, 1}));
  EXPECT_EQ(audit.compiler.family, Compiler::GCC);

  for (const Check& C : audit.checklist) {
    ASSERT_TRUE(C.result.has_value()) << primaryLeaf(C).name;
    EXPECT_NE(primaryLeaf(C).source, DataSource::CMDLINE);
  }

  const Check* strong = findCheck(audit.checklist, "CONFIG_STACKPROTECTOR_STRONG");
  ASSERT_NE(strong, nullptr);
  EXPECT_EQ(strong->result->verdict, Verdict::OK);

  const Check* refcount = findCheck(audit.checklist, "CONFIG_REFCOUNT_FULL");
  ASSERT_NE(refcount, nullptr);
  EXPECT_EQ(refcount->result->reason, "kernel version 6.1 >= 5.5");

  const Check* rnd = findCheck(audit.checklist, "CONFIG_ARCH_MMAP_RND_BITS");
  ASSERT_NE(rnd, nullptr);
  EXPECT_EQ(rnd->result->verdict, Verdict::FAIL);
  EXPECT_EQ(rnd->result->reason, "CONFIG_ARCH_MMAP_RND_BITS is 28, expected >= 32");

  const Check* freelist = findCheck(audit.checklist, "CONFIG_SLAB_FREELIST_RANDOM");
  ASSERT_NE(freelist, nullptr);
  EXPECT_EQ(freelist->result->verdict, Verdict::UNKNOWN);

  const auto UNKNOWN = collectUnknownOptions(audit.checklist, audit.kconfig);
  ASSERT_FALSE(UNKNOWN.empty());
  EXPECT_EQ(UNKNOWN.back().name, "CONFIG_VENDOR_WIDGET");
}

/** @test With a cmdline, parameter rules are added and evaluated. */
TEST(AuditPipelineTest, KconfigAndCmdline) {
  Audit kconfigOnly;
  std::string error;
  ASSERT_TRUE(runAudit(CONFIG, std::nullopt, kconfigOnly, error)) << error;

  Audit audit;
  ASSERT_TRUE(runAudit(CONFIG, parseCmdline(CMDLINE), audit, error)) << error;
  EXPECT_GT(audit.checklist.size(), kconfigOnly.checklist.size());

  const Check* nosmt = findCheck(audit.checklist, "nosmt");
  ASSERT_NE(nosmt, nullptr);
  EXPECT_EQ(nosmt->result->verdict, Verdict::OK);

  // Absent parameter with the Kconfig default enabled
  const Check* initOnAlloc = findCheck(audit.checklist, "init_on_alloc");
  ASSERT_NE(initOnAlloc, nullptr);
  EXPECT_EQ(initOnAlloc->result->verdict, Verdict::OK);
  EXPECT_EQ(initOnAlloc->result->reason, "CONFIG_INIT_ON_ALLOC_DEFAULT_ON is \"y\"");

  const auto UNKNOWN = collectUnknownOptions(audit.checklist, audit.cmdline);
  ASSERT_EQ(UNKNOWN.size(), 2U);
  EXPECT_EQ(UNKNOWN[0].name, "root");
  EXPECT_EQ(UNKNOWN[1].name, "ro");
}

/** @test Input errors stop the pipeline with the detector or parser message. */
TEST(AuditPipelineTest, FatalInputErrors) {
  Audit audit;
  std::string error;

  EXPECT_FALSE(runAudit("# Linux/x86 6.1.0 Kernel Configuration\nCONFIG_BUG=y\n", std::nullopt,
                        audit, error));
  EXPECT_EQ(error, "failed to detect microarchitecture");

  EXPECT_FALSE(runAudit("CONFIG_X86_64=y\n", std::nullopt, audit, error));
  EXPECT_EQ(error, "no kernel version detected");

  EXPECT_FALSE(runAudit("# Linux/x86 6.1.0 Kernel Configuration\nCONFIG_X86_64=y\n"
                        "CONFIG_GCC_VERSION=120200\nCONFIG_CLANG_VERSION=150000\n",
                        std::nullopt, audit, error));
  EXPECT_EQ(error, "invalid GCC_VERSION and CLANG_VERSION: 120200 150000");

  EXPECT_FALSE(runAudit("# Linux/x86 6.1.0 Kernel Configuration\nCONFIG_X86_64=y\n"
                        "CONFIG_BUG=y\nCONFIG_BUG=n\n",
                        std::nullopt, audit, error));
  EXPECT_NE(error.find("exists multiple times"), std::string::npos);
}

/** @test Missing compiler markers are not fatal. */
TEST(AuditPipelineTest, UnknownCompiler) {
  Audit audit;
  std::string error;
  ASSERT_TRUE(runAudit("# Linux/arm64 5.10.0 Kernel Configuration\nCONFIG_ARM64=y\n",
                       std::nullopt, audit, error))
      << error;
  EXPECT_EQ(audit.arch, Arch::ARM64);
  EXPECT_FALSE(audit.compiler.detected());
  EXPECT_EQ(audit.compilerNote, "no CONFIG_GCC_VERSION or CONFIG_CLANG_VERSION");
}

/* ----------------------------- File Tests ----------------------------- */

/** @test Files are read and run through the same pipeline. */
TEST(AuditFileTest, ConfigAndCmdlineFiles) {
  const std::string CONFIG_PATH = tempPath("kcheck_audit.config");
  const std::string CMDLINE_PATH = tempPath("kcheck_audit.cmdline");
  writeFile(CONFIG_PATH, CONFIG);
  writeFile(CMDLINE_PATH, CMDLINE);

  Audit audit;
  std::string error;
  ASSERT_TRUE(auditFiles(CONFIG_PATH, std::string_view{CMDLINE_PATH}, audit, error)) << error;
  EXPECT_EQ(audit.cmdline.size(), 4U);
  EXPECT_NE(findCheck(audit.checklist, "nosmt"), nullptr);

  std::remove(CONFIG_PATH.c_str());
  std::remove(CMDLINE_PATH.c_str());
}

/** @test A missing Kconfig file is reported. */
TEST(AuditFileTest, MissingConfig) {
  Audit audit;
  std::string error;
  EXPECT_FALSE(auditFiles(tempPath("kcheck_no_such.config"), std::nullopt, audit, error));
  EXPECT_NE(error.find("kcheck_no_such.config"), std::string::npos);
}
