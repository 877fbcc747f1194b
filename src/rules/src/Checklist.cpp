/**
 * @file Checklist.cpp
 * @brief Hardening rule tables for X86_64, X86_32, ARM64 and ARM.
 */

#include "src/rules/inc/Checklist.hpp"

#include <algorithm>
#include <initializer_list>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace kcheck {

namespace rules {

namespace {

using engine::Check;
using engine::Checklist;
using engine::Combinator;
using engine::Comparison;
using engine::DataSource;
using engine::Tag;
using input::Arch;
using input::KernelVersion;

constexpr std::string_view IS_NOT_SET = "is not set";
constexpr std::string_view IS_NOT_OFF = "is not off";
constexpr std::string_view IS_PRESENT = "is present";

/* ----------------------------- Builders ----------------------------- */

Check kconfig(const char* reason, const char* decision, const char* name,
              std::string_view expected) {
  return engine::makeLeaf(DataSource::KCONFIG, Tag{reason, decision},
                          fmt::format("CONFIG_{}", name), expected);
}

Check cmdline(const char* reason, const char* decision, const char* name,
              std::string_view expected) {
  return engine::makeLeaf(DataSource::CMDLINE, Tag{reason, decision}, name, expected);
}

Check kconfigAtLeast(const char* reason, const char* decision, const char* name,
                     const char* threshold) {
  return engine::makeThreshold(DataSource::KCONFIG, Tag{reason, decision},
                               fmt::format("CONFIG_{}", name), Comparison::AT_LEAST, threshold);
}

Check version(int major, int minor) { return engine::makeVersion(KernelVersion{major, minor}); }

Check anyOf(std::initializer_list<Check> kids) {
  return engine::makeCombinator(Combinator::OR, std::vector<Check>(kids));
}

Check allOf(std::initializer_list<Check> kids) {
  return engine::makeCombinator(Combinator::AND, std::vector<Check>(kids));
}

/// `before` applies to kernels older than major.minor, `after` to the rest.
Check versionGate(int major, int minor, Check before, Check after) {
  return engine::makeVersionGated(KernelVersion{major, minor}, std::move(before),
                                  std::move(after));
}

bool oneOf(Arch arch, std::initializer_list<Arch> set) {
  return std::find(set.begin(), set.end(), arch) != set.end();
}

/// `param` is not disabled, or is left at its default.
Check notOffOrDefault(const char* reason, const char* decision, const char* param) {
  return anyOf({cmdline(reason, decision, param, IS_NOT_OFF),
                cmdline(reason, decision, param, IS_NOT_SET)});
}

/// `param` is set to `value`, or is absent while the Kconfig default provides it.
Check paramOrDefault(const char* reason, const char* decision, const char* param,
                     const char* value, const char* option, std::string_view optionValue) {
  return anyOf({cmdline(reason, decision, param, value),
                allOf({kconfig(reason, decision, option, optionValue),
                       cmdline(reason, decision, param, IS_NOT_SET)})});
}

/* ----------------------------- Kconfig: self_protection ----------------------------- */

void addSelfProtection(Checklist& l, Arch arch) {
  const Check MODULES_NOT_SET = kconfig("cut_attack_surface", "kspp", "MODULES", IS_NOT_SET);
  // Also holds when EFI is absent altogether (32-bit ARM)
  const Check EFI_NOT_PRESENT = kconfig("-", "-", "EFI", IS_NOT_SET);
  const Check CC_IS_GCC = kconfig("-", "-", "CC_IS_GCC", "y");
  const Check GCC_PLUGINS = kconfig("self_protection", "defconfig", "GCC_PLUGINS", "y");
  const Check IOMMU_SUPPORT = kconfig("self_protection", "defconfig", "IOMMU_SUPPORT", "y");

  // defconfig
  l.push_back(kconfig("self_protection", "defconfig", "BUG", "y"));
  l.push_back(kconfig("self_protection", "defconfig", "SLUB_DEBUG", "y"));
  l.push_back(kconfig("self_protection", "defconfig", "THREAD_INFO_IN_TASK", "y"));
  l.push_back(GCC_PLUGINS);
  l.push_back(IOMMU_SUPPORT);
  l.push_back(anyOf({kconfig("self_protection", "defconfig", "STACKPROTECTOR", "y"),
                     kconfig("self_protection", "defconfig", "CC_STACKPROTECTOR", "y"),
                     kconfig("self_protection", "defconfig", "CC_STACKPROTECTOR_REGULAR", "y"),
                     kconfig("self_protection", "defconfig", "CC_STACKPROTECTOR_AUTO", "y"),
                     kconfig("self_protection", "defconfig", "CC_STACKPROTECTOR_STRONG", "y")}));
  l.push_back(versionGate(4, 18,
                          kconfig("self_protection", "defconfig", "CC_STACKPROTECTOR_STRONG", "y"),
                          kconfig("self_protection", "defconfig", "STACKPROTECTOR_STRONG", "y")));
  l.push_back(versionGate(4, 11, kconfig("self_protection", "defconfig", "DEBUG_RODATA", "y"),
                          kconfig("self_protection", "defconfig", "STRICT_KERNEL_RWX", "y")));
  l.push_back(anyOf(
      {versionGate(4, 11, kconfig("self_protection", "defconfig", "DEBUG_SET_MODULE_RONX", "y"),
                   kconfig("self_protection", "defconfig", "STRICT_MODULE_RWX", "y")),
       MODULES_NOT_SET}));
  l.push_back(anyOf({kconfig("self_protection", "defconfig", "REFCOUNT_FULL", "y"),
                     version(5, 5)}));
  if (oneOf(arch, {Arch::X86_64, Arch::ARM64, Arch::X86_32})) {
    l.push_back(kconfig("self_protection", "defconfig", "RANDOMIZE_BASE", "y"));
  }
  if (oneOf(arch, {Arch::X86_64, Arch::ARM64, Arch::ARM})) {
    l.push_back(kconfig("self_protection", "defconfig", "VMAP_STACK", "y"));
  }
  if (oneOf(arch, {Arch::X86_64, Arch::X86_32})) {
    l.push_back(kconfig("self_protection", "defconfig", "DEBUG_WX", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "WERROR", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "X86_MCE", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "X86_MCE_INTEL", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "X86_MCE_AMD", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "MICROCODE", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "RETPOLINE", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "SYN_COOKIES", "y"));
    l.push_back(anyOf({kconfig("self_protection", "defconfig", "X86_SMAP", "y"), version(5, 19)}));
    l.push_back(anyOf({kconfig("self_protection", "defconfig", "X86_UMIP", "y"),
                       kconfig("self_protection", "defconfig", "X86_INTEL_UMIP", "y")}));
  }
  if (oneOf(arch, {Arch::ARM64, Arch::ARM})) {
    l.push_back(kconfig("self_protection", "defconfig", "IOMMU_DEFAULT_DMA_STRICT", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "IOMMU_DEFAULT_PASSTHROUGH", IS_NOT_SET));
    l.push_back(kconfig("self_protection", "defconfig", "STACKPROTECTOR_PER_TASK", "y"));
  }
  if (arch == Arch::X86_64) {
    l.push_back(kconfig("self_protection", "defconfig", "PAGE_TABLE_ISOLATION", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "RANDOMIZE_MEMORY", "y"));
    l.push_back(allOf({kconfig("self_protection", "defconfig", "INTEL_IOMMU", "y"), IOMMU_SUPPORT}));
    l.push_back(allOf({kconfig("self_protection", "defconfig", "AMD_IOMMU", "y"), IOMMU_SUPPORT}));
  }
  if (arch == Arch::ARM64) {
    l.push_back(kconfig("self_protection", "defconfig", "ARM64_PAN", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "ARM64_EPAN", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "UNMAP_KERNEL_AT_EL0", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "ARM64_E0PD", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "RODATA_FULL_DEFAULT_ENABLED", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "ARM64_PTR_AUTH_KERNEL", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "ARM64_BTI_KERNEL", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "MITIGATE_SPECTRE_BRANCH_HISTORY", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "ARM64_MTE", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "RANDOMIZE_MODULE_REGION_FULL", "y"));
    // HARDEN_EL2_VECTORS was folded into RANDOMIZE_BASE in 5.9
    l.push_back(anyOf({kconfig("self_protection", "defconfig", "HARDEN_EL2_VECTORS", "y"),
                       allOf({kconfig("self_protection", "defconfig", "RANDOMIZE_BASE", "y"),
                              version(5, 9)})}));
    l.push_back(anyOf({kconfig("self_protection", "defconfig", "HARDEN_BRANCH_PREDICTOR", "y"),
                       version(5, 10)}));
  }
  if (arch == Arch::ARM) {
    l.push_back(kconfig("self_protection", "defconfig", "CPU_SW_DOMAIN_PAN", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "HARDEN_BRANCH_PREDICTOR", "y"));
    l.push_back(kconfig("self_protection", "defconfig", "HARDEN_BRANCH_HISTORY", "y"));
  }

  // kspp
  const Check RANDSTRUCT =
      versionGate(5, 19, kconfig("self_protection", "kspp", "GCC_PLUGIN_RANDSTRUCT", "y"),
                  kconfig("self_protection", "kspp", "RANDSTRUCT_FULL", "y"));
  const Check HARDENED_USERCOPY = kconfig("self_protection", "kspp", "HARDENED_USERCOPY", "y");
  const Check UBSAN_BOUNDS = kconfig("self_protection", "kspp", "UBSAN_BOUNDS", "y");

  l.push_back(kconfig("self_protection", "kspp", "BUG_ON_DATA_CORRUPTION", "y"));
  l.push_back(kconfig("self_protection", "kspp", "SCHED_STACK_END_CHECK", "y"));
  l.push_back(kconfig("self_protection", "kspp", "SLAB_FREELIST_HARDENED", "y"));
  l.push_back(kconfig("self_protection", "kspp", "SLAB_FREELIST_RANDOM", "y"));
  l.push_back(kconfig("self_protection", "kspp", "SHUFFLE_PAGE_ALLOCATOR", "y"));
  l.push_back(kconfig("self_protection", "kspp", "FORTIFY_SOURCE", "y"));
  l.push_back(kconfig("self_protection", "kspp", "DEBUG_LIST", "y"));
  l.push_back(kconfig("self_protection", "kspp", "DEBUG_VIRTUAL", "y"));
  l.push_back(kconfig("self_protection", "kspp", "DEBUG_SG", "y"));
  l.push_back(kconfig("self_protection", "kspp", "DEBUG_CREDENTIALS", "y"));
  l.push_back(kconfig("self_protection", "kspp", "DEBUG_NOTIFIERS", "y"));
  l.push_back(kconfig("self_protection", "kspp", "INIT_ON_ALLOC_DEFAULT_ON", "y"));
  l.push_back(kconfig("self_protection", "kspp", "KFENCE", "y"));
  l.push_back(kconfig("self_protection", "kspp", "ZERO_CALL_USED_REGS", "y"));
  l.push_back(kconfig("self_protection", "kspp", "HW_RANDOM_TPM", "y"));
  l.push_back(kconfig("self_protection", "kspp", "STATIC_USERMODEHELPER", "y"));
  l.push_back(RANDSTRUCT);
  l.push_back(allOf(
      {versionGate(5, 19,
                   kconfig("self_protection", "kspp", "GCC_PLUGIN_RANDSTRUCT_PERFORMANCE",
                           IS_NOT_SET),
                   kconfig("self_protection", "kspp", "RANDSTRUCT_PERFORMANCE", IS_NOT_SET)),
       RANDSTRUCT}));
  l.push_back(HARDENED_USERCOPY);
  l.push_back(allOf({kconfig("self_protection", "kspp", "HARDENED_USERCOPY_FALLBACK", IS_NOT_SET),
                     HARDENED_USERCOPY}));
  l.push_back(allOf({kconfig("self_protection", "kspp", "HARDENED_USERCOPY_PAGESPAN", IS_NOT_SET),
                     HARDENED_USERCOPY}));
  l.push_back(allOf(
      {kconfig("self_protection", "kspp", "GCC_PLUGIN_LATENT_ENTROPY", "y"), GCC_PLUGINS}));
  l.push_back(anyOf({kconfig("self_protection", "kspp", "MODULE_SIG", "y"), MODULES_NOT_SET}));
  l.push_back(anyOf({kconfig("self_protection", "kspp", "MODULE_SIG_ALL", "y"), MODULES_NOT_SET}));
  l.push_back(
      anyOf({kconfig("self_protection", "kspp", "MODULE_SIG_SHA512", "y"), MODULES_NOT_SET}));
  l.push_back(
      anyOf({kconfig("self_protection", "kspp", "MODULE_SIG_FORCE", "y"), MODULES_NOT_SET}));
  l.push_back(anyOf({kconfig("self_protection", "kspp", "INIT_STACK_ALL_ZERO", "y"),
                     kconfig("self_protection", "kspp", "GCC_PLUGIN_STRUCTLEAK_BYREF_ALL", "y")}));
  // PAGE_POISONING_ZERO was removed in 5.11
  l.push_back(anyOf({kconfig("self_protection", "kspp", "INIT_ON_FREE_DEFAULT_ON", "y"),
                     kconfig("self_protection", "kspp", "PAGE_POISONING_ZERO", "y")}));
  l.push_back(
      anyOf({kconfig("self_protection", "kspp", "EFI_DISABLE_PCI_DMA", "y"), EFI_NOT_PRESENT}));
  l.push_back(anyOf(
      {kconfig("self_protection", "kspp", "RESET_ATTACK_MITIGATION", "y"), EFI_NOT_PRESENT}));
  l.push_back(UBSAN_BOUNDS);
  l.push_back(anyOf({kconfig("self_protection", "kspp", "UBSAN_LOCAL_BOUNDS", "y"),
                     allOf({UBSAN_BOUNDS, CC_IS_GCC})}));
  // array index bounds checking with traps only
  l.push_back(allOf({kconfig("self_protection", "kspp", "UBSAN_TRAP", "y"), UBSAN_BOUNDS,
                     kconfig("self_protection", "kspp", "UBSAN_SHIFT", IS_NOT_SET),
                     kconfig("self_protection", "kspp", "UBSAN_DIV_ZERO", IS_NOT_SET),
                     kconfig("self_protection", "kspp", "UBSAN_UNREACHABLE", IS_NOT_SET),
                     kconfig("self_protection", "kspp", "UBSAN_BOOL", IS_NOT_SET),
                     kconfig("self_protection", "kspp", "UBSAN_ENUM", IS_NOT_SET),
                     kconfig("self_protection", "kspp", "UBSAN_ALIGNMENT", IS_NOT_SET)}));
  if (oneOf(arch, {Arch::X86_64, Arch::ARM64, Arch::X86_32})) {
    const Check STACKLEAK = kconfig("self_protection", "kspp", "GCC_PLUGIN_STACKLEAK", "y");
    l.push_back(allOf({kconfig("self_protection", "kspp", "UBSAN_SANITIZE_ALL", "y"), UBSAN_BOUNDS}));
    l.push_back(allOf({STACKLEAK, GCC_PLUGINS}));
    l.push_back(allOf({kconfig("self_protection", "kspp", "STACKLEAK_METRICS", IS_NOT_SET),
                       STACKLEAK, GCC_PLUGINS}));
    l.push_back(allOf({kconfig("self_protection", "kspp", "STACKLEAK_RUNTIME_DISABLE", IS_NOT_SET),
                       STACKLEAK, GCC_PLUGINS}));
    l.push_back(kconfig("self_protection", "kspp", "RANDOMIZE_KSTACK_OFFSET_DEFAULT", "y"));
  }
  if (oneOf(arch, {Arch::X86_64, Arch::ARM64})) {
    const Check CFI_CLANG = kconfig("self_protection", "kspp", "CFI_CLANG", "y");
    l.push_back(CFI_CLANG);
    l.push_back(allOf({kconfig("self_protection", "kspp", "CFI_PERMISSIVE", IS_NOT_SET), CFI_CLANG}));
  }
  if (oneOf(arch, {Arch::X86_64, Arch::X86_32})) {
    l.push_back(kconfig("self_protection", "kspp", "SCHED_CORE", "y"));
    l.push_back(kconfig("self_protection", "kspp", "DEFAULT_MMAP_MIN_ADDR", "65536"));
    l.push_back(kconfig("self_protection", "kspp", "IOMMU_DEFAULT_DMA_STRICT", "y"));
    l.push_back(kconfig("self_protection", "kspp", "IOMMU_DEFAULT_PASSTHROUGH", IS_NOT_SET));
    l.push_back(allOf(
        {kconfig("self_protection", "kspp", "INTEL_IOMMU_DEFAULT_ON", "y"), IOMMU_SUPPORT}));
  }
  if (oneOf(arch, {Arch::ARM64, Arch::ARM})) {
    l.push_back(kconfig("self_protection", "kspp", "DEBUG_WX", "y"));
    l.push_back(kconfig("self_protection", "kspp", "WERROR", "y"));
    l.push_back(kconfig("self_protection", "kspp", "DEFAULT_MMAP_MIN_ADDR", "32768"));
    l.push_back(kconfig("self_protection", "kspp", "SYN_COOKIES", "y"));
  }
  if (arch == Arch::X86_64) {
    l.push_back(kconfig("self_protection", "kspp", "SLS", "y"));
    l.push_back(allOf({kconfig("self_protection", "kspp", "INTEL_IOMMU_SVM", "y"), IOMMU_SUPPORT}));
    l.push_back(allOf({kconfig("self_protection", "kspp", "AMD_IOMMU_V2", "y"), IOMMU_SUPPORT}));
  }
  if (arch == Arch::ARM64) {
    l.push_back(kconfig("self_protection", "kspp", "ARM64_SW_TTBR0_PAN", "y"));
    l.push_back(kconfig("self_protection", "kspp", "SHADOW_CALL_STACK", "y"));
    l.push_back(kconfig("self_protection", "kspp", "KASAN_HW_TAGS", "y"));
  }
  if (arch == Arch::X86_32) {
    l.push_back(kconfig("self_protection", "kspp", "PAGE_TABLE_ISOLATION", "y"));
    l.push_back(kconfig("self_protection", "kspp", "HIGHMEM64G", "y"));
    l.push_back(kconfig("self_protection", "kspp", "X86_PAE", "y"));
    l.push_back(allOf({kconfig("self_protection", "kspp", "INTEL_IOMMU", "y"), IOMMU_SUPPORT}));
  }

  // clipos
  l.push_back(kconfig("self_protection", "clipos", "SLAB_MERGE_DEFAULT", IS_NOT_SET));
}

/* ----------------------------- Kconfig: security_policy ----------------------------- */

void addSecurityPolicy(Checklist& l, Arch arch) {
  if (oneOf(arch, {Arch::X86_64, Arch::ARM64, Arch::X86_32})) {
    l.push_back(kconfig("security_policy", "defconfig", "SECURITY", "y"));
  }
  if (arch == Arch::ARM) {
    l.push_back(kconfig("security_policy", "kspp", "SECURITY", "y"));
  }
  l.push_back(kconfig("security_policy", "kspp", "SECURITY_YAMA", "y"));
  l.push_back(kconfig("security_policy", "kspp", "SECURITY_LANDLOCK", "y"));
  l.push_back(kconfig("security_policy", "kspp", "SECURITY_SELINUX_DISABLE", IS_NOT_SET));
  l.push_back(kconfig("security_policy", "kspp", "SECURITY_SELINUX_BOOTPARAM", IS_NOT_SET));
  l.push_back(kconfig("security_policy", "kspp", "SECURITY_SELINUX_DEVELOP", IS_NOT_SET));
  l.push_back(kconfig("security_policy", "kspp", "SECURITY_LOCKDOWN_LSM", "y"));
  l.push_back(kconfig("security_policy", "kspp", "SECURITY_LOCKDOWN_LSM_EARLY", "y"));
  l.push_back(kconfig("security_policy", "kspp", "LOCK_DOWN_KERNEL_FORCE_CONFIDENTIALITY", "y"));
  l.push_back(kconfig("security_policy", "kspp", "SECURITY_WRITABLE_HOOKS", IS_NOT_SET));
}

/* ----------------------------- Kconfig: cut_attack_surface ----------------------------- */

void addCutAttackSurface(Checklist& l, Arch arch) {
  const Check MODULES_NOT_SET = kconfig("cut_attack_surface", "kspp", "MODULES", IS_NOT_SET);
  const Check DEVMEM_NOT_SET = kconfig("cut_attack_surface", "kspp", "DEVMEM", IS_NOT_SET);
  const Check BPF_SYSCALL_NOT_SET =
      kconfig("cut_attack_surface", "lockdown", "BPF_SYSCALL", IS_NOT_SET);

  // defconfig
  l.push_back(anyOf({kconfig("cut_attack_surface", "defconfig", "BPF_UNPRIV_DEFAULT_OFF", "y"),
                     BPF_SYSCALL_NOT_SET}));
  l.push_back(kconfig("cut_attack_surface", "defconfig", "SECCOMP", "y"));
  l.push_back(kconfig("cut_attack_surface", "defconfig", "SECCOMP_FILTER", "y"));
  if (oneOf(arch, {Arch::X86_64, Arch::ARM64, Arch::X86_32})) {
    l.push_back(anyOf(
        {kconfig("cut_attack_surface", "defconfig", "STRICT_DEVMEM", "y"), DEVMEM_NOT_SET}));
  }
  if (oneOf(arch, {Arch::X86_64, Arch::X86_32})) {
    l.push_back(kconfig("cut_attack_surface", "defconfig", "X86_INTEL_TSX_MODE_OFF", "y"));
  }

  // kspp
  l.push_back(kconfig("cut_attack_surface", "kspp", "SECURITY_DMESG_RESTRICT", "y"));
  l.push_back(kconfig("cut_attack_surface", "kspp", "ACPI_CUSTOM_METHOD", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "kspp", "COMPAT_BRK", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "kspp", "DEVKMEM", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "kspp", "BINFMT_MISC", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "kspp", "INET_DIAG", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "kspp", "KEXEC", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "kspp", "PROC_KCORE", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "kspp", "LEGACY_PTYS", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "kspp", "HIBERNATION", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "kspp", "IA32_EMULATION", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "kspp", "X86_X32", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "kspp", "X86_X32_ABI", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "kspp", "MODIFY_LDT_SYSCALL", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "kspp", "OABI_COMPAT", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "kspp", "X86_MSR", IS_NOT_SET));
  l.push_back(MODULES_NOT_SET);
  l.push_back(DEVMEM_NOT_SET);
  l.push_back(
      anyOf({kconfig("cut_attack_surface", "kspp", "IO_STRICT_DEVMEM", "y"), DEVMEM_NOT_SET}));
  // LDISC_AUTOLOAD must exist (4.19+) and be disabled
  l.push_back(allOf({kconfig("cut_attack_surface", "kspp", "LDISC_AUTOLOAD", IS_NOT_SET),
                     kconfig("cut_attack_surface", "kspp", "LDISC_AUTOLOAD", IS_PRESENT)}));
  if (arch == Arch::X86_64) {
    l.push_back(kconfig("cut_attack_surface", "kspp", "LEGACY_VSYSCALL_NONE", "y"));
  }
  if (arch == Arch::ARM) {
    l.push_back(
        anyOf({kconfig("cut_attack_surface", "kspp", "STRICT_DEVMEM", "y"), DEVMEM_NOT_SET}));
  }

  // grsec
  for (const char* name :
       {"ZSMALLOC_STAT", "PAGE_OWNER", "DEBUG_KMEMLEAK", "BINFMT_AOUT", "KPROBE_EVENTS",
        "UPROBE_EVENTS", "GENERIC_TRACER", "FUNCTION_TRACER", "STACK_TRACER", "HIST_TRIGGERS",
        "BLK_DEV_IO_TRACE", "PROC_VMCORE", "PROC_PAGE_MONITOR", "USELIB", "CHECKPOINT_RESTORE",
        "USERFAULTFD", "HWPOISON_INJECT", "MEM_SOFT_DIRTY", "DEVPORT", "DEBUG_FS",
        "NOTIFIER_ERROR_INJECTION", "FAIL_FUTEX", "PUNIT_ATOM_DEBUG", "ACPI_CONFIGFS",
        "EDAC_DEBUG", "DRM_I915_DEBUG", "BCACHE_CLOSURES_DEBUG", "DVB_C8SECTPFE", "MTD_SLRAM",
        "MTD_PHRAM", "IO_URING", "KCMP", "RSEQ", "LATENCYTOP", "KCOV",
        "PROVIDE_OHCI1394_DMA_INIT", "SUNRPC_DEBUG"}) {
    l.push_back(kconfig("cut_attack_surface", "grsec", name, IS_NOT_SET));
  }
  l.push_back(allOf({kconfig("cut_attack_surface", "grsec", "PTDUMP_DEBUGFS", IS_NOT_SET),
                     kconfig("cut_attack_surface", "grsec", "X86_PTDUMP", IS_NOT_SET)}));

  // maintainer
  for (const char* name : {"DRM_LEGACY", "FB", "VT", "BLK_DEV_FD", "BLK_DEV_FD_RAWCMD",
                           "NOUVEAU_LEGACY_CTX_SUPPORT"}) {
    l.push_back(kconfig("cut_attack_surface", "maintainer", name, IS_NOT_SET));
  }

  // clipos
  for (const char* name :
       {"STAGING", "KSM", "KALLSYMS", "MAGIC_SYSRQ", "KEXEC_FILE", "USER_NS", "X86_CPUID",
        "X86_IOPL_IOPERM", "ACPI_TABLE_UPGRADE", "EFI_CUSTOM_SSDT_OVERLAYS", "COREDUMP"}) {
    l.push_back(kconfig("cut_attack_surface", "clipos", name, IS_NOT_SET));
  }

  // lockdown
  l.push_back(kconfig("cut_attack_surface", "lockdown", "EFI_TEST", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "lockdown", "MMIOTRACE_TEST", IS_NOT_SET));
  l.push_back(kconfig("cut_attack_surface", "lockdown", "KPROBES", IS_NOT_SET));
  l.push_back(BPF_SYSCALL_NOT_SET);

  // my
  for (const char* name : {"LEGACY_TIOCSTI", "MMIOTRACE", "LIVEPATCH", "IP_DCCP", "IP_SCTP",
                           "FTRACE", "VIDEO_VIVID", "INPUT_EVBUG", "KGDB"}) {
    l.push_back(kconfig("cut_attack_surface", "my", name, IS_NOT_SET));
  }
  l.push_back(
      anyOf({kconfig("cut_attack_surface", "my", "TRIM_UNUSED_KSYMS", "y"), MODULES_NOT_SET}));
}

/* ----------------------------- Kconfig: harden_userspace ----------------------------- */

void addHardenUserspace(Checklist& l, Arch arch) {
  if (oneOf(arch, {Arch::X86_64, Arch::ARM64, Arch::X86_32})) {
    l.push_back(kconfig("harden_userspace", "defconfig", "INTEGRITY", "y"));
  }
  if (arch == Arch::ARM) {
    l.push_back(kconfig("harden_userspace", "my", "INTEGRITY", "y"));
  }
  if (arch == Arch::ARM64) {
    l.push_back(kconfig("harden_userspace", "defconfig", "ARM64_PTR_AUTH", "y"));
    l.push_back(kconfig("harden_userspace", "defconfig", "ARM64_BTI", "y"));
  }
  if (oneOf(arch, {Arch::ARM, Arch::X86_32})) {
    l.push_back(kconfig("harden_userspace", "defconfig", "VMSPLIT_3G", "y"));
  }
  // Threshold is raised to CONFIG_ARCH_MMAP_RND_BITS_MAX when the config provides it
  if (oneOf(arch, {Arch::X86_64, Arch::ARM64})) {
    l.push_back(kconfigAtLeast("harden_userspace", "clipos", "ARCH_MMAP_RND_BITS", "32"));
  }
  if (oneOf(arch, {Arch::X86_32, Arch::ARM})) {
    l.push_back(kconfigAtLeast("harden_userspace", "my", "ARCH_MMAP_RND_BITS", "16"));
  }
}

} // namespace

/* ----------------------------- API ----------------------------- */

void addKconfigChecks(Checklist& checklist, Arch arch) {
  addSelfProtection(checklist, arch);
  addSecurityPolicy(checklist, arch);
  addCutAttackSurface(checklist, arch);
  addHardenUserspace(checklist, arch);
}

void addCmdlineChecks(Checklist& l, Arch arch) {
  const bool X86 = oneOf(arch, {Arch::X86_64, Arch::X86_32});

  // self_protection, defconfig
  if (X86) {
    for (const char* name : {"nosmep", "nosmap", "nopti", "nospectre_v1", "nospectre_v2",
                             "nospec_store_bypass_disable"}) {
      l.push_back(cmdline("self_protection", "defconfig", name, IS_NOT_SET));
    }
  }
  if (oneOf(arch, {Arch::X86_64, Arch::X86_32, Arch::ARM64})) {
    l.push_back(cmdline("self_protection", "defconfig", "nokaslr", IS_NOT_SET));
  }
  if (arch == Arch::ARM64) {
    for (const char* name : {"nospectre_bhb", "arm64.nobti", "arm64.nopauth", "arm64.nomte"}) {
      l.push_back(cmdline("self_protection", "defconfig", name, IS_NOT_SET));
    }
  }
  l.push_back(notOffOrDefault("self_protection", "defconfig", "mitigations"));
  if (X86) {
    for (const char* name : {"spectre_v2", "spectre_v2_user", "spec_store_bypass_disable",
                             "l1tf", "mds", "tsx_async_abort", "srbds", "mmio_stale_data",
                             "retbleed"}) {
      l.push_back(notOffOrDefault("self_protection", "defconfig", name));
    }
  }
  if (arch == Arch::ARM64) {
    l.push_back(notOffOrDefault("self_protection", "defconfig", "kpti"));
    l.push_back(anyOf({cmdline("self_protection", "defconfig", "ssbd", "kernel"),
                       cmdline("self_protection", "my", "ssbd", "force-on"),
                       cmdline("self_protection", "defconfig", "ssbd", IS_NOT_SET)}));
    l.push_back(paramOrDefault("self_protection", "defconfig", "rodata", "full",
                               "RODATA_FULL_DEFAULT_ENABLED", "y"));
  }

  // self_protection, kspp
  l.push_back(cmdline("self_protection", "kspp", "nosmt", IS_PRESENT));
  l.push_back(cmdline("self_protection", "kspp", "mitigations", "auto,nosmt"));
  l.push_back(cmdline("self_protection", "kspp", "slub_merge", IS_NOT_SET));
  l.push_back(cmdline("self_protection", "kspp", "page_alloc.shuffle", "1"));
  l.push_back(anyOf({cmdline("self_protection", "kspp", "slab_nomerge", IS_PRESENT),
                     allOf({kconfig("self_protection", "clipos", "SLAB_MERGE_DEFAULT", IS_NOT_SET),
                            cmdline("self_protection", "kspp", "slab_merge", IS_NOT_SET),
                            cmdline("self_protection", "clipos", "slub_merge", IS_NOT_SET)})}));
  l.push_back(paramOrDefault("self_protection", "kspp", "init_on_alloc", "1",
                             "INIT_ON_ALLOC_DEFAULT_ON", "y"));
  l.push_back(
      anyOf({cmdline("self_protection", "kspp", "init_on_free", "1"),
             allOf({kconfig("self_protection", "kspp", "INIT_ON_FREE_DEFAULT_ON", "y"),
                    cmdline("self_protection", "kspp", "init_on_free", IS_NOT_SET)}),
             allOf({cmdline("self_protection", "kspp", "page_poison", "1"),
                    kconfig("self_protection", "kspp", "PAGE_POISONING_ZERO", "y"),
                    cmdline("self_protection", "kspp", "slub_debug", "P")})}));
  l.push_back(paramOrDefault("self_protection", "kspp", "hardened_usercopy", "1",
                             "HARDENED_USERCOPY", "y"));
  l.push_back(paramOrDefault("self_protection", "kspp", "slab_common.usercopy_fallback", "0",
                             "HARDENED_USERCOPY_FALLBACK", IS_NOT_SET));
  if (oneOf(arch, {Arch::X86_64, Arch::ARM64, Arch::X86_32})) {
    l.push_back(paramOrDefault("self_protection", "kspp", "iommu.strict", "1",
                               "IOMMU_DEFAULT_DMA_STRICT", "y"));
    l.push_back(paramOrDefault("self_protection", "kspp", "iommu.passthrough", "0",
                               "IOMMU_DEFAULT_PASSTHROUGH", IS_NOT_SET));
    l.push_back(paramOrDefault("self_protection", "kspp", "randomize_kstack_offset", "1",
                               "RANDOMIZE_KSTACK_OFFSET_DEFAULT", "y"));
  }
  if (X86) {
    l.push_back(allOf({cmdline("self_protection", "kspp", "pti", "on"),
                       cmdline("self_protection", "defconfig", "nopti", IS_NOT_SET)}));
    l.push_back(cmdline("self_protection", "clipos", "iommu", "force"));
  }

  // cut_attack_surface
  if (X86) {
    l.push_back(paramOrDefault("cut_attack_surface", "defconfig", "tsx", "off",
                               "X86_INTEL_TSX_MODE_OFF", "y"));
  }
  if (arch == Arch::X86_64) {
    l.push_back(paramOrDefault("cut_attack_surface", "kspp", "vsyscall", "none",
                               "LEGACY_VSYSCALL_NONE", "y"));
  }
  l.push_back(anyOf({cmdline("cut_attack_surface", "grsec", "debugfs", "off"),
                     kconfig("cut_attack_surface", "grsec", "DEBUG_FS", IS_NOT_SET)}));
  l.push_back(cmdline("cut_attack_surface", "my", "sysrq_always_enabled", IS_NOT_SET));

  // harden_userspace
  l.push_back(cmdline("harden_userspace", "defconfig", "norandmaps", IS_NOT_SET));
}

Checklist buildChecklist(Arch arch, RuleSelection selection) {
  Checklist checklist;
  if (selection.kconfig) {
    addKconfigChecks(checklist, arch);
  }
  if (selection.cmdline) {
    addCmdlineChecks(checklist, arch);
  }
  return checklist;
}

} // namespace rules

} // namespace kcheck
