#include "colscore/kernels/dispatch.hpp"
#include "colscore/kernels/backends/scalar.hpp"
#include "colscore/core/platform_utils.hpp"
#include "colscore/platform/compiler.hpp"

#if defined(COLSCORE_ARCH_X64)
#ifdef _MSC_VER
#include <intrin.h>  // For __cpuid on MSVC
#else
#include <cpuid.h>  // For __get_cpuid on GCC/Clang
#endif
#include "colscore/kernels/backends/sse.hpp"
#include "colscore/kernels/backends/avx2.hpp"
#endif

#if defined(COLSCORE_ARCH_ARM64)
#include "colscore/kernels/backends/neon.hpp"
#endif

#include <array>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

namespace colscore::kernels {

namespace detail {

/** \brief Detect CPU features at runtime using CPUID.
 *
 * Results cached for process lifetime by cpu_features().
 */
COLSCORE_COLD
inline auto detect_cpu_features() noexcept -> CpuFeatures {
    CpuFeatures features{};

#if defined(COLSCORE_ARCH_X64)
    // SSE2 is part of the x86-64 baseline
    features.has_sse2 = true;
#ifdef _MSC_VER
    int cpu_info[4];
    __cpuid(cpu_info, 0);
    const unsigned int max_level = static_cast<unsigned int>(cpu_info[0]);

    // CPUID.07H:EBX.AVX2[bit 5]
    if (max_level >= 7) {
        __cpuidex(cpu_info, 7, 0);
        features.has_avx2 = (cpu_info[1] & (1 << 5)) != 0;
    }

    // CPUID.01H:ECX.FMA[bit 12]
    __cpuid(cpu_info, 1);
    features.has_fma = (cpu_info[2] & (1 << 12)) != 0;
#else
    unsigned int eax, ebx, ecx, edx;
    if (__get_cpuid(0, &eax, &ebx, &ecx, &edx)) {
        const unsigned int max_level = eax;

        // CPUID.07H:EBX.AVX2[bit 5]
        if (max_level >= 7) {
            __cpuid_count(7, 0, eax, ebx, ecx, edx);
            features.has_avx2 = (ebx & (1u << 5)) != 0;
        }

        // CPUID.01H:ECX.FMA[bit 12]
        if (__get_cpuid(1, &eax, &ebx, &ecx, &edx)) {
            features.has_fma = (ecx & (1u << 12)) != 0;
        }
    }
#endif
#endif  // defined(COLSCORE_ARCH_X64)

#if defined(COLSCORE_ARCH_ARM64)
    // NEON is mandatory on AArch64
    features.has_neon = true;
#endif

    return features;
}

inline auto to_lower(std::string_view s) -> std::string {
    std::string out(s);
    for (char& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

constexpr std::array<std::string_view, 5> kKnownBackends{"scalar", "sse", "avx2", "neon", "auto"};

/** \brief Environment override for backend selection.
 *
 * COLSCORE_KERNEL_BACKEND, case-insensitive: scalar, sse, avx2, neon, auto.
 * "auto", unknown values and an unset variable yield an empty string (no override).
 */
inline auto get_backend_name_override() -> std::string {
    const auto env = core::safe_getenv("COLSCORE_KERNEL_BACKEND");
    if (!env || env->empty()) return {};
    std::string name = to_lower(*env);
    if (name == "auto" || !is_known_backend(name)) {
        if (core::debug_enabled() && name != "auto") {
            std::cerr << "[colscore][dispatch] ignoring COLSCORE_KERNEL_BACKEND=" << *env << "\n";
        }
        return {};
    }
    return name;
}

#if defined(COLSCORE_ARCH_X64)
inline bool avx2_usable() noexcept {
    const auto& f = cpu_features();
    return f.has_avx2 && f.has_fma;
}
#endif

inline const KernelOps& probe_best() noexcept {
#if defined(COLSCORE_ARCH_X64)
    if (avx2_usable()) return get_avx2_ops();
    if (cpu_features().has_sse2) return get_sse_ops();
#endif
#if defined(COLSCORE_ARCH_ARM64)
    if (cpu_features().has_neon) return get_neon_ops();
#endif
    return get_scalar_ops();
}

} // namespace detail

const CpuFeatures& cpu_features() noexcept {
    static const CpuFeatures features = detail::detect_cpu_features();
    return features;
}

bool is_known_backend(std::string_view name) noexcept {
    for (const auto known : detail::kKnownBackends) {
        if (name == known) return true;
    }
    return false;
}

auto canonical_backend_name(std::string_view name) -> std::string {
    return detail::to_lower(name);
}

const KernelOps& select_backend(std::string_view name) noexcept {
    if (name == "scalar") {
        return get_scalar_ops();
    }
    if (name == "auto") {
        return detail::probe_best();
    }

#if defined(COLSCORE_ARCH_X64)
    if (name == "avx2") {
        if (detail::avx2_usable()) {
            return get_avx2_ops();
        }
        // AVX2 unavailable: SSE is always present on x86-64
        return get_sse_ops();
    }
    if (name == "sse") {
        return get_sse_ops();
    }
#endif

#if defined(COLSCORE_ARCH_ARM64)
    if (name == "neon") {
        return get_neon_ops();
    }
#endif

    // Unknown or unsupported on this architecture
    return get_scalar_ops();
}

const KernelOps& select_backend_auto() noexcept {
    static const KernelOps& chosen = []() -> const KernelOps& {
        std::string override_name;
        try {
            override_name = detail::get_backend_name_override();
        } catch (const std::exception& e) {
            // Allocation failure while reading the environment; use the probe
            if (core::debug_enabled()) {
                std::cerr << "[colscore][dispatch] env override unavailable: " << e.what() << "\n";
            }
        }
        const KernelOps& ops = override_name.empty() ? detail::probe_best()
                                                     : select_backend(override_name);
        if (core::debug_enabled()) {
            const auto& f = cpu_features();
            std::cerr << "[colscore][dispatch] backend=" << ops.name
                      << " lanes=" << ops.lanes
                      << " override=" << (override_name.empty() ? "none" : override_name)
                      << " sse2=" << f.has_sse2 << " avx2=" << f.has_avx2
                      << " fma=" << f.has_fma << " neon=" << f.has_neon << "\n";
        }
        return ops;
    }();
    return chosen;
}

} // namespace colscore::kernels
