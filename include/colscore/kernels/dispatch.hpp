#pragma once

/** \file dispatch.hpp
 *  \brief SIMD kernel interface and dispatcher. Scalar is the default backend.
 *
 * Preconditions for all ops: a.size() == b.size() == dim; inputs finite.
 * Determinism: each backend is bit-for-bit reproducible for identical inputs. Backends
 * agree with each other only within float tolerance, since lane-parallel accumulation
 * reorders the summation.
 * Row consistency: max_dot_product evaluates every row with exactly the arithmetic of
 * dot_product on the same backend, so grouping rows into blocks never changes a value.
 */

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace colscore::kernels {

struct KernelOps {
  const char* name;      /**< "scalar" | "sse" | "avx2" | "neon" */
  std::size_t lanes;     /**< floats per vector register (1 for scalar) */

  float (*dot_product)(std::span<const float>, std::span<const float>) noexcept;
  float (*squared_norm)(std::span<const float>) noexcept;

  // Max dot product of one query token against ntokens row-major tokens; -inf if empty.
  float (*max_dot_product)(std::span<const float> query,
                           const float* tokens, std::size_t ntokens, std::size_t dim) noexcept;
};

/** \brief CPU feature flags relevant to backend selection. */
struct CpuFeatures {
  bool has_sse2{false};
  bool has_avx2{false};
  bool has_fma{false};
  bool has_neon{false};
};

/** \brief Cached CPU feature probe (CPUID on x86-64). */
const CpuFeatures& cpu_features() noexcept;

/** \brief True for backend names understood by select_backend ("auto" included). */
bool is_known_backend(std::string_view name) noexcept;

/** \brief ASCII lower-case form of a backend name; names are matched case-insensitively. */
auto canonical_backend_name(std::string_view name) -> std::string;

// Returns a stable reference valid for the process lifetime. "scalar" is the default backend.
// Unsupported or unknown names fall back: avx2 -> sse -> scalar, neon -> scalar.
const KernelOps& select_backend(std::string_view name = "scalar") noexcept;

/** \brief Auto-selects a kernel backend based on CPU features.
 *
 * COLSCORE_KERNEL_BACKEND (scalar|sse|avx2|neon|auto, case-insensitive) overrides the probe.
 * Thread-safe initialization and stable reference semantics apply.
 */
const KernelOps& select_backend_auto() noexcept;

} // namespace colscore::kernels
