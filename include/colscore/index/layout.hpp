#pragma once

/** \file layout.hpp
 *  \brief Flat-buffer contract, validation and packing for queries and corpora.
 *
 * Layout contract:
 * - A query is Tq * D floats, row-major.
 * - A corpus is one buffer of sum(token_counts) * D floats holding every document's
 *   tokens in order, plus one std::uint32_t token count per document.
 *
 * Every public entry point funnels through pack_query / pack_documents (or, for flat
 * input that needs no transformation, a borrowed CorpusView over the caller's buffer),
 * so validation and packing live in exactly one place.
 *
 * Thread-safety: free functions are reentrant. Packed objects are immutable once built.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>

#include "colscore/error.hpp"
#include "colscore/index/aligned_buffer.hpp"

namespace colscore::index {

/** \brief One token sequence in nested form: tokens x dim. */
using TokenEmbeddings = std::vector<std::vector<float>>;

/** \brief Ingest transformations applied while packing. */
struct PackOptions {
    bool normalize_rows{false};           /**< L2-normalize every token copy (cosine mode) */
    bool verify_normalized{false};        /**< reject tokens whose norm is not ~1 */
    float normalization_tolerance{1e-3f}; /**< |norm - 1| allowed by verify_normalized */
};

/** \brief Per-document offsets derived from token counts. */
struct DocumentLayout {
    std::vector<std::uint32_t> token_counts;
    std::vector<std::size_t> offsets;          /**< float offset of each document */
    std::size_t total_tokens{0};
    std::optional<std::uint32_t> uniform_tokens; /**< set when every document has the same Td */

    [[nodiscard]] auto num_documents() const noexcept -> std::size_t { return token_counts.size(); }
};

/** \brief Non-owning view of a query. */
struct QueryView {
    const float* data{nullptr};
    std::size_t tokens{0};
    std::size_t dim{0};
};

/** \brief Non-owning view of a corpus (packed or borrowed). */
struct CorpusView {
    const float* data{nullptr};
    const DocumentLayout* layout{nullptr};
    std::size_t dim{0};

    [[nodiscard]] auto num_documents() const noexcept -> std::size_t {
        return layout ? layout->num_documents() : 0;
    }
};

/** \brief Owned, aligned copy of a query. */
struct PackedQuery {
    AlignedFloatBuffer data;
    std::size_t tokens{0};
    std::size_t dim{0};

    [[nodiscard]] auto view() const noexcept -> QueryView { return {data.data(), tokens, dim}; }
};

/** \brief Owned, aligned copy of a corpus. Immutable after packing. */
struct PackedDocuments {
    AlignedFloatBuffer data;
    DocumentLayout layout;
    std::size_t dim{0};

    [[nodiscard]] auto view() const noexcept -> CorpusView { return {data.data(), &layout, dim}; }
    [[nodiscard]] auto num_documents() const noexcept -> std::size_t { return layout.num_documents(); }
};

/** \brief Requires dim > 0. */
[[nodiscard]] auto validate_dimension(std::size_t dim) -> std::expected<void, core::error>;

/** \brief Requires query.size() == tokens * dim. */
[[nodiscard]] auto validate_query(std::span<const float> query, std::size_t tokens,
                                  std::size_t dim) -> std::expected<void, core::error>;

/** \brief Requires docs.size() == sum(token_counts) * dim without overflow.
 *
 * \return total token count on success
 */
[[nodiscard]] auto validate_documents(std::span<const float> docs,
                                      std::span<const std::uint32_t> token_counts,
                                      std::size_t dim) -> std::expected<std::size_t, core::error>;

/** \brief Common token count when all counts are equal; nullopt for an empty list or mixed lengths. */
[[nodiscard]] auto detect_uniform(std::span<const std::uint32_t> token_counts) noexcept
    -> std::optional<std::uint32_t>;

/** \brief Prefix-sum offsets and uniform detection. Counts must already be validated. */
[[nodiscard]] auto make_layout(std::span<const std::uint32_t> token_counts, std::size_t dim)
    -> DocumentLayout;

/** \brief Dimension shared by every token of a nested sequence set.
 *
 * Returns the size of the first token found, or 0 when no sequence has a token.
 */
[[nodiscard]] auto infer_dimension(std::span<const TokenEmbeddings> sequences) noexcept -> std::size_t;

/** \brief L2-normalize each row of a row-major matrix in place. Zero rows are left unchanged. */
void normalize_rows(std::span<float> data, std::size_t dim) noexcept;

/** \brief Check every row's L2 norm is within tolerance of 1.
 *
 * \param what "query" or "document", used in the error message
 */
[[nodiscard]] auto verify_unit_rows(std::span<const float> data, std::size_t dim, float tolerance,
                                    const char* what) -> std::expected<void, core::error>;

/** \brief verify_unit_rows per document; errors name the document and its token. */
[[nodiscard]] auto verify_document_rows(std::span<const float> docs, const DocumentLayout& layout,
                                        std::size_t dim, float tolerance)
    -> std::expected<void, core::error>;

/** \brief Validate and copy a flat query. */
[[nodiscard]] auto pack_query(std::span<const float> query, std::size_t tokens, std::size_t dim,
                              const PackOptions& options = {})
    -> std::expected<PackedQuery, core::error>;

/** \brief Validate and flatten a nested query; every token must have dimension dim. */
[[nodiscard]] auto pack_query(const TokenEmbeddings& query, std::size_t dim,
                              const PackOptions& options = {})
    -> std::expected<PackedQuery, core::error>;

/** \brief Validate and copy a flat corpus. */
[[nodiscard]] auto pack_documents(std::span<const float> docs,
                                  std::span<const std::uint32_t> token_counts,
                                  std::size_t dim, const PackOptions& options = {})
    -> std::expected<PackedDocuments, core::error>;

/** \brief Validate and flatten nested documents; every token must have dimension dim. */
[[nodiscard]] auto pack_documents(std::span<const TokenEmbeddings> docs, std::size_t dim,
                                  const PackOptions& options = {})
    -> std::expected<PackedDocuments, core::error>;

} // namespace colscore::index
