#include "colscore/index/layout.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <string>

#include "colscore/kernels/similarity.hpp"

namespace colscore::index {

namespace {

constexpr const char* kComponent = "layout";

auto float_to_string(float v) -> std::string {
    // std::to_string uses %f, which hides small deviations
    char buf[32];
    const int n = std::snprintf(buf, sizeof(buf), "%g", static_cast<double>(v));
    return n > 0 ? std::string(buf, static_cast<std::size_t>(n)) : std::string("?");
}

auto check_nested_tokens(const TokenEmbeddings& seq, std::size_t dim, const std::string& label)
    -> std::expected<void, core::error> {
    for (std::size_t t = 0; t < seq.size(); ++t) {
        if (seq[t].size() != dim) {
            return core::make_error(core::error_code::invalid_argument,
                label + " token " + std::to_string(t) + " has dimension " +
                    std::to_string(seq[t].size()) + ", expected " + std::to_string(dim),
                kComponent);
        }
    }
    return {};
}

// Rows are numbered from 0 within data; label names the owning sequence.
auto check_unit_rows(std::span<const float> data, std::size_t dim, float tolerance,
                     const std::string& label) -> std::expected<void, core::error> {
    if (dim == 0) return {};
    const std::size_t rows = data.size() / dim;
    for (std::size_t r = 0; r < rows; ++r) {
        const float norm = std::sqrt(kernels::squared_norm(data.subspan(r * dim, dim)));
        if (!(std::fabs(norm - 1.0f) <= tolerance)) {
            return core::make_error(core::error_code::precondition_failed,
                label + " token " + std::to_string(r) + " has L2 norm " +
                    float_to_string(norm) + ", expected 1 within " + float_to_string(tolerance),
                kComponent);
        }
    }
    return {};
}

// Normalization and verification run once on freshly copied data, never on scoring paths.
auto apply_ingest(AlignedFloatBuffer& data, std::size_t dim, const PackOptions& options,
                  const char* what) -> std::expected<void, core::error> {
    if (options.normalize_rows) {
        normalize_rows(data, dim);
        return {};
    }
    if (options.verify_normalized) {
        return check_unit_rows(data, dim, options.normalization_tolerance, what);
    }
    return {};
}

auto apply_ingest(PackedDocuments& packed, const PackOptions& options)
    -> std::expected<void, core::error> {
    if (options.normalize_rows) {
        normalize_rows(packed.data, packed.dim);
        return {};
    }
    if (options.verify_normalized) {
        return verify_document_rows(packed.data, packed.layout, packed.dim,
                                    options.normalization_tolerance);
    }
    return {};
}

} // namespace

auto validate_dimension(std::size_t dim) -> std::expected<void, core::error> {
    if (dim == 0) {
        return core::make_error(core::error_code::invalid_argument,
                                "embedding dimension must be positive", kComponent);
    }
    return {};
}

auto validate_query(std::span<const float> query, std::size_t tokens, std::size_t dim)
    -> std::expected<void, core::error> {
    if (auto ok = validate_dimension(dim); !ok) return ok;
    if (tokens > std::numeric_limits<std::size_t>::max() / dim) {
        return core::make_error(core::error_code::out_of_range,
                                "query token_count*dim overflows size_t", kComponent);
    }
    const std::size_t expected = tokens * dim;
    if (query.size() != expected) {
        return core::make_error(core::error_code::invalid_argument,
            "query buffer length " + std::to_string(query.size()) +
                " does not match expected token_count*dim=" + std::to_string(expected),
            kComponent);
    }
    return {};
}

auto validate_documents(std::span<const float> docs, std::span<const std::uint32_t> token_counts,
                        std::size_t dim) -> std::expected<std::size_t, core::error> {
    if (auto ok = validate_dimension(dim); !ok) return std::unexpected(ok.error());

    std::size_t total = 0;
    for (const auto c : token_counts) {
        if (c > std::numeric_limits<std::size_t>::max() - total) {
            return core::make_error(core::error_code::out_of_range,
                                    "sum of document token counts overflows size_t", kComponent);
        }
        total += c;
    }
    if (total > std::numeric_limits<std::size_t>::max() / dim) {
        return core::make_error(core::error_code::out_of_range,
                                "document token_count*dim overflows size_t", kComponent);
    }
    const std::size_t expected = total * dim;
    if (docs.size() != expected) {
        return core::make_error(core::error_code::invalid_argument,
            "document buffer length " + std::to_string(docs.size()) +
                " does not match expected token_count*dim=" + std::to_string(expected),
            kComponent);
    }
    return total;
}

auto detect_uniform(std::span<const std::uint32_t> token_counts) noexcept
    -> std::optional<std::uint32_t> {
    if (token_counts.empty()) return std::nullopt;
    const std::uint32_t first = token_counts.front();
    const bool uniform = std::all_of(token_counts.begin(), token_counts.end(),
                                     [first](std::uint32_t c) { return c == first; });
    return uniform ? std::optional<std::uint32_t>(first) : std::nullopt;
}

auto make_layout(std::span<const std::uint32_t> token_counts, std::size_t dim) -> DocumentLayout {
    DocumentLayout layout;
    layout.token_counts.assign(token_counts.begin(), token_counts.end());
    layout.offsets.resize(token_counts.size());
    std::size_t offset = 0;
    std::size_t total = 0;
    for (std::size_t i = 0; i < token_counts.size(); ++i) {
        layout.offsets[i] = offset;
        offset += static_cast<std::size_t>(token_counts[i]) * dim;
        total += token_counts[i];
    }
    layout.total_tokens = total;
    layout.uniform_tokens = detect_uniform(token_counts);
    return layout;
}

auto infer_dimension(std::span<const TokenEmbeddings> sequences) noexcept -> std::size_t {
    for (const auto& seq : sequences) {
        if (!seq.empty()) return seq.front().size();
    }
    return 0;
}

void normalize_rows(std::span<float> data, std::size_t dim) noexcept {
    if (dim == 0) return;
    const std::size_t rows = data.size() / dim;
    for (std::size_t r = 0; r < rows; ++r) {
        const std::span<float> row = data.subspan(r * dim, dim);
        const float sq = kernels::squared_norm(row);
        if (sq > 0.0f) {
            const float inv = 1.0f / std::sqrt(sq);
            for (float& v : row) v *= inv;
        }
    }
}

auto verify_unit_rows(std::span<const float> data, std::size_t dim, float tolerance,
                      const char* what) -> std::expected<void, core::error> {
    return check_unit_rows(data, dim, tolerance, what);
}

auto verify_document_rows(std::span<const float> docs, const DocumentLayout& layout,
                          std::size_t dim, float tolerance) -> std::expected<void, core::error> {
    if (dim == 0) return {};
    for (std::size_t d = 0; d < layout.num_documents(); ++d) {
        const std::size_t len = static_cast<std::size_t>(layout.token_counts[d]) * dim;
        const auto rows = docs.subspan(layout.offsets[d], len);
        if (auto ok = check_unit_rows(rows, dim, tolerance, "document " + std::to_string(d)); !ok) {
            return ok;
        }
    }
    return {};
}

auto pack_query(std::span<const float> query, std::size_t tokens, std::size_t dim,
                const PackOptions& options) -> std::expected<PackedQuery, core::error> {
    if (auto ok = validate_query(query, tokens, dim); !ok) return std::unexpected(ok.error());

    PackedQuery packed;
    packed.data.assign(query.begin(), query.end());
    packed.tokens = tokens;
    packed.dim = dim;
    if (auto ok = apply_ingest(packed.data, dim, options, "query"); !ok) {
        return std::unexpected(ok.error());
    }
    return packed;
}

auto pack_query(const TokenEmbeddings& query, std::size_t dim, const PackOptions& options)
    -> std::expected<PackedQuery, core::error> {
    if (auto ok = validate_dimension(dim); !ok) return std::unexpected(ok.error());
    if (auto ok = check_nested_tokens(query, dim, "query"); !ok) return std::unexpected(ok.error());

    PackedQuery packed;
    packed.data.reserve(query.size() * dim);
    for (const auto& token : query) {
        packed.data.insert(packed.data.end(), token.begin(), token.end());
    }
    packed.tokens = query.size();
    packed.dim = dim;
    if (auto ok = apply_ingest(packed.data, dim, options, "query"); !ok) {
        return std::unexpected(ok.error());
    }
    return packed;
}

auto pack_documents(std::span<const float> docs, std::span<const std::uint32_t> token_counts,
                    std::size_t dim, const PackOptions& options)
    -> std::expected<PackedDocuments, core::error> {
    if (auto total = validate_documents(docs, token_counts, dim); !total) {
        return std::unexpected(total.error());
    }

    PackedDocuments packed;
    packed.data.assign(docs.begin(), docs.end());
    packed.layout = make_layout(token_counts, dim);
    packed.dim = dim;
    if (auto ok = apply_ingest(packed, options); !ok) {
        return std::unexpected(ok.error());
    }
    return packed;
}

auto pack_documents(std::span<const TokenEmbeddings> docs, std::size_t dim,
                    const PackOptions& options) -> std::expected<PackedDocuments, core::error> {
    if (auto ok = validate_dimension(dim); !ok) return std::unexpected(ok.error());

    std::vector<std::uint32_t> counts;
    counts.reserve(docs.size());
    std::size_t total = 0;
    for (std::size_t d = 0; d < docs.size(); ++d) {
        const auto& doc = docs[d];
        if (doc.size() > std::numeric_limits<std::uint32_t>::max()) {
            return core::make_error(core::error_code::out_of_range,
                "document " + std::to_string(d) + " has more than 2^32-1 tokens", kComponent);
        }
        if (auto ok = check_nested_tokens(doc, dim, "document " + std::to_string(d)); !ok) {
            return std::unexpected(ok.error());
        }
        counts.push_back(static_cast<std::uint32_t>(doc.size()));
        total += doc.size();
    }

    PackedDocuments packed;
    packed.data.reserve(total * dim);
    for (const auto& doc : docs) {
        for (const auto& token : doc) {
            packed.data.insert(packed.data.end(), token.begin(), token.end());
        }
    }
    packed.layout = make_layout(counts, dim);
    packed.dim = dim;
    if (auto ok = apply_ingest(packed, options); !ok) {
        return std::unexpected(ok.error());
    }
    return packed;
}

} // namespace colscore::index
