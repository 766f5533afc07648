/**
 * Simple late-interaction search example using colscore
 *
 * This example demonstrates:
 * - Creating a scorer
 * - Scoring nested token embeddings
 * - Preloading a flat corpus
 * - Ranking documents by normalized MaxSim
 */

#include <colscore/maxsim.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <numeric>
#include <random>
#include <vector>

// Generate random unit-length token embeddings for demonstration
colscore::TokenEmbeddings generate_tokens(std::size_t tokens, std::size_t dim, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);

    colscore::TokenEmbeddings out(tokens, std::vector<float>(dim));
    for (auto& tok : out) {
        for (auto& v : tok) {
            v = dist(gen);
        }
    }
    return colscore::MaxSim::normalize(out);
}

int main() {
    using namespace colscore;

    auto engine = MaxSim::create();
    if (!engine) {
        std::cerr << "Failed to create scorer: " << engine.error().message << std::endl;
        return 1;
    }
    std::cout << engine->get_info() << std::endl;

    const std::size_t dimension = 128;
    const std::size_t num_docs = 200;

    // Documents of varying length, as produced by a real tokenizer
    std::vector<TokenEmbeddings> docs;
    docs.reserve(num_docs);
    for (std::size_t i = 0; i < num_docs; ++i) {
        docs.push_back(generate_tokens(16 + (i * 37) % 180, dimension, static_cast<std::uint32_t>(i + 1)));
    }

    // Query built from tokens of document 42 so that it ranks first
    TokenEmbeddings query(docs[42].begin(), docs[42].begin() + 8);

    // Nested convention: convenient, copies per call
    auto single = engine->maxsim_normalized(query, docs[42]);
    if (!single) {
        std::cerr << "Scoring failed: " << single.error().message << std::endl;
        return 1;
    }
    std::cout << "Score against source document: " << *single << std::endl;

    // Flat convention: pack once, search many times
    std::vector<float> flat;
    std::vector<std::uint32_t> counts;
    for (const auto& doc : docs) {
        counts.push_back(static_cast<std::uint32_t>(doc.size()));
        for (const auto& tok : doc) {
            flat.insert(flat.end(), tok.begin(), tok.end());
        }
    }

    if (auto loaded = engine->load_documents(flat, counts, dimension); !loaded) {
        std::cerr << "Failed to load corpus: " << loaded.error().message << std::endl;
        return 1;
    }
    std::cout << "Loaded " << engine->num_documents_loaded() << " documents" << std::endl;

    auto scores = engine->search_preloaded_normalized(query);
    if (!scores) {
        std::cerr << "Search failed: " << scores.error().message << std::endl;
        return 1;
    }

    std::vector<std::size_t> order(scores->size());
    std::iota(order.begin(), order.end(), 0);
    const std::size_t k = std::min<std::size_t>(5, order.size());
    std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(k), order.end(),
                      [&](std::size_t a, std::size_t b) { return (*scores)[a] > (*scores)[b]; });

    std::cout << "\nTop " << k << " documents:" << std::endl;
    for (std::size_t i = 0; i < k; ++i) {
        std::cout << "  doc " << order[i] << " (" << counts[order[i]] << " tokens): "
                  << (*scores)[order[i]] << std::endl;
    }

    engine->clear_documents();
    return 0;
}
