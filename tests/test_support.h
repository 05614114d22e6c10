#pragma once

#include <cmath>
#include <cstdio>
#include <memory>
#include <vector>

#include "cpt_store.h"
#include "network_structure.h"

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
        return 1; \
    } \
} while (0)

#define EXPECT_NEAR(a, b, tol, msg) EXPECT(std::abs((a) - (b)) <= (tol), msg)

#define EXPECT_THROWS(stmt, type, msg) do { \
    bool thrown_ = false; \
    try { stmt; } catch (const type&) { thrown_ = true; } \
    EXPECT(thrown_, msg); \
} while (0)

namespace stock_dbn {
namespace testing {

// Hidden H{up,down} with H(t-1) -> H(t), observed O{up,down} with H(t) -> O(t).
inline std::shared_ptr<const NetworkStructure> updown_structure() {
    return std::make_shared<const NetworkStructure>(NetworkStructure::build(
        {{"H", {"up", "down"}, NodeRole::Hidden}, {"O", {"up", "down"}, NodeRole::Observed}},
        {{"H", "H", SliceRelation::Inter}, {"H", "O", SliceRelation::Intra}}));
}

// transition[i] is the row for previous state i, emission[i] the row for state i.
inline std::shared_ptr<CptStore> updown_cpts(const std::vector<std::vector<double>>& transition,
                                             const std::vector<std::vector<double>>& emission,
                                             double strength = 1.0) {
    auto cpts = std::make_shared<CptStore>(updown_structure(), strength);
    for (int i = 0; i < 2; ++i) {
        cpts->set_row(0, {i}, transition[i], strength);
        cpts->set_row(1, {i}, emission[i], strength);
    }
    return cpts;
}

inline bool rows_normalized(const CptStore& cpts, double tolerance = 1e-9) {
    for (size_t n = 0; n < cpts.structure().size(); ++n) {
        const ConditionalTable& table = cpts.table(static_cast<int>(n));
        for (size_t row = 0; row < table.row_count(); ++row) {
            double sum = 0.0;
            for (size_t k = 0; k < table.values(); ++k) {
                double p = table.probability(row, k);
                if (p < 0.0) return false;
                sum += p;
            }
            if (std::abs(sum - 1.0) > tolerance) return false;
        }
    }
    return true;
}

}  // namespace testing
}  // namespace stock_dbn
