#include "learning_engine.h"

#include "inference_engine.h"
#include "test_support.h"

using namespace stock_dbn;
using namespace stock_dbn::testing;

static const std::vector<std::vector<double>> kTransition = {{0.7, 0.3}, {0.4, 0.6}};
static const std::vector<std::vector<double>> kEmission = {{0.9, 0.1}, {0.2, 0.8}};

static Observation obs(long long t, const std::string& node, const std::string& value)
{
    Observation o;
    o.timestamp = t;
    o.values[node] = value;
    return o;
}

static int test_soft_and_hard_counts()
{
    auto cpts = updown_cpts(kTransition, kEmission, 10.0);
    InferenceEngine inference(cpts);
    LearningEngine learning(cpts);

    BeliefState previous = BeliefState::from_prior(cpts->structure(), {{"H", {0.3, 0.7}}});
    Observation o = obs(1, "O", "up");
    BeliefPtr current = inference.filter(previous, o).belief;
    const std::vector<double>& prior = previous.marginal(0);
    const std::vector<double>& post = current->marginal(0);

    std::vector<double> h_before = cpts->table(0).all_counts();
    std::vector<double> o_before = cpts->table(1).all_counts();
    LearnResult result = learning.learn(previous, *current, o);
    std::vector<double> h_after = cpts->table(0).all_counts();
    std::vector<double> o_after = cpts->table(1).all_counts();

    EXPECT(result.rows_updated == 4, "two transition rows and two emission rows");
    for (int from = 0; from < 2; ++from) {
        for (int to = 0; to < 2; ++to) {
            EXPECT_NEAR(h_after[from * 2 + to] - h_before[from * 2 + to], prior[from] * post[to], 1e-12,
                        "transition count is previous(parent) x current(child)");
        }
    }
    for (int state = 0; state < 2; ++state) {
        EXPECT_NEAR(o_after[state * 2] - o_before[state * 2], prior[state], 1e-12,
                    "emission count weighted by the previous hidden marginal");
        EXPECT(std::abs(prior[state] - post[state]) > 0.1, "previous and posterior differ here");
        EXPECT_NEAR(o_after[state * 2 + 1], o_before[state * 2 + 1], 1e-12, "unobserved value untouched");
    }
    EXPECT(result.max_change > 0.0, "probabilities moved");
    EXPECT(rows_normalized(*cpts), "rows normalized");
    return 0;
}

static int test_emission_ignores_posterior()
{
    auto cpts = updown_cpts(kTransition, kEmission, 10.0);
    InferenceEngine inference(cpts);
    LearningEngine learning(cpts);
    BeliefState previous = BeliefState::uniform(cpts->structure());
    Observation o = obs(1, "O", "up");
    BeliefPtr current = inference.filter(previous, o).belief;

    std::vector<double> before = cpts->table(1).all_counts();
    learning.learn(previous, *current, o);
    std::vector<double> after = cpts->table(1).all_counts();
    EXPECT_NEAR(after[0] - before[0], 0.5, 1e-12, "up row gains previous(up)");
    EXPECT_NEAR(after[2] - before[2], 0.5, 1e-12, "down row gains previous(down)");
    return 0;
}

static int test_missing_value_skips_observed_table()
{
    auto cpts = updown_cpts(kTransition, kEmission, 10.0);
    InferenceEngine inference(cpts);
    LearningEngine learning(cpts);
    BeliefState previous = BeliefState::uniform(cpts->structure());
    Observation o = obs(1, "O", kMissingValue);
    BeliefPtr current = inference.filter(previous, o).belief;

    std::vector<double> o_before = cpts->table(1).all_counts();
    LearnResult result = learning.learn(previous, *current, o);
    EXPECT(result.rows_updated == 2, "only the transition rows learn");
    EXPECT(cpts->table(1).all_counts() == o_before, "emission counts unchanged");
    return 0;
}

static int test_malformed_observation_leaves_counts()
{
    auto cpts = updown_cpts(kTransition, kEmission, 10.0);
    InferenceEngine inference(cpts);
    LearningEngine learning(cpts, 0.5);
    BeliefState previous = BeliefState::uniform(cpts->structure());

    std::vector<double> h_before = cpts->table(0).all_counts();
    std::vector<double> o_before = cpts->table(1).all_counts();

    Observation bad = obs(1, "O", "sideways");
    FilterResult filtered = inference.filter(previous, bad);
    EXPECT(filtered.belief->is_normalized(), "filtering still produces a belief");
    EXPECT_THROWS(learning.learn(previous, *filtered.belief, bad), DataError, "value outside domain");

    Observation unknown = obs(1, "Volume", "high");
    EXPECT_THROWS(learning.learn(previous, *filtered.belief, unknown), DataError, "unknown node");

    EXPECT(cpts->table(0).all_counts() == h_before, "transition counts untouched");
    EXPECT(cpts->table(1).all_counts() == o_before, "emission counts untouched, no decay either");
    return 0;
}

static int test_mass_non_decreasing_without_decay()
{
    auto cpts = updown_cpts(kTransition, kEmission, 2.0);
    InferenceEngine inference(cpts);
    LearningEngine learning(cpts, 1.0);
    BeliefPtr belief = std::make_shared<const BeliefState>(BeliefState::uniform(cpts->structure()));

    const char* stream = "uudduduuuddddudu?uduu";
    for (int t = 0; stream[t] != '\0'; ++t) {
        std::string value = stream[t] == 'u' ? "up" : stream[t] == 'd' ? "down" : kMissingValue;
        Observation o = obs(t + 1, "O", value);
        BeliefPtr next = inference.filter(*belief, o).belief;

        std::vector<double> mass_before;
        for (int n = 0; n < 2; ++n) {
            for (size_t row = 0; row < 2; ++row) mass_before.push_back(cpts->table(n).row_mass(row));
        }
        learning.learn(*belief, *next, o);
        size_t i = 0;
        for (int n = 0; n < 2; ++n) {
            for (size_t row = 0; row < 2; ++row) {
                EXPECT(cpts->table(n).row_mass(row) >= mass_before[i++], "row mass never shrinks");
            }
        }
        EXPECT(rows_normalized(*cpts), "rows normalized every step");
        belief = next;
    }
    return 0;
}

static std::shared_ptr<CptStore> single_observed_root()
{
    auto structure = std::make_shared<const NetworkStructure>(
        NetworkStructure::build({{"O", {"up", "down"}, NodeRole::Observed}}, {}));
    return std::make_shared<CptStore>(structure, 2.0);
}

static double p_up_after_constant_stream(double gamma, int steps)
{
    auto cpts = single_observed_root();
    LearningEngine learning(cpts, gamma);
    BeliefState belief = BeliefState::uniform(cpts->structure());
    for (int t = 0; t < steps; ++t) {
        learning.learn(belief, belief, obs(t + 1, "O", "up"));
    }
    return cpts->row_probabilities(0, {})[0];
}

static int test_decay_shrinks_and_converges_faster()
{
    auto cpts = single_observed_root();
    LearningEngine learning(cpts, 0.5);
    BeliefState belief = BeliefState::uniform(cpts->structure());
    learning.learn(belief, belief, obs(1, "O", "up"));
    std::vector<double> counts = cpts->table(0).row_counts(0);
    EXPECT_NEAR(counts[1], 0.5, 1e-12, "old count halved before the addition");
    EXPECT_NEAR(counts[0], 1.5, 1e-12, "decayed count plus the new observation");

    double fast = p_up_after_constant_stream(0.5, 20);
    double slow = p_up_after_constant_stream(0.9, 20);
    double none = p_up_after_constant_stream(1.0, 20);
    EXPECT(fast > slow && slow > none, "smaller gamma converges faster");
    EXPECT(fast > 0.999, "gamma 0.5 reaches the stationary row");
    EXPECT_NEAR(none, 21.0 / 22.0, 1e-12, "plain accumulation");
    return 0;
}

static int test_convergence_warning_latches()
{
    auto cpts = single_observed_root();
    LearningEngine learning(cpts, 1.0, 1.0);
    BeliefState belief = BeliefState::uniform(cpts->structure());
    LearnResult first = learning.learn(belief, belief, obs(1, "O", "up"));
    EXPECT(first.diagnostics.size() == 1, "first quiet step reports convergence");
    EXPECT(first.diagnostics[0].kind == DiagnosticKind::ConvergenceWarning, "convergence warning");
    EXPECT(learning.has_converged(), "latched");
    LearnResult second = learning.learn(belief, belief, obs(2, "O", "up"));
    EXPECT(second.diagnostics.empty(), "reported once");
    return 0;
}

static int test_rejects_bad_decay()
{
    auto cpts = single_observed_root();
    EXPECT_THROWS(LearningEngine(cpts, 0.0), ConfigError, "gamma 0");
    EXPECT_THROWS(LearningEngine(cpts, 1.1), ConfigError, "gamma above 1");
    EXPECT_THROWS(LearningEngine(nullptr), ConfigError, "store required");
    return 0;
}

int main()
{
    if (test_soft_and_hard_counts() != 0) return 1;
    if (test_emission_ignores_posterior() != 0) return 1;
    if (test_missing_value_skips_observed_table() != 0) return 1;
    if (test_malformed_observation_leaves_counts() != 0) return 1;
    if (test_mass_non_decreasing_without_decay() != 0) return 1;
    if (test_decay_shrinks_and_converges_faster() != 0) return 1;
    if (test_convergence_warning_latches() != 0) return 1;
    if (test_rejects_bad_decay() != 0) return 1;
    return 0;
}
