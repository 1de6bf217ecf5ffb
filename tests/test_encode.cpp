/*
 *      Tests of the likelihood and gradient.
 *
 * Copyright (c) 2007-2010, Naoaki Okazaki
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *     * Redistributions of source code must retain the above copyright
 *       notice, this list of conditions and the following disclaimer.
 *     * Redistributions in binary form must reproduce the above copyright
 *       notice, this list of conditions and the following disclaimer in the
 *       documentation and/or other materials provided with the distribution.
 *     * Neither the names of the authors nor the names of its contributors
 *       may be used to endorse or promote products derived from this
 *       software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/* $Id$ */

#include <math.h>
#include <stdexcept>

#include <gtest/gtest.h>

#include <crftree.h>
#include "crftree_internal.h"
#include "crft.h"

namespace {

/* A single binary variable with one indicator feature on state 1. */
crftree_featureset_t single_feature()
{
    crftree_featureset_t fs;
    fs.num_params = 1;
    fs.append(crftree_feature_t({0}, {1}, 0));
    return fs;
}

crftree_observation_t small_image(int V, int J)
{
    crftree_observation_t X(V, J);
    for (int v = 0;v < V;++v) {
        X.set(v, 0, 1);
        for (int j = 1;j < J;++j) {
            X.set(v, j, (v + j) % 2);
        }
    }
    return X;
}

}

TEST(Likelihood, SingleVariable)
{
    crftree_featureset_t fs = single_feature();
    crftree_model_params_t mp(2, 2, 0.);
    std::vector<int> y = {1};
    std::vector<floatval_t> theta = {.7}, grad;
    floatval_t nll = 0;

    ASSERT_EQ(CRFTREE_SUCCESS, crftree_evaluate_featureset(fs, y, theta, mp, &nll, grad));

    const floatval_t e = exp(.7);
    EXPECT_NEAR(log(1. + e) - .7, nll, 1e-12);
    ASSERT_EQ(1u, grad.size());
    EXPECT_NEAR(e / (1. + e) - 1., grad[0], 1e-12);

    /* The feature is inactive when the label is 0. */
    y = {0};
    ASSERT_EQ(CRFTREE_SUCCESS, crftree_evaluate_featureset(fs, y, theta, mp, &nll, grad));
    EXPECT_NEAR(log(1. + e), nll, 1e-12);
    EXPECT_NEAR(e / (1. + e), grad[0], 1e-12);
}

TEST(Likelihood, Regularization)
{
    crftree_featureset_t fs = single_feature();
    crftree_model_params_t mp(2, 2, .5);
    std::vector<int> y = {1};
    std::vector<floatval_t> theta = {-1.3}, grad;
    floatval_t nll = 0;

    ASSERT_EQ(CRFTREE_SUCCESS, crftree_evaluate_featureset(fs, y, theta, mp, &nll, grad));

    const floatval_t e = exp(-1.3);
    EXPECT_NEAR(log(1. + e) + 1.3 + .25 * 1.3 * 1.3, nll, 1e-12);
    EXPECT_NEAR(e / (1. + e) - 1. - .5 * 1.3, grad[0], 1e-12);
}

TEST(Likelihood, ZeroParametersGiveUniformPartition)
{
    crftree_observation_t X = small_image(3, 2);
    crftree_model_params_t mp(3, 2, 0.);
    std::vector<int> y = {0, 1, 2};
    std::vector<floatval_t> grad;
    floatval_t nll = 0;

    crftree_featureset_t fs;
    ASSERT_EQ(CRFTREE_SUCCESS, crftree_generate_features(X, y, mp, 1, fs));
    std::vector<floatval_t> theta(fs.num_params, 0.);

    ASSERT_EQ(CRFTREE_SUCCESS, crftree_evaluate(X, y, theta, mp, &nll, grad));
    EXPECT_NEAR(3. * log(3.), nll, 1e-12);
    ASSERT_EQ((size_t)fs.num_params, grad.size());

    /*
        Every unary marginal is 1/3 and every pairwise marginal 1/9, so
        the expectation of a parameter is its group size over the state
        count of its scope.
     */
    std::vector<feature_refs_t> refs;
    crftf_init_references(refs, fs.features, fs.num_params);
    for (int p = 0;p < fs.num_params;++p) {
        floatval_t etheta = 0., ed = 0.;
        for (auto fid: refs[p].fids) {
            const crftree_feature_t& f = fs.features[fid];
            etheta += (f.vars.size() == 1) ? 1. / 3. : 1. / 9.;
            bool active = true;
            for (size_t k = 0;k < f.vars.size();++k) {
                active = active && (y[f.vars[k]] == f.assignment[k]);
            }
            if (active) ed += 1.;
        }
        EXPECT_NEAR(etheta - ed, grad[p], 1e-12);
    }
}

TEST(Likelihood, SharedParametersAccumulate)
{
    crftree_featureset_t fs;
    fs.num_params = 1;
    fs.append(crftree_feature_t({0}, {1}, 0));
    fs.append(crftree_feature_t({1}, {1}, 0));
    crftree_model_params_t mp(2, 2, 0.);
    std::vector<int> y = {1, 0};
    std::vector<floatval_t> theta = {.4}, grad;
    floatval_t nll = 0;

    ASSERT_EQ(CRFTREE_SUCCESS, crftree_evaluate_featureset(fs, y, theta, mp, &nll, grad));

    const floatval_t e = exp(.4);
    EXPECT_NEAR(2. * log(1. + e) - .4, nll, 1e-12);
    EXPECT_NEAR(2. * e / (1. + e) - 1., grad[0], 1e-12);
}

TEST(Likelihood, ScopeOrderDoesNotMatter)
{
    crftree_model_params_t mp(3, 2, .1);
    std::vector<int> y = {0, 2};
    std::vector<floatval_t> theta = {.9, -.4}, g1, g2;
    floatval_t nll1 = 0, nll2 = 0;

    crftree_featureset_t fs1, fs2;
    fs1.num_params = fs2.num_params = 2;
    fs1.append(crftree_feature_t({0, 1}, {0, 2}, 0));
    fs1.append(crftree_feature_t({1}, {1}, 1));
    fs2.append(crftree_feature_t({1, 0}, {2, 0}, 0));
    fs2.append(crftree_feature_t({1}, {1}, 1));

    ASSERT_EQ(CRFTREE_SUCCESS, crftree_evaluate_featureset(fs1, y, theta, mp, &nll1, g1));
    ASSERT_EQ(CRFTREE_SUCCESS, crftree_evaluate_featureset(fs2, y, theta, mp, &nll2, g2));
    EXPECT_NEAR(nll1, nll2, 1e-12);
    EXPECT_NEAR(g1[0], g2[0], 1e-12);
    EXPECT_NEAR(g1[1], g2[1], 1e-12);
}

TEST(Gradient, AgreesWithFiniteDifferences)
{
    crftree_observation_t X = small_image(2, 2);
    crftree_model_params_t mp(3, 2, .1);
    std::vector<int> y = {2, 0};
    crftree_featureset_t fs;
    floatval_t error = 1.;

    ASSERT_EQ(CRFTREE_SUCCESS, crftree_generate_features(X, y, mp, 1, fs));
    std::vector<floatval_t> theta(fs.num_params);
    for (int p = 0;p < fs.num_params;++p) {
        theta[p] = .5 * sin(1. + 3. * p);
    }

    ASSERT_EQ(CRFTREE_SUCCESS, crftree_gradient_check(fs, y, theta, mp, 1e-5, &error));
    EXPECT_LT(error, 1e-4);
}

TEST(Gradient, AgreesWithFiniteDifferencesOnLoops)
{
    crftree_featureset_t fs;
    crftree_model_params_t mp(2, 2, .05);
    std::vector<int> y = {1, 0, 1, 1};
    floatval_t error = 1.;

    fs.num_params = 5;
    for (int v = 0;v < 4;++v) {
        fs.append(crftree_feature_t({v}, {1}, v % 2));
        for (int h = 0;h < 2;++h) {
            fs.append(crftree_feature_t({v, (v+1) % 4}, {h, h}, 2 + h));
        }
    }
    fs.append(crftree_feature_t({0, 2}, {1, 0}, 4));
    std::vector<floatval_t> theta = {.3, -.2, .8, -.5, 1.1};

    ASSERT_EQ(CRFTREE_SUCCESS, crftree_gradient_check(fs, y, theta, mp, 1e-5, &error));
    EXPECT_LT(error, 1e-4);
}

TEST(Gradient, ConsistencyCheckPassesOnCalibratedTrees)
{
    crftree_observation_t X = small_image(4, 3);
    crftree_model_params_t mp(3, 2, .01);
    std::vector<int> y = {0, 1, 2, 1};
    crftree_featureset_t fs;
    crfte_option_t opt;
    std::vector<floatval_t> grad;
    floatval_t nll = 0;

    ASSERT_EQ(CRFTREE_SUCCESS, crftree_generate_features(X, y, mp, 1, fs));
    std::vector<floatval_t> theta(fs.num_params);
    for (int p = 0;p < fs.num_params;++p) {
        theta[p] = cos(.7 * p);
    }

    opt.check_consistency = 1;
    opt.consistency_tolerance = 1e-9;
    EXPECT_NO_THROW(crfte_evaluate(fs, y, theta, mp, opt, &nll, grad, NULL));
    EXPECT_EQ((size_t)fs.num_params, grad.size());
}

TEST(Gradient, MissingCoveringCliqueThrows)
{
    std::vector<crftree_feature_t> features = {
        crftree_feature_t({0}, {1}, 0),
        crftree_feature_t({0, 1}, {1, 1}, 1),
    };
    std::vector<feature_refs_t> refs;
    std::vector<crftree_factor_t> factors;
    std::vector<floatval_t> theta = {.2, .3}, etheta;
    crft_cliquetree_t tree;
    crfte_option_t opt;

    /* The tree only knows the first feature. */
    ASSERT_EQ(CRFTREE_SUCCESS, crfte_assemble_factors(
        std::vector<crftree_feature_t>(features.begin(), features.begin() + 1), theta, 2, factors));
    ASSERT_EQ(CRFTREE_SUCCESS, tree.crftc_build(factors));
    ASSERT_EQ(CRFTREE_SUCCESS, tree.crftc_calibrate());

    crftf_init_references(refs, features, 2);
    EXPECT_THROW(crfte_model_expectation(tree, features, refs, opt, etheta), std::logic_error);
}

TEST(Gradient, DisagreeingCliquesThrowWhenChecked)
{
    /* The scope {1} is covered by both cliques of the chain {0,1}, {1,2}. */
    std::vector<crftree_feature_t> features = {
        crftree_feature_t({0, 1}, {1, 1}, 0),
        crftree_feature_t({1, 2}, {0, 0}, 1),
        crftree_feature_t({1}, {1}, 0),
    };
    std::vector<feature_refs_t> refs;
    std::vector<crftree_factor_t> factors;
    std::vector<floatval_t> theta = {1.5, -2.}, etheta;
    crft_cliquetree_t tree;
    crfte_option_t opt;

    ASSERT_EQ(CRFTREE_SUCCESS, crfte_assemble_factors(features, theta, 2, factors));
    ASSERT_EQ(CRFTREE_SUCCESS, tree.crftc_build(factors));
    ASSERT_EQ(2u, tree.num_cliques());
    std::vector<int> covering;
    tree.crftc_covering_cliques({1}, covering);
    ASSERT_EQ(2u, covering.size());

    /* Without calibration the cliques hold raw potentials and disagree. */
    crftf_init_references(refs, features, 2);
    EXPECT_NO_THROW(crfte_model_expectation(tree, features, refs, opt, etheta));

    opt.check_consistency = 1;
    EXPECT_THROW(crfte_model_expectation(tree, features, refs, opt, etheta), std::logic_error);

    /* After calibration they agree. */
    ASSERT_EQ(CRFTREE_SUCCESS, tree.crftc_calibrate());
    EXPECT_NO_THROW(crfte_model_expectation(tree, features, refs, opt, etheta));
}

TEST(Validation, RejectsOversizedFactors)
{
    /* 2^31 entries do not fit a factor table. */
    const int V = 31;
    crftree_featureset_t fs;
    crftree_model_params_t mp(2, 2, 0.);
    std::vector<int> vars, assignment(V, 0), y(V, 0);
    std::vector<floatval_t> theta = {0.}, grad = {42.};
    floatval_t nll = 123.;

    for (int v = 0;v < V;++v) vars.push_back(v);
    fs.num_params = 1;
    fs.append(crftree_feature_t(vars, assignment, 0));

    EXPECT_EQ(CRFTREEERR_OUTOFMEMORY, crftree_evaluate_featureset(fs, y, theta, mp, &nll, grad));
    EXPECT_EQ(123., nll);
    EXPECT_EQ(42., grad[0]);
}

TEST(Validation, RejectsBadInputsAndLeavesOutputs)
{
    crftree_model_params_t mp(2, 2, 0.);
    std::vector<int> y = {1, 0};
    std::vector<floatval_t> theta = {.1, .2};
    std::vector<floatval_t> grad = {42.};
    floatval_t nll = 123.;

    crftree_featureset_t fs;
    fs.num_params = 2;
    fs.append(crftree_feature_t({0}, {1}, 0));
    fs.append(crftree_feature_t({0, 1}, {1, 0}, 1));

    crftree_featureset_t bad = fs;
    bad.features[0].param = 2;
    EXPECT_EQ(CRFTREEERR_OUTOFRANGE, crftree_evaluate_featureset(bad, y, theta, mp, &nll, grad));

    bad = fs;
    bad.features[1].vars = {0, 2};
    EXPECT_EQ(CRFTREEERR_OUTOFRANGE, crftree_evaluate_featureset(bad, y, theta, mp, &nll, grad));

    bad = fs;
    bad.features[1].assignment = {1, 2};
    EXPECT_EQ(CRFTREEERR_OUTOFRANGE, crftree_evaluate_featureset(bad, y, theta, mp, &nll, grad));

    bad = fs;
    bad.features[1].vars = {1, 1};
    EXPECT_EQ(CRFTREEERR_INCOMPATIBLE, crftree_evaluate_featureset(bad, y, theta, mp, &nll, grad));

    bad = fs;
    bad.features[1].assignment = {1};
    EXPECT_EQ(CRFTREEERR_INCOMPATIBLE, crftree_evaluate_featureset(bad, y, theta, mp, &nll, grad));

    bad = fs;
    bad.features[0].vars.clear();
    bad.features[0].assignment.clear();
    EXPECT_EQ(CRFTREEERR_INCOMPATIBLE, crftree_evaluate_featureset(bad, y, theta, mp, &nll, grad));

    std::vector<floatval_t> shorter = {.1};
    EXPECT_EQ(CRFTREEERR_INCOMPATIBLE, crftree_evaluate_featureset(fs, y, shorter, mp, &nll, grad));

    std::vector<int> ybad = {1, 2};
    EXPECT_EQ(CRFTREEERR_OUTOFRANGE, crftree_evaluate_featureset(fs, ybad, theta, mp, &nll, grad));

    crftree_model_params_t negative(2, 2, -1.);
    EXPECT_EQ(CRFTREEERR_INCOMPATIBLE, crftree_evaluate_featureset(fs, y, theta, negative, &nll, grad));

    std::vector<floatval_t> huge = {1000., .2};
    EXPECT_EQ(CRFTREEERR_OVERFLOW, crftree_evaluate_featureset(fs, y, huge, mp, &nll, grad));

    EXPECT_EQ(123., nll);
    ASSERT_EQ(1u, grad.size());
    EXPECT_EQ(42., grad[0]);
}
