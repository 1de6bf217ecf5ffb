/*
 *      Negative log-likelihood and gradient.
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
#include <algorithm>
#include <map>
#include <vector>

#include <crftree.h>
#include "crftree_internal.h"
#include "crft.h"
#include "params.h"
#include "vecmath.h"

/**
 * Per-call data of the likelihood evaluation.
 */
struct crfte_t {
    const crftree_featureset_t& fs;     /**< Feature set. */
    std::vector<feature_refs_t> refs;   /**< Features grouped by parameter [P]. */
    crft_cliquetree_t tree;             /**< Clique tree of the feature factors. */
public:
    crfte_t(const crftree_featureset_t& fs) : fs(fs)
    {
        crftf_init_references(this->refs, fs.features, fs.num_params);
    }

    /* Test whether the labels agree with the assignment of a feature. */
    static bool active(const crftree_feature_t& f, const std::vector<int>& y)
    {
        for (size_t k = 0;k < f.vars.size();++k) {
            if (y[f.vars[k]] != f.assignment[k]) {
                return false;
            }
        }
        return true;
    }

    /*
        Empirical counts of the parameters and the total weight of the
        features that the labels activate.
     */
    floatval_t observation_expectation(
        const std::vector<int>& y,
        const std::vector<floatval_t>& theta,
        std::vector<floatval_t>& ed
        ) const
    {
        floatval_t score = 0.;
        const int P = this->fs.num_params;

        ed.assign(P, 0.);
        for (int p = 0;p < P;++p) {
            const feature_refs_t& group = this->refs[p];
            for (int r = 0;r < group.num_features;++r) {
                const crftree_feature_t& f = this->fs.features[group.fids[r]];
                if (active(f, y)) {
                    ed[p] += 1.;
                    score += theta[p];
                }
            }
        }
        return score;
    }
};

int crfte_assemble_factors(
    const std::vector<crftree_feature_t>& features,
    const std::vector<floatval_t>& theta,
    int num_hidden_states,
    std::vector<crftree_factor_t>& factors
    )
{
    std::vector<crftree_factor_t> fac(features.size());

    for (size_t i = 0;i < features.size();++i) {
        const crftree_feature_t& f = features[i];
        std::vector<int> card(f.vars.size(), num_hidden_states);
        floatval_t value = exp(theta[f.param]);
        if (!isfinite(value)) {
            return CRFTREEERR_OVERFLOW;
        }

        int ret = crftree_factor_init(fac[i], f.vars, card, 1.);
        if (ret != CRFTREE_SUCCESS) {
            return ret;
        }
        fac[i].val[crftree_assignment_to_index(f.assignment, card)] = value;
    }

    factors.swap(fac);
    return CRFTREE_SUCCESS;
}

void crfte_model_expectation(
    const crft_cliquetree_t& tree,
    const std::vector<crftree_feature_t>& features,
    const std::vector<feature_refs_t>& refs,
    const crfte_option_t& opt,
    std::vector<floatval_t>& etheta
    )
{
    /* Normalized marginal of each distinct (sorted) scope. */
    std::map<std::vector<int>, crftree_factor_t> marginals;
    std::vector<int> a, covering;
    const int P = refs.size();

    etheta.assign(P, 0.);

    for (int p = 0;p < P;++p) {
        const feature_refs_t& group = refs[p];
        floatval_t s = 0.;

        for (int r = 0;r < group.num_features;++r) {
            const crftree_feature_t& f = features[group.fids[r]];
            std::vector<int> scope(f.vars);
            std::sort(scope.begin(), scope.end());

            auto it = marginals.find(scope);
            if (it == marginals.end()) {
                crftree_factor_t m;
                int c = tree.crftc_find_clique(scope);
                if (c < 0) {
                    throw std::logic_error("no clique covers the scope of a feature");
                }
                tree.crftc_marginal(c, scope, m);

                if (opt.check_consistency) {
                    tree.crftc_covering_cliques(scope, covering);
                    for (auto d: covering) {
                        crftree_factor_t n;
                        tree.crftc_marginal(d, scope, n);
                        if (opt.consistency_tolerance < vecmaxdiff(m.val.begin(), n.val.begin(), m.num_values())) {
                            throw std::logic_error("cliques covering a feature scope disagree");
                        }
                    }
                }

                it = marginals.insert(std::make_pair(scope, m)).first;
            }

            /* Reorder the assignment to the ascending scope of the marginal. */
            const crftree_factor_t& m = it->second;
            a.resize(m.num_vars());
            for (size_t k = 0;k < m.num_vars();++k) {
                size_t i = std::find(f.vars.begin(), f.vars.end(), m.vars[k]) - f.vars.begin();
                a[k] = f.assignment[i];
            }
            s += m.val[crftree_assignment_to_index(a, m.card)];
        }

        etheta[p] = s;
    }
}

int crfte_exchange_options(crftree_params_t* params, crfte_option_t* opt, int mode)
{
    BEGIN_PARAM_MAP(params, mode)
        DDX_PARAM_INT(
            "calibration.check_consistency", opt->check_consistency, 0,
            "Compare the marginals of every clique covering a feature scope."
            )
        DDX_PARAM_FLOAT(
            "calibration.consistency_tolerance", opt->consistency_tolerance, 1e-6,
            "The largest difference allowed between such marginals."
            )
    END_PARAM_MAP()

    return 0;
}

int crfte_validate(
    const crftree_featureset_t& fs,
    const std::vector<int>& y,
    const std::vector<floatval_t>& theta,
    const crftree_model_params_t& mp
    )
{
    const int K = mp.num_hidden_states;
    const int V = y.size();
    const int P = fs.num_params;

    if (K <= 0 || mp.num_observed_states <= 0 || mp.lambda < 0.) {
        return CRFTREEERR_INCOMPATIBLE;
    }
    if (P < 0 || (int)theta.size() != P) {
        return CRFTREEERR_INCOMPATIBLE;
    }

    for (auto label: y) {
        if (label < 0 || K <= label) {
            return CRFTREEERR_OUTOFRANGE;
        }
    }

    for (const auto& f: fs.features) {
        if (f.vars.empty() || f.vars.size() != f.assignment.size()) {
            return CRFTREEERR_INCOMPATIBLE;
        }
        if (f.param < 0 || P <= f.param) {
            return CRFTREEERR_OUTOFRANGE;
        }
        for (size_t k = 0;k < f.vars.size();++k) {
            if (f.vars[k] < 0 || V <= f.vars[k]) {
                return CRFTREEERR_OUTOFRANGE;
            }
            if (f.assignment[k] < 0 || K <= f.assignment[k]) {
                return CRFTREEERR_OUTOFRANGE;
            }
            for (size_t l = 0;l < k;++l) {
                if (f.vars[l] == f.vars[k]) {
                    return CRFTREEERR_INCOMPATIBLE;
                }
            }
        }
    }

    for (auto w: theta) {
        if (!isfinite(exp(w))) {
            return CRFTREEERR_OVERFLOW;
        }
    }

    return CRFTREE_SUCCESS;
}

int crfte_evaluate(
    const crftree_featureset_t& fs,
    const std::vector<int>& y,
    const std::vector<floatval_t>& theta,
    const crftree_model_params_t& mp,
    const crfte_option_t& opt,
    floatval_t *ptr_nll,
    std::vector<floatval_t>& grad,
    crfte_stats_t *stats
    )
{
    int ret = 0;
    std::vector<crftree_factor_t> factors;
    std::vector<floatval_t> ed, etheta;
    const int P = fs.num_params;

    if ((ret = crfte_validate(fs, y, theta, mp)) != CRFTREE_SUCCESS) {
        return ret;
    }

    crfte_t crfte(fs);

    /* Factors, clique tree and calibration. */
    if ((ret = crfte_assemble_factors(fs.features, theta, mp.num_hidden_states, factors)) != CRFTREE_SUCCESS) {
        return ret;
    }
    if ((ret = crfte.tree.crftc_build(factors)) != CRFTREE_SUCCESS) {
        return ret;
    }
    if ((ret = crfte.tree.crftc_calibrate()) != CRFTREE_SUCCESS) {
        return ret;
    }

    /* Negative log-likelihood. */
    const floatval_t logz = crfte.tree.crftc_lognorm();
    const floatval_t score = crfte.observation_expectation(y, theta, ed);
    const floatval_t nll = logz - score + 0.5 * mp.lambda * vecsumsq(theta.begin(), P);

    /* Gradient. */
    crfte_model_expectation(crfte.tree, fs.features, crfte.refs, opt, etheta);
    std::vector<floatval_t> g(P);
    for (int p = 0;p < P;++p) {
        g[p] = etheta[p] - ed[p] + mp.lambda * theta[p];
    }

    if (stats != NULL) {
        stats->num_features = fs.num_features();
        stats->num_params = P;
        stats->num_cliques = crfte.tree.num_cliques();
        stats->max_clique_size = crfte.tree.max_clique_size();
        stats->log_norm = logz;
        stats->nll = nll;
    }

    *ptr_nll = nll;
    grad.swap(g);
    return CRFTREE_SUCCESS;
}

int crftree_evaluate_featureset(
    const crftree_featureset_t& fs,
    const std::vector<int>& y,
    const std::vector<floatval_t>& theta,
    const crftree_model_params_t& mp,
    floatval_t *ptr_nll,
    std::vector<floatval_t>& grad
    )
{
    crfte_option_t opt;
    return crfte_evaluate(fs, y, theta, mp, opt, ptr_nll, grad, NULL);
}

int crftree_evaluate(
    const crftree_observation_t& X,
    const std::vector<int>& y,
    const std::vector<floatval_t>& theta,
    const crftree_model_params_t& mp,
    floatval_t *ptr_nll,
    std::vector<floatval_t>& grad
    )
{
    int ret = 0;
    crftree_featureset_t fs;

    if ((ret = crftree_generate_features(X, y, mp, 1, fs)) != CRFTREE_SUCCESS) {
        return ret;
    }
    return crftree_evaluate_featureset(fs, y, theta, mp, ptr_nll, grad);
}
