/*
 *      Internal declarations of the evaluator.
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

#ifndef __CRFTREE_INTERNAL_H__
#define __CRFTREE_INTERNAL_H__

#include <crftree.h>
#include "logging.h"

/**
 * Options of the likelihood evaluation.
 */
struct crfte_option_t {
    int         check_consistency;      /** Cross-check every covering clique. */
    floatval_t  consistency_tolerance;  /** Tolerance of the cross-check. */
public:
    crfte_option_t() : check_consistency(0), consistency_tolerance(1e-6) {}
};

/**
 * Summary of one evaluation (for logging).
 */
struct crfte_stats_t {
    int         num_features;
    int         num_params;
    int         num_cliques;
    int         max_clique_size;
    floatval_t  log_norm;
    floatval_t  nll;
public:
    crfte_stats_t()
        : num_features(0), num_params(0), num_cliques(0), max_clique_size(0),
          log_norm(0), nll(0) {}
};

/**
 * Exchanges the evaluation options.
 *  @param  params      The parameter interface.
 *  @param  opt         The options.
 *  @param  mode        The direction of parameter exchange.
 *  @return             A status code.
 */
int crfte_exchange_options(crftree_params_t* params, crfte_option_t* opt, int mode);

/**
 * Validate a feature set against labels, parameters and model parameters.
 *  @return             A status code.
 */
int crfte_validate(
    const crftree_featureset_t& fs,
    const std::vector<int>& y,
    const std::vector<floatval_t>& theta,
    const crftree_model_params_t& mp
    );

/**
 * Compute the negative log-likelihood and the gradient for a feature set.
 *  The inputs are validated first; outputs are untouched on error.
 *  @param  fs          The feature set.
 *  @param  y           The true labels.
 *  @param  theta       The parameters.
 *  @param  mp          The model parameters.
 *  @param  opt         The evaluation options.
 *  @param  ptr_nll     The pointer that receives the negative log-likelihood.
 *  @param  grad        The vector that receives the gradient.
 *  @param  stats       The pointer that receives the summary (may be NULL).
 *  @return             A status code.
 */
int crfte_evaluate(
    const crftree_featureset_t& fs,
    const std::vector<int>& y,
    const std::vector<floatval_t>& theta,
    const crftree_model_params_t& mp,
    const crfte_option_t& opt,
    floatval_t *ptr_nll,
    std::vector<floatval_t>& grad,
    crfte_stats_t *stats
    );

/**
 * Compare the analytic gradient with central finite differences.
 *  Reports the progress over the parameters to #lg.
 *  @param  ptr_error   The pointer that receives the maximum absolute
 *                      difference over the parameters.
 *  @return             A status code.
 */
int crfte_gradient_check(
    const crftree_featureset_t& fs,
    const std::vector<int>& y,
    const std::vector<floatval_t>& theta,
    const crftree_model_params_t& mp,
    const crfte_option_t& opt,
    floatval_t epsilon,
    floatval_t *ptr_error,
    logging_t *lg
    );

/**
 * Internal data structure for the evaluator object.
 */
struct tag_crftree_evaluator_internal: public tag_crftree_evaluator {
    crftree_params_t *m_params;     /**< Parameter interface. */
    logging_t* lg;                  /**< Logging interface. */
    crftree_model_params_t mp;      /**< Model parameters. */
    int pairwise;                   /**< Emit pairwise features. */
    crfte_option_t opt;             /**< Evaluation options. */

    tag_crftree_evaluator_internal();
    ~tag_crftree_evaluator_internal();

    crftree_params_t* params();
    void set_message_callback(void *instance, crftree_logging_callback cbm);
    int evaluate(
        const crftree_observation_t& X,
        const std::vector<int>& y,
        const std::vector<floatval_t>& theta,
        floatval_t *ptr_nll,
        std::vector<floatval_t>& grad
        );
    int features(
        const crftree_observation_t& X,
        const std::vector<int>& y,
        crftree_featureset_t& fs
        );

private:
    int exchange_options(int mode);
};
typedef struct tag_crftree_evaluator_internal crftree_evaluator_internal_t;

int crfte_create_instance(const char *iid, void **ptr);

#endif/*__CRFTREE_INTERNAL_H__*/
