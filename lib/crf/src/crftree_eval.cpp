/*
 *      Evaluator object.
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

#include <string.h>
#include <time.h>

#include <crftree.h>
#include "crftree_internal.h"
#include "params.h"
#include "logging.h"

tag_crftree_evaluator_internal::tag_crftree_evaluator_internal()
    : pairwise(1)
{
    this->lg = new logging_t();
    this->m_params = params_create_instance();
    this->exchange_options(0);
}

tag_crftree_evaluator_internal::~tag_crftree_evaluator_internal()
{
    if (this->m_params != NULL) {
        this->m_params->release(this->m_params);
    }
    delete this->lg;
}

int tag_crftree_evaluator_internal::exchange_options(int mode)
{
    crftree_model_params_t *mp = &this->mp;

    BEGIN_PARAM_MAP(this->m_params, mode)
        DDX_PARAM_INT(
            "model.num_hidden_states", mp->num_hidden_states, 26,
            "The number of hidden states of every variable."
            )
        DDX_PARAM_INT(
            "model.num_observed_states", mp->num_observed_states, 2,
            "The number of states of every image feature."
            )
        DDX_PARAM_FLOAT(
            "regularization.lambda", mp->lambda, 0.003,
            "The coefficient of the L2 regularization."
            )
        DDX_PARAM_INT(
            "feature.pairwise", this->pairwise, 1,
            "Generate transition features between adjacent variables."
            )
    END_PARAM_MAP()

    return crfte_exchange_options(this->m_params, &this->opt, mode);
}

void tag_crftree_evaluator_internal::set_message_callback(void *instance, crftree_logging_callback cbm)
{
    this->lg->func = cbm;
    this->lg->instance = instance;
}

crftree_params_t* tag_crftree_evaluator_internal::params()
{
    crftree_params_t* params = this->m_params;
    params->addref(params);
    return params;
}

int tag_crftree_evaluator_internal::features(
    const crftree_observation_t& X,
    const std::vector<int>& y,
    crftree_featureset_t& fs
    )
{
    this->exchange_options(-1);
    return crftree_generate_features(X, y, this->mp, this->pairwise, fs);
}

int tag_crftree_evaluator_internal::evaluate(
    const crftree_observation_t& X,
    const std::vector<int>& y,
    const std::vector<floatval_t>& theta,
    floatval_t *ptr_nll,
    std::vector<floatval_t>& grad
    )
{
    int ret = 0;
    clock_t begin = clock();
    logging_t *lg = this->lg;
    crftree_featureset_t fs;
    crfte_stats_t stats;

    if ((ret = this->features(X, y, fs)) != CRFTREE_SUCCESS) {
        logging(lg, "Feature generation failed (%d)\n", ret);
        return ret;
    }

    ret = crfte_evaluate(fs, y, theta, this->mp, this->opt, ptr_nll, grad, &stats);
    if (ret != CRFTREE_SUCCESS) {
        logging(lg, "Evaluation failed (%d)\n", ret);
        return ret;
    }

    logging(lg, "Number of features: %d\n", stats.num_features);
    logging(lg, "Number of parameters: %d\n", stats.num_params);
    logging(lg, "Number of cliques: %d\n", stats.num_cliques);
    logging(lg, "Largest clique: %d\n", stats.max_clique_size);
    logging(lg, "Log of the partition factor: %f\n", stats.log_norm);
    logging(lg, "Negative log-likelihood: %f\n", stats.nll);
    logging(lg, "Seconds required: %.3f\n", (clock() - begin) / (double)CLOCKS_PER_SEC);
    logging(lg, "\n");
    return CRFTREE_SUCCESS;
}

int crfte_create_instance(const char *iid, void **ptr)
{
    if (strcmp(iid, "evaluator/tree") == 0) {
        *ptr = static_cast<crftree_evaluator_t*>(new tag_crftree_evaluator_internal());
        return 0;
    }
    return 1;
}
