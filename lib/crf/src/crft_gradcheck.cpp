/*
 *      Finite-difference gradient check.
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
#include <vector>

#include <crftree.h>
#include "crftree_internal.h"
#include "logging.h"

int crfte_gradient_check(
    const crftree_featureset_t& fs,
    const std::vector<int>& y,
    const std::vector<floatval_t>& theta,
    const crftree_model_params_t& mp,
    const crfte_option_t& opt,
    floatval_t epsilon,
    floatval_t *ptr_error,
    logging_t *lg
    )
{
    int ret = 0;
    floatval_t nll = 0, fp = 0, fm = 0, error = 0;
    std::vector<floatval_t> grad, g;
    const int P = theta.size();

    if (!(0. < epsilon)) {
        return CRFTREEERR_INCOMPATIBLE;
    }

    /* The analytic gradient. */
    if ((ret = crfte_evaluate(fs, y, theta, mp, opt, &nll, grad, NULL)) != CRFTREE_SUCCESS) {
        return ret;
    }

    logging(lg, "Gradient check (epsilon = %g)\n", epsilon);
    logging_progress_start(lg);

    std::vector<floatval_t> w(theta);
    for (int p = 0;p < P;++p) {
        /* Central difference along the parameter #p. */
        w[p] = theta[p] + epsilon;
        if ((ret = crfte_evaluate(fs, y, w, mp, opt, &fp, g, NULL)) != CRFTREE_SUCCESS) {
            return ret;
        }
        w[p] = theta[p] - epsilon;
        if ((ret = crfte_evaluate(fs, y, w, mp, opt, &fm, g, NULL)) != CRFTREE_SUCCESS) {
            return ret;
        }
        w[p] = theta[p];

        floatval_t d = fabs((fp - fm) / (2. * epsilon) - grad[p]);
        if (error < d) {
            error = d;
        }

        logging_progress(lg, (p+1) * 100 / P);
    }

    logging_progress_end(lg);
    logging(lg, "Maximum difference: %g\n", error);

    *ptr_error = error;
    return CRFTREE_SUCCESS;
}

int crftree_gradient_check(
    const crftree_featureset_t& fs,
    const std::vector<int>& y,
    const std::vector<floatval_t>& theta,
    const crftree_model_params_t& mp,
    floatval_t epsilon,
    floatval_t *ptr_error
    )
{
    logging_t lg;
    crfte_option_t opt;
    return crfte_gradient_check(fs, y, theta, mp, opt, epsilon, ptr_error, &lg);
}
