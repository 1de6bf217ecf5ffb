/*
 *      Tied feature generation.
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

#include <limits.h>
#include <vector>

#include <crftree.h>

#include "crft.h"

int crftree_generate_features(
    const crftree_observation_t& X,
    const std::vector<int>& y,
    const crftree_model_params_t& mp,
    int pairwise,
    crftree_featureset_t& fs
    )
{
    const int V = X.num_vars;
    const int J = X.num_image_features;
    const int K = mp.num_hidden_states;
    const int O = mp.num_observed_states;

    if (K <= 0 || O <= 0) {
        return CRFTREEERR_INCOMPATIBLE;
    }
    if (V < 0 || J < 0 || V != (int)y.size() ||
        X.values.size() != (size_t)V * (size_t)J) {
        return CRFTREEERR_INCOMPATIBLE;
    }
    for (auto x: X.values) {
        if (x < 0 || O <= x) {
            return CRFTREEERR_OUTOFRANGE;
        }
    }

    /* The parameter count must fit the int parameter indices. */
    const long long num_unary = (long long)J * O * K;
    const long long num_params = num_unary + (pairwise ? (long long)K * K : 0);
    if (INT_MAX < num_params) {
        return CRFTREEERR_OUTOFMEMORY;
    }

    fs.clear();
    fs.num_params = (int)num_params;

    /* Unary features tied across the positions. */
    for (int v = 0;v < V;++v) {
        for (int j = 0;j < J;++j) {
            const int base = (j * O + X.get(v, j)) * K;
            for (int h = 0;h < K;++h) {
                fs.append(crftree_feature_t({v}, {h}, base + h));
            }
        }
    }

    /* Transition features between adjacent positions. */
    if (pairwise) {
        for (int v = 0;v+1 < V;++v) {
            for (int h1 = 0;h1 < K;++h1) {
                for (int h2 = 0;h2 < K;++h2) {
                    fs.append(crftree_feature_t({v, v+1}, {h1, h2}, (int)num_unary + h1 * K + h2));
                }
            }
        }
    }

    return CRFTREE_SUCCESS;
}

void crftf_init_references(
    std::vector<feature_refs_t>& refs,
    const std::vector<crftree_feature_t>& features,
    int num_params
    )
{
    refs.assign(num_params, feature_refs_t());
    for (size_t i = 0;i < features.size();++i) {
        feature_refs_t& r = refs[features[i].param];
        r.num_features++;
        r.fids.push_back((int)i);
    }
}
