/*
 *      Clique-tree calibration (sum-product).
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
#include <stdio.h>
#include <algorithm>
#include <queue>
#include <vector>

#include <crftree.h>

#include "crft.h"
#include "vecmath.h"

/* Direction of the message that arrives at the clique #c along the edge #e. */
static inline int incoming(const crft_edge_t& edge, int c)
{
    return (edge.dst == c) ? 0 : 1;
}

void crft_cliquetree_t::crftc_schedule(int root, std::vector<int>& order, std::vector<int>& parent_edge) const
{
    std::queue<int> bfs;

    order.clear();
    parent_edge.assign(this->num_cliques(), -1);

    bfs.push(root);
    while (!bfs.empty()) {
        int c = bfs.front();
        bfs.pop();
        order.push_back(c);

        for (auto e: this->adjacency[c]) {
            if (e == parent_edge[c]) continue;
            const crft_edge_t& edge = this->edges[e];
            int n = (edge.src == c) ? edge.dst : edge.src;
            parent_edge[n] = e;
            bfs.push(n);
        }
    }
}

int crft_cliquetree_t::crftc_send_message(int e, int dir, floatval_t *ptr_scale)
{
    const crft_edge_t& edge = this->edges[e];
    const int from = (dir == 0) ? edge.src : edge.dst;
    crftree_factor_t psi = this->cliques[from];
    std::vector<int> eliminate;

    /* Absorb the messages arriving at #from, except the one along #e. */
    for (auto f: this->adjacency[from]) {
        if (f == e) continue;
        int ret = crftree_factor_product(psi, MESSAGE(this, f, incoming(this->edges[f], from)), psi);
        if (ret != CRFTREE_SUCCESS) {
            return ret;
        }
    }

    for (auto v: psi.vars) {
        if (!std::binary_search(edge.sep.begin(), edge.sep.end(), v)) {
            eliminate.push_back(v);
        }
    }

    crftree_factor_t& msg = MESSAGE(this, e, dir);
    crftree_factor_marginalize(psi, eliminate, msg);

    /* Scale the message so that it sums to one. */
    floatval_t sum = crftree_factor_sum(msg);
    if (!(0. < sum) || !isfinite(sum)) {
        return CRFTREEERR_OVERFLOW;
    }
    vecscale(msg.val.begin(), 1. / sum, msg.num_values());
    *ptr_scale = sum;
    return CRFTREE_SUCCESS;
}

int crft_cliquetree_t::crftc_calibrate()
{
    int ret = 0;
    floatval_t scale = 0.;
    floatval_t logz = 0.;
    std::vector<int> order, parent_edge;

    if (!(this->flag & CTF_BUILT)) {
        return CRFTREEERR_INTERNAL_LOGIC;
    }

    for (auto root: this->roots) {
        this->crftc_schedule(root, order, parent_edge);

        /* Upward pass: every clique reports to its parent, leaves first. */
        for (auto it = order.rbegin();it != order.rend();++it) {
            int e = parent_edge[*it];
            if (e < 0) continue;
            int dir = (this->edges[e].src == *it) ? 0 : 1;
            if ((ret = this->crftc_send_message(e, dir, &scale)) != CRFTREE_SUCCESS) {
                return ret;
            }
            logz += log(scale);
        }

        /* Downward pass: every clique informs its children, root first. */
        for (auto c: order) {
            for (auto e: this->adjacency[c]) {
                if (e == parent_edge[c]) continue;
                int dir = (this->edges[e].src == c) ? 0 : 1;
                if ((ret = this->crftc_send_message(e, dir, &scale)) != CRFTREE_SUCCESS) {
                    return ret;
                }
            }
        }
    }

    /* Beliefs: the potential of each clique times all its incoming messages. */
    std::vector<crftree_factor_t> beliefs(this->cliques);
    for (size_t c = 0;c < beliefs.size();++c) {
        for (auto e: this->adjacency[c]) {
            ret = crftree_factor_product(beliefs[c], MESSAGE(this, e, incoming(this->edges[e], c)), beliefs[c]);
            if (ret != CRFTREE_SUCCESS) {
                return ret;
            }
        }
    }

    for (auto root: this->roots) {
        floatval_t sum = crftree_factor_sum(beliefs[root]);
        if (!(0. < sum) || !isfinite(sum)) {
            return CRFTREEERR_OVERFLOW;
        }
        logz += log(sum);
    }

    this->cliques.swap(beliefs);
    this->log_norm = logz;
    this->flag |= CTF_CALIBRATED;
    return CRFTREE_SUCCESS;
}

int crft_cliquetree_t::crftc_find_clique(const std::vector<int>& scope) const
{
    for (size_t c = 0;c < this->cliques.size();++c) {
        if (crftx_covers(this->cliques[c].vars, scope)) {
            return (int)c;
        }
    }
    return -1;
}

void crft_cliquetree_t::crftc_covering_cliques(const std::vector<int>& scope, std::vector<int>& cliques) const
{
    cliques.clear();
    for (size_t c = 0;c < this->cliques.size();++c) {
        if (crftx_covers(this->cliques[c].vars, scope)) {
            cliques.push_back((int)c);
        }
    }
}

void crft_cliquetree_t::crftc_marginal(int c, const std::vector<int>& scope, crftree_factor_t& marginal) const
{
    const crftree_factor_t& belief = this->cliques[c];
    std::vector<int> eliminate;

    for (auto v: belief.vars) {
        if (std::find(scope.begin(), scope.end(), v) == scope.end()) {
            eliminate.push_back(v);
        }
    }

    crftree_factor_marginalize(belief, eliminate, marginal);
    crftree_factor_normalize(marginal);
}

static int check_values(FILE *fp, floatval_t cv, floatval_t tv)
{
    if (fabs(cv - tv) < 1e-9) {
        fprintf(fp, "OK (%f)\n", cv);
        return 0;
    } else {
        fprintf(fp, "FAIL: %f (%f)\n", cv, tv);
        return 1;
    }
}

int crftc_debug_calibration(FILE *fp)
{
    int y1, y2, y3;
    int failures = 0;
    floatval_t norm = 0;
    const int L = 3;
    floatval_t state[3][3] = {
        {.4, .5, .1},
        {.4, .1, .5},
        {.4, .1, .5},
    };
    floatval_t trans[3][3] = {
        {.3, .1, .4},
        {.6, .2, .1},
        {.5, .2, .1},
    };
    floatval_t scores[3][3][3];
    std::vector<crftree_factor_t> factors;
    crft_cliquetree_t tree;
    crftree_factor_t f, m;

    /* Unary factors of the three variables. */
    for (int t = 0;t < 3;++t) {
        if (crftree_factor_init(f, {t}, {L}, 0.) != CRFTREE_SUCCESS) return 1;
        for (int i = 0;i < L;++i) f.val[i] = state[t][i];
        factors.push_back(f);
    }

    /* Pairwise factors (0,1) and (1,2) sharing the same transition table. */
    for (int t = 0;t < 2;++t) {
        if (crftree_factor_init(f, {t, t+1}, {L, L}, 0.) != CRFTREE_SUCCESS) return 1;
        for (int i = 0;i < L;++i) {
            for (int j = 0;j < L;++j) {
                f.val[i + L * j] = trans[i][j];
            }
        }
        factors.push_back(f);
    }

    if (tree.crftc_build(factors) != CRFTREE_SUCCESS ||
        tree.crftc_calibrate() != CRFTREE_SUCCESS) {
        fprintf(fp, "FAIL: calibration\n");
        return 1;
    }

    /* Compute the score of every joint assignment. */
    for (y1 = 0;y1 < L;++y1) {
        for (y2 = 0;y2 < L;++y2) {
            for (y3 = 0;y3 < L;++y3) {
                scores[y1][y2][y3] =
                    state[0][y1] * state[1][y2] * state[2][y3] *
                    trans[y1][y2] * trans[y2][y3];
                norm += scores[y1][y2][y3];
            }
        }
    }

    fprintf(fp, "Check for the partition factor... ");
    failures += check_values(fp, exp(tree.crftc_lognorm()), norm);

    /* Compute the marginal probability of each variable. */
    for (int t = 0;t < 3;++t) {
        int c = tree.crftc_find_clique({t});
        tree.crftc_marginal(c, {t}, m);
        for (int i = 0;i < L;++i) {
            floatval_t s = 0.;
            for (y1 = 0;y1 < L;++y1) {
                for (y2 = 0;y2 < L;++y2) {
                    for (y3 = 0;y3 < L;++y3) {
                        int y[3] = {y1, y2, y3};
                        if (y[t] == i) s += scores[y1][y2][y3];
                    }
                }
            }
            fprintf(fp, "Check for the marginal probability (%d,%d)... ", t, i);
            failures += check_values(fp, m.val[i], s / norm);
        }
    }

    /* Compute the marginal probabilities of adjacent pairs. */
    for (int t = 0;t < 2;++t) {
        int c = tree.crftc_find_clique({t, t+1});
        tree.crftc_marginal(c, {t, t+1}, m);
        for (int i = 0;i < L;++i) {
            for (int j = 0;j < L;++j) {
                floatval_t p = 0.;
                for (y1 = 0;y1 < L;++y1) {
                    for (y2 = 0;y2 < L;++y2) {
                        for (y3 = 0;y3 < L;++y3) {
                            int y[3] = {y1, y2, y3};
                            if (y[t] == i && y[t+1] == j) p += scores[y1][y2][y3];
                        }
                    }
                }
                fprintf(fp, "Check for the marginal probability (%d,%d)-(%d,%d)... ", t, i, t+1, j);
                failures += check_values(fp, m.val[i + L * j], p / norm);
            }
        }
    }

    return failures;
}
