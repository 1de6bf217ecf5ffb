/*
 *      Factor primitives.
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
#include <algorithm>
#include <utility>
#include <vector>

#include <crftree.h>

#include "crft.h"
#include "vecmath.h"

int crftree_assignment_to_index(const std::vector<int>& assignment, const std::vector<int>& card)
{
    int index = 0, stride = 1;
    for (size_t k = 0;k < card.size();++k) {
        index += assignment[k] * stride;
        stride *= card[k];
    }
    return index;
}

void crftree_index_to_assignment(int index, const std::vector<int>& card, std::vector<int>& assignment)
{
    assignment.resize(card.size());
    for (size_t k = 0;k < card.size();++k) {
        assignment[k] = index % card[k];
        index /= card[k];
    }
}

int crftree_factor_init(crftree_factor_t& factor, const std::vector<int>& vars, const std::vector<int>& card, floatval_t value)
{
    int n = 1;
    for (auto c: card) {
        if (c <= 0) {
            return CRFTREEERR_INCOMPATIBLE;
        }
        if (INT_MAX / c < n) {
            return CRFTREEERR_OUTOFMEMORY;
        }
        n *= c;
    }

    factor.vars = vars;
    factor.card = card;
    factor.val.assign(n, value);
    return CRFTREE_SUCCESS;
}

void crftx_strides(const crftree_factor_t& factor, const std::vector<int>& vars, std::vector<int>& strides)
{
    const int n = factor.num_vars();

    strides.assign(vars.size(), 0);
    for (size_t i = 0;i < vars.size();++i) {
        int stride = 1;
        for (int k = 0;k < n;++k) {
            if (factor.vars[k] == vars[i]) {
                strides[i] = stride;
                break;
            }
            stride *= factor.card[k];
        }
    }
}

bool crftx_covers(const std::vector<int>& vars, const std::vector<int>& scope)
{
    for (auto v: scope) {
        if (std::find(vars.begin(), vars.end(), v) == vars.end()) {
            return false;
        }
    }
    return true;
}

void crftree_factor_marginalize(const crftree_factor_t& factor, const std::vector<int>& eliminate, crftree_factor_t& result)
{
    const int n = factor.num_vars();
    const int N = factor.num_values();
    std::vector<int> vars, card, stride;

    /* The remaining variables in ascending order. */
    for (int k = 0;k < n;++k) {
        if (std::find(eliminate.begin(), eliminate.end(), factor.vars[k]) == eliminate.end()) {
            vars.push_back(factor.vars[k]);
        }
    }
    std::sort(vars.begin(), vars.end());
    for (auto v: vars) {
        card.push_back(factor.card[std::find(factor.vars.begin(), factor.vars.end(), v) - factor.vars.begin()]);
    }

    /* The marginal table is never larger than the table of #factor. */
    crftree_factor_t m;
    int M = 1;
    for (auto c: card) M *= c;
    m.vars = vars;
    m.card = card;
    m.val.assign(M, 0.);

    /* stride[k] is the step in the marginal when the variable #k advances. */
    crftx_strides(m, factor.vars, stride);

    /*
        Walk the table of the factor in its own order, carrying the
        assignment and the corresponding index into the marginal.
     */
    std::vector<int> a(n, 0);
    int j = 0;
    for (int i = 0;i < N;++i) {
        m.val[j] += factor.val[i];
        for (int k = 0;k < n;++k) {
            ++a[k];
            j += stride[k];
            if (a[k] < factor.card[k]) break;
            j -= stride[k] * factor.card[k];
            a[k] = 0;
        }
    }

    result = std::move(m);
}

int crftree_factor_product(const crftree_factor_t& a, const crftree_factor_t& b, crftree_factor_t& result)
{
    std::vector<int> vars, card, sa, sb;

    /* Union of the scopes in ascending order. */
    vars = a.vars;
    vars.insert(vars.end(), b.vars.begin(), b.vars.end());
    std::sort(vars.begin(), vars.end());
    vars.erase(std::unique(vars.begin(), vars.end()), vars.end());

    for (auto v: vars) {
        int ca = 0, cb = 0;
        auto ia = std::find(a.vars.begin(), a.vars.end(), v);
        auto ib = std::find(b.vars.begin(), b.vars.end(), v);
        if (ia != a.vars.end()) ca = a.card[ia - a.vars.begin()];
        if (ib != b.vars.end()) cb = b.card[ib - b.vars.begin()];
        if (ca != 0 && cb != 0 && ca != cb) {
            return CRFTREEERR_INCOMPATIBLE;
        }
        card.push_back(ca != 0 ? ca : cb);
    }

    crftree_factor_t c;
    int ret = crftree_factor_init(c, vars, card, 0.);
    if (ret != CRFTREE_SUCCESS) {
        return ret;
    }
    crftx_strides(a, vars, sa);
    crftx_strides(b, vars, sb);

    const int n = vars.size();
    const int N = c.num_values();
    std::vector<int> assignment(n, 0);
    int i = 0, j = 0;
    for (int k = 0;k < N;++k) {
        c.val[k] = a.val[i] * b.val[j];
        for (int l = 0;l < n;++l) {
            ++assignment[l];
            i += sa[l];
            j += sb[l];
            if (assignment[l] < card[l]) break;
            i -= sa[l] * card[l];
            j -= sb[l] * card[l];
            assignment[l] = 0;
        }
    }

    result = std::move(c);
    return CRFTREE_SUCCESS;
}

floatval_t crftree_factor_sum(const crftree_factor_t& factor)
{
    return vecsum(factor.val.begin(), factor.num_values());
}

floatval_t crftree_factor_normalize(crftree_factor_t& factor)
{
    floatval_t sum = crftree_factor_sum(factor);
    if (sum != 0.) {
        vecscale(factor.val.begin(), 1. / sum, factor.num_values());
    }
    return sum;
}
